#include "skitter/logger.hh"

#include <caf/term.hpp>

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>

namespace skitter {

namespace {

event_observer_ptr global_observer;

class console_logger : public event_observer {
public:
  console_logger(event::severity_level severity, event::component_mask mask)
    : severity_(severity), mask_(mask) {
    // nop
  }

  void observe(event_ptr what) override {
    auto color = caf::term::reset;
    switch (what->severity) {
      case event::severity_level::critical:
      case event::severity_level::error:
        color = caf::term::red;
        break;
      case event::severity_level::warning:
        color = caf::term::yellow;
        break;
      case event::severity_level::info:
        color = caf::term::green;
        break;
      default:
        break;
    }
    auto secs = std::chrono::system_clock::to_time_t(
      std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        what->timestamp));
    std::tm tm_buf;
    localtime_r(&secs, &tm_buf);
    std::lock_guard<std::mutex> guard{mtx_};
    std::cerr << color << std::put_time(&tm_buf, "%F %T") << " ["
              << to_string(what->severity) << "] "
              << to_string(what->component) << ' ' << what->identifier << ": "
              << what->description << caf::term::reset << std::endl;
  }

  bool accepts(event::severity_level severity,
               event::component_type component) const override {
    return severity <= severity_ && has_component(mask_, component);
  }

private:
  event::severity_level severity_;
  event::component_mask mask_;
  std::mutex mtx_;
};

constexpr std::string_view severity_names[] = {
  "critical", "error", "warning", "info", "verbose", "debug",
};

} // namespace

std::string_view to_string(event::severity_level level) noexcept {
  return severity_names[static_cast<int>(level)];
}

std::string_view to_string(event::component_type component) noexcept {
  switch (component) {
    case event::component_type::runtime:
      return "runtime";
    case event::component_type::dispatcher:
      return "dispatcher";
    case event::component_type::handler:
      return "handler";
    case event::component_type::registry:
      return "registry";
    case event::component_type::notifier:
      return "notifier";
    case event::component_type::connection:
      return "connection";
    case event::component_type::app:
      return "app";
  }
  return "???";
}

bool convert(std::string_view str, event::severity_level& level) noexcept {
  for (int index = 0; index < 6; ++index) {
    if (severity_names[index] == str) {
      level = static_cast<event::severity_level>(index);
      return true;
    }
  }
  return false;
}

event_observer* logger() noexcept {
  return global_observer.get();
}

void logger(event_observer_ptr ptr) noexcept {
  global_observer = std::move(ptr);
}

event_observer_ptr make_console_logger(event::severity_level severity,
                                       event::component_mask mask) {
  return std::make_shared<console_logger>(severity, mask);
}

event_observer_ptr make_console_logger(std::string_view severity,
                                       event::component_mask mask) {
  auto level = event::severity_level::critical;
  if (!convert(severity, level)) {
    std::string what = "invalid severity level: ";
    what.insert(what.end(), severity.begin(), severity.end());
    throw std::invalid_argument(what);
  }
  return make_console_logger(level, mask);
}

} // namespace skitter
