#include "skitter/runtime.hh"

#include "skitter/configuration.hh"
#include "skitter/connect_failure.hh"
#include "skitter/defaults.hh"
#include "skitter/logger.hh"
#include "skitter/master_connection.hh"
#include "skitter/registry.hh"
#include "skitter/version.hh"
#include "skitter/worker_connection.hh"
#include "skitter/internal/beacon_actor.hh"
#include "skitter/internal/connector.hh"
#include "skitter/internal/dispatcher_actor.hh"
#include "skitter/internal/handler_actor.hh"
#include "skitter/internal/logger.hh"
#include "skitter/internal/notifier_actor.hh"
#include "skitter/internal/registry_manager.hh"
#include "skitter/internal/resolver.hh"
#include "skitter/internal/type_id.hh"

#include <caf/actor_system.hpp>
#include <caf/exit_reason.hpp>
#include <caf/io/middleman.hpp>
#include <caf/scoped_actor.hpp>
#include <caf/send.hpp>

#include <string>
#include <utility>

namespace skitter {

namespace atom = internal::atom;

namespace log = internal::log;

// --- construction and destruction --------------------------------------------

runtime::runtime(caf::actor_system& sys, runtime_options opts,
                 caf::actor resolver)
  : sys_(&sys), opts_(std::move(opts)) {
  init(std::move(resolver));
}

runtime::runtime(configuration& cfg)
  : owned_sys_(std::make_unique<caf::actor_system>(cfg)),
    sys_(owned_sys_.get()),
    opts_(to_runtime_options(cfg)) {
  if (auto verbosity = cfg.console_verbosity();
      verbosity != "quiet" && logger() == nullptr)
    set_console_logger(verbosity);
  init(caf::actor{});
}

runtime::~runtime() {
  stop();
}

void runtime::init(caf::actor resolver) {
  if (opts_.local.host.empty())
    opts_.local.host = std::string{defaults::host};
  if (opts_.local.port == 0)
    opts_.local.port = opts_.port;
  reg_ = make_registry();
  if (resolver) {
    resolver_ = std::move(resolver);
  } else {
    resolver_ = sys_->spawn(internal::middleman_resolver);
    owns_resolver_ = true;
  }
  notifier_hdl_ = sys_->spawn<internal::notifier_actor>();
  beacon_ = sys_->spawn<internal::beacon_actor>(
    beacon_info{opts_.local_role, version::protocol, opts_.tags});
  dispatcher_hdl_ = sys_->spawn<internal::dispatcher_actor>(beacon_,
                                                            notifier_hdl_,
                                                            reg_);
  connector_ = sys_->spawn<internal::connector_actor>(opts_.local,
                                                      opts_.local_role,
                                                      opts_.tags,
                                                      dispatcher_hdl_,
                                                      resolver_);
  notifier_.emplace(*sys_, notifier_hdl_);
  dispatcher_.emplace(*sys_, dispatcher_hdl_, resolver_, connector_, reg_);
  bind_default_policies();
  log::runtime::info("init", "created runtime {} with role {} (version {})",
                     opts_.local, opts_.local_role, version::string());
}

void runtime::bind_default_policies() {
  auto shutdown_fn = [this](int code) { request_shutdown(code); };
  error err;
  if (opts_.local_role.is_master()) {
    err = bind(role::worker(),
               std::make_unique<worker_connection::policy>(
                 opts_.local, reg_, *notifier_, opts_.shutdown_with_workers,
                 shutdown_fn));
  } else if (opts_.local_role.is_worker()) {
    registry_manager_ = sys_->spawn<internal::registry_manager_actor>(
      opts_.local, reg_, resolver_);
    err = bind(role::master(), std::make_unique<master_connection::policy>(
                                 reg_, *notifier_, registry_manager_,
                                 opts_.shutdown_with_master, shutdown_fn));
  }
  if (err)
    log::runtime::error("bind-default-failed",
                        "failed to bind the default connection policy: {}",
                        err);
}

// --- binding -----------------------------------------------------------------

caf::actor runtime::spawn_handler(const role& key, handler_ptr impl) {
  return sys_->spawn<internal::handler_actor>(key, std::move(impl));
}

error runtime::bind(const role& key, handler_ptr impl) {
  if (stopped_)
    return make_error(ec::shutting_down);
  if (!impl)
    return make_error(ec::unspecified, "cannot bind an empty handler");
  auto hdl = spawn_handler(key, std::move(impl));
  if (auto err = dispatcher_->bind(key, hdl)) {
    caf::anon_send_exit(hdl, caf::exit_reason::user_shutdown);
    return err;
  }
  if (auto i = handlers_.find(key); i != handlers_.end()) {
    caf::anon_send_exit(i->second, caf::exit_reason::user_shutdown);
    i->second = std::move(hdl);
  } else {
    handlers_.emplace(key, std::move(hdl));
  }
  return {};
}

error runtime::default_bind(handler_ptr impl) {
  if (stopped_)
    return make_error(ec::shutting_down);
  if (!impl)
    return make_error(ec::unspecified, "cannot bind an empty handler");
  auto hdl = spawn_handler(role{}, std::move(impl));
  if (auto err = dispatcher_->default_bind(hdl)) {
    caf::anon_send_exit(hdl, caf::exit_reason::user_shutdown);
    return err;
  }
  if (default_handler_)
    caf::anon_send_exit(default_handler_, caf::exit_reason::user_shutdown);
  default_handler_ = std::move(hdl);
  return {};
}

// --- connection management ---------------------------------------------------

error runtime::listen() {
  if (stopped_)
    return make_error(ec::shutting_down);
  if (!owns_resolver_) {
    error result;
    caf::scoped_actor self{*sys_};
    self
      ->request(resolver_, caf::infinite, atom::publish_v, opts_.local,
                dispatcher_hdl_)
      .receive([] {}, [&result](caf::error& err) { result = std::move(err); });
    if (!result)
      log::runtime::info("listen", "runtime {} is reachable", opts_.local);
    return result;
  }
  auto port = opts_.port != 0 ? opts_.port : opts_.local.port;
  log::runtime::info("try-listen", "try listening on port {}", port);
  auto res = sys_->middleman().publish(dispatcher_hdl_, port, nullptr, true);
  if (!res) {
    log::runtime::error("listen-failed", "cannot listen on port {}: {}", port,
                        res.error());
    return make_error(ec::unreachable, "cannot listen on port "
                                         + std::to_string(port) + ": "
                                         + to_string(res.error()));
  }
  published_port_ = *res;
  log::runtime::info("listen", "listening on port {}", published_port_);
  if (opts_.local.port == 0) {
    auto prev = opts_.local;
    opts_.local.port = published_port_;
    announce_local_endpoint(prev);
  }
  return {};
}

void runtime::announce_local_endpoint(const endpoint& prev) {
  if (auto prev_role = reg_->role_of(prev)) {
    reg_->remove(prev);
    reg_->add(opts_.local, *prev_role);
  }
  caf::scoped_actor self{*sys_};
  auto update = [this, &self](const caf::actor& hdl) {
    self->request(hdl, caf::infinite, atom::publish_v, opts_.local)
      .receive([] {},
               [](const caf::error& err) {
                 log::runtime::warning("announce-failed",
                                       "cannot update local endpoint: {}",
                                       err);
               });
  };
  update(connector_);
  if (registry_manager_)
    update(registry_manager_);
}

error runtime::start() {
  if (stopped_)
    return make_error(ec::shutting_down);
  if (!owns_resolver_ || opts_.port != 0) {
    if (auto err = listen())
      return err;
  }
  if (opts_.local_role.is_master()) {
    auto failures = worker_connection{*this}.connect(opts_.workers);
    if (!failures.empty()) {
      log::runtime::error("start-failed",
                          "failed to connect to {} of {} workers: {}",
                          failures.size(), opts_.workers.size(),
                          to_string(failures));
      return make_error(code_of(failures.front().reason), to_string(failures));
    }
  } else if (opts_.local_role.is_worker()) {
    if (auto err = master_connection{*this}.connect(opts_.master))
      log::runtime::warning("no-master", "continue without master: {}", err);
  }
  return {};
}

expected<role> runtime::connect(const endpoint& remote,
                                std::optional<role> expected_role) {
  if (stopped_)
    return make_error(ec::shutting_down);
  expected<role> result{role{}};
  caf::scoped_actor self{*sys_};
  self
    ->request(connector_, caf::infinite, atom::connect_v, remote,
              std::move(expected_role))
    .receive([&result](role& x) { result = std::move(x); },
             [&result](caf::error& err) { result = std::move(err); });
  return result;
}

failure_list runtime::connect(std::vector<endpoint> remotes,
                              const role& expected_role) {
  failure_list result;
  if (stopped_) {
    for (auto& remote : remotes)
      result.emplace_back(
        connect_failure{std::move(remote), make_error(ec::shutting_down)});
    return result;
  }
  caf::scoped_actor self{*sys_};
  self
    ->request(connector_, caf::infinite, atom::connect_v, remotes,
              expected_role)
    .receive([&result](failure_list& xs) { result = std::move(xs); },
             [&result, &remotes](const caf::error& err) {
               for (auto& remote : remotes)
                 result.emplace_back(connect_failure{remote, err});
             });
  return result;
}

error runtime::disconnect(const endpoint& remote,
                          std::optional<role> remote_role) {
  if (stopped_)
    return make_error(ec::shutting_down);
  if (!remote_role)
    remote_role = reg_->role_of(remote);
  if (!remote_role)
    return make_error(ec::not_connected, to_string(remote));
  error result;
  caf::scoped_actor self{*sys_};
  self
    ->request(connector_, caf::infinite, atom::remove_v, remote, *remote_role)
    .receive([] {}, [&result](caf::error& err) { result = std::move(err); });
  return result;
}

// --- shutdown ----------------------------------------------------------------

void runtime::stop() {
  if (stopped_)
    return;
  stopped_ = true;
  log::runtime::info("stop", "stopping runtime {}", opts_.local);
  if (published_port_ != 0) {
    auto res = sys_->middleman().unpublish(dispatcher_hdl_, published_port_);
    if (!res)
      log::runtime::warning("unpublish-failed",
                            "failed to close port {}: {}", published_port_,
                            res.error());
    published_port_ = 0;
  }
  std::vector<caf::actor> hdls{dispatcher_hdl_, connector_, beacon_,
                               notifier_hdl_};
  if (registry_manager_)
    hdls.emplace_back(registry_manager_);
  if (default_handler_)
    hdls.emplace_back(default_handler_);
  for (auto& kvp : handlers_)
    hdls.emplace_back(kvp.second);
  if (owns_resolver_)
    hdls.emplace_back(resolver_);
  for (auto& hdl : hdls)
    caf::anon_send_exit(hdl, caf::exit_reason::user_shutdown);
  log::runtime::debug("wait-for-actors", "wait until {} actors terminated",
                      hdls.size());
  caf::scoped_actor self{*sys_};
  for (auto& hdl : hdls)
    self->wait_for(hdl);
  handlers_.clear();
  default_handler_ = nullptr;
  registry_manager_ = nullptr;
}

void runtime::on_shutdown(shutdown_callback f) {
  std::unique_lock<std::mutex> guard{shutdown_mtx_};
  on_shutdown_ = std::move(f);
}

void runtime::request_shutdown(int code) {
  shutdown_callback f;
  {
    std::unique_lock<std::mutex> guard{shutdown_mtx_};
    if (exit_code_)
      return;
    log::runtime::info("request-shutdown", "shutdown requested with code {}",
                       code);
    exit_code_ = code;
    f = on_shutdown_;
    shutdown_cv_.notify_all();
  }
  if (f)
    f(code);
}

int runtime::await_shutdown() {
  std::unique_lock<std::mutex> guard{shutdown_mtx_};
  shutdown_cv_.wait(guard, [this] { return exit_code_.has_value(); });
  return *exit_code_;
}

std::optional<int> runtime::exit_code() const {
  std::unique_lock<std::mutex> guard{shutdown_mtx_};
  return exit_code_;
}

} // namespace skitter
