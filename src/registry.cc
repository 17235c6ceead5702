#include "skitter/registry.hh"

#include "skitter/internal/logger.hh"

#include <atomic>

namespace skitter {

namespace {

void erase_tags(registry::snapshot& st, const endpoint& node) {
  auto i = st.tags_of.find(node);
  if (i == st.tags_of.end())
    return;
  for (const auto& tag : i->second) {
    auto j = st.by_tag.find(tag);
    if (j != st.by_tag.end()) {
      j->second.erase(node);
      if (j->second.empty())
        st.by_tag.erase(j);
    }
  }
  st.tags_of.erase(i);
}

void merge_tags(registry::snapshot& st, const endpoint& node,
                const tag_set& tags) {
  if (tags.empty())
    return;
  st.tags_of[node].insert(tags.begin(), tags.end());
  for (const auto& tag : tags)
    st.by_tag[tag].emplace(node);
}

} // namespace

registry::registry() : state_(std::make_shared<snapshot>()) {
  // nop
}

template <class F>
void registry::update(F&& fn) {
  std::lock_guard<std::mutex> guard{writer_mtx_};
  auto next = std::make_shared<snapshot>(*std::atomic_load(&state_));
  fn(*next);
  std::atomic_store(&state_, snapshot_ptr{std::move(next)});
}

bool registry::add(const endpoint& node, const role& node_role, tag_set tags) {
  auto added = false;
  update([&](snapshot& st) {
    if (st.records.count(node) != 0)
      return;
    merge_tags(st, node, tags);
    st.records.emplace(node, record{node_role, std::move(tags)});
    added = true;
  });
  if (added)
    internal::log::registry::debug("add", "added {} as {}", node, node_role);
  else
    internal::log::registry::debug("add-duplicate",
                                   "ignored duplicate record for {}", node);
  return added;
}

bool registry::remove(const endpoint& node) {
  auto removed = false;
  update([&](snapshot& st) {
    erase_tags(st, node);
    removed = st.records.erase(node) != 0;
  });
  if (removed)
    internal::log::registry::debug("remove", "removed {}", node);
  return removed;
}

void registry::remove_all() {
  update([](snapshot& st) {
    st.records.clear();
    st.tags_of.clear();
    st.by_tag.clear();
  });
  internal::log::registry::debug("remove-all", "removed all records");
}

void registry::add_tags(const endpoint& node, const tag_set& tags) {
  update([&](snapshot& st) {
    merge_tags(st, node, tags);
    auto i = st.records.find(node);
    if (i != st.records.end())
      i->second.tags.insert(tags.begin(), tags.end());
  });
}

registry::snapshot_ptr registry::load() const {
  return std::atomic_load(&state_);
}

std::vector<std::pair<endpoint, role>> registry::all() const {
  auto st = load();
  std::vector<std::pair<endpoint, role>> result;
  result.reserve(st->records.size());
  for (const auto& [node, rec] : st->records)
    result.emplace_back(node, rec.node_role);
  return result;
}

bool registry::connected(const endpoint& node) const {
  return load()->records.count(node) != 0;
}

std::optional<role> registry::role_of(const endpoint& node) const {
  auto st = load();
  if (auto i = st->records.find(node); i != st->records.end())
    return i->second.node_role;
  return std::nullopt;
}

std::optional<endpoint> registry::master() const {
  auto st = load();
  for (const auto& [node, rec] : st->records)
    if (rec.node_role.is_master())
      return node;
  return std::nullopt;
}

std::vector<endpoint> registry::workers() const {
  auto st = load();
  std::vector<endpoint> result;
  for (const auto& [node, rec] : st->records)
    if (rec.node_role.is_worker())
      result.emplace_back(node);
  return result;
}

size_t registry::size() const {
  return load()->records.size();
}

registry_ptr make_registry() {
  return std::make_shared<registry>();
}

} // namespace skitter
