#include "skitter/tag_index.hh"

#include "skitter/registry.hh"

#include <utility>

namespace skitter {

tag_index::tag_index(registry_ptr reg) : reg_(std::move(reg)) {
  // nop
}

void tag_index::add(const endpoint& node, const tag_set& tags) {
  reg_->add_tags(node, tags);
}

std::set<endpoint> tag_index::workers_with(const tag& what) const {
  auto st = reg_->load();
  if (auto i = st->by_tag.find(what); i != st->by_tag.end())
    return i->second;
  return {};
}

tag_set tag_index::of_worker(const endpoint& node) const {
  auto st = reg_->load();
  if (auto i = st->tags_of.find(node); i != st->tags_of.end())
    return i->second;
  return {};
}

std::map<endpoint, tag_set> tag_index::of_all_workers() const {
  auto st = reg_->load();
  std::map<endpoint, tag_set> result;
  for (const auto& [node, rec] : st->records) {
    if (!rec.node_role.is_worker())
      continue;
    auto i = st->tags_of.find(node);
    result.emplace(node, i != st->tags_of.end() ? i->second : tag_set{});
  }
  return result;
}

std::string to_string(const tag_set& tags) {
  std::string result = "[";
  for (auto& x : tags) {
    if (result.size() > 1)
      result += ", ";
    result += x;
  }
  result += ']';
  return result;
}

} // namespace skitter
