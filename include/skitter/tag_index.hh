#pragma once

#include "skitter/endpoint.hh"
#include "skitter/fwd.hh"

#include <map>
#include <set>
#include <string>

namespace skitter {

/// Secondary index from tags to worker endpoints. The index shares its state
/// with a @ref registry: removing an endpoint from the registry also removes
/// its tags.
class tag_index {
public:
  explicit tag_index(registry_ptr reg);

  /// Merges `tags` into the index for `node`.
  void add(const endpoint& node, const tag_set& tags);

  /// Returns all endpoints that carry `what`.
  [[nodiscard]] std::set<endpoint> workers_with(const tag& what) const;

  /// Returns all tags of `node`.
  [[nodiscard]] tag_set of_worker(const endpoint& node) const;

  /// Returns the tags of every worker in the registry, including workers
  /// without tags.
  [[nodiscard]] std::map<endpoint, tag_set> of_all_workers() const;

private:
  registry_ptr reg_;
};

/// Renders `tags` as a list such as `[gpu, ssd]`.
std::string to_string(const tag_set& tags);

} // namespace skitter
