#pragma once

#include "skitter/endpoint.hh"
#include "skitter/fwd.hh"
#include "skitter/role.hh"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <utility>
#include <vector>

namespace skitter {

/// The authoritative table of endpoints connected to the local runtime.
///
/// Readers never block: each read operates on an immutable snapshot that the
/// registry swaps atomically on every mutation. Writers serialize on a mutex.
/// The snapshot also carries the tag index (see @ref tag_index), which keeps
/// both views consistent for readers of either one.
class registry {
public:
  // -- member types -----------------------------------------------------------

  /// A single connection record.
  struct record {
    role node_role;
    tag_set tags;
  };

  /// An immutable view of the registry state.
  struct snapshot {
    /// Maps connected endpoints to their record.
    std::map<endpoint, record> records;

    /// Maps endpoints to their tags.
    std::map<endpoint, tag_set> tags_of;

    /// Maps tags to all endpoints that carry them.
    std::map<tag, std::set<endpoint>> by_tag;
  };

  using snapshot_ptr = std::shared_ptr<const snapshot>;

  // -- constructors, destructors, and assignment operators --------------------

  registry();

  registry(const registry&) = delete;

  registry& operator=(const registry&) = delete;

  // -- mutators ---------------------------------------------------------------

  /// Adds a record for `node`. Fails if `node` already has a record.
  /// @returns `true` if the registry added a record, `false` otherwise.
  bool add(const endpoint& node, const role& node_role, tag_set tags = {});

  /// Removes the record for `node` along with its tags.
  /// @returns `true` if the registry had a record for `node`.
  bool remove(const endpoint& node);

  /// Drops all records and tags.
  void remove_all();

  /// Merges `tags` into the tag index for `node`.
  void add_tags(const endpoint& node, const tag_set& tags);

  // -- properties -------------------------------------------------------------

  /// Returns the current state.
  [[nodiscard]] snapshot_ptr load() const;

  /// Returns all connected endpoints with their roles.
  [[nodiscard]] std::vector<std::pair<endpoint, role>> all() const;

  /// Checks whether `node` has a record.
  [[nodiscard]] bool connected(const endpoint& node) const;

  /// Returns the role of `node` if it has a record.
  [[nodiscard]] std::optional<role> role_of(const endpoint& node) const;

  /// Returns the connected master if present.
  [[nodiscard]] std::optional<endpoint> master() const;

  /// Returns all connected workers.
  [[nodiscard]] std::vector<endpoint> workers() const;

  /// Returns the number of records.
  [[nodiscard]] size_t size() const;

private:
  template <class F>
  void update(F&& fn);

  std::mutex writer_mtx_;

  snapshot_ptr state_;
};

/// @relates registry
registry_ptr make_registry();

} // namespace skitter
