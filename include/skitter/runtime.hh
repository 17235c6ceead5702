#pragma once

#include "skitter/dispatcher.hh"
#include "skitter/endpoint.hh"
#include "skitter/error.hh"
#include "skitter/fwd.hh"
#include "skitter/notifier.hh"
#include "skitter/role.hh"
#include "skitter/runtime_options.hh"
#include "skitter/tag_index.hh"

#include <caf/actor.hpp>
#include <caf/fwd.hpp>

#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace skitter {

/// The local node of a cluster. A runtime declares a role, hosts the handlers
/// for all roles it talks to and owns the registry of connected endpoints.
///
/// Masters bind a @ref worker_connection::policy for the role `worker` and
/// workers bind a @ref master_connection::policy for the role `master` on
/// construction. Users may replace these defaults by calling `bind`.
class runtime {
public:
  // --- construction and destruction ------------------------------------------

  /// Creates a runtime in an existing actor system. If `resolver` is valid,
  /// the runtime registers itself at this resolver when listening and uses it
  /// for reaching other runtimes. Otherwise, the runtime communicates via the
  /// CAF middleman.
  runtime(caf::actor_system& sys, runtime_options opts,
          caf::actor resolver = {});

  /// Creates a runtime with its own actor system.
  explicit runtime(configuration& cfg);

  runtime(const runtime&) = delete;

  runtime& operator=(const runtime&) = delete;

  /// Calls `stop`.
  ~runtime();

  // --- binding ---------------------------------------------------------------

  /// Binds `impl` to `key`, replacing any previous handler for `key`.
  error bind(const role& key, handler_ptr impl);

  /// Binds `impl` for all roles without a specific binding.
  error default_bind(handler_ptr impl);

  // --- connection management -------------------------------------------------

  /// Makes the runtime reachable for other runtimes at its local endpoint.
  error listen();

  /// Starts listening if configured and connects to the configured master or
  /// workers. A master fails to start if it cannot connect to all of its
  /// workers, whereas a worker merely logs a failed master connection.
  error start();

  /// Connects to `remote` and fails if `expected_role` is set and differs
  /// from the role of `remote`.
  /// @returns the role of `remote` on success.
  expected<role> connect(const endpoint& remote,
                         std::optional<role> expected_role = std::nullopt);

  /// Connects to all `remotes` concurrently, requiring each of them to have
  /// the role `expected_role`.
  /// @returns a list with one entry per failed attempt.
  failure_list connect(std::vector<endpoint> remotes,
                       const role& expected_role);

  /// Tears down the connection to `remote` on both sides. Looks up the role
  /// of `remote` in the registry unless `remote_role` is set.
  error disconnect(const endpoint& remote,
                   std::optional<role> remote_role = std::nullopt);

  // --- shutdown --------------------------------------------------------------

  /// Terminates all actors of this runtime. Remote runtimes observe this as
  /// the loss of this runtime. Calling `stop` more than once has no effect.
  void stop();

  /// Records `code` as exit code and wakes up `await_shutdown`. Only the
  /// first call has an effect.
  void request_shutdown(int code);

  /// Installs a callback that `request_shutdown` invokes with the exit code.
  /// The callback runs in the context of the requesting component and must
  /// not call `stop`.
  void on_shutdown(shutdown_callback f);

  /// Blocks until some component calls `request_shutdown`.
  /// @returns the recorded exit code.
  int await_shutdown();

  /// Returns the exit code if some component requested a shutdown.
  std::optional<int> exit_code() const;

  // --- properties ------------------------------------------------------------

  caf::actor_system& system() noexcept {
    return *sys_;
  }

  const runtime_options& options() const noexcept {
    return opts_;
  }

  const endpoint& local_endpoint() const noexcept {
    return opts_.local;
  }

  const role& local_role() const noexcept {
    return opts_.local_role;
  }

  skitter::registry& registry() const noexcept {
    return *reg_;
  }

  const registry_ptr& registry_handle() const noexcept {
    return reg_;
  }

  skitter::tag_index tags() const {
    return skitter::tag_index{reg_};
  }

  const skitter::notifier& notifier() const noexcept {
    return *notifier_;
  }

  const skitter::dispatcher& dispatcher() const noexcept {
    return *dispatcher_;
  }

  bool stopped() const noexcept {
    return stopped_;
  }

private:
  void init(caf::actor resolver);

  void bind_default_policies();

  /// Replaces `prev` with the current local endpoint in all components.
  void announce_local_endpoint(const endpoint& prev);

  caf::actor spawn_handler(const role& key, handler_ptr impl);

  std::unique_ptr<caf::actor_system> owned_sys_;

  caf::actor_system* sys_;

  runtime_options opts_;

  registry_ptr reg_;

  caf::actor beacon_;

  caf::actor notifier_hdl_;

  caf::actor dispatcher_hdl_;

  caf::actor resolver_;

  /// Stores whether we have spawned `resolver_` ourselves.
  bool owns_resolver_ = false;

  caf::actor connector_;

  caf::actor registry_manager_;

  /// Maps roles to the handlers bound by this runtime.
  std::map<role, caf::actor> handlers_;

  caf::actor default_handler_;

  std::optional<skitter::notifier> notifier_;

  std::optional<skitter::dispatcher> dispatcher_;

  /// Stores the port of the dispatcher if published via the middleman.
  uint16_t published_port_ = 0;

  bool stopped_ = false;

  mutable std::mutex shutdown_mtx_;

  std::condition_variable shutdown_cv_;

  std::optional<int> exit_code_;

  shutdown_callback on_shutdown_;
};

} // namespace skitter
