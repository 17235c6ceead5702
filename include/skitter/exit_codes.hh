#pragma once

namespace skitter::exit_codes {

/// The runtime terminated normally.
constexpr int success = 0;

/// The runtime failed to start, e.g., because it could not connect to its
/// workers.
constexpr int startup_failure = 1;

/// The runtime stopped because a remote endpoint it depends on went down.
constexpr int remote_shutdown = 4;

} // namespace skitter::exit_codes
