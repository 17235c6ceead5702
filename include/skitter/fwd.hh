#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace skitter {

// -- PODs ---------------------------------------------------------------------

struct beacon_info;
struct connect_failure;
struct dispatch_result;
struct endpoint;
struct endpoint_down;
struct endpoint_up;
struct peer_handshake;
struct runtime_options;

// -- classes ------------------------------------------------------------------

class configuration;
class dispatcher;
class event;
class event_observer;
class handler;
class master_connection;
class notifier;
class registry;
class role;
class runtime;
class tag_index;
class worker_connection;

// -- enum classes -------------------------------------------------------------

enum class ec : uint8_t;

// -- aliases ------------------------------------------------------------------

using tag = std::string;
using tag_set = std::set<tag>;
using failure_list = std::vector<connect_failure>;
using dispatch_results = std::vector<dispatch_result>;
using handler_ptr = std::unique_ptr<handler>;
using registry_ptr = std::shared_ptr<registry>;
using shutdown_callback = std::function<void(int)>;

} // namespace skitter
