#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include <chmesh/config/config.h>
#include <chmesh/gateway/gateway.h>
#include <chmesh/gateway/route.h>
#include <chmesh/http/http_server.h>
#include <chmesh/registry/heartbeat_monitor.h>

namespace chmesh::config {

struct ServerOptions {
    std::string log_level = "info";
    std::size_t io_threads = 0;

    chmesh::http::ListenAddress registry_listen{"0.0.0.0", 8761};
    chmesh::registry::HeartbeatOptions heartbeat;

    chmesh::http::ListenAddress gateway_listen{"0.0.0.0", 8080};
    std::uint64_t max_body_bytes = chmesh::http::kDefaultBodyLimit; // gateway ingress, 413 above
    chmesh::gateway::GatewayOptions gateway;
    std::string load_balancer = "round_robin";
    std::vector<chmesh::gateway::Route> routes; // declaration order
};

// Typed options with defaults for everything `cfg` leaves out. A null `cfg`
// (config source unavailable) yields pure defaults. Bad values are logged and
// replaced by their default; bad routes are logged and skipped.
ServerOptions LoadServerOptions(const Config* cfg);

// Loads `path` and applies LoadServerOptions(). An empty path or an unreadable
// or malformed file logs a warning and falls back to defaults.
ServerOptions LoadServerOptionsFromFile(const std::string& path);

} // namespace chmesh::config
