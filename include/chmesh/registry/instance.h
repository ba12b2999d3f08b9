#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace chmesh::registry {

struct Endpoint {
    std::string host;
    std::uint16_t port = 0;

    std::string ToString() const { return host + ":" + std::to_string(port); }

    bool operator==(const Endpoint& o) const { return host == o.host && port == o.port; }
};

enum class InstanceStatus {
    up = 0,
    down, // missed a heartbeat, kept until evicted
};

std::string_view InstanceStatusName(InstanceStatus s);

struct InstanceRecord {
    std::string service;
    std::string instance_id;
    Endpoint address;
    InstanceStatus status = InstanceStatus::up;
    std::chrono::steady_clock::time_point last_renewal_at{};
    std::chrono::steady_clock::time_point registered_at{};

    bool healthy() const { return status == InstanceStatus::up; }
};

} // namespace chmesh::registry
