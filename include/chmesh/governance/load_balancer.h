#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <string_view>
#include <vector>

#include <chmesh/core/status.h>
#include <chmesh/registry/instance.h>

namespace chmesh::governance {

class ILoadBalancer {
public:
    virtual ~ILoadBalancer() = default;

    // Thread-safe. An empty list yields StatusCode::unavailable.
    virtual chmesh::Result<registry::InstanceRecord> Pick(
        std::string_view service, const std::vector<registry::InstanceRecord>& instances) = 0;
};

// Per-service monotonic cursor modulo the current list size. The cursor is not
// tied to instance identity, so membership changes shift the rotation.
class RoundRobinLoadBalancer final : public ILoadBalancer {
public:
    chmesh::Result<registry::InstanceRecord> Pick(
        std::string_view service, const std::vector<registry::InstanceRecord>& instances) override;

private:
    std::mutex mu_;
    std::map<std::string, std::size_t, std::less<>> rr_; // per-service cursor
};

class RandomLoadBalancer final : public ILoadBalancer {
public:
    RandomLoadBalancer();

    chmesh::Result<registry::InstanceRecord> Pick(
        std::string_view service, const std::vector<registry::InstanceRecord>& instances) override;

private:
    std::mutex mu_;
    std::mt19937_64 gen_;
};

// "round_robin" or "random"; nullptr for anything else.
std::unique_ptr<ILoadBalancer> MakeLoadBalancer(std::string_view name);

} // namespace chmesh::governance
