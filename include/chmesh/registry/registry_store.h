#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <chmesh/core/clock.h>
#include <chmesh/core/status.h>
#include <chmesh/registry/instance.h>

namespace chmesh::registry {

struct SweepPolicy {
    // Silent for longer than this: flagged down, no longer listed as healthy.
    std::chrono::steady_clock::duration down_after{std::chrono::seconds(30)};
    // Silent for longer than this: removed.
    std::chrono::steady_clock::duration evict_after{std::chrono::seconds(90)};
};

struct SweepStats {
    std::size_t marked_down = 0;
    std::size_t evicted = 0;
    std::size_t remaining_up = 0;
    std::size_t remaining_down = 0;
};

// Authoritative in-memory directory: service name -> instance id -> record.
//
// All operations are thread-safe. Reads take a shared lock and return copies,
// so no caller ever holds a reference into the map. Writes to one
// (service, instance_id) key are linearizable.
class RegistryStore {
public:
    explicit RegistryStore(const Clock& clock);

    RegistryStore(const RegistryStore&) = delete;
    RegistryStore& operator=(const RegistryStore&) = delete;

    // Upsert. A re-registration replaces address and status in place and keeps registered_at.
    chmesh::Status Register(std::string_view service, std::string_view instance_id, Endpoint address);

    // not_found if the key is unknown; the caller is expected to register again.
    chmesh::Status Renew(std::string_view service, std::string_view instance_id);

    // Returns whether a record was removed.
    bool Deregister(std::string_view service, std::string_view instance_id);

    // Up instances only, ordered by instance id. Unknown service -> empty.
    std::vector<InstanceRecord> ListHealthy(std::string_view service) const;

    // Every record of the service, down ones included.
    std::vector<InstanceRecord> List(std::string_view service) const;

    std::vector<std::string> Services() const;
    std::size_t Size() const;

    // Removes every record with now - last_renewal_at > threshold. Returns the count removed.
    std::size_t SweepExpired(std::chrono::steady_clock::time_point now, std::chrono::steady_clock::duration threshold);

    // Two-phase sweep: flag down after policy.down_after, remove after policy.evict_after.
    SweepStats Sweep(std::chrono::steady_clock::time_point now, const SweepPolicy& policy);

    const Clock& clock() const { return clock_; }

private:
    using InstanceMap = std::map<std::string, InstanceRecord, std::less<>>;

    const Clock& clock_;

    mutable std::shared_mutex mu_;
    std::unordered_map<std::string, InstanceMap> services_;
};

} // namespace chmesh::registry
