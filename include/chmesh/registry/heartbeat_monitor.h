#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <chmesh/registry/registry_store.h>
#include <chmesh/runtime/app.h>

namespace chmesh::registry {

struct HeartbeatOptions {
    // Tick period, and the silence after which an instance is flagged down.
    std::chrono::milliseconds interval{30000};
    // Silence after which an instance is removed. Clamped to >= interval.
    std::chrono::milliseconds eviction_threshold{90000};
};

// Periodic sweep of the registry, independent of request traffic.
class HeartbeatMonitor final : public chmesh::IService, public std::enable_shared_from_this<HeartbeatMonitor> {
public:
    HeartbeatMonitor(boost::asio::io_context& ioc, RegistryStore& store, HeartbeatOptions opts);

    void Start() override;
    void Stop() override;

    // One sweep at the store clock's current time. Never throws; a failed sweep
    // is logged and reported as empty stats.
    SweepStats Tick();

    const HeartbeatOptions& options() const { return opts_; }

private:
    void Schedule();

    RegistryStore& store_;
    HeartbeatOptions opts_;

    std::mutex timer_mu_;
    boost::asio::steady_timer timer_;
    std::atomic<bool> running_{false};
};

} // namespace chmesh::registry
