#include <chmesh/registry/heartbeat_monitor.h>

#include <chmesh/core/log.h>
#include <chmesh/core/metrics.h>

#include <exception>

namespace chmesh::registry {
namespace {

void PublishSweep(const SweepStats& stats) {
    auto& metrics = chmesh::DefaultMetrics();
    metrics.GaugeMetric("registry_instances", "Registered instances by status",
        MetricLabels{{{"status", "up"}}}).Set(static_cast<double>(stats.remaining_up));
    metrics.GaugeMetric("registry_instances", "Registered instances by status",
        MetricLabels{{{"status", "down"}}}).Set(static_cast<double>(stats.remaining_down));
    metrics.CounterMetric("registry_evictions_total", "Instances removed for missing heartbeats")
        .Inc(static_cast<std::int64_t>(stats.evicted));
}

} // namespace

HeartbeatMonitor::HeartbeatMonitor(boost::asio::io_context& ioc, RegistryStore& store, HeartbeatOptions opts)
    : store_(store), opts_(opts), timer_(ioc) {
    if (opts_.interval.count() <= 0) {
        opts_.interval = std::chrono::milliseconds(30000);
    }
    if (opts_.eviction_threshold < opts_.interval) {
        chmesh::log::warn("eviction threshold {}ms below heartbeat interval {}ms, using the interval",
            opts_.eviction_threshold.count(), opts_.interval.count());
        opts_.eviction_threshold = opts_.interval;
    }
}

void HeartbeatMonitor::Start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        return;
    }
    chmesh::log::info("Heartbeat monitor started (interval={}ms, eviction={}ms)",
        opts_.interval.count(), opts_.eviction_threshold.count());
    Schedule();
}

void HeartbeatMonitor::Stop() {
    bool expected = true;
    if (!running_.compare_exchange_strong(expected, false)) {
        return;
    }
    std::lock_guard<std::mutex> lk(timer_mu_);
    timer_.cancel();
}

void HeartbeatMonitor::Schedule() {
    std::lock_guard<std::mutex> lk(timer_mu_);
    if (!running_.load(std::memory_order_acquire)) {
        return;
    }
    timer_.expires_after(opts_.interval);
    timer_.async_wait([self = shared_from_this()](const boost::system::error_code& ec) {
        if (ec || !self->running_.load(std::memory_order_acquire)) {
            return;
        }
        self->Tick();
        self->Schedule();
    });
}

SweepStats HeartbeatMonitor::Tick() {
    SweepPolicy policy;
    policy.down_after = opts_.interval;
    policy.evict_after = opts_.eviction_threshold;

    try {
        auto stats = store_.Sweep(store_.clock().Now(), policy);
        if (stats.marked_down > 0 || stats.evicted > 0) {
            chmesh::log::info("Heartbeat sweep: {} flagged down, {} evicted, {} up, {} down",
                stats.marked_down, stats.evicted, stats.remaining_up, stats.remaining_down);
        }
        PublishSweep(stats);
        return stats;
    } catch (const std::exception& e) {
        chmesh::log::error("Heartbeat sweep failed, retrying next tick: {}", e.what());
    }
    return SweepStats{};
}

} // namespace chmesh::registry
