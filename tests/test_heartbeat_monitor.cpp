#include <chtest.hpp>

#include <chmesh/core/clock.h>
#include <chmesh/registry/heartbeat_monitor.h>
#include <chmesh/registry/registry_store.h>

#include <boost/asio/io_context.hpp>

#include <chrono>
#include <memory>

using chmesh::ManualClock;
using chmesh::registry::Endpoint;
using chmesh::registry::HeartbeatMonitor;
using chmesh::registry::HeartbeatOptions;
using chmesh::registry::RegistryStore;
using namespace std::chrono_literals;

namespace {

HeartbeatOptions Defaults() {
    HeartbeatOptions opts;
    opts.interval = 30s;
    opts.eviction_threshold = 90s;
    return opts;
}

} // namespace

TEST_CASE("HeartbeatMonitor excludes a silent instance after one interval") {
    boost::asio::io_context ioc;
    ManualClock clock;
    RegistryStore store(clock);
    auto monitor = std::make_shared<HeartbeatMonitor>(ioc, store, Defaults());

    REQUIRE(store.Register("catalog", "a", Endpoint{"host1", 8081}).ok());
    REQUIRE(store.Register("catalog", "b", Endpoint{"host1", 8082}).ok());

    clock.Advance(29s);
    REQUIRE(store.Renew("catalog", "b").ok());
    clock.Advance(2s); // a silent 31s, b silent 2s

    auto stats = monitor->Tick();
    REQUIRE(stats.marked_down == 1);

    auto healthy = store.ListHealthy("catalog");
    REQUIRE(healthy.size() == 1);
    REQUIRE(healthy[0].instance_id == "b");
    REQUIRE(store.List("catalog").size() == 2);
}

TEST_CASE("HeartbeatMonitor keeps an instance renewed just before expiry") {
    boost::asio::io_context ioc;
    ManualClock clock;
    RegistryStore store(clock);
    auto monitor = std::make_shared<HeartbeatMonitor>(ioc, store, Defaults());

    REQUIRE(store.Register("catalog", "a", Endpoint{"host1", 8081}).ok());
    clock.Advance(29s);
    REQUIRE(store.Renew("catalog", "a").ok());
    clock.Advance(29s);

    monitor->Tick();
    REQUIRE(store.ListHealthy("catalog").size() == 1);
}

TEST_CASE("HeartbeatMonitor removes an instance after the eviction threshold") {
    boost::asio::io_context ioc;
    ManualClock clock;
    RegistryStore store(clock);
    auto monitor = std::make_shared<HeartbeatMonitor>(ioc, store, Defaults());

    REQUIRE(store.Register("catalog", "a", Endpoint{"host1", 8081}).ok());

    for (int tick = 0; tick < 3; ++tick) {
        clock.Advance(30s);
        monitor->Tick();
    }
    // 90s is not beyond the threshold yet: flagged down, still present.
    REQUIRE(store.ListHealthy("catalog").empty());
    REQUIRE(store.List("catalog").size() == 1);

    clock.Advance(30s);
    auto stats = monitor->Tick();
    REQUIRE(stats.evicted == 1);
    REQUIRE(store.Size() == 0);
    REQUIRE(store.Renew("catalog", "a").code() == chmesh::StatusCode::not_found);
}

TEST_CASE("HeartbeatMonitor clamps an eviction threshold below the interval") {
    boost::asio::io_context ioc;
    ManualClock clock;
    RegistryStore store(clock);

    HeartbeatOptions opts;
    opts.interval = 10s;
    opts.eviction_threshold = 1s;
    auto monitor = std::make_shared<HeartbeatMonitor>(ioc, store, opts);

    REQUIRE(monitor->options().eviction_threshold == 10s);
}

TEST_CASE("HeartbeatMonitor ticks on its timer") {
    boost::asio::io_context ioc;
    ManualClock clock;
    RegistryStore store(clock);

    HeartbeatOptions opts;
    opts.interval = 10ms;
    opts.eviction_threshold = 10ms;
    auto monitor = std::make_shared<HeartbeatMonitor>(ioc, store, opts);

    REQUIRE(store.Register("catalog", "a", Endpoint{"host1", 8081}).ok());
    clock.Advance(1s);

    monitor->Start();
    ioc.run_for(200ms);
    monitor->Stop();

    REQUIRE(store.Size() == 0);
}
