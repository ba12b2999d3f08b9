#include <chtest.hpp>

#include <chmesh/core/clock.h>
#include <chmesh/registry/registry_store.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <thread>
#include <vector>

using chmesh::ManualClock;
using chmesh::registry::Endpoint;
using chmesh::registry::InstanceStatus;
using chmesh::registry::RegistryStore;
using chmesh::registry::SweepPolicy;
using namespace std::chrono_literals;

namespace {

// Every reading is one tick later than the previous one.
class TickingClock final : public chmesh::Clock {
public:
    time_point Now() const override {
        return time_point{} + std::chrono::nanoseconds(ticks_.fetch_add(1, std::memory_order_relaxed) + 1);
    }

    time_point Last() const { return time_point{} + std::chrono::nanoseconds(ticks_.load(std::memory_order_relaxed)); }

private:
    mutable std::atomic<std::int64_t> ticks_{0};
};

} // namespace

TEST_CASE("RegistryStore register then list healthy") {
    ManualClock clock;
    RegistryStore store(clock);

    REQUIRE(store.Register("catalog", "a", Endpoint{"host1", 8081}).ok());
    REQUIRE(store.Register("catalog", "b", Endpoint{"host1", 8082}).ok());

    auto healthy = store.ListHealthy("catalog");
    REQUIRE(healthy.size() == 2);
    REQUIRE(healthy[0].instance_id == "a");
    REQUIRE(healthy[1].instance_id == "b");
    REQUIRE(healthy[0].address.port == 8081);
    REQUIRE(healthy[0].status == InstanceStatus::up);
}

TEST_CASE("RegistryStore unknown service lists empty") {
    ManualClock clock;
    RegistryStore store(clock);

    REQUIRE(store.ListHealthy("nope").empty());
    REQUIRE(store.List("nope").empty());
}

TEST_CASE("RegistryStore re-register overwrites in place") {
    ManualClock clock;
    RegistryStore store(clock);

    REQUIRE(store.Register("catalog", "a", Endpoint{"host1", 8081}).ok());
    auto first = store.List("catalog").at(0);

    clock.Advance(5s);
    REQUIRE(store.Register("catalog", "a", Endpoint{"host2", 9090}).ok());

    auto all = store.List("catalog");
    REQUIRE(all.size() == 1);
    REQUIRE((all[0].address == Endpoint{"host2", 9090}));
    REQUIRE(all[0].registered_at == first.registered_at);
    REQUIRE(all[0].last_renewal_at == first.last_renewal_at + 5s);
    REQUIRE(store.Size() == 1);
}

TEST_CASE("RegistryStore rejects empty keys") {
    ManualClock clock;
    RegistryStore store(clock);

    REQUIRE(store.Register("", "a", Endpoint{"h", 1}).code() == chmesh::StatusCode::invalid_argument);
    REQUIRE(store.Register("svc", "", Endpoint{"h", 1}).code() == chmesh::StatusCode::invalid_argument);
    REQUIRE(store.Size() == 0);
}

TEST_CASE("RegistryStore renew of unknown key is not_found") {
    ManualClock clock;
    RegistryStore store(clock);

    auto st = store.Renew("catalog", "a");
    REQUIRE(!st.ok());
    REQUIRE(st.code() == chmesh::StatusCode::not_found);

    REQUIRE(store.Register("catalog", "a", Endpoint{"host1", 8081}).ok());
    REQUIRE(store.Renew("catalog", "b").code() == chmesh::StatusCode::not_found);
    REQUIRE(store.Size() == 1);
}

TEST_CASE("RegistryStore renew refreshes timestamp") {
    ManualClock clock;
    RegistryStore store(clock);

    REQUIRE(store.Register("catalog", "a", Endpoint{"host1", 8081}).ok());
    auto before = store.List("catalog").at(0).last_renewal_at;

    clock.Advance(10s);
    REQUIRE(store.Renew("catalog", "a").ok());
    REQUIRE(store.List("catalog").at(0).last_renewal_at == before + 10s);
}

TEST_CASE("RegistryStore deregister removes and is a no-op when absent") {
    ManualClock clock;
    RegistryStore store(clock);

    REQUIRE(store.Register("catalog", "a", Endpoint{"host1", 8081}).ok());
    REQUIRE(store.Deregister("catalog", "a"));
    REQUIRE(!store.Deregister("catalog", "a"));
    REQUIRE(!store.Deregister("other", "x"));
    REQUIRE(store.ListHealthy("catalog").empty());
    REQUIRE(store.Services().empty());

    // A deregistered key cannot be renewed back to life.
    REQUIRE(store.Renew("catalog", "a").code() == chmesh::StatusCode::not_found);
}

TEST_CASE("RegistryStore last operation wins on one key") {
    ManualClock clock;
    RegistryStore store(clock);

    REQUIRE(store.Register("catalog", "a", Endpoint{"h", 1}).ok());
    REQUIRE(store.Renew("catalog", "a").ok());
    REQUIRE(store.Deregister("catalog", "a"));
    REQUIRE(store.Register("catalog", "a", Endpoint{"h", 2}).ok());
    REQUIRE(store.Register("catalog", "a", Endpoint{"h", 3}).ok());

    auto all = store.List("catalog");
    REQUIRE(all.size() == 1);
    REQUIRE(all[0].address.port == 3);
}

TEST_CASE("RegistryStore sweep flags down then evicts") {
    ManualClock clock;
    RegistryStore store(clock);
    SweepPolicy policy{30s, 90s};

    REQUIRE(store.Register("catalog", "a", Endpoint{"host1", 8081}).ok());
    REQUIRE(store.Register("catalog", "b", Endpoint{"host1", 8082}).ok());

    clock.Advance(31s);
    REQUIRE(store.Renew("catalog", "b").ok());

    auto stats = store.Sweep(clock.Now(), policy);
    REQUIRE(stats.marked_down == 1);
    REQUIRE(stats.evicted == 0);
    REQUIRE(stats.remaining_up == 1);
    REQUIRE(stats.remaining_down == 1);

    auto healthy = store.ListHealthy("catalog");
    REQUIRE(healthy.size() == 1);
    REQUIRE(healthy[0].instance_id == "b");
    REQUIRE(store.List("catalog").size() == 2);

    clock.Advance(60s); // a silent for 91s
    stats = store.Sweep(clock.Now(), policy);
    REQUIRE(stats.evicted == 1);
    REQUIRE(store.List("catalog").size() == 1);
}

TEST_CASE("RegistryStore renew brings a down instance back up") {
    ManualClock clock;
    RegistryStore store(clock);

    REQUIRE(store.Register("catalog", "a", Endpoint{"host1", 8081}).ok());
    clock.Advance(40s);
    store.Sweep(clock.Now(), SweepPolicy{30s, 90s});
    REQUIRE(store.ListHealthy("catalog").empty());

    REQUIRE(store.Renew("catalog", "a").ok());
    REQUIRE(store.ListHealthy("catalog").size() == 1);
}

TEST_CASE("RegistryStore SweepExpired uses a strict threshold") {
    ManualClock clock;
    RegistryStore store(clock);

    REQUIRE(store.Register("catalog", "a", Endpoint{"host1", 8081}).ok());
    clock.Advance(90s);
    REQUIRE(store.SweepExpired(clock.Now(), 90s) == 0);
    REQUIRE(store.ListHealthy("catalog").size() == 1);

    clock.Advance(1ms);
    REQUIRE(store.SweepExpired(clock.Now(), 90s) == 1);
    REQUIRE(store.Size() == 0);
}

TEST_CASE("RegistryStore concurrent writers and readers keep one record per key") {
    ManualClock clock;
    RegistryStore store(clock);

    constexpr int kThreads = 8;
    constexpr int kOps = 500;
    std::atomic<int> torn{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&store, &torn, t] {
            for (int i = 0; i < kOps; ++i) {
                auto id = "i" + std::to_string(i % 10);
                (void)store.Register("svc", id, Endpoint{"h", static_cast<std::uint16_t>(t + 1)});
                (void)store.Renew("svc", id);
                for (const auto& rec : store.ListHealthy("svc")) {
                    if (rec.service != "svc" || rec.instance_id.empty() || rec.address.host != "h") {
                        torn.fetch_add(1);
                    }
                }
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    REQUIRE(torn.load() == 0);
    REQUIRE(store.Size() == 10);
    REQUIRE(store.ListHealthy("svc").size() == 10);
}

TEST_CASE("RegistryStore concurrent renewals leave the latest timestamp") {
    TickingClock clock;
    RegistryStore store(clock);
    REQUIRE(store.Register("catalog", "a", Endpoint{"host1", 8081}).ok());

    std::atomic<int> failures{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&store, &failures] {
            for (int i = 0; i < 500; ++i) {
                if (!store.Renew("catalog", "a").ok()) {
                    failures.fetch_add(1);
                }
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    REQUIRE(failures.load() == 0);
    auto all = store.List("catalog");
    REQUIRE(all.size() == 1);
    REQUIRE(all[0].last_renewal_at == clock.Last());
}
