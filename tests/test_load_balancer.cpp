#include <chtest.hpp>

#include <chmesh/governance/load_balancer.h>

#include <set>
#include <string>
#include <vector>

using chmesh::governance::MakeLoadBalancer;
using chmesh::governance::RandomLoadBalancer;
using chmesh::governance::RoundRobinLoadBalancer;
using chmesh::registry::InstanceRecord;

namespace {

std::vector<InstanceRecord> Instances(int n) {
    std::vector<InstanceRecord> out;
    for (int i = 0; i < n; ++i) {
        InstanceRecord rec;
        rec.service = "catalog";
        rec.instance_id = "i" + std::to_string(i);
        rec.address.host = "host";
        rec.address.port = static_cast<std::uint16_t>(8000 + i);
        out.push_back(rec);
    }
    return out;
}

} // namespace

TEST_CASE("RoundRobin visits each instance exactly once per cycle") {
    RoundRobinLoadBalancer lb;
    auto instances = Instances(5);

    std::set<std::string> seen;
    for (int i = 0; i < 5; ++i) {
        auto r = lb.Pick("catalog", instances);
        REQUIRE(r.ok());
        seen.insert(r.value().instance_id);
    }
    REQUIRE(seen.size() == 5);
}

TEST_CASE("RoundRobin alternates between two instances") {
    RoundRobinLoadBalancer lb;
    auto instances = Instances(2);

    auto a = lb.Pick("catalog", instances).value().instance_id;
    auto b = lb.Pick("catalog", instances).value().instance_id;
    auto c = lb.Pick("catalog", instances).value().instance_id;
    REQUIRE(a != b);
    REQUIRE(a == c);
}

TEST_CASE("RoundRobin keeps a cursor per service") {
    RoundRobinLoadBalancer lb;
    auto instances = Instances(3);

    REQUIRE(lb.Pick("catalog", instances).value().instance_id == "i0");
    REQUIRE(lb.Pick("orders", instances).value().instance_id == "i0");
    REQUIRE(lb.Pick("catalog", instances).value().instance_id == "i1");
    REQUIRE(lb.Pick("orders", instances).value().instance_id == "i1");
}

TEST_CASE("Empty target set is unavailable") {
    RoundRobinLoadBalancer rr;
    RandomLoadBalancer rnd;
    std::vector<InstanceRecord> none;

    auto r1 = rr.Pick("catalog", none);
    REQUIRE(!r1.ok());
    REQUIRE(r1.status().code() == chmesh::StatusCode::unavailable);

    auto r2 = rnd.Pick("catalog", none);
    REQUIRE(!r2.ok());
    REQUIRE(r2.status().code() == chmesh::StatusCode::unavailable);
}

TEST_CASE("Random picks come from the list") {
    RandomLoadBalancer lb;
    auto instances = Instances(3);
    for (int i = 0; i < 50; ++i) {
        auto r = lb.Pick("catalog", instances);
        REQUIRE(r.ok());
        REQUIRE(r.value().address.port >= 8000);
        REQUIRE(r.value().address.port <= 8002);
    }
}

TEST_CASE("MakeLoadBalancer knows its names") {
    REQUIRE(MakeLoadBalancer("round_robin") != nullptr);
    REQUIRE(MakeLoadBalancer("random") != nullptr);
    REQUIRE(MakeLoadBalancer("least_conn") == nullptr);
}
