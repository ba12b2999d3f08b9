#include <chmesh/governance/load_balancer.h>

namespace chmesh::governance {
namespace {

chmesh::Status EmptyTargetSet(std::string_view service) {
    return chmesh::Status(chmesh::StatusCode::unavailable, "no healthy instance of " + std::string(service));
}

} // namespace

chmesh::Result<registry::InstanceRecord> RoundRobinLoadBalancer::Pick(
    std::string_view service, const std::vector<registry::InstanceRecord>& instances) {
    if (instances.empty()) {
        return EmptyTargetSet(service);
    }

    std::lock_guard<std::mutex> lk(mu_);
    auto it = rr_.find(service);
    if (it == rr_.end()) {
        it = rr_.emplace(std::string(service), 0).first;
    }
    auto idx = it->second++ % instances.size();
    return instances[idx];
}

RandomLoadBalancer::RandomLoadBalancer() : gen_(std::random_device{}()) {}

chmesh::Result<registry::InstanceRecord> RandomLoadBalancer::Pick(
    std::string_view service, const std::vector<registry::InstanceRecord>& instances) {
    if (instances.empty()) {
        return EmptyTargetSet(service);
    }

    std::lock_guard<std::mutex> lk(mu_);
    std::uniform_int_distribution<std::size_t> dist(0, instances.size() - 1);
    return instances[dist(gen_)];
}

std::unique_ptr<ILoadBalancer> MakeLoadBalancer(std::string_view name) {
    if (name == "round_robin") {
        return std::make_unique<RoundRobinLoadBalancer>();
    }
    if (name == "random") {
        return std::make_unique<RandomLoadBalancer>();
    }
    return nullptr;
}

} // namespace chmesh::governance
