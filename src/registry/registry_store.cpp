#include <chmesh/registry/registry_store.h>

#include <algorithm>
#include <mutex>

namespace chmesh::registry {

std::string_view InstanceStatusName(InstanceStatus s) {
    switch (s) {
        case InstanceStatus::up: return "UP";
        case InstanceStatus::down: return "DOWN";
    }
    return "UNKNOWN";
}

RegistryStore::RegistryStore(const Clock& clock) : clock_(clock) {}

chmesh::Status RegistryStore::Register(std::string_view service, std::string_view instance_id, Endpoint address) {
    if (service.empty()) {
        return chmesh::Status(chmesh::StatusCode::invalid_argument, "empty service name");
    }
    if (instance_id.empty()) {
        return chmesh::Status(chmesh::StatusCode::invalid_argument, "empty instance id");
    }

    // Read under the lock so the last writer of a key stores the latest time.
    std::unique_lock<std::shared_mutex> lk(mu_);
    auto now = clock_.Now();
    auto& instances = services_[std::string(service)];
    auto it = instances.find(instance_id);
    if (it == instances.end()) {
        InstanceRecord rec;
        rec.service = std::string(service);
        rec.instance_id = std::string(instance_id);
        rec.address = std::move(address);
        rec.status = InstanceStatus::up;
        rec.last_renewal_at = now;
        rec.registered_at = now;
        instances.emplace(rec.instance_id, std::move(rec));
        return chmesh::Status::Ok();
    }

    auto& rec = it->second;
    rec.address = std::move(address);
    rec.status = InstanceStatus::up;
    rec.last_renewal_at = now;
    return chmesh::Status::Ok();
}

chmesh::Status RegistryStore::Renew(std::string_view service, std::string_view instance_id) {
    std::unique_lock<std::shared_mutex> lk(mu_);
    auto now = clock_.Now();
    auto sit = services_.find(std::string(service));
    if (sit == services_.end()) {
        return chmesh::Status(chmesh::StatusCode::not_found, "service not registered");
    }
    auto it = sit->second.find(instance_id);
    if (it == sit->second.end()) {
        return chmesh::Status(chmesh::StatusCode::not_found, "instance not registered");
    }

    it->second.last_renewal_at = now;
    it->second.status = InstanceStatus::up;
    return chmesh::Status::Ok();
}

bool RegistryStore::Deregister(std::string_view service, std::string_view instance_id) {
    std::unique_lock<std::shared_mutex> lk(mu_);
    auto sit = services_.find(std::string(service));
    if (sit == services_.end()) {
        return false;
    }
    auto it = sit->second.find(instance_id);
    if (it == sit->second.end()) {
        return false;
    }
    sit->second.erase(it);
    if (sit->second.empty()) {
        services_.erase(sit);
    }
    return true;
}

std::vector<InstanceRecord> RegistryStore::ListHealthy(std::string_view service) const {
    std::vector<InstanceRecord> out;

    std::shared_lock<std::shared_mutex> lk(mu_);
    auto sit = services_.find(std::string(service));
    if (sit == services_.end()) {
        return out;
    }
    out.reserve(sit->second.size());
    for (const auto& [id, rec] : sit->second) {
        if (rec.healthy()) {
            out.push_back(rec);
        }
    }
    return out;
}

std::vector<InstanceRecord> RegistryStore::List(std::string_view service) const {
    std::vector<InstanceRecord> out;

    std::shared_lock<std::shared_mutex> lk(mu_);
    auto sit = services_.find(std::string(service));
    if (sit == services_.end()) {
        return out;
    }
    out.reserve(sit->second.size());
    for (const auto& [id, rec] : sit->second) {
        out.push_back(rec);
    }
    return out;
}

std::vector<std::string> RegistryStore::Services() const {
    std::vector<std::string> out;
    {
        std::shared_lock<std::shared_mutex> lk(mu_);
        out.reserve(services_.size());
        for (const auto& [name, instances] : services_) {
            out.push_back(name);
        }
    }
    std::sort(out.begin(), out.end());
    return out;
}

std::size_t RegistryStore::Size() const {
    std::shared_lock<std::shared_mutex> lk(mu_);
    std::size_t total = 0;
    for (const auto& [name, instances] : services_) {
        total += instances.size();
    }
    return total;
}

std::size_t RegistryStore::SweepExpired(std::chrono::steady_clock::time_point now, std::chrono::steady_clock::duration threshold) {
    SweepPolicy policy;
    policy.down_after = threshold;
    policy.evict_after = threshold;
    return Sweep(now, policy).evicted;
}

SweepStats RegistryStore::Sweep(std::chrono::steady_clock::time_point now, const SweepPolicy& policy) {
    SweepStats stats;

    std::unique_lock<std::shared_mutex> lk(mu_);
    for (auto sit = services_.begin(); sit != services_.end();) {
        auto& instances = sit->second;
        for (auto it = instances.begin(); it != instances.end();) {
            auto& rec = it->second;
            auto silent = now - rec.last_renewal_at;
            if (silent > policy.evict_after) {
                it = instances.erase(it);
                ++stats.evicted;
                continue;
            }
            if (silent > policy.down_after && rec.status == InstanceStatus::up) {
                rec.status = InstanceStatus::down;
                ++stats.marked_down;
            }
            if (rec.healthy()) {
                ++stats.remaining_up;
            } else {
                ++stats.remaining_down;
            }
            ++it;
        }

        if (instances.empty()) {
            sit = services_.erase(sit);
        } else {
            ++sit;
        }
    }
    return stats;
}

} // namespace chmesh::registry
