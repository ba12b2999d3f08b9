#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <chmesh/core/status.h>
#include <chmesh/governance/service_discovery.h>
#include <chmesh/registry/registry_store.h>

namespace chmesh::http {
class Router;
}

namespace chmesh::registry {

struct RegisterRequest {
    std::string service;
    std::string instance_id; // optional, defaults to "host:port"
    std::string host;
    int port = 0;
};

// Boundary used by backend instances. A renewal of an unknown key is reported
// as not_found and never recreates the record.
class RegistrationService {
public:
    explicit RegistrationService(RegistryStore& store) : store_(store) {}

    // Returns the effective instance id.
    chmesh::Result<std::string> Register(const RegisterRequest& req);
    chmesh::Status Renew(std::string_view service, std::string_view instance_id);
    void Deregister(std::string_view service, std::string_view instance_id);

private:
    RegistryStore& store_;
};

// Boundary used by the gateway.
class QueryService final : public chmesh::governance::IServiceDiscovery {
public:
    explicit QueryService(const RegistryStore& store) : store_(store) {}

    std::vector<InstanceRecord> Resolve(std::string_view service) const override;

    std::vector<InstanceRecord> ListAll(std::string_view service) const { return store_.List(service); }
    std::vector<std::string> Services() const { return store_.Services(); }

private:
    const RegistryStore& store_;
};

// Mounts the JSON endpoints:
//   POST /registry/register    {"service","instance_id"?,"host","port"}
//   POST /registry/renew       {"service","instance_id"}
//   POST /registry/deregister  {"service","instance_id"}
//   GET  /registry/instances?service=NAME[&all=true]
//   GET  /registry/services
void MountRegistryApi(chmesh::http::Router& router, RegistrationService& registration, const QueryService& query);

} // namespace chmesh::registry
