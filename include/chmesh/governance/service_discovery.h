#pragma once

#include <string_view>
#include <vector>

#include <chmesh/registry/instance.h>

namespace chmesh::governance {

// What the gateway needs from a registry: the currently selectable instances
// of a service. Empty is a normal answer, not an error.
class IServiceDiscovery {
public:
    virtual ~IServiceDiscovery() = default;

    // Thread-safe
    virtual std::vector<registry::InstanceRecord> Resolve(std::string_view service) const = 0;
};

} // namespace chmesh::governance
