#pragma once

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

#include <chmesh/core/status.h>
#include <chmesh/gateway/forwarder.h>
#include <chmesh/gateway/route.h>
#include <chmesh/governance/load_balancer.h>
#include <chmesh/governance/service_discovery.h>
#include <chmesh/http/router.h>
#include <chmesh/resilience/retry.h>

namespace chmesh::gateway {

struct GatewayOptions {
    int retry_budget = 1; // retries after the first attempt
    std::chrono::milliseconds forward_timeout{5000};
    std::chrono::milliseconds retry_backoff{0};
};

enum class RouteOutcome {
    responded = 0, // downstream answered, relayed as is
    not_found,     // no route matched (404)
    unavailable,   // no healthy instance (503)
    failed,        // every attempt failed (502)
    cancelled,     // caller went away during forwarding
};

std::string_view RouteOutcomeName(RouteOutcome o);

struct GatewayResult {
    RouteOutcome outcome = RouteOutcome::not_found;
    std::string route_id;
    std::string service;
    ForwardResponse response;                // set when responded
    std::vector<std::string> tried_instances; // in attempt order
    chmesh::Status last_error;

    int attempts() const { return static_cast<int>(tried_instances.size()); }
};

// Per-request routing state machine:
// MATCH -> RESOLVE -> SELECT -> FORWARD -> (RETRY -> SELECT)* -> RESPOND,
// terminating early in not_found, unavailable, failed or cancelled.
//
// Thread-safe; the route table is immutable and collaborators are thread-safe.
class Gateway {
public:
    Gateway(RouteTable routes,
            const chmesh::governance::IServiceDiscovery& discovery,
            chmesh::governance::ILoadBalancer& balancer,
            IForwarder& forwarder,
            GatewayOptions opts);

    GatewayResult Dispatch(const chmesh::http::Request& req) const;

    // Dispatch() plus translation into an HTTP response.
    void Handle(const chmesh::http::Request& req, chmesh::http::Response& resp) const;

    const RouteTable& routes() const { return routes_; }
    const GatewayOptions& options() const { return opts_; }

private:
    ForwardRequest BuildForwardRequest(const chmesh::http::Request& req, const RouteMatch& match) const;

    RouteTable routes_;
    const chmesh::governance::IServiceDiscovery& discovery_;
    chmesh::governance::ILoadBalancer& balancer_;
    IForwarder& forwarder_;
    GatewayOptions opts_;
    chmesh::resilience::RetryPolicy retry_;
};

} // namespace chmesh::gateway
