#include <chmesh/gateway/gateway.h>

#include <chmesh/core/log.h>
#include <chmesh/core/metrics.h>

#include <chjson/chjson.hpp>

#include <algorithm>
#include <thread>

namespace chmesh::gateway {
namespace {

namespace beast_http = boost::beast::http;

std::vector<registry::InstanceRecord> Untried(const std::vector<registry::InstanceRecord>& instances,
                                              const std::vector<std::string>& tried) {
    std::vector<registry::InstanceRecord> out;
    out.reserve(instances.size());
    for (const auto& rec : instances) {
        if (std::find(tried.begin(), tried.end(), rec.instance_id) == tried.end()) {
            out.push_back(rec);
        }
    }
    return out;
}

void CountOutcome(const GatewayResult& r) {
    chmesh::DefaultMetrics().CounterMetric(
        "gateway_requests_total",
        "Gateway requests by route and outcome",
        MetricLabels{{{"route", r.route_id.empty() ? "-" : r.route_id},
                      {"outcome", std::string(RouteOutcomeName(r.outcome))}}})
        .Inc(1);
}

std::string ErrorJson(std::string_view error, std::string_view detail) {
    chjson::value j(chjson::value::object{
        {"error", chjson::value(std::string(error))},
        {"detail", chjson::value(std::string(detail))},
    });
    return chjson::dump(j);
}

} // namespace

std::string_view RouteOutcomeName(RouteOutcome o) {
    switch (o) {
        case RouteOutcome::responded: return "responded";
        case RouteOutcome::not_found: return "not_found";
        case RouteOutcome::unavailable: return "unavailable";
        case RouteOutcome::failed: return "failed";
        case RouteOutcome::cancelled: return "cancelled";
    }
    return "unknown";
}

Gateway::Gateway(RouteTable routes,
                 const chmesh::governance::IServiceDiscovery& discovery,
                 chmesh::governance::ILoadBalancer& balancer,
                 IForwarder& forwarder,
                 GatewayOptions opts)
    : routes_(std::move(routes)),
      discovery_(discovery),
      balancer_(balancer),
      forwarder_(forwarder),
      opts_(opts),
      retry_(chmesh::resilience::RetryPolicy::FromBudget(opts.retry_budget, opts.retry_backoff)) {}

ForwardRequest Gateway::BuildForwardRequest(const chmesh::http::Request& req, const RouteMatch& match) const {
    ForwardRequest fwd;
    fwd.method = req.raw.method();
    fwd.target = match.forward_path;
    if (!req.query_string.empty()) {
        fwd.target.push_back('?');
        fwd.target.append(req.query_string);
    }
    fwd.body = req.raw.body();
    fwd.cancelled = req.client_gone;

    std::vector<std::string> per_hop;
    for (const auto& field : req.raw) {
        if (field.name() == beast_http::field::connection) {
            auto tokens = chmesh::http::ConnectionTokens(std::string_view(field.value().data(), field.value().size()));
            per_hop.insert(per_hop.end(), tokens.begin(), tokens.end());
        }
    }

    std::string forwarded_for;
    for (const auto& field : req.raw) {
        std::string name(field.name_string().data(), field.name_string().size());
        std::string value(field.value().data(), field.value().size());
        if (chmesh::http::IsHopByHopHeader(name) || field.name() == beast_http::field::host ||
            chmesh::http::NamedIn(per_hop, name)) {
            continue;
        }
        if (chmesh::http::HeaderNameEquals(name, "x-forwarded-for")) {
            forwarded_for = std::move(value);
            continue;
        }
        fwd.headers.emplace_back(std::move(name), std::move(value));
    }

    if (!req.remote_address.empty()) {
        forwarded_for = forwarded_for.empty() ? req.remote_address : forwarded_for + ", " + req.remote_address;
    }
    if (!forwarded_for.empty()) {
        fwd.headers.emplace_back("X-Forwarded-For", std::move(forwarded_for));
    }
    if (match.route->strip_prefix && !match.prefix.empty()) {
        fwd.headers.emplace_back("X-Forwarded-Prefix", match.prefix);
    }
    return fwd;
}

GatewayResult Gateway::Dispatch(const chmesh::http::Request& req) const {
    GatewayResult result;

    // MATCH
    auto match = routes_.Match(req.path);
    if (match.route == nullptr) {
        result.outcome = RouteOutcome::not_found;
        result.last_error = chmesh::Status(chmesh::StatusCode::not_found, "no route matches " + req.path);
        CountOutcome(result);
        return result;
    }
    result.route_id = match.route->id;
    result.service = match.route->service;

    // RESOLVE
    auto instances = discovery_.Resolve(match.route->service);
    if (instances.empty()) {
        result.outcome = RouteOutcome::unavailable;
        result.last_error = chmesh::Status(chmesh::StatusCode::unavailable, "no healthy instance of " + result.service);
        chmesh::log::warn("Route {}: service {} has no healthy instance", result.route_id, result.service);
        CountOutcome(result);
        return result;
    }

    auto fwd = BuildForwardRequest(req, match);
    auto& latency = chmesh::DefaultMetrics().HistogramMetric(
        "gateway_forward_ms",
        "Downstream call latency (ms)",
        {1, 2, 5, 10, 25, 50, 100, 250, 500, 1000, 5000},
        MetricLabels{{{"service", result.service}}});

    for (int attempt = 1; attempt <= retry_.max_attempts(); ++attempt) {
        // SELECT, never reusing an instance that already failed this request
        auto candidates = Untried(instances, result.tried_instances);
        auto picked = balancer_.Pick(result.service, candidates);
        if (!picked.ok()) {
            if (result.tried_instances.empty()) {
                result.outcome = RouteOutcome::unavailable;
                result.last_error = picked.status();
                CountOutcome(result);
                return result;
            }
            break;
        }
        const auto& target = picked.value();

        if (auto backoff = retry_.BackoffBeforeAttempt(attempt); backoff.count() > 0) {
            std::this_thread::sleep_for(backoff);
        }

        // FORWARD
        result.tried_instances.push_back(target.instance_id);
        auto start = std::chrono::steady_clock::now();
        auto r = forwarder_.Forward(target, fwd, opts_.forward_timeout);
        latency.Observe(std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count());

        if (r.ok()) {
            // RESPOND
            result.outcome = RouteOutcome::responded;
            result.response = std::move(r.value());
            CountOutcome(result);
            return result;
        }

        result.last_error = r.status();
        if (r.status().code() == chmesh::StatusCode::cancelled) {
            chmesh::log::info("Route {}: caller disconnected, dropped call to {}", result.route_id, target.instance_id);
            result.outcome = RouteOutcome::cancelled;
            CountOutcome(result);
            return result;
        }

        // RETRY
        chmesh::log::warn("Route {}: attempt {}/{} to {} ({}) failed: {}",
            result.route_id, attempt, retry_.max_attempts(), target.instance_id,
            target.address.ToString(), r.status().ToString());
    }

    result.outcome = RouteOutcome::failed;
    chmesh::log::error("Route {}: giving up after {} attempt(s): {}",
        result.route_id, result.attempts(), result.last_error.ToString());
    CountOutcome(result);
    return result;
}

void Gateway::Handle(const chmesh::http::Request& req, chmesh::http::Response& resp) const {
    auto result = Dispatch(req);
    switch (result.outcome) {
        case RouteOutcome::responded:
            resp.status = result.response.status;
            resp.headers = std::move(result.response.headers);
            resp.body = std::move(result.response.body);
            resp.content_type = std::move(result.response.content_type);
            return;
        case RouteOutcome::not_found:
            resp.SetJson(404, ErrorJson("route_not_matched", req.path));
            return;
        case RouteOutcome::unavailable:
            resp.SetJson(503, ErrorJson("service_unavailable", result.service));
            return;
        case RouteOutcome::failed:
            resp.SetJson(502, ErrorJson("bad_gateway", result.last_error.ToString()));
            return;
        case RouteOutcome::cancelled:
            // Nobody is listening; 499 only shows up in metrics.
            resp.SetJson(499, ErrorJson("client_closed_request", result.service));
            return;
    }
}

} // namespace chmesh::gateway
