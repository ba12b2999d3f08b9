#include <chmesh/config/options.h>
#include <chmesh/core/clock.h>
#include <chmesh/core/log.h>
#include <chmesh/core/metrics.h>
#include <chmesh/gateway/forwarder.h>
#include <chmesh/gateway/gateway.h>
#include <chmesh/governance/load_balancer.h>
#include <chmesh/http/http_server.h>
#include <chmesh/http/router.h>
#include <chmesh/registry/heartbeat_monitor.h>
#include <chmesh/registry/registry_service.h>
#include <chmesh/registry/registry_store.h>
#include <chmesh/runtime/app.h>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>

// Registry listener, gateway listener and heartbeat monitor in one process.
//
//   chmesh_server --config chmesh.json [--log debug] [--threads 4]
int main(int argc, char** argv) {
    std::string config_path;
    std::string log_override;
    int threads_override = -1;

    for (int i = 1; i < argc; ++i) {
        std::string_view a(argv[i]);
        if (a == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (a == "--log" && i + 1 < argc) {
            log_override = argv[++i];
        } else if (a == "--threads" && i + 1 < argc) {
            threads_override = std::atoi(argv[++i]);
        } else {
            std::cerr << "usage: chmesh_server [--config PATH] [--log LEVEL] [--threads N]\n";
            return 2;
        }
    }

    chmesh::log::Init(log_override.empty() ? "info" : log_override);
    auto opt = chmesh::config::LoadServerOptionsFromFile(config_path);

    chmesh::AppOptions app_opt;
    app_opt.io_threads = threads_override >= 0 ? static_cast<std::size_t>(threads_override) : opt.io_threads;
    app_opt.log_level = log_override.empty() ? opt.log_level : log_override;
    chmesh::App app(app_opt);

    auto routes = chmesh::gateway::RouteTable::Build(opt.routes);
    if (!routes.ok()) {
        chmesh::log::error("Route table rejected: {}", routes.status().ToString());
        return 1;
    }
    for (const auto& r : routes.value().routes()) {
        chmesh::log::info("Route {}: {} -> {}{}", r.id, r.path, r.service, r.strip_prefix ? " (strip prefix)" : "");
    }

    chmesh::registry::RegistryStore store(chmesh::SystemClock());
    chmesh::registry::RegistrationService registration(store);
    chmesh::registry::QueryService query(store);

    auto monitor = std::make_shared<chmesh::registry::HeartbeatMonitor>(app.Io().Next(), store, opt.heartbeat);

    chmesh::http::Router registry_router;
    chmesh::registry::MountRegistryApi(registry_router, registration, query);
    registry_router.Get("/health", [](const chmesh::http::Request&, chmesh::http::Response& resp) {
        resp.status = 200;
        resp.body = "ok";
    });
    registry_router.Get("/metrics", [](const chmesh::http::Request&, chmesh::http::Response& resp) {
        resp.status = 200;
        resp.content_type = "text/plain; version=0.0.4; charset=utf-8";
        resp.body = chmesh::DefaultMetrics().ToPrometheusText();
    });

    auto balancer = chmesh::governance::MakeLoadBalancer(opt.load_balancer);
    if (!balancer) {
        chmesh::log::error("Unknown load balancer {}", opt.load_balancer);
        return 1;
    }
    chmesh::gateway::HttpForwarder forwarder;
    chmesh::gateway::Gateway gateway(std::move(routes).value(), query, *balancer, forwarder, opt.gateway);

    chmesh::http::Router gateway_router;
    gateway_router.Fallback([&gateway](const chmesh::http::Request& req, chmesh::http::Response& resp) {
        gateway.Handle(req, resp);
    });

    app.AddService(monitor);
    app.AddService(std::make_shared<chmesh::http::HttpServer>(
        app.Io(), "registry", opt.registry_listen, std::move(registry_router)));
    app.AddService(std::make_shared<chmesh::http::HttpServer>(
        app.Io(), "gateway", opt.gateway_listen, std::move(gateway_router), opt.max_body_bytes));

    chmesh::log::info("Gateway: {} route(s), load balancer {}, retry budget {}, forward timeout {}ms",
        gateway.routes().size(), opt.load_balancer, opt.gateway.retry_budget, opt.gateway.forward_timeout.count());
    chmesh::log::info("Press Ctrl+C to stop.");
    return app.Run();
}
