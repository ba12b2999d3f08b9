#include <chmesh/config/options.h>

#include <chmesh/core/log.h>

#include <unordered_set>

namespace chmesh::config {
namespace {

// Missing keys keep the default silently; present but invalid ones warn.
template <class T>
bool Present(const chmesh::Result<T>& r, std::string_view key) {
    if (r.ok()) {
        return true;
    }
    if (r.status().code() != chmesh::StatusCode::not_found) {
        chmesh::log::warn("config {}: {}, using default", key, r.status().message());
    }
    return false;
}

void ReadListen(const Config& cfg, std::string_view key, chmesh::http::ListenAddress& out) {
    auto r = cfg.GetString(key);
    if (!Present(r, key)) {
        return;
    }
    chmesh::http::ListenAddress parsed;
    if (!chmesh::http::ParseListenAddress(r.value(), parsed)) {
        chmesh::log::warn("config {}: expected host:port, got '{}', using default", key, r.value());
        return;
    }
    out = parsed;
}

void ReadMillis(const Config& cfg, std::string_view key, std::chrono::milliseconds& out, int min_value) {
    auto r = cfg.GetInt(key);
    if (!Present(r, key)) {
        return;
    }
    if (r.value() < min_value) {
        chmesh::log::warn("config {}: {} is below {}, using default", key, r.value(), min_value);
        return;
    }
    out = std::chrono::milliseconds(r.value());
}

std::vector<chmesh::gateway::Route> ReadRoutes(const Config& cfg) {
    std::vector<chmesh::gateway::Route> routes;
    std::unordered_set<std::string> ids;

    if (cfg.Has("gateway.routes") && !cfg.IsObject("gateway.routes")) {
        chmesh::log::error("config gateway.routes: expected an object keyed \"0\", \"1\", ..., no route loaded");
        return routes;
    }

    for (int i = 0;; ++i) {
        auto base = "gateway.routes." + std::to_string(i);
        if (!cfg.Has(base)) {
            auto id_key = base + ".id";
            if (!cfg.Has(id_key)) {
                break;
            }
        }

        chmesh::gateway::Route route;
        if (auto r = cfg.GetString(base + ".id"); r.ok()) route.id = r.value();
        if (auto r = cfg.GetString(base + ".path"); r.ok()) route.path = r.value();
        if (auto r = cfg.GetString(base + ".service"); r.ok()) route.service = r.value();
        if (auto r = cfg.GetBool(base + ".strip_prefix"); r.ok()) route.strip_prefix = r.value();

        auto st = chmesh::gateway::ValidateRoute(route);
        if (!st.ok()) {
            chmesh::log::error("config {}: {}, route skipped", base, st.message());
            continue;
        }
        if (!ids.insert(route.id).second) {
            chmesh::log::error("config {}: duplicate route id {}, route skipped", base, route.id);
            continue;
        }
        routes.push_back(std::move(route));
    }

    if (routes.empty() && cfg.Has("gateway.routes")) {
        chmesh::log::warn("config gateway.routes is present but no route loaded, the gateway answers 404 to everything");
    }
    return routes;
}

} // namespace

ServerOptions LoadServerOptions(const Config* cfg) {
    ServerOptions opt;
    if (cfg == nullptr) {
        return opt;
    }

    if (auto r = cfg->GetString("log.level"); Present(r, "log.level")) {
        opt.log_level = r.value();
    }
    if (auto r = cfg->GetInt("runtime.io_threads"); Present(r, "runtime.io_threads") && r.value() >= 0) {
        opt.io_threads = static_cast<std::size_t>(r.value());
    }

    ReadListen(*cfg, "registry.listen", opt.registry_listen);
    ReadMillis(*cfg, "registry.heartbeat_interval_ms", opt.heartbeat.interval, 1);
    opt.heartbeat.eviction_threshold = opt.heartbeat.interval * 3;
    ReadMillis(*cfg, "registry.eviction_threshold_ms", opt.heartbeat.eviction_threshold, 1);

    ReadListen(*cfg, "gateway.listen", opt.gateway_listen);
    if (auto r = cfg->GetInt("gateway.retry_budget"); Present(r, "gateway.retry_budget")) {
        if (r.value() < 0) {
            chmesh::log::warn("config gateway.retry_budget: {} is negative, using default", r.value());
        } else {
            opt.gateway.retry_budget = r.value();
        }
    }
    if (auto r = cfg->GetInt("gateway.max_body_bytes"); Present(r, "gateway.max_body_bytes")) {
        if (r.value() <= 0) {
            chmesh::log::warn("config gateway.max_body_bytes: {} is not positive, using default", r.value());
        } else {
            opt.max_body_bytes = static_cast<std::uint64_t>(r.value());
        }
    }
    ReadMillis(*cfg, "gateway.forward_timeout_ms", opt.gateway.forward_timeout, 1);
    ReadMillis(*cfg, "gateway.retry_backoff_ms", opt.gateway.retry_backoff, 0);
    if (auto r = cfg->GetString("gateway.load_balancer"); Present(r, "gateway.load_balancer")) {
        if (r.value() == "round_robin" || r.value() == "random") {
            opt.load_balancer = r.value();
        } else {
            chmesh::log::warn("config gateway.load_balancer: unknown '{}', using round_robin", r.value());
        }
    }

    opt.routes = ReadRoutes(*cfg);
    return opt;
}

ServerOptions LoadServerOptionsFromFile(const std::string& path) {
    if (path.empty()) {
        chmesh::log::warn("No config file given, using defaults (no routes)");
        return LoadServerOptions(nullptr);
    }
    auto cfg = Config::LoadFile(path);
    if (!cfg.ok()) {
        chmesh::log::warn("Config source {} unavailable ({}), using defaults", path, cfg.status().ToString());
        return LoadServerOptions(nullptr);
    }
    return LoadServerOptions(&cfg.value());
}

} // namespace chmesh::config
