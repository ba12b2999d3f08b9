#include <chmesh/registry/registry_service.h>

#include <chmesh/core/log.h>
#include <chmesh/core/metrics.h>
#include <chmesh/http/router.h>

#include <chjson/chjson.hpp>

#include <cstdint>
#include <limits>

namespace chmesh::registry {
namespace {

void CountRegistryOp(const char* op, const chmesh::Status& st) {
    chmesh::DefaultMetrics().CounterMetric(
        "registry_operations_total",
        "Registration API calls by operation and result",
        MetricLabels{{{"op", op}, {"result", std::string(chmesh::StatusCodeName(st.code()))}}})
        .Inc(1);
}

std::string ErrorJson(std::string_view error, std::string_view message) {
    chjson::value j(chjson::value::object{
        {"error", chjson::value(std::string(error))},
        {"message", chjson::value(std::string(message))},
    });
    return chjson::dump(j);
}

unsigned HttpStatusFor(const chmesh::Status& st) {
    switch (st.code()) {
        case chmesh::StatusCode::ok: return 200;
        case chmesh::StatusCode::invalid_argument: return 400;
        case chmesh::StatusCode::not_found: return 404;
        case chmesh::StatusCode::unavailable: return 503;
        default: return 500;
    }
}

void SetStatusError(chmesh::http::Response& resp, const chmesh::Status& st) {
    resp.SetJson(HttpStatusFor(st), ErrorJson(chmesh::StatusCodeName(st.code()), st.message()));
}

std::string GetString(const chjson::sv_value& obj, std::string_view key) {
    const auto* v = obj.find(key);
    if (v == nullptr || !v->is_string()) {
        return {};
    }
    return std::string(v->as_string_view());
}

// -1 when missing, not an integer, or outside int range.
int GetInt(const chjson::sv_value& obj, std::string_view key) {
    const auto* v = obj.find(key);
    if (v == nullptr || !v->is_number() || !v->is_int()) {
        return -1;
    }
    auto n = v->as_int();
    if (n < std::numeric_limits<int>::min() || n > std::numeric_limits<int>::max()) {
        return -1;
    }
    return static_cast<int>(n);
}

std::string InstanceJson(const InstanceRecord& rec) {
    chjson::value j(chjson::value::object{
        {"service", chjson::value(rec.service)},
        {"instance_id", chjson::value(rec.instance_id)},
        {"host", chjson::value(rec.address.host)},
        {"port", chjson::value::integer(static_cast<std::int64_t>(rec.address.port))},
        {"status", chjson::value(std::string(InstanceStatusName(rec.status)))},
    });
    return chjson::dump(j);
}

// Concatenates already-encoded JSON elements.
template <class T, class F>
std::string JsonArray(const std::vector<T>& items, F&& encode) {
    std::string out = "[";
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i != 0) {
            out.push_back(',');
        }
        out.append(encode(items[i]));
    }
    out.push_back(']');
    return out;
}

// Parses {"service": ..., "instance_id": ...}. Returns false and fills resp on bad input.
bool ParseKey(const chmesh::http::Request& req, chmesh::http::Response& resp, std::string& service, std::string& instance_id) {
    auto r = chjson::parse(req.raw.body());
    if (r.err || !r.doc.root().is_object()) {
        resp.SetJson(400, ErrorJson("invalid_argument", "invalid json"));
        return false;
    }
    service = GetString(r.doc.root(), "service");
    instance_id = GetString(r.doc.root(), "instance_id");
    if (service.empty() || instance_id.empty()) {
        resp.SetJson(400, ErrorJson("invalid_argument", "service and instance_id are required"));
        return false;
    }
    return true;
}

} // namespace

chmesh::Result<std::string> RegistrationService::Register(const RegisterRequest& req) {
    if (req.host.empty()) {
        chmesh::Status st(chmesh::StatusCode::invalid_argument, "empty host");
        CountRegistryOp("register", st);
        return st;
    }
    if (req.port <= 0 || req.port > 65535) {
        chmesh::Status st(chmesh::StatusCode::invalid_argument, "port out of range");
        CountRegistryOp("register", st);
        return st;
    }

    Endpoint address{req.host, static_cast<std::uint16_t>(req.port)};
    std::string instance_id = req.instance_id.empty() ? address.ToString() : req.instance_id;

    auto st = store_.Register(req.service, instance_id, address);
    CountRegistryOp("register", st);
    if (!st.ok()) {
        chmesh::log::warn("Register {}/{} rejected: {}", req.service, instance_id, st.ToString());
        return st;
    }
    chmesh::log::info("Registered {}/{} at {}", req.service, instance_id, address.ToString());
    return instance_id;
}

chmesh::Status RegistrationService::Renew(std::string_view service, std::string_view instance_id) {
    auto st = store_.Renew(service, instance_id);
    CountRegistryOp("renew", st);
    if (!st.ok()) {
        chmesh::log::warn("Renew {}/{} failed: {}", service, instance_id, st.ToString());
    }
    return st;
}

void RegistrationService::Deregister(std::string_view service, std::string_view instance_id) {
    bool removed = store_.Deregister(service, instance_id);
    CountRegistryOp("deregister", chmesh::Status::Ok());
    if (removed) {
        chmesh::log::info("Deregistered {}/{}", service, instance_id);
    }
}

std::vector<InstanceRecord> QueryService::Resolve(std::string_view service) const {
    return store_.ListHealthy(service);
}

void MountRegistryApi(chmesh::http::Router& router, RegistrationService& registration, const QueryService& query) {
    router.Post("/registry/register", [&registration](const chmesh::http::Request& req, chmesh::http::Response& resp) {
        auto r = chjson::parse(req.raw.body());
        if (r.err || !r.doc.root().is_object()) {
            resp.SetJson(400, ErrorJson("invalid_argument", "invalid json"));
            return;
        }

        RegisterRequest reg;
        reg.service = GetString(r.doc.root(), "service");
        reg.instance_id = GetString(r.doc.root(), "instance_id");
        reg.host = GetString(r.doc.root(), "host");
        reg.port = GetInt(r.doc.root(), "port");

        auto result = registration.Register(reg);
        if (!result.ok()) {
            SetStatusError(resp, result.status());
            return;
        }
        chjson::value j(chjson::value::object{
            {"ok", chjson::value(true)},
            {"instance_id", chjson::value(result.value())},
        });
        resp.SetJson(200, chjson::dump(j));
    });

    router.Post("/registry/renew", [&registration](const chmesh::http::Request& req, chmesh::http::Response& resp) {
        std::string service;
        std::string instance_id;
        if (!ParseKey(req, resp, service, instance_id)) {
            return;
        }
        auto st = registration.Renew(service, instance_id);
        if (!st.ok()) {
            SetStatusError(resp, st);
            return;
        }
        resp.SetJson(200, "{\"ok\":true}");
    });

    router.Post("/registry/deregister", [&registration](const chmesh::http::Request& req, chmesh::http::Response& resp) {
        std::string service;
        std::string instance_id;
        if (!ParseKey(req, resp, service, instance_id)) {
            return;
        }
        registration.Deregister(service, instance_id);
        resp.SetJson(200, "{\"ok\":true}");
    });

    router.Get("/registry/instances", [&query](const chmesh::http::Request& req, chmesh::http::Response& resp) {
        std::string service(req.Query("service"));
        if (service.empty()) {
            resp.SetJson(400, ErrorJson("invalid_argument", "missing query param: service"));
            return;
        }
        auto instances = req.Query("all") == "true" ? query.ListAll(service) : query.Resolve(service);
        resp.SetJson(200, JsonArray(instances, InstanceJson));
    });

    router.Get("/registry/services", [&query](const chmesh::http::Request&, chmesh::http::Response& resp) {
        auto services = query.Services();
        resp.SetJson(200, JsonArray(services, [](const std::string& name) {
            return chjson::dump(chjson::value(name));
        }));
    });
}

} // namespace chmesh::registry
