#include <chtest.hpp>

#include <chmesh/core/clock.h>
#include <chmesh/http/router.h>
#include <chmesh/registry/registry_service.h>
#include <chmesh/registry/registry_store.h>

#include <chjson/chjson.hpp>

#include <string>

using chmesh::ManualClock;
using chmesh::registry::QueryService;
using chmesh::registry::RegisterRequest;
using chmesh::registry::RegistrationService;
using chmesh::registry::RegistryStore;

namespace {

struct Api {
    ManualClock clock;
    RegistryStore store{clock};
    RegistrationService registration{store};
    QueryService query{store};
    chmesh::http::Router router;

    Api() { chmesh::registry::MountRegistryApi(router, registration, query); }

    chmesh::http::Response Post(std::string path, std::string body) {
        chmesh::http::Request req;
        req.raw.method(boost::beast::http::verb::post);
        req.path = std::move(path);
        req.raw.body() = std::move(body);
        chmesh::http::Response resp;
        router.Handle(req, resp);
        return resp;
    }

    chmesh::http::Response Get(std::string path, std::string service, bool all = false) {
        chmesh::http::Request req;
        req.raw.method(boost::beast::http::verb::get);
        req.path = std::move(path);
        if (!service.empty()) {
            req.query["service"] = service;
        }
        if (all) {
            req.query["all"] = "true";
        }
        chmesh::http::Response resp;
        router.Handle(req, resp);
        return resp;
    }
};

} // namespace

TEST_CASE("RegistrationService derives the instance id from host and port") {
    ManualClock clock;
    RegistryStore store(clock);
    RegistrationService svc(store);

    RegisterRequest req;
    req.service = "catalog";
    req.host = "host1";
    req.port = 8081;

    auto r = svc.Register(req);
    REQUIRE(r.ok());
    REQUIRE(r.value() == "host1:8081");
    REQUIRE(store.ListHealthy("catalog").at(0).instance_id == "host1:8081");
}

TEST_CASE("RegistrationService validates the address") {
    ManualClock clock;
    RegistryStore store(clock);
    RegistrationService svc(store);

    RegisterRequest req;
    req.service = "catalog";
    req.host = "";
    req.port = 8081;
    REQUIRE(svc.Register(req).status().code() == chmesh::StatusCode::invalid_argument);

    req.host = "host1";
    req.port = 70000;
    REQUIRE(svc.Register(req).status().code() == chmesh::StatusCode::invalid_argument);

    req.port = 8081;
    req.service = "";
    REQUIRE(svc.Register(req).status().code() == chmesh::StatusCode::invalid_argument);
    REQUIRE(store.Size() == 0);
}

TEST_CASE("Registration API register, renew and deregister over JSON") {
    Api api;

    auto reg = api.Post("/registry/register", R"({"service":"catalog","instance_id":"a","host":"host1","port":8081})");
    REQUIRE(reg.status == 200);
    REQUIRE(reg.body.find("\"a\"") != std::string::npos);
    REQUIRE(api.store.ListHealthy("catalog").size() == 1);

    auto renew = api.Post("/registry/renew", R"({"service":"catalog","instance_id":"a"})");
    REQUIRE(renew.status == 200);

    auto dereg = api.Post("/registry/deregister", R"({"service":"catalog","instance_id":"a"})");
    REQUIRE(dereg.status == 200);
    REQUIRE(api.store.Size() == 0);
}

TEST_CASE("Registration API rejects ports that only fit after narrowing") {
    Api api;
    // 4294967377 == 2^32 + 81
    auto resp = api.Post("/registry/register", R"({"service":"catalog","host":"host1","port":4294967377})");
    REQUIRE(resp.status == 400);
    REQUIRE(api.store.Size() == 0);

    resp = api.Post("/registry/register", R"({"service":"catalog","host":"host1","port":-65455})");
    REQUIRE(resp.status == 400);
    REQUIRE(api.store.Size() == 0);
}

TEST_CASE("Registration API renew of an unknown instance is 404 and creates nothing") {
    Api api;

    auto renew = api.Post("/registry/renew", R"({"service":"catalog","instance_id":"ghost"})");
    REQUIRE(renew.status == 404);
    REQUIRE(api.store.Size() == 0);
}

TEST_CASE("Registration API rejects malformed bodies") {
    Api api;

    REQUIRE(api.Post("/registry/register", "not json").status == 400);
    REQUIRE(api.Post("/registry/register", R"({"service":"catalog","host":"h"})").status == 400);
    REQUIRE(api.Post("/registry/renew", R"({"service":"catalog"})").status == 400);
    REQUIRE(api.store.Size() == 0);
}

TEST_CASE("Query API lists healthy instances as JSON") {
    Api api;
    REQUIRE(api.Post("/registry/register", R"({"service":"catalog","instance_id":"a","host":"host1","port":8081})").status == 200);
    REQUIRE(api.Post("/registry/register", R"({"service":"catalog","instance_id":"b","host":"host1","port":8082})").status == 200);

    auto resp = api.Get("/registry/instances", "catalog");
    REQUIRE(resp.status == 200);
    REQUIRE(resp.content_type.find("application/json") == 0);
    REQUIRE(resp.body.front() == '[');
    REQUIRE(resp.body.find("8081") != std::string::npos);
    REQUIRE(resp.body.find("8082") != std::string::npos);
    REQUIRE(resp.body.find("UP") != std::string::npos);

    auto empty = api.Get("/registry/instances", "unknown");
    REQUIRE(empty.status == 200);
    REQUIRE(empty.body == "[]");

    REQUIRE(api.Get("/registry/instances", "").status == 400);
}

TEST_CASE("Query API hides down instances unless all=true") {
    Api api;
    REQUIRE(api.Post("/registry/register", R"({"service":"catalog","instance_id":"a","host":"host1","port":8081})").status == 200);
    api.clock.Advance(std::chrono::seconds(31));
    api.store.Sweep(api.clock.Now(), chmesh::registry::SweepPolicy{std::chrono::seconds(30), std::chrono::seconds(90)});

    REQUIRE(api.Get("/registry/instances", "catalog").body == "[]");

    auto all = api.Get("/registry/instances", "catalog", true);
    REQUIRE(all.body.find("DOWN") != std::string::npos);
}

TEST_CASE("Query API lists service names") {
    Api api;
    REQUIRE(api.Post("/registry/register", R"({"service":"orders","host":"h","port":1})").status == 200);
    REQUIRE(api.Post("/registry/register", R"({"service":"catalog","host":"h","port":2})").status == 200);

    auto resp = api.Get("/registry/services", "");
    REQUIRE(resp.status == 200);
    REQUIRE(resp.body == R"(["catalog","orders"])");
}
