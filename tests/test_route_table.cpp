#include <chtest.hpp>

#include <chmesh/gateway/route.h>

#include <vector>

using chmesh::gateway::Route;
using chmesh::gateway::RouteTable;

namespace {

Route MakeRoute(std::string id, std::string path, std::string service, bool strip = true) {
    Route r;
    r.id = std::move(id);
    r.path = std::move(path);
    r.service = std::move(service);
    r.strip_prefix = strip;
    return r;
}

} // namespace

TEST_CASE("RouteTable matches a wildcard prefix and strips it") {
    auto t = RouteTable::Build({MakeRoute("catalog", "/catalog/**", "catalog")});
    REQUIRE(t.ok());

    auto m = t.value().Match("/catalog/items");
    REQUIRE(m.route != nullptr);
    REQUIRE(m.route->service == "catalog");
    REQUIRE(m.forward_path == "/items");
    REQUIRE(m.prefix == "/catalog");

    auto bare = t.value().Match("/catalog");
    REQUIRE(bare.route != nullptr);
    REQUIRE(bare.forward_path == "/");
}

TEST_CASE("RouteTable matches on segment boundaries only") {
    auto t = RouteTable::Build({MakeRoute("catalog", "/catalog/**", "catalog")});
    REQUIRE(t.ok());

    REQUIRE(t.value().Match("/catalogue/items").route == nullptr);
    REQUIRE(t.value().Match("/").route == nullptr);
    REQUIRE(t.value().Match("/orders/1").route == nullptr);
}

TEST_CASE("RouteTable first declared match wins") {
    auto t = RouteTable::Build({
        MakeRoute("special", "/catalog/special/**", "special"),
        MakeRoute("catalog", "/catalog/**", "catalog"),
        MakeRoute("shadowed", "/catalog/special/**", "never"),
        MakeRoute("fallback", "/**", "web"),
    });
    REQUIRE(t.ok());

    REQUIRE(t.value().Match("/catalog/special/1").route->id == "special");
    REQUIRE(t.value().Match("/catalog/1").route->id == "catalog");
    REQUIRE(t.value().Match("/anything").route->id == "fallback");
    REQUIRE(t.value().Match("/anything").forward_path == "/anything");
}

TEST_CASE("RouteTable keeps the path when strip_prefix is off") {
    auto t = RouteTable::Build({MakeRoute("api", "/api", "api", false)});
    REQUIRE(t.ok());

    auto m = t.value().Match("/api/v1/users");
    REQUIRE(m.route != nullptr);
    REQUIRE(m.forward_path == "/api/v1/users");
}

TEST_CASE("RouteTable rejects invalid and duplicate routes") {
    REQUIRE(!RouteTable::Build({MakeRoute("", "/a/**", "a")}).ok());
    REQUIRE(!RouteTable::Build({MakeRoute("a", "a/**", "a")}).ok());
    REQUIRE(!RouteTable::Build({MakeRoute("a", "/a/**", "")}).ok());

    auto dup = RouteTable::Build({MakeRoute("a", "/a/**", "a"), MakeRoute("a", "/b/**", "b")});
    REQUIRE(!dup.ok());
    REQUIRE(dup.status().code() == chmesh::StatusCode::invalid_argument);
}

TEST_CASE("Empty RouteTable matches nothing") {
    RouteTable t;
    REQUIRE(t.Match("/catalog/items").route == nullptr);
}
