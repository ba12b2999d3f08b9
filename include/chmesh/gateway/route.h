#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include <chmesh/core/status.h>

namespace chmesh::gateway {

struct Route {
    std::string id;
    std::string path;    // "/catalog/**", "/catalog" or "/**"
    std::string service; // registry service name
    bool strip_prefix = true;
};

struct RouteMatch {
    const Route* route = nullptr;
    std::string forward_path; // path sent downstream
    std::string prefix;       // the matched literal prefix, "" for "/**"
};

// Immutable, ordered route table. Matching is segment-aligned prefix matching in
// declaration order; the first match wins.
class RouteTable {
public:
    RouteTable() = default;

    // Rejects empty fields, predicates not starting with '/', and duplicate ids.
    static chmesh::Result<RouteTable> Build(std::vector<Route> routes);

    // nullptr route when nothing matches.
    RouteMatch Match(std::string_view path) const;

    const std::vector<Route>& routes() const { return routes_; }
    std::size_t size() const { return routes_.size(); }

private:
    struct Compiled {
        std::string prefix; // without trailing "/**" or "/"
    };

    std::vector<Route> routes_;
    std::vector<Compiled> compiled_;
};

// Validates one route the way Build() does.
chmesh::Status ValidateRoute(const Route& route);

} // namespace chmesh::gateway
