#include <chmesh/gateway/route.h>

#include <unordered_set>

namespace chmesh::gateway {
namespace {

std::string CompilePrefix(std::string_view pattern) {
    if (pattern.size() >= 3 && pattern.substr(pattern.size() - 3) == "/**") {
        pattern.remove_suffix(3);
    }
    while (!pattern.empty() && pattern.back() == '/') {
        pattern.remove_suffix(1);
    }
    return std::string(pattern);
}

// "/a/b" matches "/a/b" and "/a/b/..." but not "/a/bc". "" matches everything.
bool PrefixMatches(std::string_view prefix, std::string_view path) {
    if (prefix.empty()) {
        return true;
    }
    if (path.size() < prefix.size() || path.substr(0, prefix.size()) != prefix) {
        return false;
    }
    return path.size() == prefix.size() || path[prefix.size()] == '/';
}

} // namespace

chmesh::Status ValidateRoute(const Route& route) {
    if (route.id.empty()) {
        return chmesh::Status(chmesh::StatusCode::invalid_argument, "route id is empty");
    }
    if (route.path.empty() || route.path.front() != '/') {
        return chmesh::Status(chmesh::StatusCode::invalid_argument, "route " + route.id + ": path must start with '/'");
    }
    if (route.service.empty()) {
        return chmesh::Status(chmesh::StatusCode::invalid_argument, "route " + route.id + ": service is empty");
    }
    return chmesh::Status::Ok();
}

chmesh::Result<RouteTable> RouteTable::Build(std::vector<Route> routes) {
    RouteTable table;
    std::unordered_set<std::string> ids;
    for (auto& r : routes) {
        auto st = ValidateRoute(r);
        if (!st.ok()) {
            return st;
        }
        if (!ids.insert(r.id).second) {
            return chmesh::Status(chmesh::StatusCode::invalid_argument, "duplicate route id " + r.id);
        }
        table.compiled_.push_back(Compiled{CompilePrefix(r.path)});
        table.routes_.push_back(std::move(r));
    }
    return table;
}

RouteMatch RouteTable::Match(std::string_view path) const {
    RouteMatch m;
    for (std::size_t i = 0; i < routes_.size(); ++i) {
        const auto& prefix = compiled_[i].prefix;
        if (!PrefixMatches(prefix, path)) {
            continue;
        }

        m.route = &routes_[i];
        m.prefix = prefix;
        if (routes_[i].strip_prefix) {
            auto rest = path.substr(prefix.size());
            m.forward_path = rest.empty() ? "/" : std::string(rest);
        } else {
            m.forward_path = std::string(path);
        }
        return m;
    }
    return m;
}

} // namespace chmesh::gateway
