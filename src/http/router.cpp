#include <chmesh/http/router.h>

#include <boost/functional/hash.hpp>

namespace chmesh::http {

std::size_t Router::RouteKeyHash::operator()(const RouteKey& k) const {
    std::size_t seed = 0;
    boost::hash_combine(seed, static_cast<unsigned>(k.method));
    boost::hash_combine(seed, k.path);
    return seed;
}

void Router::AddRoute(boost::beast::http::verb method, std::string path, Handler handler) {
    routes_[RouteKey{method, std::move(path)}] = std::move(handler);
}

void Router::Handle(const Request& req, Response& resp) const {
    const Handler* handler = nullptr;
    if (auto it = routes_.find(RouteKey{req.raw.method(), req.path}); it != routes_.end()) {
        handler = &it->second;
    } else if (fallback_) {
        handler = &fallback_;
    } else {
        resp.SetJson(404, "{\"error\":\"not_found\"}");
        return;
    }

    (*handler)(req, resp);
}

} // namespace chmesh::http
