#include <chmesh/gateway/forwarder.h>

#include <chmesh/http/http_client.h>

#include <string>
#include <vector>

namespace chmesh::gateway {

chmesh::Result<ForwardResponse> HttpForwarder::Forward(
    const registry::InstanceRecord& target,
    const ForwardRequest& request,
    std::chrono::milliseconds timeout) {
    chmesh::http::HttpClientRequest out;
    out.method = request.method;
    out.host = target.address.host;
    out.port = std::to_string(target.address.port);
    out.target = request.target;
    out.headers = request.headers;
    out.body = request.body;

    auto r = chmesh::http::HttpClient::Send(out, timeout, request.cancelled);
    if (!r.ok()) {
        return r.status();
    }

    auto& resp = r.value();
    ForwardResponse fr;
    fr.status = resp.status;
    fr.content_type = std::move(resp.content_type);
    fr.body = std::move(resp.body);
    std::vector<std::string> per_hop;
    for (const auto& h : resp.headers) {
        if (chmesh::http::HeaderNameEquals(h.first, "connection")) {
            auto tokens = chmesh::http::ConnectionTokens(h.second);
            per_hop.insert(per_hop.end(), tokens.begin(), tokens.end());
        }
    }

    const bool head = request.method == boost::beast::http::verb::head;
    fr.headers.reserve(resp.headers.size());
    for (auto& h : resp.headers) {
        if (chmesh::http::NamedIn(per_hop, h.first)) {
            continue;
        }
        // The Content-Length of a HEAD reply is the only length the caller gets.
        if (head && chmesh::http::HeaderNameEquals(h.first, "content-length")) {
            fr.headers.push_back(std::move(h));
            continue;
        }
        if (!chmesh::http::IsHopByHopHeader(h.first)) {
            fr.headers.push_back(std::move(h));
        }
    }
    return fr;
}

} // namespace chmesh::gateway
