#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include <boost/beast/http.hpp>

namespace chmesh::http {

namespace beast_http = boost::beast::http;

using HeaderList = std::vector<std::pair<std::string, std::string>>;

struct Request {
    beast_http::request<beast_http::string_body> raw;
    std::string path;         // target without query
    std::string query_string; // target after '?', without it
    std::unordered_map<std::string, std::string> query;
    std::string remote_address;

    // Set by the server; true once the peer has closed its side. May be empty.
    std::function<bool()> client_gone;

    std::string_view Query(std::string_view key) const;
};

struct Response {
    unsigned status = 200;
    std::string body;
    std::string content_type = "text/plain; charset=utf-8"; // empty: no Content-Type
    HeaderList headers; // repeated names allowed

    void SetJson(std::string json);
    void SetJson(unsigned code, std::string json);
};

// ASCII case-insensitive comparison of header names.
bool HeaderNameEquals(std::string_view a, std::string_view b);

// Connection-level headers that are never relayed by a proxy (RFC 9110 7.6.1),
// plus Content-Length which is recomputed per hop. Case-insensitive.
bool IsHopByHopHeader(std::string_view name);

// Tokens of a Connection header value, trimmed: "close, X-Trace" -> {"close", "X-Trace"}.
// Headers named there are hop-by-hop for this message only.
std::vector<std::string> ConnectionTokens(std::string_view value);

// True when `name` is in `tokens`, case-insensitively.
bool NamedIn(const std::vector<std::string>& tokens, std::string_view name);

} // namespace chmesh::http
