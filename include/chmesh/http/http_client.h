#pragma once

#include <chrono>
#include <functional>
#include <string>

#include <boost/beast/http/verb.hpp>

#include <chmesh/core/status.h>
#include <chmesh/http/types.h>

namespace chmesh::http {

struct HttpClientRequest {
    boost::beast::http::verb method = boost::beast::http::verb::get;
    std::string host;
    std::string port;
    std::string target = "/";
    HeaderList headers;
    std::string body;
    std::string content_type; // empty: no Content-Type unless given in headers
};

struct HttpClientResponse {
    unsigned status = 0;
    HeaderList headers;
    std::string body;
    std::string content_type;
};

class HttpClient {
public:
    // Thread-safe: each call uses a local io_context.
    //
    // Errors: timeout when the whole exchange exceeds `timeout`, cancelled when
    // `cancelled` (polled while waiting) returns true, unavailable for resolve,
    // connect and I/O failures.
    static chmesh::Result<HttpClientResponse> Send(
        const HttpClientRequest& request,
        std::chrono::milliseconds timeout,
        std::function<bool()> cancelled = {});
};

} // namespace chmesh::http
