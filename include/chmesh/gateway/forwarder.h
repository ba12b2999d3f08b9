#pragma once

#include <chrono>
#include <functional>
#include <string>

#include <boost/beast/http/verb.hpp>

#include <chmesh/core/status.h>
#include <chmesh/http/types.h>
#include <chmesh/registry/instance.h>

namespace chmesh::gateway {

struct ForwardRequest {
    boost::beast::http::verb method = boost::beast::http::verb::get;
    std::string target; // path plus "?query" if any
    chmesh::http::HeaderList headers;
    std::string body;

    // Polled while waiting on the downstream; true aborts the call.
    std::function<bool()> cancelled;
};

struct ForwardResponse {
    unsigned status = 0;
    chmesh::http::HeaderList headers;
    std::string content_type;
    std::string body;
};

// The one downstream operation every backend speaks.
//
// Errors: StatusCode::unavailable (connect or I/O failure), StatusCode::timeout,
// StatusCode::cancelled. Any HTTP response, 5xx included, is a success.
class IForwarder {
public:
    virtual ~IForwarder() = default;

    // Thread-safe
    virtual chmesh::Result<ForwardResponse> Forward(
        const registry::InstanceRecord& target,
        const ForwardRequest& request,
        std::chrono::milliseconds timeout) = 0;
};

class HttpForwarder final : public IForwarder {
public:
    chmesh::Result<ForwardResponse> Forward(
        const registry::InstanceRecord& target,
        const ForwardRequest& request,
        std::chrono::milliseconds timeout) override;
};

} // namespace chmesh::gateway
