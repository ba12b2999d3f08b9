#include <chmesh/http/http_client.h>

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <cstdint>
#include <limits>

namespace chmesh::http {
namespace {
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = boost::asio::ip::tcp;

constexpr std::chrono::milliseconds kCancelPollInterval{20};

struct ClientOpState {
    boost::asio::io_context ioc;
    tcp::resolver resolver{ioc};
    beast::tcp_stream stream{ioc};
    boost::asio::steady_timer deadline{ioc};
    boost::asio::steady_timer poll{ioc};
    beast::flat_buffer buffer;
    http::request<http::string_body> req;
    http::response_parser<http::string_body> parser;
    std::function<bool()> cancelled;
    beast::error_code ec;
    bool done = false;
    bool timed_out = false;
    bool was_cancelled = false;

    void Finish(beast::error_code e) {
        if (done) {
            return;
        }
        done = true;
        ec = e;
        deadline.cancel();
        poll.cancel();
    }

    void Abort() {
        resolver.cancel();
        stream.cancel();
    }

    void PollCancel() {
        poll.expires_after(kCancelPollInterval);
        poll.async_wait([this](beast::error_code e) {
            if (e || done) {
                return;
            }
            if (cancelled()) {
                was_cancelled = true;
                Abort();
                return;
            }
            PollCancel();
        });
    }
};

} // namespace

chmesh::Result<HttpClientResponse> HttpClient::Send(const HttpClientRequest& request, std::chrono::milliseconds timeout, std::function<bool()> cancelled) {
    ClientOpState st;
    st.cancelled = std::move(cancelled);

    st.req.method(request.method);
    st.req.version(11);
    st.req.target(request.target);
    for (const auto& h : request.headers) {
        st.req.insert(h.first, h.second);
    }
    if (st.req.find(http::field::host) == st.req.end()) {
        st.req.set(http::field::host, request.host + ":" + request.port);
    }
    if (st.req.find(http::field::user_agent) == st.req.end()) {
        st.req.set(http::field::user_agent, "chmesh/0.1");
    }
    if (!request.content_type.empty()) {
        st.req.set(http::field::content_type, request.content_type);
    }
    st.req.keep_alive(false);
    st.req.body() = request.body;
    st.req.prepare_payload();

    // Replies to HEAD carry the GET Content-Length but no body.
    st.parser.body_limit(std::numeric_limits<std::uint64_t>::max());
    if (request.method == http::verb::head) {
        st.parser.skip(true);
    }

    st.deadline.expires_after(timeout);
    st.deadline.async_wait([&](beast::error_code ec) {
        if (ec || st.done) {
            return;
        }
        st.timed_out = true;
        st.Abort();
    });
    if (st.cancelled) {
        st.PollCancel();
    }

    st.resolver.async_resolve(request.host, request.port, [&](beast::error_code ec, tcp::resolver::results_type results) {
        if (ec) {
            return st.Finish(ec);
        }
        st.stream.async_connect(results, [&](beast::error_code ec, const tcp::resolver::results_type::endpoint_type&) {
            if (ec) {
                return st.Finish(ec);
            }
            http::async_write(st.stream, st.req, [&](beast::error_code ec, std::size_t) {
                if (ec) {
                    return st.Finish(ec);
                }
                http::async_read(st.stream, st.buffer, st.parser, [&](beast::error_code ec, std::size_t) {
                    beast::error_code ec2;
                    st.stream.socket().shutdown(tcp::socket::shutdown_both, ec2);
                    st.Finish(ec);
                });
            });
        });
    });

    st.ioc.run();

    if (st.timed_out) {
        return chmesh::Status(chmesh::StatusCode::timeout, "http client timeout");
    }
    if (st.was_cancelled) {
        return chmesh::Status(chmesh::StatusCode::cancelled, "http client cancelled");
    }
    if (st.ec) {
        return chmesh::Status(chmesh::StatusCode::unavailable, st.ec.message());
    }

    auto resp = st.parser.release();
    HttpClientResponse out;
    out.status = resp.result_int();
    for (const auto& field : resp) {
        if (field.name() == http::field::content_type) {
            out.content_type.assign(field.value().data(), field.value().size());
            continue;
        }
        out.headers.emplace_back(
            std::string(field.name_string().data(), field.name_string().size()),
            std::string(field.value().data(), field.value().size()));
    }
    out.body = std::move(resp.body());
    return out;
}

} // namespace chmesh::http
