#include <chmesh/http/http_server.h>

#include <chmesh/core/log.h>
#include <chmesh/core/metrics.h>
#include <chmesh/http/types.h>

#include <boost/asio/dispatch.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <exception>
#include <optional>
#include <string_view>

#ifndef _WIN32
#include <sys/socket.h>
#endif

namespace chmesh::http {
namespace {

namespace beast = boost::beast;
namespace http = beast::http;
using tcp = boost::asio::ip::tcp;

std::string_view ExtractPath(std::string_view target) {
    auto q = target.find('?');
    if (q == std::string_view::npos) {
        return target;
    }
    return target.substr(0, q);
}

std::string_view ExtractQueryString(std::string_view target) {
    auto q = target.find('?');
    if (q == std::string_view::npos) {
        return {};
    }
    return target.substr(q + 1);
}

void ParseQuery(std::string_view s, std::unordered_map<std::string, std::string>& out) {
    while (!s.empty()) {
        auto amp = s.find('&');
        auto part = (amp == std::string_view::npos) ? s : s.substr(0, amp);
        auto eq = part.find('=');
        if (eq != std::string_view::npos) {
            out.emplace(std::string(part.substr(0, eq)), std::string(part.substr(eq + 1)));
        } else if (!part.empty()) {
            out.emplace(std::string(part), "");
        }
        if (amp == std::string_view::npos) {
            break;
        }
        s.remove_prefix(amp + 1);
    }
}

class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    HttpSession(tcp::socket socket, const Router& router, const std::string& server_name, std::uint64_t body_limit)
        : stream_(std::move(socket)), router_(router), server_name_(server_name), body_limit_(body_limit) {}

    void Run() {
        beast::error_code ec;
        auto remote = stream_.socket().remote_endpoint(ec);
        if (!ec) {
            remote_address_ = remote.address().to_string();
        }
        Read();
    }

private:
    using Reply = http::response<http::string_body>;

    void Read() {
        parser_.emplace();
        parser_->body_limit(body_limit_);
        http::async_read(stream_, buffer_, *parser_,
            beast::bind_front_handler(&HttpSession::OnRead, shared_from_this()));
    }

    // Non-blocking peek: a zero-byte read means the peer closed its side.
    bool PeerClosed() {
#ifndef _WIN32
        char c = 0;
        auto n = ::recv(stream_.socket().native_handle(), &c, 1, MSG_PEEK | MSG_DONTWAIT);
        return n == 0;
#else
        return false;
#endif
    }

    void OnRead(beast::error_code ec, std::size_t) {
        if (ec == http::error::end_of_stream) {
            return DoClose();
        }
        if (ec == http::error::body_limit) {
            chmesh::log::warn("[{}] request body above {} bytes from {}, answering 413", server_name_, body_limit_, remote_address_);
            Reply out{http::status::payload_too_large, 11};
            out.keep_alive(false);
            out.set(http::field::server, "chmesh/0.1");
            out.set(http::field::content_type, "application/json; charset=utf-8");
            out.body() = "{\"error\":\"payload_too_large\"}";
            out.prepare_payload();
            return Write(std::move(out));
        }
        if (ec) {
            return;
        }

        auto start = std::chrono::steady_clock::now();

        Request req;
        req.raw = parser_->release();
        auto target_sv = std::string_view(req.raw.target().data(), req.raw.target().size());
        req.path = std::string(ExtractPath(target_sv));
        req.query_string = std::string(ExtractQueryString(target_sv));
        ParseQuery(req.query_string, req.query);
        req.remote_address = remote_address_;
        req.client_gone = [this] { return PeerClosed(); };

        Response resp;
        try {
            router_.Handle(req, resp);
        } catch (const std::exception& e) {
            chmesh::log::error("[{}] handler for {} failed: {}", server_name_, req.path, e.what());
            resp = Response{};
            resp.SetJson(500, "{\"error\":\"internal_error\"}");
        }

        Reply out{http::status(resp.status), req.raw.version()};
        out.keep_alive(req.raw.keep_alive());
        out.set(http::field::server, "chmesh/0.1");
        if (!resp.content_type.empty()) {
            out.set(http::field::content_type, resp.content_type);
        }
        for (const auto& h : resp.headers) {
            out.insert(h.first, h.second);
        }
        if (req.raw.method() == http::verb::head) {
            // Header only. A relayed Content-Length describes the GET body and is kept.
            if (out.find(http::field::content_length) == out.end()) {
                out.content_length(resp.body.size());
            }
        } else {
            out.body() = std::move(resp.body);
            out.prepare_payload();
        }

        auto elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
        chmesh::DefaultMetrics().HistogramMetric(
            "http_server_request_ms",
            "HTTP server request latency (ms)",
            {0.25, 0.5, 1, 2, 5, 10, 25, 50, 100, 250, 1000},
            MetricLabels{{{"server", server_name_}}})
            .Observe(elapsed);
        chmesh::DefaultMetrics().CounterMetric(
            "http_server_requests_total",
            "HTTP server requests total",
            MetricLabels{{{"server", server_name_}, {"status", std::to_string(resp.status)}}})
            .Inc(1);

        Write(std::move(out));
    }

    void Write(Reply out) {
        auto sp = std::make_shared<Reply>(std::move(out));
        http::async_write(stream_, *sp,
            beast::bind_front_handler(&HttpSession::OnWrite, shared_from_this(), sp->need_eof(), sp));
    }

    void OnWrite(bool close, std::shared_ptr<void>, beast::error_code ec, std::size_t) {
        if (ec) {
            return;
        }
        if (close) {
            return DoClose();
        }
        Read();
    }

    void DoClose() {
        beast::error_code ec;
        stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
    }

private:
    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    std::optional<http::request_parser<http::string_body>> parser_;
    const Router& router_;
    const std::string& server_name_;
    std::uint64_t body_limit_;
    std::string remote_address_;
};

} // namespace

bool ParseListenAddress(std::string_view s, ListenAddress& out) {
    auto colon = s.rfind(':');
    if (colon == std::string_view::npos) {
        return false;
    }
    auto host = s.substr(0, colon);
    auto port_sv = s.substr(colon + 1);
    if (host.empty() || port_sv.empty()) {
        return false;
    }
    char* end = nullptr;
    std::string port_str(port_sv);
    long port = std::strtol(port_str.c_str(), &end, 10);
    if (end == nullptr || *end != '\0' || port < 0 || port > 65535) {
        return false;
    }
    out.host = std::string(host);
    out.port = static_cast<std::uint16_t>(port);
    return true;
}

std::string_view Request::Query(std::string_view key) const {
    auto it = query.find(std::string(key));
    if (it == query.end()) {
        return {};
    }
    return it->second;
}

void Response::SetJson(std::string json) {
    content_type = "application/json; charset=utf-8";
    body = std::move(json);
}

void Response::SetJson(unsigned code, std::string json) {
    status = code;
    SetJson(std::move(json));
}

bool HeaderNameEquals(std::string_view a, std::string_view b) {
    return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
        return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
    });
}

bool IsHopByHopHeader(std::string_view name) {
    static constexpr std::string_view kHopByHop[] = {
        "connection", "keep-alive", "proxy-authenticate", "proxy-authorization", "proxy-connection",
        "te", "trailer", "transfer-encoding", "upgrade", "content-length",
    };
    return std::any_of(std::begin(kHopByHop), std::end(kHopByHop), [&](std::string_view h) {
        return HeaderNameEquals(h, name);
    });
}

std::vector<std::string> ConnectionTokens(std::string_view value) {
    std::vector<std::string> out;
    while (!value.empty()) {
        auto comma = value.find(',');
        auto token = value.substr(0, comma);
        while (!token.empty() && (token.front() == ' ' || token.front() == '\t')) token.remove_prefix(1);
        while (!token.empty() && (token.back() == ' ' || token.back() == '\t')) token.remove_suffix(1);
        if (!token.empty()) {
            out.emplace_back(token);
        }
        if (comma == std::string_view::npos) {
            break;
        }
        value.remove_prefix(comma + 1);
    }
    return out;
}

bool NamedIn(const std::vector<std::string>& tokens, std::string_view name) {
    return std::any_of(tokens.begin(), tokens.end(), [&](const std::string& t) {
        return HeaderNameEquals(t, name);
    });
}

HttpServer::HttpServer(chmesh::IoContextPool& pool, std::string name, ListenAddress addr, Router router, std::uint64_t body_limit)
    : pool_(pool),
      name_(std::move(name)),
      addr_(std::move(addr)),
      router_(std::move(router)),
      body_limit_(body_limit),
      acceptor_(pool.Next()) {}

std::uint16_t HttpServer::LocalPort() const {
    return bound_port_.load(std::memory_order_acquire);
}

void HttpServer::Start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        return;
    }

    beast::error_code ec;
    auto address = boost::asio::ip::make_address(addr_.host, ec);
    if (ec) {
        chmesh::log::error("[{}] invalid listen address {}: {}", name_, addr_.host, ec.message());
        return;
    }
    tcp::endpoint endpoint{address, addr_.port};

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
        chmesh::log::error("[{}] acceptor open failed: {}", name_, ec.message());
        return;
    }

    acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
    if (ec) {
        chmesh::log::warn("[{}] acceptor set_option failed: {}", name_, ec.message());
    }

    acceptor_.bind(endpoint, ec);
    if (ec) {
        chmesh::log::error("[{}] acceptor bind failed: {}", name_, ec.message());
        return;
    }

    acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec) {
        chmesh::log::error("[{}] acceptor listen failed: {}", name_, ec.message());
        return;
    }

    auto local = acceptor_.local_endpoint(ec);
    bound_port_.store(ec ? addr_.port : local.port(), std::memory_order_release);

    chmesh::log::info("[{}] HTTP server listening on {}:{}", name_, addr_.host, LocalPort());
    DoAccept();
}

void HttpServer::Stop() {
    bool expected = true;
    if (!running_.compare_exchange_strong(expected, false)) {
        return;
    }

    beast::error_code ec;
    acceptor_.cancel(ec);
    acceptor_.close(ec);
    bound_port_.store(0, std::memory_order_release);
}

void HttpServer::DoAccept() {
    acceptor_.async_accept(boost::asio::make_strand(pool_.Next()),
        [self = shared_from_this()](beast::error_code ec, tcp::socket socket) {
            if (ec) {
                if (self->running_.load(std::memory_order_relaxed)) {
                    chmesh::log::warn("[{}] accept failed: {}", self->name_, ec.message());
                    self->DoAccept();
                }
                return;
            }

            std::make_shared<HttpSession>(std::move(socket), self->router_, self->name_, self->body_limit_)->Run();
            self->DoAccept();
        });
}

} // namespace chmesh::http
