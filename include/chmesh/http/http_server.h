#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include <boost/asio/ip/tcp.hpp>

#include <chmesh/runtime/app.h>
#include <chmesh/runtime/io_context_pool.h>
#include <chmesh/http/router.h>

namespace chmesh::http {

struct ListenAddress {
    std::string host;
    std::uint16_t port = 0; // 0 picks an ephemeral port
};

// Largest request body accepted by default; larger ones get 413.
inline constexpr std::uint64_t kDefaultBodyLimit = 8 * 1024 * 1024;

// "host:port" -> ListenAddress. Returns false on malformed input.
bool ParseListenAddress(std::string_view s, ListenAddress& out);

class HttpServer final : public chmesh::IService, public std::enable_shared_from_this<HttpServer> {
public:
    // name labels logs and metrics ("registry", "gateway", ...). Accepted
    // connections are spread over the pool, so blocking handlers on one
    // connection do not hold up the others.
    HttpServer(chmesh::IoContextPool& pool, std::string name, ListenAddress addr, Router router,
               std::uint64_t body_limit = kDefaultBodyLimit);

    void Start() override;
    void Stop() override;

    // Bound port after Start(), 0 if not listening.
    std::uint16_t LocalPort() const;

private:
    void DoAccept();

    chmesh::IoContextPool& pool_;
    std::string name_;
    ListenAddress addr_;
    Router router_;
    std::uint64_t body_limit_;

    boost::asio::ip::tcp::acceptor acceptor_;
    std::atomic<std::uint16_t> bound_port_{0};
    std::atomic<bool> running_{false};
};

} // namespace chmesh::http
