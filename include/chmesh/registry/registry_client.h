#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <chmesh/core/status.h>
#include <chmesh/runtime/app.h>

namespace chmesh::registry {

struct RegistryClientOptions {
    std::string registry_host = "127.0.0.1";
    std::uint16_t registry_port = 8761;

    std::string service;
    std::string instance_id; // empty: the registry derives "host:port"
    std::string host;        // address advertised to the gateway
    std::uint16_t port = 0;

    std::chrono::milliseconds renew_interval{30000};
    std::chrono::milliseconds request_timeout{2000};
};

// Backend-side agent: registers on Start(), renews every renew_interval,
// registers again when a renewal comes back not_found, deregisters on Stop().
class RegistryClient final : public chmesh::IService, public std::enable_shared_from_this<RegistryClient> {
public:
    RegistryClient(boost::asio::io_context& ioc, RegistryClientOptions opts);

    void Start() override;
    void Stop() override;

    // Single calls, blocking on the network. Exposed for tests and tools.
    chmesh::Status Register();
    chmesh::Status Renew();
    chmesh::Status Deregister();

    // Renew, or register when not (or no longer) registered.
    void Heartbeat();

    bool registered() const { return registered_.load(std::memory_order_acquire); }
    std::string instance_id() const;

private:
    chmesh::Result<std::string> Post(const std::string& target, std::string body);
    std::string KeyJson() const;
    void Schedule();

    RegistryClientOptions opts_;

    mutable std::mutex mu_;
    std::string instance_id_;

    std::mutex timer_mu_;
    boost::asio::steady_timer timer_;
    std::atomic<bool> running_{false};
    std::atomic<bool> registered_{false};
};

} // namespace chmesh::registry
