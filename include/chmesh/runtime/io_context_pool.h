#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <optional>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

namespace chmesh {

// One io_context per worker thread. Sessions are spread round-robin, so each
// connection stays on one thread for its lifetime.
class IoContextPool {
public:
    explicit IoContextPool(std::size_t threads);
    ~IoContextPool();

    IoContextPool(const IoContextPool&) = delete;
    IoContextPool& operator=(const IoContextPool&) = delete;

    // Thread-safe
    boost::asio::io_context& Next();

    std::size_t size() const { return slots_.size(); }

    // Start() after Stop() restarts the contexts.
    void Start();
    void Stop();

private:
    using WorkGuard = boost::asio::executor_work_guard<boost::asio::io_context::executor_type>;

    struct Slot {
        std::unique_ptr<boost::asio::io_context> ctx;
        std::optional<WorkGuard> guard;
        std::thread worker;
    };

    std::vector<Slot> slots_;
    std::atomic<std::size_t> rr_{0};
    std::atomic<bool> started_{false};
};

} // namespace chmesh
