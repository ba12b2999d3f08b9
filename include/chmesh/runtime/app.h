#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <boost/asio/signal_set.hpp>

#include <chmesh/runtime/io_context_pool.h>

namespace chmesh {

// Anything the App starts after the io threads and stops before them.
class IService {
public:
    virtual ~IService() = default;
    virtual void Start() = 0;
    virtual void Stop() = 0;
};

struct AppOptions {
    std::size_t io_threads = 0; // 0: hardware concurrency
    std::string log_level = "info";
};

class App {
public:
    explicit App(AppOptions options);
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    IoContextPool& Io();

    // Started in insertion order, stopped in reverse order.
    void AddService(std::shared_ptr<IService> service);

    // Blocking until Stop() or SIGINT/SIGTERM, then stops services in reverse
    // order and joins the io threads before returning.
    int Run();

    // Thread-safe, callable from a handler on an io thread. Only wakes Run().
    void Stop();

private:
    void Shutdown();

    AppOptions options_;
    IoContextPool io_;
    std::vector<std::shared_ptr<IService>> services_;
    std::unique_ptr<boost::asio::signal_set> signals_;
    std::atomic<bool> running_{false};
    std::mutex stop_mu_;
    std::condition_variable stop_cv_;
    bool stop_requested_{false};
};

} // namespace chmesh
