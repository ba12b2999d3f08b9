#include <chmesh/runtime/app.h>

#include <chmesh/core/log.h>

#include <csignal>
#include <thread>

#include <boost/asio/signal_set.hpp>

namespace chmesh {
namespace {

std::size_t ResolveThreads(std::size_t requested) {
    if (requested != 0) {
        return requested;
    }
    auto hc = static_cast<std::size_t>(std::thread::hardware_concurrency());
    return hc == 0 ? static_cast<std::size_t>(1) : hc;
}

} // namespace

App::App(AppOptions options)
    : options_(std::move(options)), io_(ResolveThreads(options_.io_threads)) {
    chmesh::log::Init(options_.log_level);
}

App::~App() {
    Shutdown();
}

IoContextPool& App::Io() {
    return io_;
}

void App::AddService(std::shared_ptr<IService> service) {
    services_.push_back(std::move(service));
}

int App::Run() {
    {
        std::lock_guard<std::mutex> lk(stop_mu_);
        stop_requested_ = false;
    }

    signals_ = std::make_unique<boost::asio::signal_set>(io_.Next(), SIGINT, SIGTERM);
    signals_->async_wait([this](const boost::system::error_code& ec, int sig) {
        if (ec) {
            return;
        }
        chmesh::log::info("Signal {} received", sig);
        this->Stop();
    });

    io_.Start();
    running_.store(true, std::memory_order_release);

    for (auto& s : services_) {
        s->Start();
    }

    {
        std::unique_lock<std::mutex> lk(stop_mu_);
        stop_cv_.wait(lk, [&] { return stop_requested_; });
    }

    Shutdown();
    return 0;
}

void App::Stop() {
    {
        std::lock_guard<std::mutex> lk(stop_mu_);
        stop_requested_ = true;
    }
    stop_cv_.notify_all();
}

// Runs on the thread that called Run(), never on an io thread: the pool joins them.
void App::Shutdown() {
    if (!running_.exchange(false, std::memory_order_acq_rel)) {
        return;
    }

    chmesh::log::info("Stopping...");
    for (auto it = services_.rbegin(); it != services_.rend(); ++it) {
        (*it)->Stop();
    }
    if (signals_) {
        boost::system::error_code ec;
        signals_->cancel(ec);
    }
    io_.Stop();
    signals_.reset();
    chmesh::log::info("Stopped.");
}

} // namespace chmesh
