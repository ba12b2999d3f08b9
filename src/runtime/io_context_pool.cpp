#include <chmesh/runtime/io_context_pool.h>

#include <chmesh/core/log.h>

#include <exception>
#include <stdexcept>

namespace chmesh {

IoContextPool::IoContextPool(std::size_t threads) {
    if (threads == 0) {
        throw std::invalid_argument("IoContextPool threads must be > 0");
    }

    slots_.resize(threads);
    for (auto& slot : slots_) {
        slot.ctx = std::make_unique<boost::asio::io_context>(1);
    }
}

IoContextPool::~IoContextPool() {
    Stop();
}

boost::asio::io_context& IoContextPool::Next() {
    auto idx = rr_.fetch_add(1, std::memory_order_relaxed) % slots_.size();
    return *slots_[idx].ctx;
}

void IoContextPool::Start() {
    bool expected = false;
    if (!started_.compare_exchange_strong(expected, true)) {
        return;
    }

    for (auto& slot : slots_) {
        if (slot.ctx->stopped()) {
            slot.ctx->restart();
        }
        slot.guard.emplace(boost::asio::make_work_guard(*slot.ctx));
        slot.worker = std::thread([c = slot.ctx.get()] {
            for (;;) {
                try {
                    c->run();
                    return;
                } catch (const std::exception& e) {
                    chmesh::log::error("io worker: unhandled exception, continuing: {}", e.what());
                }
            }
        });
    }
}

void IoContextPool::Stop() {
    bool expected = true;
    if (!started_.compare_exchange_strong(expected, false)) {
        return;
    }

    for (auto& slot : slots_) {
        slot.guard.reset();
        slot.ctx->stop();
    }
    for (auto& slot : slots_) {
        if (slot.worker.joinable()) {
            slot.worker.join();
        }
    }
}

} // namespace chmesh
