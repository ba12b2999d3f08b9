#pragma once

#include <chrono>
#include <mutex>

namespace chmesh {

// Time source for everything that ages records. Tests swap in ManualClock.
class Clock {
public:
    using time_point = std::chrono::steady_clock::time_point;
    using duration = std::chrono::steady_clock::duration;

    virtual ~Clock() = default;

    // Thread-safe
    virtual time_point Now() const = 0;
};

class SteadyClock final : public Clock {
public:
    time_point Now() const override { return std::chrono::steady_clock::now(); }
};

// Only moves when told to.
class ManualClock final : public Clock {
public:
    ManualClock() : now_(std::chrono::steady_clock::time_point{} + std::chrono::hours(1)) {}

    time_point Now() const override {
        std::lock_guard<std::mutex> lk(mu_);
        return now_;
    }

    void Advance(duration d) {
        std::lock_guard<std::mutex> lk(mu_);
        now_ += d;
    }

private:
    mutable std::mutex mu_;
    time_point now_;
};

// Shared instance for production wiring.
const Clock& SystemClock();

} // namespace chmesh
