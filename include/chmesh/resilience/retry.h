#pragma once

#include <chrono>
#include <mutex>
#include <random>

namespace chmesh::resilience {

struct RetryOptions {
    int max_attempts = 2; // first try included
    std::chrono::milliseconds base_backoff{0};
    std::chrono::milliseconds max_backoff{200};
    double jitter_ratio = 0.2; // [0,1]
};

class RetryPolicy {
public:
    explicit RetryPolicy(RetryOptions opts);

    // Gateway wiring: `retry_budget` retries after the first attempt.
    static RetryPolicy FromBudget(int retry_budget, std::chrono::milliseconds base_backoff);

    RetryPolicy(const RetryPolicy& other) : RetryPolicy(other.opts_) {}
    RetryPolicy& operator=(const RetryPolicy&) = delete;

    int max_attempts() const { return opts_.max_attempts; }
    int retry_budget() const { return opts_.max_attempts - 1; }

    // Thread-safe. attempt: 1..max_attempts; attempt 1 (and a zero base) waits 0.
    std::chrono::milliseconds BackoffBeforeAttempt(int attempt) const;

private:
    RetryOptions opts_;

    mutable std::mutex mu_;
    mutable std::mt19937 gen_;
};

} // namespace chmesh::resilience
