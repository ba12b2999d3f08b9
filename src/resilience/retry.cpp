#include <chmesh/resilience/retry.h>

#include <algorithm>
#include <cmath>

namespace chmesh::resilience {

RetryPolicy::RetryPolicy(RetryOptions opts) : opts_(opts), gen_(std::random_device{}()) {
    if (opts_.max_attempts < 1) {
        opts_.max_attempts = 1;
    }
    if (opts_.base_backoff.count() < 0) {
        opts_.base_backoff = std::chrono::milliseconds(0);
    }
    opts_.jitter_ratio = std::clamp(opts_.jitter_ratio, 0.0, 1.0);
}

RetryPolicy RetryPolicy::FromBudget(int retry_budget, std::chrono::milliseconds base_backoff) {
    RetryOptions opts;
    opts.max_attempts = std::max(0, retry_budget) + 1;
    opts.base_backoff = base_backoff;
    opts.max_backoff = std::max(opts.max_backoff, base_backoff);
    return RetryPolicy(opts);
}

std::chrono::milliseconds RetryPolicy::BackoffBeforeAttempt(int attempt) const {
    if (attempt <= 1 || opts_.base_backoff.count() == 0) {
        return std::chrono::milliseconds(0);
    }

    // Exponential backoff: base * 2^(attempt-2)
    double factor = std::pow(2.0, static_cast<double>(attempt - 2));
    auto raw = static_cast<long long>(static_cast<double>(opts_.base_backoff.count()) * factor);
    raw = std::min<long long>(raw, opts_.max_backoff.count());

    double jitter = 0.0;
    {
        std::lock_guard<std::mutex> lk(mu_);
        std::uniform_real_distribution<double> dist(-opts_.jitter_ratio, opts_.jitter_ratio);
        jitter = dist(gen_);
    }

    auto jittered = static_cast<long long>(static_cast<double>(raw) * (1.0 + jitter));
    jittered = std::clamp<long long>(jittered, 0, opts_.max_backoff.count());
    return std::chrono::milliseconds(jittered);
}

} // namespace chmesh::resilience
