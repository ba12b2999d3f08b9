#include <chtest.hpp>

#include <chmesh/resilience/retry.h>

#include <chrono>

using chmesh::resilience::RetryOptions;
using chmesh::resilience::RetryPolicy;
using namespace std::chrono_literals;

TEST_CASE("RetryPolicy from budget counts the first attempt") {
    auto p = RetryPolicy::FromBudget(1, 0ms);
    REQUIRE(p.max_attempts() == 2);
    REQUIRE(p.retry_budget() == 1);

    auto none = RetryPolicy::FromBudget(-3, 0ms);
    REQUIRE(none.max_attempts() == 1);
}

TEST_CASE("RetryPolicy without base backoff never waits") {
    auto p = RetryPolicy::FromBudget(3, 0ms);
    for (int attempt = 1; attempt <= 4; ++attempt) {
        REQUIRE(p.BackoffBeforeAttempt(attempt) == 0ms);
    }
}

TEST_CASE("RetryPolicy backoff grows and stays capped") {
    RetryOptions opts;
    opts.max_attempts = 6;
    opts.base_backoff = 10ms;
    opts.max_backoff = 40ms;
    opts.jitter_ratio = 0.0;
    RetryPolicy p(opts);

    REQUIRE(p.BackoffBeforeAttempt(1) == 0ms);
    REQUIRE(p.BackoffBeforeAttempt(2) == 10ms);
    REQUIRE(p.BackoffBeforeAttempt(3) == 20ms);
    REQUIRE(p.BackoffBeforeAttempt(4) == 40ms);
    REQUIRE(p.BackoffBeforeAttempt(5) == 40ms);
}

TEST_CASE("RetryPolicy jitter stays within bounds") {
    RetryOptions opts;
    opts.base_backoff = 100ms;
    opts.max_backoff = 1000ms;
    opts.jitter_ratio = 0.5;
    RetryPolicy p(opts);

    for (int i = 0; i < 50; ++i) {
        auto d = p.BackoffBeforeAttempt(2);
        REQUIRE(d >= 50ms);
        REQUIRE(d <= 150ms);
    }
}
