#pragma once

#include "ErrorHandler.hpp"
#include <chrono>

namespace sqlreplay {

// Shape of the delay between two attempts
enum class BackoffStrategy {
    Stable,          // every wait is firstDelay
    LinearIncrease   // the n-th wait is n * firstDelay
};

// What the retry loop does after a failed attempt
enum class RetryAction {
    Retry,
    RecoverThenRetry,
    Fail
};

const char* toString(RetryAction action);

/**
 * @struct RetryPolicy
 * @brief Retry budget and decision function for one kind of operation.
 *
 * The decision is a pure function of the error class. Recovering the
 * connection is the caller's job when RecoverThenRetry is returned.
 */
struct RetryPolicy {
    int maxAttempts = 10;
    std::chrono::milliseconds firstDelay{1000};
    BackoffStrategy backoffStrategy = BackoffStrategy::Stable;

    // 10 attempts, 1s constant delay
    static RetryPolicy forQuery();

    // 10 attempts, 2s delay growing linearly
    static RetryPolicy forExecute();

    /**
     * @brief Delay to wait after a failed attempt.
     * @param attempt Zero-based index of the attempt that just failed.
     */
    std::chrono::milliseconds backoff(int attempt) const;

    RetryAction decide(ErrorClass cls) const;

    // True if another attempt is allowed after attempt index @p attempt
    bool hasBudgetAfter(int attempt) const { return attempt + 1 < maxAttempts; }
};

}  // namespace sqlreplay
