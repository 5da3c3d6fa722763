#include "RetryPolicy.hpp"

namespace sqlreplay {

const char* toString(RetryAction action) {
    switch (action) {
        case RetryAction::Retry:            return "retry";
        case RetryAction::RecoverThenRetry: return "recover-then-retry";
        case RetryAction::Fail:             return "fail";
    }
    return "unknown";
}

RetryPolicy RetryPolicy::forQuery() {
    RetryPolicy policy;
    policy.maxAttempts = 10;
    policy.firstDelay = std::chrono::seconds(1);
    policy.backoffStrategy = BackoffStrategy::Stable;
    return policy;
}

RetryPolicy RetryPolicy::forExecute() {
    RetryPolicy policy;
    policy.maxAttempts = 10;
    policy.firstDelay = std::chrono::seconds(2);
    policy.backoffStrategy = BackoffStrategy::LinearIncrease;
    return policy;
}

std::chrono::milliseconds RetryPolicy::backoff(int attempt) const {
    if (attempt < 0) attempt = 0;

    switch (backoffStrategy) {
        case BackoffStrategy::LinearIncrease:
            return firstDelay * (attempt + 1);
        case BackoffStrategy::Stable:
            break;
    }
    return firstDelay;
}

RetryAction RetryPolicy::decide(ErrorClass cls) const {
    switch (cls) {
        case ErrorClass::ConnectionLost:
            return RetryAction::RecoverThenRetry;
        case ErrorClass::Retryable:
            return RetryAction::Retry;
        case ErrorClass::Fatal:
        case ErrorClass::Idempotent:
            break;
    }
    return RetryAction::Fail;
}

}  // namespace sqlreplay
