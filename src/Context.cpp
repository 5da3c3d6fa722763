#include "Context.hpp"
#include <memory>

namespace sqlreplay {

Context::Context(Clock::time_point deadline)
    : m_deadline(deadline) {
}

std::unique_ptr<Context> Context::withTimeout(std::chrono::milliseconds timeout) {
    return std::make_unique<Context>(Clock::now() + timeout);
}

void Context::cancel() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_cancelled = true;
    }
    m_cv.notify_all();
}

bool Context::isDone() const {
    return reason().has_value();
}

std::optional<CancelReason> Context::reason() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_cancelled) {
        return CancelReason::Canceled;
    }
    if (m_deadline && Clock::now() >= *m_deadline) {
        return CancelReason::DeadlineExceeded;
    }
    return std::nullopt;
}

bool Context::waitFor(std::chrono::milliseconds delay) const {
    auto until = Clock::now() + delay;
    bool hitDeadline = false;
    if (m_deadline && *m_deadline < until) {
        until = *m_deadline;
        hitDeadline = true;
    }

    std::unique_lock<std::mutex> lock(m_mutex);
    bool cancelled = m_cv.wait_until(lock, until, [this] { return m_cancelled; });
    if (cancelled) {
        return false;
    }
    return !hitDeadline;
}

void Context::throwIfDone() const {
    auto why = reason();
    if (why) {
        throw CancelledError(*why);
    }
}

}  // namespace sqlreplay
