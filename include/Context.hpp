#pragma once

#include "ErrorHandler.hpp"
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>

namespace sqlreplay {

/**
 * @class Context
 * @brief Cancellation and deadline signal shared by one or more operations.
 *
 * A Context is created by the caller and passed by reference into every
 * DBConn operation. cancel() may be called from any thread; waits blocked
 * in waitFor() wake up immediately.
 */
class Context {
public:
    using Clock = std::chrono::steady_clock;

    Context() = default;
    explicit Context(Clock::time_point deadline);

    // Non-copyable, non-movable (waiters hold references)
    Context(const Context&) = delete;
    Context& operator=(const Context&) = delete;

    static std::unique_ptr<Context> withTimeout(std::chrono::milliseconds timeout);

    void cancel();

    bool isDone() const;

    /**
     * @brief Why the context is done.
     * @return std::nullopt while the context is still live.
     */
    std::optional<CancelReason> reason() const;

    std::optional<Clock::time_point> deadline() const { return m_deadline; }

    /**
     * @brief Block for up to @p delay.
     * @return true if the full delay elapsed, false if the context finished first.
     */
    bool waitFor(std::chrono::milliseconds delay) const;

    // Throws CancelledError if the context is done
    void throwIfDone() const;

private:
    std::optional<Clock::time_point> m_deadline;
    bool m_cancelled = false;

    mutable std::mutex m_mutex;
    mutable std::condition_variable m_cv;
};

}  // namespace sqlreplay
