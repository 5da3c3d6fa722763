#pragma once

/**
 * @file DBConn.hpp
 * @brief Retrying connection used by one loader worker.
 *
 * A DBConn wraps one BaseConn and runs every query and statement batch under
 * a RetryPolicy. Failures are classified by ErrorHandler; a lost connection is
 * replaced through the ConnectionRecovery supplied by the owning pool.
 */

#include "BaseConn.hpp"
#include "ErrorHandler.hpp"
#include "RetryPolicy.hpp"
#include "SqlTypes.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace sqlreplay {

class Context;
class FaultInjector;
class MetricsSink;

/**
 * @class ConnectionRecovery
 * @brief Capability to discard a broken BaseConn and obtain a new one.
 */
class ConnectionRecovery {
public:
    virtual ~ConnectionRecovery() = default;

    /**
     * @brief Close @p current and open a replacement.
     * @return The new connection; @p current must no longer be used.
     * @throws ResetConnectionError if no replacement could be opened.
     * @throws CancelledError if @p ctx is done.
     */
    virtual std::unique_ptr<BaseConn> recover(Context& ctx, BaseConn& current) = 0;
};

struct DBConnOptions {
    RetryPolicy queryPolicy = RetryPolicy::forQuery();
    RetryPolicy executePolicy = RetryPolicy::forExecute();

    // Successful attempts slower than this are logged as warnings
    std::chrono::milliseconds slowThreshold{1000};
};

/**
 * @class DBConn
 * @brief A live downstream connection owned by a single worker.
 *
 * Thread Safety:
 * - NOT thread-safe. One worker thread drives one DBConn; operations on the
 *   same DBConn never overlap.
 * - Different DBConns of one pool are independent and may run in parallel.
 */
class DBConn {
public:
    /**
     * @param name Display name, used as metric and log label.
     * @param sourceId Upstream source identifier, used as metric and log label.
     * @param conn Underlying connection, may be null (every call then fails).
     * @param recovery Non-owning; must outlive this DBConn.
     * @param metrics Non-owning; must outlive this DBConn.
     * @param faultInjector Optional, tests only.
     */
    DBConn(std::string name,
           std::string sourceId,
           std::unique_ptr<BaseConn> conn,
           ConnectionRecovery& recovery,
           MetricsSink& metrics,
           FaultInjector* faultInjector = nullptr,
           DBConnOptions options = DBConnOptions());

    DBConn(const DBConn&) = delete;
    DBConn& operator=(const DBConn&) = delete;

    /**
     * @brief Run a query, retrying transient failures.
     * @throws InvalidConnectionError if there is no underlying connection.
     * @throws ResetConnectionError if a lost connection could not be replaced.
     * @throws IdempotentOutcomeError for already-exists / duplicate-key errors.
     * @throws MySQLException for fatal errors or when the budget is exhausted.
     * @throws CancelledError if @p ctx is cancelled or its deadline passes.
     */
    Rows query(Context& ctx, const std::string& statement, const Args& args = Args());

    /**
     * @brief Execute a batch of statements, retrying the whole batch.
     *
     * An empty batch returns immediately. Errors are as for query().
     *
     * @param argsPerStatement Empty, or exactly one Args per statement.
     * @throws std::invalid_argument on an argument count mismatch.
     */
    void execute(Context& ctx,
                 const std::vector<std::string>& statements,
                 const std::vector<Args>& argsPerStatement = std::vector<Args>());

    /**
     * @brief Replace the underlying connection through the recovery capability.
     *
     * On failure the current connection is left in place.
     */
    void resetConn(Context& ctx);

    bool isValid() const { return m_conn != nullptr; }

    const std::string& name() const { return m_name; }
    const std::string& sourceId() const { return m_sourceId; }

    // Downstream once a connection is present
    ErrorScope scope() const;

private:
    struct OperationLog {
        const char* operation;   // e.g. "query statement"
        std::function<std::string()> statements;
        std::function<std::string()> args;
    };

    template <typename Result>
    Result applyRetryStrategy(Context& ctx,
                              const RetryPolicy& policy,
                              const OperationLog& log,
                              const std::function<Result()>& attempt,
                              const std::function<void()>& onAttemptFailed);

    [[noreturn]] void failCancelled(CancelReason reason, const OperationLog& log) const;
    [[noreturn]] void failTerminal(const MySQLException& error, ErrorClass cls,
                                   int attempt, const OperationLog& log) const;

    void checkSlow(std::chrono::steady_clock::duration cost, const OperationLog& log) const;

    std::string m_name;
    std::string m_sourceId;
    std::unique_ptr<BaseConn> m_conn;

    ConnectionRecovery& m_recovery;
    MetricsSink& m_metrics;
    FaultInjector* m_faultInjector;
    DBConnOptions m_options;
};

}  // namespace sqlreplay
