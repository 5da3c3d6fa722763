#include "DBConn.hpp"
#include "Context.hpp"
#include "FaultInjector.hpp"
#include "LogUtil.hpp"
#include "MetricsSink.hpp"
#include <spdlog/spdlog.h>
#include <optional>
#include <stdexcept>

namespace sqlreplay {

using Clock = std::chrono::steady_clock;

DBConn::DBConn(std::string name,
               std::string sourceId,
               std::unique_ptr<BaseConn> conn,
               ConnectionRecovery& recovery,
               MetricsSink& metrics,
               FaultInjector* faultInjector,
               DBConnOptions options)
    : m_name(std::move(name)),
      m_sourceId(std::move(sourceId)),
      m_conn(std::move(conn)),
      m_recovery(recovery),
      m_metrics(metrics),
      m_faultInjector(faultInjector),
      m_options(std::move(options)) {
}

ErrorScope DBConn::scope() const {
    return m_conn ? ErrorScope::Downstream : ErrorScope::NotSet;
}

// ============================================================================
// Query Execution
// ============================================================================

Rows DBConn::query(Context& ctx, const std::string& statement, const Args& args) {
    if (!m_conn) {
        throw InvalidConnectionError("database connection not valid", ErrorScope::Downstream);
    }

    OperationLog log{
        "query statement",
        [&statement] { return truncateString(statement); },
        [&args] { return formatArgs(args); },
    };

    std::function<Rows()> attempt = [&]() {
        auto start = Clock::now();
        Rows rows = m_conn->querySQL(ctx, statement, args);

        auto cost = Clock::now() - start;
        m_metrics.observeQueryDuration(m_name, m_sourceId,
                                       std::chrono::duration<double>(cost).count());
        checkSlow(cost, log);
        return rows;
    };

    return applyRetryStrategy<Rows>(ctx, m_options.queryPolicy, log, attempt, nullptr);
}

void DBConn::execute(Context& ctx,
                     const std::vector<std::string>& statements,
                     const std::vector<Args>& argsPerStatement) {
    if (statements.empty()) {
        return;
    }

    if (!m_conn) {
        throw InvalidConnectionError("database connection not valid", ErrorScope::Downstream);
    }

    if (!argsPerStatement.empty() && argsPerStatement.size() != statements.size()) {
        throw std::invalid_argument("execute: " + std::to_string(argsPerStatement.size()) +
                                    " argument lists for " + std::to_string(statements.size()) +
                                    " statements");
    }

    OperationLog log{
        "execute statements",
        [&statements] { return formatStatements(statements); },
        [&argsPerStatement] { return formatArgs(argsPerStatement); },
    };

    std::function<void()> attempt = [&]() {
        auto start = Clock::now();

        std::optional<MySQLException> failure;
        try {
            m_conn->executeSQL(ctx, statements, argsPerStatement);
        } catch (const MySQLException& e) {
            failure.emplace(e);
        }

        // The injected error overrides the real outcome, as if the reply was lost
        if (m_faultInjector) {
            m_faultInjector->maybeFail(kExecCreateTableFailed, statements);
        }

        if (failure) {
            throw *failure;
        }
        checkSlow(Clock::now() - start, log);
    };

    std::function<void()> countError = [this]() {
        m_metrics.incExecutionError(m_name, m_sourceId);
    };

    applyRetryStrategy<void>(ctx, m_options.executePolicy, log, attempt, countError);
}

// ============================================================================
// Connection Recovery
// ============================================================================

void DBConn::resetConn(Context& ctx) {
    if (!m_conn) {
        throw InvalidConnectionError("database connection not valid", ErrorScope::Downstream);
    }

    std::unique_ptr<BaseConn> fresh = m_recovery.recover(ctx, *m_conn);
    if (!fresh) {
        throw ResetConnectionError("recovery returned no connection", 0, ErrorScope::Downstream);
    }
    m_conn = std::move(fresh);
    spdlog::info("[{}/{}] connection reset", m_name, m_sourceId);
}

// ============================================================================
// Retry Loop
// ============================================================================

template <typename Result>
Result DBConn::applyRetryStrategy(Context& ctx,
                                  const RetryPolicy& policy,
                                  const OperationLog& log,
                                  const std::function<Result()>& attempt,
                                  const std::function<void()>& onAttemptFailed) {
    for (int i = 0;; ++i) {
        if (auto why = ctx.reason()) {
            failCancelled(*why, log);
        }

        std::optional<MySQLException> failure;
        try {
            return attempt();
        } catch (const CancelledError& e) {
            failCancelled(e.reason(), log);
        } catch (const MySQLException& e) {
            failure.emplace(e);
        }

        if (onAttemptFailed) {
            onAttemptFailed();
        }

        // A failure observed after cancellation is a consequence of it
        if (auto why = ctx.reason()) {
            failCancelled(*why, log);
        }

        ErrorClass cls = ErrorHandler::classify(*failure);
        RetryAction action = policy.decide(cls);
        if (action == RetryAction::Fail || !policy.hasBudgetAfter(i)) {
            failTerminal(*failure, cls, i, log);
        }

        if (action == RetryAction::RecoverThenRetry) {
            try {
                resetConn(ctx);
            } catch (ResetConnectionError& e) {
                spdlog::error("[{}/{}] reset connection failed, retry={}, operation={}, statements={}, arguments={}: {}",
                              m_name, m_sourceId, i, log.operation,
                              log.statements(), log.args(), e.what());
                e.setScope(ErrorScope::Downstream);
                throw;
            } catch (const CancelledError& e) {
                failCancelled(e.reason(), log);
            }
        } else {
            spdlog::warn("[{}/{}] {} failed, retry={}, statements={}, arguments={}: {}",
                         m_name, m_sourceId, log.operation, i,
                         log.statements(), log.args(), failure->what());
        }

        if (!ctx.waitFor(policy.backoff(i))) {
            failCancelled(ctx.reason().value_or(CancelReason::DeadlineExceeded), log);
        }
    }
}

void DBConn::failCancelled(CancelReason reason, const OperationLog& log) const {
    spdlog::debug("[{}/{}] {} stopped: {}, statements={}",
                  m_name, m_sourceId, log.operation, toString(reason), log.statements());
    throw CancelledError(reason, ErrorScope::Downstream);
}

void DBConn::failTerminal(const MySQLException& error, ErrorClass cls,
                          int attempt, const OperationLog& log) const {
    if (cls == ErrorClass::Idempotent) {
        spdlog::info("[{}/{}] {} reached an existing state (code {}), statements={}: {}",
                     m_name, m_sourceId, log.operation, error.errorCode(),
                     log.statements(), error.what());
        throw IdempotentOutcomeError(error.errorCode(), error.what(), ErrorScope::Downstream);
    }

    spdlog::error("[{}/{}] {} failed after retry, attempts={}, class={}, statements={}, arguments={}: {}",
                  m_name, m_sourceId, log.operation, attempt + 1, toString(cls),
                  log.statements(), log.args(), error.what());
    MySQLException terminal(error);
    terminal.setScope(ErrorScope::Downstream);
    throw terminal;
}

void DBConn::checkSlow(Clock::duration cost, const OperationLog& log) const {
    if (cost <= m_options.slowThreshold) {
        return;
    }
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(cost).count();
    spdlog::warn("[{}/{}] {} too slow, cost={}ms, statements={}, arguments={}",
                 m_name, m_sourceId, log.operation, ms, log.statements(), log.args());
}

}  // namespace sqlreplay
