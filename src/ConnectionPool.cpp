#include "ConnectionPool.hpp"
#include "Context.hpp"
#include "ErrorHandler.hpp"
#include "MySQLBaseDB.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace sqlreplay {

std::unique_ptr<BaseDB> openMySQLBaseDB(const ConnectionConfig& config) {
    return std::make_unique<MySQLBaseDB>(config);
}

ConnectionPool::ConnectionPool(PrivateTag,
                               const ConnectionConfig& config,
                               std::unique_ptr<BaseDB> baseDB,
                               MetricsSink* metrics)
    : m_config(config),
      m_baseDB(std::move(baseDB)),
      m_metrics(metrics ? metrics : &m_noopMetrics) {
}

ConnectionPool::~ConnectionPool() {
    close();
}

std::unique_ptr<ConnectionPool> ConnectionPool::create(Context& ctx,
                                                       const ConnectionConfig& config,
                                                       size_t workerCount,
                                                       const PoolOptions& options,
                                                       const BaseDBOpener& opener) {
    if (workerCount == 0) {
        throw std::invalid_argument("connection pool needs at least one worker");
    }

    std::unique_ptr<BaseDB> baseDB;
    try {
        baseDB = opener(config);
    } catch (ReplayException& e) {
        e.setScope(ErrorScope::Downstream);
        throw;
    }
    if (!baseDB) {
        throw ReplayException("failed to open downstream database", ErrorScope::Downstream);
    }

    auto pool = std::make_unique<ConnectionPool>(PrivateTag{}, config,
                                                 std::move(baseDB), options.metrics);

    pool->m_conns.reserve(workerCount);
    try {
        for (size_t i = 0; i < workerCount; ++i) {
            std::unique_ptr<BaseConn> conn = pool->m_baseDB->getBaseConn(ctx);
            pool->m_conns.push_back(std::make_unique<DBConn>(
                options.name, options.sourceId, std::move(conn), *pool,
                *pool->m_metrics, options.faultInjector, options.connOptions));
        }
    } catch (ReplayException& e) {
        spdlog::error("failed to create connection {} of {} for {}: {}",
                      pool->m_conns.size() + 1, workerCount, options.name, e.what());
        pool->close();
        e.setScope(ErrorScope::Downstream);
        throw;
    }

    spdlog::info("connection pool for {} ({}) created with {} connections to {}:{}",
                 options.name, options.sourceId, workerCount, config.host, config.port);
    return pool;
}

DBConn& ConnectionPool::connection(size_t index) {
    if (index >= m_conns.size()) {
        throw std::out_of_range("connection index " + std::to_string(index) +
                                " out of range (pool size " +
                                std::to_string(m_conns.size()) + ")");
    }
    return *m_conns[index];
}

void ConnectionPool::close() {
    if (m_closed) {
        return;
    }
    m_closed = true;

    // Connections go back to the BaseDB before it is closed
    m_conns.clear();

    try {
        m_baseDB->close();
    } catch (const ReplayException& e) {
        spdlog::error("failed to close base database: {}", e.what());
    }
}

std::unique_ptr<BaseConn> ConnectionPool::recover(Context& ctx, BaseConn& current) {
    try {
        m_baseDB->forceCloseConn(current);
    } catch (const ReplayException& e) {
        spdlog::warn("failed to close connection in reset: {}", e.what());
    }

    try {
        return m_baseDB->getBaseConn(ctx);
    } catch (const MySQLException& e) {
        throw ResetConnectionError(std::string("failed to open a new connection: ") + e.what(),
                                   e.errorCode(), ErrorScope::Downstream);
    }
}

}  // namespace sqlreplay
