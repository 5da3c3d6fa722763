#pragma once

/**
 * @file ConnectionPool.hpp
 * @brief Fixed-size set of worker connections to the downstream database.
 */

#include "BaseDB.hpp"
#include "Config.hpp"
#include "DBConn.hpp"
#include "MetricsSink.hpp"
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace sqlreplay {

class Context;
class FaultInjector;

// Builds the shared BaseDB for a target database
using BaseDBOpener = std::function<std::unique_ptr<BaseDB>(const ConnectionConfig&)>;

// Default opener, backed by libmysqlclient
std::unique_ptr<BaseDB> openMySQLBaseDB(const ConnectionConfig& config);

struct PoolOptions {
    std::string name;
    std::string sourceId;

    // Non-owning; a no-op sink is used when null
    MetricsSink* metrics = nullptr;

    // Non-owning; tests only
    FaultInjector* faultInjector = nullptr;

    DBConnOptions connOptions;
};

/**
 * @class ConnectionPool
 * @brief Owns the shared BaseDB and one DBConn per worker.
 *
 * The pool is built all-or-nothing: create() either returns a pool holding
 * exactly workerCount connections, or throws after closing the BaseDB. The
 * set of connections never changes afterwards; recovery only swaps the
 * BaseConn inside a DBConn.
 *
 * The pool is the ConnectionRecovery of each of its DBConns, so it must
 * outlive every use of connection(i).
 *
 * Thread Safety:
 * - connection(i) may be handed to worker i; workers never share a DBConn.
 * - recover() is called concurrently by workers; the BaseDB serialises
 *   what it needs to.
 */
class ConnectionPool : public ConnectionRecovery {
    // Restricts construction to create()
    struct PrivateTag {};

public:
    /**
     * @brief Build a pool of @p workerCount connections.
     * @param ctx Cancellation for the connection attempts.
     * @param config Target database.
     * @param workerCount Number of connections, at least 1.
     * @param options Labels, metrics sink and optional fault injector.
     * @param opener Factory for the shared BaseDB.
     * @throws std::invalid_argument if workerCount is 0.
     * @throws ReplayException (Downstream scope) if the BaseDB or any
     *         connection could not be opened.
     */
    static std::unique_ptr<ConnectionPool> create(Context& ctx,
                                                  const ConnectionConfig& config,
                                                  size_t workerCount,
                                                  const PoolOptions& options,
                                                  const BaseDBOpener& opener = openMySQLBaseDB);

    ConnectionPool(PrivateTag,
                   const ConnectionConfig& config,
                   std::unique_ptr<BaseDB> baseDB,
                   MetricsSink* metrics);

    ~ConnectionPool() override;

    // Non-copyable, non-movable
    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    size_t size() const { return m_conns.size(); }

    /**
     * @brief Connection reserved for worker @p index.
     * @throws std::out_of_range if index >= size().
     */
    DBConn& connection(size_t index);

    const ConnectionConfig& config() const { return m_config; }

    BaseDB& baseDB() { return *m_baseDB; }

    /**
     * @brief Drop every connection and close the BaseDB.
     *
     * Close failures are logged. Safe to call more than once.
     */
    void close();

    // ----- ConnectionRecovery -----

    /**
     * @brief Force-close @p current (best effort) and open a new connection.
     * @throws ResetConnectionError if the BaseDB cannot open a connection.
     */
    std::unique_ptr<BaseConn> recover(Context& ctx, BaseConn& current) override;

private:
    ConnectionConfig m_config;
    std::unique_ptr<BaseDB> m_baseDB;
    std::vector<std::unique_ptr<DBConn>> m_conns;

    NoopMetricsSink m_noopMetrics;
    MetricsSink* m_metrics;
    bool m_closed = false;
};

}  // namespace sqlreplay
