#pragma once

/**
 * @file MySQLBaseDB.hpp
 * @brief Source of downstream MySQL connections shared by all workers.
 */

#include "BaseDB.hpp"
#include "Config.hpp"
#include <mysql/mysql.h>
#include <atomic>
#include <memory>

namespace sqlreplay {

class MySQLConnection;

/**
 * @class MySQLBaseDB
 * @brief Opens and closes libmysqlclient connections for one target database.
 *
 * Unlike a classic pool, connections are not recycled: each worker keeps its
 * MySQLConnection for the whole task and a broken one is force-closed and
 * replaced.
 *
 * Thread Safety:
 * - All public methods are thread-safe.
 * - Individual MySQLConnection objects should only be used by one thread.
 */
class MySQLBaseDB : public BaseDB {
public:
    /**
     * @brief Initialise the client library and check the target is reachable.
     * @throws MySQLException if a probe connection cannot be established.
     */
    explicit MySQLBaseDB(const ConnectionConfig& config);

    ~MySQLBaseDB() override;

    /**
     * @throws MySQLException on connection failure or after close().
     * @throws CancelledError if @p ctx is done.
     */
    std::unique_ptr<BaseConn> getBaseConn(Context& ctx) override;

    /**
     * @throws MySQLException if @p conn was not opened by a MySQLBaseDB.
     */
    void forceCloseConn(BaseConn& conn) override;

    size_t openCount() const override { return m_openCount.load(); }

    void close() override;

    const ConnectionConfig& config() const { return m_config; }

private:
    friend class MySQLConnection;  // For destroyConnection access

    /**
     * @brief Create a new MySQL connection.
     * @throws MySQLException on connection failure.
     */
    MYSQL* createConnection();

    /**
     * @brief Close and free a MySQL connection.
     */
    void destroyConnection(MYSQL* conn);

    ConnectionConfig m_config;                  ///< Connection parameters
    std::atomic<size_t> m_openCount{0};         ///< Connections not yet closed
    std::atomic<bool> m_closed{false};          ///< True after close()
};

}  // namespace sqlreplay
