#pragma once

/**
 * @file MySQLConnection.hpp
 * @brief BaseConn implementation over one libmysqlclient handle.
 */

#include "BaseConn.hpp"
#include <mysql/mysql.h>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace sqlreplay {

class MySQLBaseDB;

/**
 * @class MySQLConnection
 * @brief A live MySQL connection handed out by MySQLBaseDB.
 *
 * The MYSQL handle is closed when the object is destroyed or when the
 * owning MySQLBaseDB force-closes it, whichever comes first.
 *
 * Statement arguments are interpolated client side: each '?' outside a
 * quoted literal is replaced by the escaped value.
 *
 * Thread Safety:
 * - NOT thread-safe; owned by a single DBConn.
 */
class MySQLConnection : public BaseConn {
public:
    using Escaper = std::function<std::string(const std::string&)>;

    /**
     * @param db Owning database (for closing the connection).
     * @param conn Connected MySQL handle, ownership is taken.
     */
    MySQLConnection(MySQLBaseDB* db, MYSQL* conn);

    ~MySQLConnection() override;

    bool isValid() const { return m_conn != nullptr; }

    /**
     * @brief Run a query and materialise its result.
     * @throws MySQLException on driver or server errors.
     * @throws CancelledError if @p ctx is done before the query is sent.
     */
    Rows querySQL(Context& ctx, const std::string& query, const Args& args) override;

    /**
     * @brief Run the statements inside one transaction.
     *
     * On failure the transaction is rolled back (best effort) and the
     * original error is rethrown.
     */
    void executeSQL(Context& ctx,
                    const std::vector<std::string>& statements,
                    const std::vector<Args>& argsPerStatement) override;

    /**
     * @brief Replace '?' placeholders with SQL literals.
     * @throws MySQLException (CR_PARAMS_NOT_BOUND) if the number of
     *         placeholders and arguments differ.
     */
    static std::string interpolateParams(const std::string& sql,
                                         const Args& args,
                                         const Escaper& escape);

private:
    friend class MySQLBaseDB;

    // Send one statement and discard any result, throws on error
    void runStatement(const std::string& sql);

    void rollback();

    std::string escape(const std::string& value) const;

    /**
     * @brief Close the handle through the owning database.
     * Called by the destructor and by MySQLBaseDB::forceCloseConn.
     */
    void release();

    MySQLBaseDB* m_db;   ///< Owning database
    MYSQL* m_conn;       ///< MySQL connection handle
};

}  // namespace sqlreplay
