#pragma once

#include "BaseConn.hpp"
#include <cstddef>
#include <memory>

namespace sqlreplay {

class Context;

/**
 * @class BaseDB
 * @brief Shared source of connections to the downstream database.
 *
 * All methods must be safe to call from several worker threads at once:
 * workers recover their connections independently.
 */
class BaseDB {
public:
    virtual ~BaseDB() = default;

    // Non-copyable, non-movable
    BaseDB(const BaseDB&) = delete;
    BaseDB& operator=(const BaseDB&) = delete;

    /**
     * @brief Open a new connection.
     * @throws MySQLException if the connection cannot be established.
     */
    virtual std::unique_ptr<BaseConn> getBaseConn(Context& ctx) = 0;

    /**
     * @brief Close a connection immediately, without returning it anywhere.
     * @throws MySQLException if the driver reports a failure.
     */
    virtual void forceCloseConn(BaseConn& conn) = 0;

    // Number of connections handed out and not yet closed
    virtual size_t openCount() const = 0;

    // Release everything; further getBaseConn calls fail
    virtual void close() = 0;

protected:
    BaseDB() = default;
};

}  // namespace sqlreplay
