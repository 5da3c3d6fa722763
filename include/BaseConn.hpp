#pragma once

#include "SqlTypes.hpp"
#include <string>
#include <vector>

namespace sqlreplay {

class Context;

/**
 * @class BaseConn
 * @brief One live connection to the downstream database.
 *
 * Implementations raise MySQLException on driver or server errors and
 * CancelledError when the context is done before the call is dispatched.
 * A BaseConn is owned by exactly one DBConn and is never used concurrently.
 */
class BaseConn {
public:
    virtual ~BaseConn() = default;

    // Non-copyable, non-movable
    BaseConn(const BaseConn&) = delete;
    BaseConn& operator=(const BaseConn&) = delete;

    virtual Rows querySQL(Context& ctx, const std::string& query, const Args& args) = 0;

    /**
     * @brief Execute a batch of statements as one unit.
     * @param argsPerStatement Empty, or one Args per statement.
     */
    virtual void executeSQL(Context& ctx,
                            const std::vector<std::string>& statements,
                            const std::vector<Args>& argsPerStatement) = 0;

protected:
    BaseConn() = default;
};

}  // namespace sqlreplay
