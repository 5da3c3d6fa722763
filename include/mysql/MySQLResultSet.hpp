#pragma once

/**
 * @file MySQLResultSet.hpp
 * @brief RAII wrapper for MySQL query result sets.
 */

#include "SqlTypes.hpp"
#include <mysql/mysql.h>
#include <string>
#include <vector>

namespace sqlreplay {

/**
 * @class MySQLResultSet
 * @brief Owns a MYSQL_RES returned by mysql_store_result().
 *
 * Not thread-safe; used only by the MySQLConnection that produced it.
 */
class MySQLResultSet {
public:
    /**
     * @brief Construct a result set wrapper.
     * @param res MYSQL_RES handle to manage (takes ownership), or nullptr.
     */
    explicit MySQLResultSet(MYSQL_RES* res = nullptr);

    ~MySQLResultSet();

    // Non-copyable
    MySQLResultSet(const MySQLResultSet&) = delete;
    MySQLResultSet& operator=(const MySQLResultSet&) = delete;

    // Movable
    MySQLResultSet(MySQLResultSet&& other) noexcept;
    MySQLResultSet& operator=(MySQLResultSet&& other) noexcept;

    explicit operator bool() const { return m_res != nullptr; }

    /**
     * @brief Fetch the next row from the result set.
     * @return MYSQL_ROW for the next row, or nullptr if done.
     */
    MYSQL_ROW fetchRow();

    unsigned int numFields() const;

    std::vector<std::string> getColumnNames() const;

    /**
     * @brief Copy every remaining row into a Rows value.
     *
     * Cell lengths come from mysql_fetch_lengths so binary data survives.
     */
    Rows toRows();

private:
    MYSQL_RES* m_res;  ///< MySQL result set handle (owned)
};

}  // namespace sqlreplay
