/**
 * @file MySQLConnection.cpp
 * @brief Implementation of the libmysqlclient BaseConn.
 */

#include "MySQLConnection.hpp"
#include "MySQLBaseDB.hpp"
#include "MySQLResultSet.hpp"
#include "Context.hpp"
#include "ErrorHandler.hpp"
#include <mysql/errmsg.h>
#include <spdlog/spdlog.h>
#include <iomanip>
#include <limits>
#include <sstream>

namespace sqlreplay {

// ============================================================================
// Construction and Destruction
// ============================================================================

MySQLConnection::MySQLConnection(MySQLBaseDB* db, MYSQL* conn)
    : m_db(db), m_conn(conn) {
}

MySQLConnection::~MySQLConnection() {
    release();
}

void MySQLConnection::release() {
    if (m_conn && m_db) {
        m_db->destroyConnection(m_conn);
    }
    m_conn = nullptr;
}

// ============================================================================
// Query Execution
// ============================================================================

Rows MySQLConnection::querySQL(Context& ctx, const std::string& query, const Args& args) {
    ctx.throwIfDone();
    if (!isValid()) {
        throw MySQLException(CR_SERVER_GONE_ERROR, "connection already closed");
    }

    std::string sql = args.empty()
        ? query
        : interpolateParams(query, args, [this](const std::string& v) { return escape(v); });

    // mysql_real_query() is preferred over mysql_query() for binary safety
    if (mysql_real_query(m_conn, sql.c_str(), sql.size()) != 0) {
        throw MySQLException(m_conn);
    }

    MySQLResultSet result(mysql_store_result(m_conn));
    if (!result) {
        // No result set is only an error if the statement should have produced one
        if (mysql_field_count(m_conn) != 0) {
            throw MySQLException(m_conn);
        }
        return Rows();
    }

    return result.toRows();
}

void MySQLConnection::executeSQL(Context& ctx,
                                 const std::vector<std::string>& statements,
                                 const std::vector<Args>& argsPerStatement) {
    ctx.throwIfDone();
    if (!isValid()) {
        throw MySQLException(CR_SERVER_GONE_ERROR, "connection already closed");
    }

    runStatement("BEGIN");
    try {
        for (size_t i = 0; i < statements.size(); ++i) {
            ctx.throwIfDone();
            if (argsPerStatement.empty() || argsPerStatement[i].empty()) {
                runStatement(statements[i]);
            } else {
                runStatement(interpolateParams(
                    statements[i], argsPerStatement[i],
                    [this](const std::string& v) { return escape(v); }));
            }
        }
        runStatement("COMMIT");
    } catch (const ReplayException&) {
        rollback();
        throw;
    }
}

void MySQLConnection::runStatement(const std::string& sql) {
    if (mysql_real_query(m_conn, sql.c_str(), sql.size()) != 0) {
        throw MySQLException(m_conn);
    }
    // Drain a result set if the statement produced one
    MySQLResultSet result(mysql_store_result(m_conn));
    if (!result && mysql_field_count(m_conn) != 0) {
        throw MySQLException(m_conn);
    }
}

void MySQLConnection::rollback() {
    if (!isValid()) return;
    static const std::string kRollback = "ROLLBACK";
    if (mysql_real_query(m_conn, kRollback.c_str(), kRollback.size()) != 0) {
        spdlog::warn("rollback failed: {}", mysql_error(m_conn));
    }
}

// ============================================================================
// Argument Interpolation
// ============================================================================

std::string MySQLConnection::escape(const std::string& value) const {
    std::string out(value.size() * 2 + 1, '\0');
    unsigned long len = mysql_real_escape_string(m_conn, &out[0], value.c_str(),
                                                 static_cast<unsigned long>(value.size()));
    out.resize(len);
    return out;
}

std::string MySQLConnection::interpolateParams(const std::string& sql,
                                               const Args& args,
                                               const Escaper& escape) {
    struct Literal {
        const Escaper& escape;
        std::string operator()(std::monostate) const { return "NULL"; }
        std::string operator()(int64_t v) const { return std::to_string(v); }
        std::string operator()(uint64_t v) const { return std::to_string(v); }
        std::string operator()(double v) const {
            std::ostringstream oss;
            oss << std::setprecision(std::numeric_limits<double>::max_digits10) << v;
            return oss.str();
        }
        std::string operator()(const std::string& v) const { return "'" + escape(v) + "'"; }
    };

    std::string out;
    out.reserve(sql.size() + args.size() * 8);

    size_t next = 0;
    char quote = '\0';
    for (size_t i = 0; i < sql.size(); ++i) {
        char c = sql[i];
        if (quote != '\0') {
            out += c;
            if (c == '\\' && quote != '`' && i + 1 < sql.size()) {
                out += sql[++i];
            } else if (c == quote) {
                quote = '\0';
            }
            continue;
        }

        if (c == '\'' || c == '"' || c == '`') {
            quote = c;
            out += c;
        } else if (c == '?') {
            if (next >= args.size()) {
                throw MySQLException(CR_PARAMS_NOT_BOUND,
                                     "statement has more placeholders than arguments");
            }
            out += std::visit(Literal{escape}, args[next++]);
        } else {
            out += c;
        }
    }

    if (next != args.size()) {
        throw MySQLException(CR_PARAMS_NOT_BOUND,
                             "statement has " + std::to_string(next) + " placeholders but " +
                             std::to_string(args.size()) + " arguments");
    }
    return out;
}

}  // namespace sqlreplay
