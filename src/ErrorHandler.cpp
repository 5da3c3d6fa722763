#include "ErrorHandler.hpp"
#include <mysql/errmsg.h>
#include <mysql/mysqld_error.h>
#include <algorithm>
#include <cctype>

namespace sqlreplay {

namespace {

std::string toLower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

std::string cancelMessage(CancelReason reason) {
    return reason == CancelReason::DeadlineExceeded
        ? "context deadline exceeded"
        : "context canceled";
}

}  // namespace

const char* toString(ErrorScope scope) {
    switch (scope) {
        case ErrorScope::Upstream:   return "upstream";
        case ErrorScope::Downstream: return "downstream";
        case ErrorScope::Internal:   return "internal";
        case ErrorScope::NotSet:     break;
    }
    return "not-set";
}

const char* toString(ErrorClass cls) {
    switch (cls) {
        case ErrorClass::ConnectionLost: return "connection-lost";
        case ErrorClass::Retryable:      return "retryable";
        case ErrorClass::Fatal:          return "fatal";
        case ErrorClass::Idempotent:     return "idempotent";
    }
    return "unknown";
}

const char* toString(CancelReason reason) {
    return reason == CancelReason::DeadlineExceeded ? "deadline-exceeded" : "canceled";
}

// ============================================================================
// Exceptions
// ============================================================================

ReplayException::ReplayException(const std::string& message, ErrorScope scope)
    : std::runtime_error(message)
    , m_scope(scope) {
}

MySQLException::MySQLException(unsigned int error_code, const std::string& message,
                               ErrorScope scope)
    : ReplayException(message, scope)
    , m_errorCode(error_code) {
}

MySQLException::MySQLException(MYSQL* conn)
    : ReplayException(ErrorHandler::getErrorMessage(conn))
    , m_errorCode(conn ? mysql_errno(conn) : CR_UNKNOWN_ERROR) {
}

IdempotentOutcomeError::IdempotentOutcomeError(unsigned int error_code,
                                               const std::string& message,
                                               ErrorScope scope)
    : MySQLException(error_code, message, scope) {
}

InvalidConnectionError::InvalidConnectionError(const std::string& message, ErrorScope scope)
    : ReplayException(message, scope) {
}

ResetConnectionError::ResetConnectionError(const std::string& message,
                                           unsigned int cause_code,
                                           ErrorScope scope)
    : ReplayException(message, scope)
    , m_causeCode(cause_code) {
}

CancelledError::CancelledError(CancelReason reason, ErrorScope scope)
    : ReplayException(cancelMessage(reason), scope)
    , m_reason(reason) {
}

// ============================================================================
// Classification
// ============================================================================

ErrorClass ErrorHandler::classify(const MySQLException& error) {
    return classify(error.errorCode(), error.what());
}

ErrorClass ErrorHandler::classify(unsigned int mysql_error, const std::string& message) {
    if (isConnectionError(mysql_error)) {
        return ErrorClass::ConnectionLost;
    }
    // Server messages echo statement text, so only client-side errors are
    // matched by message
    if (isClientError(mysql_error) && isConnectionErrorMessage(message)) {
        return ErrorClass::ConnectionLost;
    }
    if (isRetryable(mysql_error)) {
        return ErrorClass::Retryable;
    }
    if (isIdempotent(mysql_error)) {
        return ErrorClass::Idempotent;
    }
    return ErrorClass::Fatal;
}

bool ErrorHandler::isConnectionError(unsigned int mysql_error) {
    switch (mysql_error) {
        case CR_CONNECTION_ERROR:
        case CR_CONN_HOST_ERROR:
        case CR_UNKNOWN_HOST:
        case CR_SERVER_GONE_ERROR:
        case CR_SERVER_LOST:
        case CR_SERVER_LOST_EXTENDED:
        case CR_COMMANDS_OUT_OF_SYNC:
        case CR_SOCKET_CREATE_ERROR:
        case CR_NAMEDPIPEOPEN_ERROR:
        case CR_NAMEDPIPEWAIT_ERROR:
        case CR_NAMEDPIPESETSTATE_ERROR:
        case CR_IPSOCK_ERROR:
            return true;
        default:
            return false;
    }
}

bool ErrorHandler::isClientError(unsigned int mysql_error) {
    return mysql_error == 0 ||
           (mysql_error >= CR_MIN_ERROR && mysql_error <= CR_MAX_ERROR);
}

bool ErrorHandler::isConnectionErrorMessage(const std::string& message) {
    if (message.empty()) return false;

    std::string lower = toLower(message);
    return lower.find("connection reset by peer") != std::string::npos ||
           lower.find("broken pipe") != std::string::npos ||
           lower.find("bad connection") != std::string::npos ||
           lower.find("invalid connection") != std::string::npos;
}

bool ErrorHandler::isRetryable(unsigned int mysql_error) {
    switch (mysql_error) {
        case ER_LOCK_WAIT_TIMEOUT:
        case ER_LOCK_DEADLOCK:
        case ER_QUERY_INTERRUPTED:
        case ER_TOO_MANY_CONCURRENT_TRXS:
        case ER_TIDB_WRITE_CONFLICT_IN_TIDB:
        case ER_TIDB_TABLE_LOCKED:
        case ER_TIDB_TXN_RETRYABLE:
        case ER_TIDB_INFO_SCHEMA_EXPIRED:
        case ER_TIDB_INFO_SCHEMA_CHANGED:
        case ER_TIDB_PD_SERVER_TIMEOUT:
        case ER_TIDB_TIKV_SERVER_TIMEOUT:
        case ER_TIDB_TIKV_SERVER_BUSY:
        case ER_TIDB_RESOLVE_LOCK_TIMEOUT:
        case ER_TIDB_REGION_UNAVAILABLE:
        case ER_TIDB_WRITE_CONFLICT:
            return true;
        default:
            return false;
    }
}

bool ErrorHandler::isIdempotent(unsigned int mysql_error) {
    switch (mysql_error) {
        case ER_DB_CREATE_EXISTS:
        case ER_TABLE_EXISTS_ERROR:
        case ER_DUP_ENTRY:
            return true;
        default:
            return false;
    }
}

bool ErrorHandler::isErrDBExists(const MySQLException& error) {
    return error.errorCode() == ER_DB_CREATE_EXISTS;
}

bool ErrorHandler::isErrTableExists(const MySQLException& error) {
    return error.errorCode() == ER_TABLE_EXISTS_ERROR;
}

bool ErrorHandler::isErrDupEntry(const MySQLException& error) {
    return error.errorCode() == ER_DUP_ENTRY;
}

std::string ErrorHandler::getErrorMessage(unsigned int mysql_error) {
    switch (mysql_error) {
        case 0:
            return "Success";
        case CR_CONNECTION_ERROR:
            return "Connection error";
        case CR_CONN_HOST_ERROR:
            return "Cannot connect to host";
        case CR_UNKNOWN_HOST:
            return "Unknown host";
        case CR_SERVER_GONE_ERROR:
            return "MySQL server has gone away";
        case CR_SERVER_LOST:
            return "Lost connection to MySQL server";
        case ER_ACCESS_DENIED_ERROR:
            return "Access denied";
        case ER_BAD_DB_ERROR:
            return "Unknown database";
        case ER_NO_SUCH_TABLE:
            return "Table does not exist";
        case ER_DB_CREATE_EXISTS:
            return "Database already exists";
        case ER_TABLE_EXISTS_ERROR:
            return "Table already exists";
        case ER_DUP_ENTRY:
            return "Duplicate entry";
        case ER_PARSE_ERROR:
            return "SQL parse error";
        case ER_LOCK_WAIT_TIMEOUT:
            return "Lock wait timeout";
        case ER_LOCK_DEADLOCK:
            return "Deadlock detected";
        case ER_TIDB_WRITE_CONFLICT:
            return "Write conflict";
        case ER_TIDB_TIKV_SERVER_BUSY:
            return "TiKV server is busy";
        default:
            return "MySQL error " + std::to_string(mysql_error);
    }
}

std::string ErrorHandler::getErrorMessage(MYSQL* conn) {
    if (!conn) {
        return "No connection";
    }
    const char* err = mysql_error(conn);
    if (err && *err) {
        return std::string(err);
    }
    return getErrorMessage(mysql_errno(conn));
}

}  // namespace sqlreplay
