#pragma once

#include <mysql/mysql.h>
#include <stdexcept>
#include <string>

namespace sqlreplay {

// Which side of the migration an error belongs to
enum class ErrorScope {
    NotSet,
    Upstream,
    Downstream,
    Internal
};

// Outcome of classifying a failed statement attempt
enum class ErrorClass {
    ConnectionLost,
    Retryable,
    Fatal,
    Idempotent
};

enum class CancelReason {
    Canceled,
    DeadlineExceeded
};

const char* toString(ErrorScope scope);
const char* toString(ErrorClass cls);
const char* toString(CancelReason reason);

// Base of every error raised by this library
class ReplayException : public std::runtime_error {
public:
    explicit ReplayException(const std::string& message,
                             ErrorScope scope = ErrorScope::NotSet);

    ErrorScope scope() const { return m_scope; }
    void setScope(ErrorScope scope) { m_scope = scope; }

private:
    ErrorScope m_scope;
};

// Exception for MySQL client and server errors
class MySQLException : public ReplayException {
public:
    MySQLException(unsigned int errorCode, const std::string& message,
                   ErrorScope scope = ErrorScope::NotSet);
    explicit MySQLException(MYSQL* conn);

    unsigned int errorCode() const { return m_errorCode; }

private:
    unsigned int m_errorCode;
};

// The statement failed because its end state already holds
// (database/table exists, duplicate key). Callers decide whether to ignore it.
class IdempotentOutcomeError : public MySQLException {
public:
    IdempotentOutcomeError(unsigned int errorCode, const std::string& message,
                           ErrorScope scope = ErrorScope::NotSet);
};

// Operation attempted on a connection without an underlying handle
class InvalidConnectionError : public ReplayException {
public:
    explicit InvalidConnectionError(const std::string& message,
                                    ErrorScope scope = ErrorScope::NotSet);
};

// Recovery could not obtain a replacement connection
class ResetConnectionError : public ReplayException {
public:
    ResetConnectionError(const std::string& message, unsigned int causeCode = 0,
                         ErrorScope scope = ErrorScope::NotSet);

    unsigned int causeCode() const { return m_causeCode; }

private:
    unsigned int m_causeCode;
};

class CancelledError : public ReplayException {
public:
    explicit CancelledError(CancelReason reason,
                            ErrorScope scope = ErrorScope::NotSet);

    CancelReason reason() const { return m_reason; }

private:
    CancelReason m_reason;
};

// Pure classification of MySQL errors
class ErrorHandler {
public:
    static ErrorClass classify(const MySQLException& error);
    static ErrorClass classify(unsigned int mysqlError, const std::string& message = "");

    // Transport failure, the connection must be replaced before retrying
    static bool isConnectionError(unsigned int mysqlError);
    static bool isConnectionErrorMessage(const std::string& message);

    // Client library error range (CR_*), or no code at all
    static bool isClientError(unsigned int mysqlError);

    // Transient server condition, retry on the same connection
    static bool isRetryable(unsigned int mysqlError);

    // Desired end state already reached
    static bool isIdempotent(unsigned int mysqlError);

    static bool isErrDBExists(const MySQLException& error);
    static bool isErrTableExists(const MySQLException& error);
    static bool isErrDupEntry(const MySQLException& error);

    static std::string getErrorMessage(unsigned int mysqlError);
    static std::string getErrorMessage(MYSQL* conn);

    // TiDB specific codes, not present in the MySQL headers
    static constexpr unsigned int ER_TIDB_WRITE_CONFLICT_IN_TIDB = 8005;
    static constexpr unsigned int ER_TIDB_TABLE_LOCKED = 8020;
    static constexpr unsigned int ER_TIDB_TXN_RETRYABLE = 8022;
    static constexpr unsigned int ER_TIDB_INFO_SCHEMA_EXPIRED = 8027;
    static constexpr unsigned int ER_TIDB_INFO_SCHEMA_CHANGED = 8028;
    static constexpr unsigned int ER_TIDB_PD_SERVER_TIMEOUT = 9001;
    static constexpr unsigned int ER_TIDB_TIKV_SERVER_TIMEOUT = 9002;
    static constexpr unsigned int ER_TIDB_TIKV_SERVER_BUSY = 9003;
    static constexpr unsigned int ER_TIDB_RESOLVE_LOCK_TIMEOUT = 9004;
    static constexpr unsigned int ER_TIDB_REGION_UNAVAILABLE = 9005;
    static constexpr unsigned int ER_TIDB_WRITE_CONFLICT = 9007;
};

}  // namespace sqlreplay
