#include "MySQLBaseDB.hpp"
#include "MySQLConnection.hpp"
#include "Context.hpp"
#include "ErrorHandler.hpp"
#include <mysql/errmsg.h>
#include <spdlog/spdlog.h>
#include <mutex>

namespace sqlreplay {

MySQLBaseDB::MySQLBaseDB(const ConnectionConfig& config)
    : m_config(config) {

    // Initialize MySQL library (thread-safe)
    static std::once_flag mysqlInitFlag;
    std::call_once(mysqlInitFlag, []() {
        mysql_library_init(0, nullptr, nullptr);
    });

    // Probe the target so a bad configuration fails here, not in a worker
    MYSQL* probe = createConnection();
    bool alive = mysql_ping(probe) == 0;
    std::string err = alive ? std::string() : mysql_error(probe);
    unsigned int code = alive ? 0 : mysql_errno(probe);
    destroyConnection(probe);
    if (!alive) {
        throw MySQLException(code, "MySQL target is not reachable: " + err);
    }

    spdlog::info("MySQL target {}:{} is reachable", m_config.host, m_config.port);
}

MySQLBaseDB::~MySQLBaseDB() {
    close();
}

MYSQL* MySQLBaseDB::createConnection() {
    MYSQL* conn = mysql_init(nullptr);
    if (!conn) {
        throw MySQLException(CR_OUT_OF_MEMORY, "Failed to initialize MySQL connection");
    }

    // Set options
    unsigned int timeout = static_cast<unsigned int>(
        m_config.connect_timeout.count() / 1000);
    mysql_options(conn, MYSQL_OPT_CONNECT_TIMEOUT, &timeout);

    unsigned int readTimeout = static_cast<unsigned int>(
        m_config.read_timeout.count() / 1000);
    mysql_options(conn, MYSQL_OPT_READ_TIMEOUT, &readTimeout);

    unsigned int writeTimeout = static_cast<unsigned int>(
        m_config.write_timeout.count() / 1000);
    mysql_options(conn, MYSQL_OPT_WRITE_TIMEOUT, &writeTimeout);

    // No auto-reconnect: a lost connection must surface so DBConn can reset it

    // SSL options
    if (m_config.use_ssl) {
        if (!m_config.ssl_ca.empty())
            mysql_options(conn, MYSQL_OPT_SSL_CA, m_config.ssl_ca.c_str());
        if (!m_config.ssl_cert.empty())
            mysql_options(conn, MYSQL_OPT_SSL_CERT, m_config.ssl_cert.c_str());
        if (!m_config.ssl_key.empty())
            mysql_options(conn, MYSQL_OPT_SSL_KEY, m_config.ssl_key.c_str());
    }

    // Connect
    const char* socket = m_config.socket.empty() ? nullptr : m_config.socket.c_str();
    const char* db = m_config.default_database.empty() ? nullptr : m_config.default_database.c_str();

    if (!mysql_real_connect(conn,
                            m_config.host.c_str(),
                            m_config.user.c_str(),
                            m_config.password.c_str(),
                            db,
                            m_config.port,
                            socket,
                            0)) {
        unsigned int err = mysql_errno(conn);
        std::string msg = mysql_error(conn);
        mysql_close(conn);
        throw MySQLException(err, "Failed to connect to MySQL: " + msg);
    }

    // Set character set to UTF-8
    mysql_set_character_set(conn, "utf8mb4");

    m_openCount++;
    spdlog::debug("Created new MySQL connection (open: {})", m_openCount.load());

    return conn;
}

void MySQLBaseDB::destroyConnection(MYSQL* conn) {
    if (conn) {
        mysql_close(conn);
        m_openCount--;
        spdlog::debug("Closed MySQL connection (open: {})", m_openCount.load());
    }
}

std::unique_ptr<BaseConn> MySQLBaseDB::getBaseConn(Context& ctx) {
    ctx.throwIfDone();
    if (m_closed) {
        throw MySQLException(CR_CONNECTION_ERROR, "MySQL database handle is closed");
    }
    return std::make_unique<MySQLConnection>(this, createConnection());
}

void MySQLBaseDB::forceCloseConn(BaseConn& conn) {
    auto* mysqlConn = dynamic_cast<MySQLConnection*>(&conn);
    if (!mysqlConn || mysqlConn->m_db != this) {
        throw MySQLException(CR_UNKNOWN_ERROR, "connection was not opened by this database");
    }
    mysqlConn->release();
}

void MySQLBaseDB::close() {
    if (m_closed.exchange(true)) {
        return;
    }
    if (m_openCount.load() != 0) {
        spdlog::warn("MySQL database closed with {} connections still open", m_openCount.load());
    }
    spdlog::info("MySQL database handle for {}:{} closed", m_config.host, m_config.port);
}

}  // namespace sqlreplay
