#pragma once

/**
 * @file Replayer.hpp
 * @brief Replays SQL files across the fixed set of pool connections.
 */

#include <atomic>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace sqlreplay {

class ConnectionPool;
class Context;
class DBConn;

struct ReplayStats {
    size_t files = 0;
    size_t statements = 0;
    size_t skipped = 0;   // idempotent outcomes treated as success
};

/**
 * @class Replayer
 * @brief Runs one worker thread per pool connection.
 *
 * Workers take files from a shared queue and execute their statements one
 * batch per statement. An already-exists or duplicate-key outcome is logged
 * and counted as success. The first other failure cancels @p ctx so the
 * remaining workers stop at their next suspension point.
 */
class Replayer {
public:
    Replayer(ConnectionPool& pool, Context& ctx);

    /**
     * @brief Replay @p files.
     * @return true if every statement succeeded.
     */
    bool run(const std::vector<std::string>& files);

    ReplayStats stats() const;

    // Message of the first failure, if any
    std::optional<std::string> firstError() const;

private:
    void worker(size_t index, DBConn& conn, const std::vector<std::string>& files);
    void replayFile(DBConn& conn, const std::string& file);
    void fail(const std::string& message);

    ConnectionPool& m_pool;
    Context& m_ctx;

    std::atomic<size_t> m_nextFile{0};
    std::atomic<size_t> m_files{0};
    std::atomic<size_t> m_statements{0};
    std::atomic<size_t> m_skipped{0};

    mutable std::mutex m_errorMutex;
    std::optional<std::string> m_firstError;
};

}  // namespace sqlreplay
