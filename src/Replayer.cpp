#include "Replayer.hpp"
#include "ConnectionPool.hpp"
#include "Context.hpp"
#include "DBConn.hpp"
#include "ErrorHandler.hpp"
#include "LogUtil.hpp"
#include "SqlFile.hpp"
#include <spdlog/spdlog.h>
#include <functional>
#include <stdexcept>
#include <thread>

namespace sqlreplay {

Replayer::Replayer(ConnectionPool& pool, Context& ctx)
    : m_pool(pool), m_ctx(ctx) {
}

bool Replayer::run(const std::vector<std::string>& files) {
    std::vector<std::thread> workers;
    workers.reserve(m_pool.size());

    for (size_t i = 0; i < m_pool.size(); ++i) {
        workers.emplace_back(&Replayer::worker, this, i, std::ref(m_pool.connection(i)),
                             std::cref(files));
    }
    for (auto& t : workers) {
        t.join();
    }

    return !firstError().has_value();
}

void Replayer::worker(size_t index, DBConn& conn, const std::vector<std::string>& files) {
    spdlog::debug("[{}/{}] worker {} started", conn.name(), conn.sourceId(), index);

    while (true) {
        size_t next = m_nextFile.fetch_add(1);
        if (next >= files.size()) {
            break;
        }
        if (auto why = m_ctx.reason()) {
            fail(CancelledError(*why).what());
            break;
        }

        try {
            replayFile(conn, files[next]);
        } catch (const CancelledError& e) {
            // Another worker failed, or the run was interrupted
            fail(e.what());
            break;
        } catch (const ReplayException& e) {
            spdlog::error("[{}/{}] worker {} failed on {}: {} (scope={})",
                          conn.name(), conn.sourceId(), index, files[next], e.what(),
                          toString(e.scope()));
            fail(files[next] + ": " + e.what());
            m_ctx.cancel();
            break;
        } catch (const std::invalid_argument& e) {
            spdlog::error("[{}/{}] worker {} failed on {}: {}",
                          conn.name(), conn.sourceId(), index, files[next], e.what());
            fail(files[next] + ": " + e.what());
            m_ctx.cancel();
            break;
        }
    }

    spdlog::debug("[{}/{}] worker {} finished", conn.name(), conn.sourceId(), index);
}

void Replayer::replayFile(DBConn& conn, const std::string& file) {
    std::vector<std::string> statements = readStatements(file);
    spdlog::info("[{}/{}] replaying {} ({} statements)",
                 conn.name(), conn.sourceId(), file, statements.size());

    for (const auto& stmt : statements) {
        try {
            conn.execute(m_ctx, {stmt});
        } catch (const IdempotentOutcomeError& e) {
            spdlog::info("[{}/{}] skip statement, {} : {}",
                         conn.name(), conn.sourceId(), e.what(), truncateString(stmt, 256));
            m_skipped++;
        }
        m_statements++;
    }
    m_files++;
}

void Replayer::fail(const std::string& message) {
    std::lock_guard<std::mutex> lock(m_errorMutex);
    if (!m_firstError) {
        m_firstError = message;
    }
}

ReplayStats Replayer::stats() const {
    ReplayStats s;
    s.files = m_files.load();
    s.statements = m_statements.load();
    s.skipped = m_skipped.load();
    return s;
}

std::optional<std::string> Replayer::firstError() const {
    std::lock_guard<std::mutex> lock(m_errorMutex);
    return m_firstError;
}

}  // namespace sqlreplay
