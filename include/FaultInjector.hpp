#pragma once

#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace sqlreplay {

// Injection point consulted by DBConn::execute
constexpr const char* kExecCreateTableFailed = "ExecCreateTableFailed";

/**
 * @class FaultInjector
 * @brief Test hook that replaces the outcome of matching statement batches
 *        with a synthetic MySQL error.
 *
 * Only test harnesses construct one; production code passes nullptr to the
 * pool. An armed point matches a batch made of exactly one statement that
 * contains the configured marker.
 */
class FaultInjector {
public:
    /**
     * @brief Arm an injection point.
     * @param point Injection point name (e.g. kExecCreateTableFailed).
     * @param errorCode MySQL error number carried by the synthetic error.
     * @param marker Substring the single statement must contain.
     * @param times Number of matching batches to fail before disarming.
     * @throws std::invalid_argument if times is not positive.
     */
    void arm(const std::string& point, unsigned int errorCode,
             const std::string& marker = "CREATE TABLE", int times = 1);

    void disarm(const std::string& point);

    bool isArmed(const std::string& point) const;

    // Number of errors injected so far at @p point
    size_t hits(const std::string& point) const;

    /**
     * @brief Fail the batch if @p point is armed and matches.
     * @throws MySQLException carrying the armed error code.
     */
    void maybeFail(const std::string& point, const std::vector<std::string>& statements);

private:
    struct Arming {
        unsigned int errorCode = 0;
        std::string marker;
        int remaining = 0;
    };

    mutable std::mutex m_mutex;
    std::map<std::string, Arming> m_points;
    std::map<std::string, size_t> m_hits;
};

}  // namespace sqlreplay
