#include "FaultInjector.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace sqlreplay {

void FaultInjector::arm(const std::string& point, unsigned int errorCode,
                        const std::string& marker, int times) {
    if (times <= 0) {
        throw std::invalid_argument("fault injection count must be positive");
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    m_points[point] = Arming{errorCode, marker, times};
}

void FaultInjector::disarm(const std::string& point) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_points.erase(point);
}

bool FaultInjector::isArmed(const std::string& point) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_points.count(point) > 0;
}

size_t FaultInjector::hits(const std::string& point) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_hits.find(point);
    return it == m_hits.end() ? 0 : it->second;
}

void FaultInjector::maybeFail(const std::string& point,
                              const std::vector<std::string>& statements) {
    unsigned int code = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_points.find(point);
        if (it == m_points.end()) {
            return;
        }
        if (statements.size() != 1 ||
            statements.front().find(it->second.marker) == std::string::npos) {
            return;
        }

        code = it->second.errorCode;
        if (--it->second.remaining == 0) {
            m_points.erase(it);
        }
        m_hits[point]++;
    }

    spdlog::warn("execute statements failed by fault injection point {} (code {})", point, code);
    throw MySQLException(code, "injected by fault point " + point);
}

}  // namespace sqlreplay
