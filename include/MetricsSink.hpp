#pragma once

#include <string>

namespace sqlreplay {

// Destination of the metrics emitted by DBConn, labeled by (name, source id)
class MetricsSink {
public:
    virtual ~MetricsSink() = default;

    virtual void observeQueryDuration(const std::string& name,
                                      const std::string& sourceId,
                                      double seconds) = 0;

    virtual void incExecutionError(const std::string& name,
                                   const std::string& sourceId) = 0;
};

class NoopMetricsSink final : public MetricsSink {
public:
    void observeQueryDuration(const std::string&, const std::string&, double) override {}
    void incExecutionError(const std::string&, const std::string&) override {}
};

}  // namespace sqlreplay
