#pragma once

#include "MetricsSink.hpp"
#include <prometheus/counter.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>
#include <memory>

namespace sqlreplay {

/**
 * @class PrometheusMetricsSink
 * @brief MetricsSink backed by a prometheus-cpp registry.
 *
 * Registers:
 * - sqlreplay_query_duration_seconds (histogram)
 * - sqlreplay_execution_errors_total (counter)
 * both labeled {task, source_id}.
 */
class PrometheusMetricsSink final : public MetricsSink {
public:
    explicit PrometheusMetricsSink(const std::shared_ptr<prometheus::Registry>& registry);

    void observeQueryDuration(const std::string& name,
                              const std::string& sourceId,
                              double seconds) override;

    void incExecutionError(const std::string& name,
                           const std::string& sourceId) override;

    const std::shared_ptr<prometheus::Registry>& registry() const { return m_registry; }

private:
    std::shared_ptr<prometheus::Registry> m_registry;
    prometheus::Family<prometheus::Histogram>& m_queryDuration;
    prometheus::Family<prometheus::Counter>& m_executionErrors;
    prometheus::Histogram::BucketBoundaries m_buckets;
};

}  // namespace sqlreplay
