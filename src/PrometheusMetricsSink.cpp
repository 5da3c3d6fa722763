#include "PrometheusMetricsSink.hpp"

namespace sqlreplay {

namespace {

// 5us .. ~84s, doubling
prometheus::Histogram::BucketBoundaries exponentialBuckets(double start, double factor, int count) {
    prometheus::Histogram::BucketBoundaries buckets;
    buckets.reserve(static_cast<size_t>(count));
    double bound = start;
    for (int i = 0; i < count; ++i) {
        buckets.push_back(bound);
        bound *= factor;
    }
    return buckets;
}

}  // namespace

PrometheusMetricsSink::PrometheusMetricsSink(const std::shared_ptr<prometheus::Registry>& registry)
    : m_registry(registry),
      m_queryDuration(prometheus::BuildHistogram()
                          .Name("sqlreplay_query_duration_seconds")
                          .Help("Duration of successful queries against the downstream database")
                          .Register(*registry)),
      m_executionErrors(prometheus::BuildCounter()
                            .Name("sqlreplay_execution_errors_total")
                            .Help("Failed statement batch attempts against the downstream database")
                            .Register(*registry)),
      m_buckets(exponentialBuckets(0.000005, 2, 25)) {}

void PrometheusMetricsSink::observeQueryDuration(const std::string& name,
                                                 const std::string& sourceId,
                                                 double seconds) {
    m_queryDuration.Add({{"task", name}, {"source_id", sourceId}}, m_buckets).Observe(seconds);
}

void PrometheusMetricsSink::incExecutionError(const std::string& name,
                                              const std::string& sourceId) {
    m_executionErrors.Add({{"task", name}, {"source_id", sourceId}}).Increment();
}

}  // namespace sqlreplay
