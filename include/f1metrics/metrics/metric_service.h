#pragma once

#include <optional>
#include <string>
#include <vector>

#include "f1metrics/cache/metric_cache.h"
#include "f1metrics/data/table_store.h"
#include "f1metrics/data/view_builder.h"
#include "f1metrics/metrics/registry.h"
#include "f1metrics/model/metric_params.h"
#include "f1metrics/model/metric_result.h"

namespace f1metrics {
namespace metrics {

/**
 * @brief Per-metric failure reported by a bulk calculation
 */
struct BulkError {
    std::string metric_name;
    std::string message;
};

/**
 * @brief Outcome of a bulk calculation
 */
struct BulkResult {
    std::vector<model::MetricResult> results;
    std::vector<BulkError> errors;

    // False only when every requested metric failed
    bool Succeeded() const { return !results.empty() || errors.empty(); }
};

struct MetricNames {
    std::vector<std::string> driver_metrics;
    std::vector<std::string> constructor_metrics;
};

/**
 * @brief Static description of a registered metric
 */
struct MetricInfo {
    std::string name;
    std::string description;
    std::string unit;
    MetricKind kind{MetricKind::DRIVER};
    std::vector<std::string> required_tables;
    std::vector<std::string> required_params;
};

/**
 * @brief Cache-then-compute dispatcher over the metric registry
 *
 * The service owns no data: the registry, views, cache and table store
 * are injected and must outlive it.
 */
class MetricService {
public:
    MetricService(const MetricRegistry& registry, data::TableStore& store,
                  const data::ViewBuilder& views, cache::MetricCache& cache);

    MetricService(const MetricService&) = delete;
    MetricService& operator=(const MetricService&) = delete;

    /**
     * @brief Calculate one metric
     *
     * A cached result is returned as is. On a miss the formula runs, the
     * result is annotated with the request's ids, season and names, and
     * stored. A formula that fails on a missing or malformed table yields a
     * null value with an "error" metadata entry; that result is not cached.
     *
     * @throws core::UnknownMetricError if the name is not registered
     * @throws core::InvalidParameterError if a required parameter is absent
     */
    model::MetricResult Calculate(const std::string& metric_name, const model::MetricParams& params);

    // Calculates every metric independently; per-metric faults go to errors
    BulkResult CalculateBulk(const std::vector<std::string>& metric_names,
                             const model::MetricParams& params);

    MetricNames AvailableMetrics() const;

    // @throws core::UnknownMetricError if the name is not registered
    MetricInfo Describe(const std::string& metric_name) const;

    // Removes cache entries, for one metric or all; returns the number removed
    size_t ClearCache(const std::optional<std::string>& metric_name = std::nullopt);

    // Drops memoized tables so the next view re-reads them from disk
    void ReloadTables();

    cache::MetricCache::Stats CacheStats() const;

private:
    const MetricDefinition& Lookup(const std::string& metric_name) const;
    void CheckParams(const MetricDefinition& definition, const model::MetricParams& params) const;
    void Annotate(model::MetricResult& result, const MetricDefinition& definition,
                  const model::MetricParams& params) const;

    const MetricRegistry& registry_;
    data::TableStore& store_;
    const data::ViewBuilder& views_;
    cache::MetricCache& cache_;
};

} // namespace metrics
} // namespace f1metrics
