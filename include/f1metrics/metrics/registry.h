#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "f1metrics/metrics/metric.h"

namespace f1metrics {
namespace metrics {

/**
 * @brief Registry for metric definitions
 *
 * Populated once at start-up and read-only afterwards.
 */
class MetricRegistry {
public:
    MetricRegistry() = default;

    // Replaces an existing definition of the same name
    void Register(const MetricDefinition& definition);

    // nullptr if the name is not registered
    const MetricDefinition* Get(const std::string& name) const;

    // Registered names in sorted order, optionally of one kind only
    std::vector<std::string> Names(std::optional<MetricKind> kind = std::nullopt) const;

    size_t size() const { return metrics_.size(); }

private:
    std::map<std::string, MetricDefinition> metrics_;
};

// Registration helpers
void RegisterDriverRaceMetrics(MetricRegistry& registry);
void RegisterDriverQualifyingMetrics(MetricRegistry& registry);
void RegisterTeammateMetrics(MetricRegistry& registry);
void RegisterConstructorChampionshipMetrics(MetricRegistry& registry);
void RegisterConstructorRaceMetrics(MetricRegistry& registry);
void RegisterConstructorQualifyingMetrics(MetricRegistry& registry);
void RegisterConstructorReliabilityMetrics(MetricRegistry& registry);
void RegisterConstructorPitStopMetrics(MetricRegistry& registry);
void RegisterConstructorLapMetrics(MetricRegistry& registry);

// Installs every built-in metric
void RegisterBuiltinMetrics(MetricRegistry& registry);

} // namespace metrics
} // namespace f1metrics
