#include "f1metrics/metrics/registry.h"

namespace f1metrics {
namespace metrics {

std::string MetricKindName(MetricKind kind) {
    switch (kind) {
        case MetricKind::DRIVER: return "driver";
        case MetricKind::CONSTRUCTOR: return "constructor";
    }
    return "unknown";
}

void MetricRegistry::Register(const MetricDefinition& definition) {
    metrics_[definition.name] = definition;
}

const MetricDefinition* MetricRegistry::Get(const std::string& name) const {
    auto it = metrics_.find(name);
    if (it != metrics_.end()) {
        return &it->second;
    }
    return nullptr;
}

std::vector<std::string> MetricRegistry::Names(std::optional<MetricKind> kind) const {
    std::vector<std::string> names;
    for (const auto& entry : metrics_) {
        if (!kind || entry.second.kind == *kind) {
            names.push_back(entry.first);
        }
    }
    return names;
}

void RegisterBuiltinMetrics(MetricRegistry& registry) {
    RegisterDriverRaceMetrics(registry);
    RegisterDriverQualifyingMetrics(registry);
    RegisterTeammateMetrics(registry);
    RegisterConstructorChampionshipMetrics(registry);
    RegisterConstructorRaceMetrics(registry);
    RegisterConstructorQualifyingMetrics(registry);
    RegisterConstructorReliabilityMetrics(registry);
    RegisterConstructorPitStopMetrics(registry);
    RegisterConstructorLapMetrics(registry);
}

} // namespace metrics
} // namespace f1metrics
