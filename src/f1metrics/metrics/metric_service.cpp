#include "f1metrics/metrics/metric_service.h"

#include <algorithm>
#include <exception>

#include "f1metrics/common/logger.h"
#include "f1metrics/core/error.h"

namespace f1metrics {
namespace metrics {

namespace {

model::MetricResult Degraded(const std::string& message) {
    model::MetricResult result;
    result.metadata = model::Metadata{{"error", model::MetricValue(message)}};
    return result;
}

bool HasParam(const model::MetricParams& params, const std::string& name) {
    if (name == "driver_id") return params.driver_id.has_value();
    if (name == "constructor_id") return params.constructor_id.has_value();
    if (name == "season") return params.season.has_value();
    if (name == "race_ids") return params.race_ids.has_value();
    return false;
}

} // namespace

MetricService::MetricService(const MetricRegistry& registry, data::TableStore& store,
                             const data::ViewBuilder& views, cache::MetricCache& cache)
    : registry_(registry), store_(store), views_(views), cache_(cache) {}

const MetricDefinition& MetricService::Lookup(const std::string& metric_name) const {
    const MetricDefinition* definition = registry_.Get(metric_name);
    if (!definition) {
        throw core::UnknownMetricError("Unknown metric: " + metric_name);
    }
    return *definition;
}

void MetricService::CheckParams(const MetricDefinition& definition,
                                const model::MetricParams& params) const {
    if (definition.kind == MetricKind::CONSTRUCTOR && !params.constructor_id) {
        throw core::InvalidParameterError("Metric " + definition.name + " requires constructor_id");
    }
    for (const auto& name : definition.required_params) {
        if (!HasParam(params, name)) {
            throw core::InvalidParameterError("Metric " + definition.name + " requires " + name);
        }
    }
}

void MetricService::Annotate(model::MetricResult& result, const MetricDefinition& definition,
                             const model::MetricParams& params) const {
    result.metric_name = definition.name;
    if (!result.driver_id) {
        result.driver_id = params.driver_id;
    }
    if (!result.constructor_id) {
        result.constructor_id = params.constructor_id;
    }
    if (!result.season) {
        result.season = params.season;
    }

    // Names are decoration; a missing lookup table does not fail the metric
    try {
        if (result.driver_id && !result.driver_name) {
            result.driver_name = views_.DriverName(*result.driver_id);
        }
        if (result.constructor_id && !result.constructor_name) {
            result.constructor_name = views_.ConstructorName(*result.constructor_id);
        }
    } catch (const core::Error& e) {
        F1METRICS_DEBUG("Name lookup for {} failed: {}", definition.name, e.what());
    }
}

model::MetricResult MetricService::Calculate(const std::string& metric_name,
                                             const model::MetricParams& params) {
    const MetricDefinition& definition = Lookup(metric_name);
    CheckParams(definition, params);

    auto cached = cache_.Get(metric_name, params);
    if (cached) {
        return std::move(*cached);
    }

    F1METRICS_DEBUG("Calculating {} {}", metric_name, params.ToString());
    model::MetricResult result;
    bool degraded = false;
    try {
        result = definition.formula(MetricContext{views_}, params);
    } catch (const core::DataUnavailableError& e) {
        F1METRICS_ERROR("Metric {} unavailable: {}", metric_name, e.what());
        result = Degraded(e.what());
        degraded = true;
    } catch (const core::NotFoundError& e) {
        F1METRICS_ERROR("Metric {} failed: {}", metric_name, e.what());
        result = Degraded(e.what());
        degraded = true;
    } catch (const core::MalformedDataError& e) {
        F1METRICS_ERROR("Metric {} failed on malformed data: {}", metric_name, e.what());
        result = Degraded(e.what());
        degraded = true;
    }

    Annotate(result, definition, params);
    if (!degraded) {
        cache_.Set(metric_name, params, result);
    }
    return result;
}

BulkResult MetricService::CalculateBulk(const std::vector<std::string>& metric_names,
                                        const model::MetricParams& params) {
    BulkResult bulk;
    for (const auto& name : metric_names) {
        try {
            bulk.results.push_back(Calculate(name, params));
        } catch (const core::Error& e) {
            F1METRICS_WARN("Bulk calculation of {} failed: {}", name, e.what());
            bulk.errors.push_back(BulkError{name, e.what()});
        } catch (const std::exception& e) {
            F1METRICS_ERROR("Bulk calculation of {} failed unexpectedly: {}", name, e.what());
            bulk.errors.push_back(BulkError{name, std::string("Internal error: ") + e.what()});
        }
    }
    F1METRICS_INFO("Bulk calculation: {} succeeded, {} failed", bulk.results.size(), bulk.errors.size());
    return bulk;
}

MetricNames MetricService::AvailableMetrics() const {
    MetricNames available;
    available.driver_metrics = registry_.Names(MetricKind::DRIVER);
    available.constructor_metrics = registry_.Names(MetricKind::CONSTRUCTOR);
    return available;
}

MetricInfo MetricService::Describe(const std::string& metric_name) const {
    const MetricDefinition& definition = Lookup(metric_name);
    MetricInfo info;
    info.name = definition.name;
    info.description = definition.description;
    info.unit = definition.unit;
    info.kind = definition.kind;
    info.required_tables = definition.required_tables;
    info.required_params = definition.required_params;
    if (definition.kind == MetricKind::CONSTRUCTOR &&
        std::find(info.required_params.begin(), info.required_params.end(), "constructor_id") ==
            info.required_params.end()) {
        info.required_params.insert(info.required_params.begin(), "constructor_id");
    }
    return info;
}

size_t MetricService::ClearCache(const std::optional<std::string>& metric_name) {
    return cache_.Clear(metric_name);
}

void MetricService::ReloadTables() {
    store_.Clear();
    F1METRICS_INFO("Table cache cleared; tables will be re-read on next use");
}

cache::MetricCache::Stats MetricService::CacheStats() const {
    return cache_.GetStats();
}

} // namespace metrics
} // namespace f1metrics
