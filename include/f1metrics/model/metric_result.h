#ifndef F1METRICS_MODEL_METRIC_RESULT_H_
#define F1METRICS_MODEL_METRIC_RESULT_H_

#include <optional>
#include <string>

#include "f1metrics/core/types.h"
#include "f1metrics/model/metric_value.h"

namespace f1metrics {
namespace model {

/**
 * @brief Result of a metric calculation
 *
 * A null value means "no result"; metadata then usually carries an
 * "error" or "message" entry explaining why.
 */
struct MetricResult {
    std::string metric_name;
    MetricValue value;
    std::optional<core::DriverId> driver_id;
    std::optional<std::string> driver_name;
    std::optional<core::ConstructorId> constructor_id;
    std::optional<std::string> constructor_name;
    std::optional<core::Season> season;
    std::optional<Metadata> metadata;

    MetricResult() = default;
    MetricResult(std::string name, MetricValue v)
        : metric_name(std::move(name)), value(std::move(v)) {}

    // Value of a metadata key, or nullptr
    const MetricValue* meta(const std::string& key) const;

    bool operator==(const MetricResult& other) const {
        return metric_name == other.metric_name && value == other.value &&
               driver_id == other.driver_id && driver_name == other.driver_name &&
               constructor_id == other.constructor_id &&
               constructor_name == other.constructor_name &&
               season == other.season && metadata == other.metadata;
    }
    bool operator!=(const MetricResult& other) const { return !(*this == other); }
};

inline const MetricValue* MetricResult::meta(const std::string& key) const {
    if (!metadata) return nullptr;
    for (const auto& field : *metadata) {
        if (field.first == key) return &field.second;
    }
    return nullptr;
}

} // namespace model
} // namespace f1metrics

#endif // F1METRICS_MODEL_METRIC_RESULT_H_
