#pragma once

#include <functional>
#include <string>
#include <vector>

#include "f1metrics/data/view_builder.h"
#include "f1metrics/model/metric_params.h"
#include "f1metrics/model/metric_result.h"

namespace f1metrics {
namespace metrics {

enum class MetricKind {
    DRIVER,
    CONSTRUCTOR
};

std::string MetricKindName(MetricKind kind);

/**
 * @brief Everything a formula may read
 */
struct MetricContext {
    const data::ViewBuilder& views;
};

/**
 * @brief Function signature for metric formulas
 *
 * Formulas are pure functions of the views. "No data" is reported as a
 * null value with a "message" metadata entry; view faults are thrown.
 */
using MetricFormula = std::function<model::MetricResult(const MetricContext& context,
                                                        const model::MetricParams& params)>;

/**
 * @brief Metadata for a metric
 */
struct MetricDefinition {
    std::string name;
    std::string description;
    std::string unit;
    MetricKind kind{MetricKind::DRIVER};
    std::vector<std::string> required_tables;
    // Parameters that must be present; constructor metrics always need constructor_id
    std::vector<std::string> required_params;
    MetricFormula formula;
};

} // namespace metrics
} // namespace f1metrics
