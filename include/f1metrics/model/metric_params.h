#ifndef F1METRICS_MODEL_METRIC_PARAMS_H_
#define F1METRICS_MODEL_METRIC_PARAMS_H_

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "f1metrics/core/types.h"
#include "f1metrics/model/metric_value.h"

namespace f1metrics {
namespace model {

/**
 * @brief Parameter map keyed by parameter name (sorted by key)
 */
using ParamMap = std::map<std::string, MetricValue>;

/**
 * @brief Parameters of a calculate-metric request
 */
struct MetricParams {
    std::optional<core::DriverId> driver_id;
    std::optional<core::ConstructorId> constructor_id;
    std::optional<core::Season> season;
    std::optional<std::vector<core::RaceId>> race_ids;

    /**
     * @brief Canonical parameter map used for cache fingerprints
     *
     * Every parameter is present; absent ones are null so that "all
     * seasons" never collides with an explicit season. Race ids are
     * sorted and de-duplicated.
     */
    ParamMap ToParamMap() const;

    std::string ToString() const;
};

} // namespace model
} // namespace f1metrics

#endif // F1METRICS_MODEL_METRIC_PARAMS_H_
