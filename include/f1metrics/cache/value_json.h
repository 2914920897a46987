#pragma once

#include <rapidjson/document.h>

#include "f1metrics/core/result.h"
#include "f1metrics/model/metric_result.h"
#include "f1metrics/model/metric_value.h"

namespace f1metrics {
namespace cache {

using JsonAllocator = rapidjson::Document::AllocatorType;

/**
 * @brief Convert a value to JSON
 *
 * Maps become objects in insertion order, lists become arrays. Fails on
 * NaN and infinite doubles, which have no JSON form.
 */
core::Result<void> ValueToJson(const model::MetricValue& value, rapidjson::Value* out,
                               JsonAllocator& allocator);

/**
 * @brief Convert JSON back to a value
 *
 * Integral numbers written without a fraction become INT, everything else
 * numeric becomes DOUBLE, so an encoded value decodes to the same kind.
 */
core::Result<model::MetricValue> ValueFromJson(const rapidjson::Value& json);

// Metric result as a JSON object; absent optional fields are written as null
core::Result<void> ResultToJson(const model::MetricResult& result, rapidjson::Value* out,
                                JsonAllocator& allocator);

core::Result<model::MetricResult> ResultFromJson(const rapidjson::Value& json);

} // namespace cache
} // namespace f1metrics
