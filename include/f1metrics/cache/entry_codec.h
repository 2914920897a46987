#pragma once

#include <string>

#include "f1metrics/core/result.h"
#include "f1metrics/core/types.h"
#include "f1metrics/model/metric_params.h"
#include "f1metrics/model/metric_result.h"

namespace f1metrics {
namespace cache {

/**
 * @brief One stored metric result with the request that produced it
 */
struct CacheEntry {
    std::string fingerprint;
    std::string metric_name;
    model::ParamMap parameters;
    model::MetricResult result;
    core::Timestamp created_at_ms = 0;   // Milliseconds since the Unix epoch
};

/**
 * @brief Serialize an entry to its on-disk JSON form
 * @return Error if the result holds a value with no JSON form
 */
core::Result<std::string> EncodeEntry(const CacheEntry& entry);

/**
 * @brief Parse and validate an on-disk entry
 * @return Error for malformed JSON or missing and mistyped fields
 */
core::Result<CacheEntry> DecodeEntry(const std::string& text);

// Result as standalone JSON text, for display
core::Result<std::string> EncodeResult(const model::MetricResult& result, bool pretty = false);

} // namespace cache
} // namespace f1metrics
