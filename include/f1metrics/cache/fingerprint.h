#pragma once

#include <string>

#include "f1metrics/model/metric_params.h"

namespace f1metrics {
namespace cache {

// Hex characters kept from the SHA-256 digest (128 bits)
constexpr size_t kFingerprintLength = 32;

/**
 * @brief Canonical JSON text of a (metric name, parameters) pair
 *
 * Keys are sorted at every level and integral doubles are written as
 * integers, so equal requests produce identical text regardless of how
 * the parameters were built.
 */
std::string CanonicalRequest(const std::string& metric_name, const model::ParamMap& params);

/**
 * @brief Cache key of a request: truncated hex SHA-256 of CanonicalRequest
 */
std::string Fingerprint(const std::string& metric_name, const model::ParamMap& params);

inline std::string Fingerprint(const std::string& metric_name, const model::MetricParams& params) {
    return Fingerprint(metric_name, params.ToParamMap());
}

} // namespace cache
} // namespace f1metrics
