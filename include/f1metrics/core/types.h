#ifndef F1METRICS_CORE_TYPES_H_
#define F1METRICS_CORE_TYPES_H_

#include <cstdint>

namespace f1metrics {
namespace core {

/**
 * @brief Integer identifiers used as join keys across the source tables
 */
using RaceId = int64_t;
using DriverId = int64_t;
using ConstructorId = int64_t;
using StatusId = int64_t;

/**
 * @brief Season (championship year)
 */
using Season = int64_t;

/**
 * @brief Represents a timestamp in milliseconds since Unix epoch
 */
using Timestamp = int64_t;

/**
 * @brief Represents a duration in milliseconds
 */
using Duration = int64_t;

} // namespace core
} // namespace f1metrics

#endif // F1METRICS_CORE_TYPES_H_
