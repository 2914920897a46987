#include "f1metrics/core/config.h"

namespace f1metrics {
namespace core {

namespace {

constexpr Season kEarliestSeason = 1950;
constexpr Season kLatestSeason = 2100;

bool IsKnownLogLevel(const std::string& level) {
    return level == "trace" || level == "debug" || level == "info" ||
           level == "warn" || level == "error" || level == "off";
}

} // namespace

Result<void> Config::Validate() const {
    if (data.dataset_dir.empty()) {
        return Result<void>::error("dataset_dir must not be empty");
    }
    if (data.min_year < kEarliestSeason || data.min_year > kLatestSeason) {
        return Result<void>::error("min_year must be between " + std::to_string(kEarliestSeason) +
                                   " and " + std::to_string(kLatestSeason) +
                                   ", got " + std::to_string(data.min_year));
    }
    if (cache.enabled && cache.cache_dir.empty()) {
        return Result<void>::error("cache_dir must not be empty when the cache is enabled");
    }
    if (cache.ttl_seconds < 0) {
        return Result<void>::error("ttl_seconds must not be negative");
    }
    if (!log_level.empty() && !IsKnownLogLevel(log_level)) {
        return Result<void>::error("unknown log level: " + log_level);
    }
    return Result<void>();
}

} // namespace core
} // namespace f1metrics
