#pragma once

#include <cstdint>
#include <string>

#include "f1metrics/core/result.h"
#include "f1metrics/core/types.h"

namespace f1metrics {
namespace core {

/**
 * @brief Configuration for the source dataset and the season floor
 */
struct DataConfig {
    std::string dataset_dir;   // Directory holding the CSV tables
    Season min_year;           // Inclusive season floor applied to every race-derived view

    // Default constructor
    DataConfig() : min_year(0) {}

    static DataConfig Default() {
        DataConfig config;
        config.dataset_dir = "dataset";
        config.min_year = 2011;           // Complete data availability from 2011
        return config;
    }
};

/**
 * @brief Configuration for the file-backed metric cache
 */
struct CacheConfig {
    std::string cache_dir;     // Directory holding one file per cache entry
    bool enabled;              // Disabled cache never hits and never stores
    int64_t ttl_seconds;       // Entries older than this are expired on read

    // Default constructor
    CacheConfig() : enabled(false), ttl_seconds(0) {}

    static CacheConfig Default() {
        CacheConfig config;
        config.cache_dir = "cache";
        config.enabled = true;
        config.ttl_seconds = 3600;        // 1 hour
        return config;
    }
};

/**
 * @brief Top-level configuration
 */
struct Config {
    DataConfig data;
    CacheConfig cache;
    std::string log_level;     // trace, debug, info, warn, error, off

    Config() = default;

    static Config Default() {
        Config config;
        config.data = DataConfig::Default();
        config.cache = CacheConfig::Default();
        config.log_level = "info";
        return config;
    }

    /**
     * @brief Check that the configuration is usable
     * @return Error describing the first invalid field, if any
     */
    Result<void> Validate() const;
};

} // namespace core
} // namespace f1metrics
