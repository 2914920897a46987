#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include "f1metrics/core/config.h"
#include "f1metrics/core/types.h"
#include "f1metrics/model/metric_params.h"
#include "f1metrics/model/metric_result.h"

namespace f1metrics {
namespace cache {

/**
 * @brief File-backed cache of computed metric results
 *
 * One `<fingerprint>.json` file per entry under the cache directory.
 * Entries expire lazily: a read that finds an entry older than the TTL
 * deletes it and reports a miss. Every fault (unreadable or corrupt
 * file, write failure) is logged as a warning and reported as a miss or
 * ignored; nothing here throws to the caller.
 */
class MetricCache {
public:
    // Milliseconds since the Unix epoch
    using Clock = std::function<core::Timestamp()>;

    struct Stats {
        bool enabled = false;
        int64_t ttl_seconds = 0;
        uint64_t total_entries = 0;
        uint64_t total_bytes = 0;
        uint64_t expired_entries = 0;
    };

    explicit MetricCache(core::CacheConfig config, Clock clock = SystemClock());

    // Disable copy constructor and assignment
    MetricCache(const MetricCache&) = delete;
    MetricCache& operator=(const MetricCache&) = delete;

    /**
     * @brief Look up a fresh cached result
     * @return The stored result, or nullopt on miss, expiry, fault or when disabled
     */
    std::optional<model::MetricResult> Get(const std::string& metric_name,
                                           const model::MetricParams& params);

    /**
     * @brief Store a result, replacing any previous entry for the request
     *
     * The entry is written to a temporary file and renamed into place so a
     * concurrent reader never sees a partial entry.
     */
    void Set(const std::string& metric_name, const model::MetricParams& params,
             const model::MetricResult& result);

    /**
     * @brief Delete entries
     * @param metric_name Only entries stored for this metric; all entries if absent
     * @return Number of entries deleted
     */
    size_t Clear(const std::optional<std::string>& metric_name = std::nullopt);

    // Non-atomic snapshot of the cache directory
    Stats GetStats() const;

    bool enabled() const { return config_.enabled; }
    const core::CacheConfig& config() const { return config_; }

    static Clock SystemClock();

private:
    std::string EntryPath(const std::string& fingerprint) const;
    bool IsExpired(core::Timestamp created_at_ms, core::Timestamp now_ms) const;
    void RemoveEntry(const std::string& path) const;

    core::CacheConfig config_;
    Clock clock_;
    std::atomic<uint64_t> temp_counter_{0};
};

} // namespace cache
} // namespace f1metrics
