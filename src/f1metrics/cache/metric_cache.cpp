#include "f1metrics/cache/metric_cache.h"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>

#include "f1metrics/cache/entry_codec.h"
#include "f1metrics/cache/fingerprint.h"
#include "f1metrics/common/logger.h"

namespace fs = std::filesystem;

namespace f1metrics {
namespace cache {

namespace {

constexpr const char* kEntryExtension = ".json";

bool IsEntryFile(const fs::directory_entry& file) {
    std::error_code ec;
    return file.is_regular_file(ec) && file.path().extension() == kEntryExtension;
}

core::Result<std::string> ReadFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return core::Result<std::string>::error("cannot open " + path.string());
    }
    std::ostringstream contents;
    contents << in.rdbuf();
    if (in.bad()) {
        return core::Result<std::string>::error("cannot read " + path.string());
    }
    return core::Result<std::string>(contents.str());
}

} // namespace

MetricCache::MetricCache(core::CacheConfig config, Clock clock)
    : config_(std::move(config)), clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = SystemClock();
    }
    if (config_.enabled) {
        std::error_code ec;
        fs::create_directories(config_.cache_dir, ec);
        if (ec) {
            F1METRICS_WARN("Cannot create cache directory {}: {}", config_.cache_dir, ec.message());
        }
    }
}

MetricCache::Clock MetricCache::SystemClock() {
    return []() -> core::Timestamp {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    };
}

std::string MetricCache::EntryPath(const std::string& fingerprint) const {
    return (fs::path(config_.cache_dir) / (fingerprint + kEntryExtension)).string();
}

bool MetricCache::IsExpired(core::Timestamp created_at_ms, core::Timestamp now_ms) const {
    return now_ms - created_at_ms > config_.ttl_seconds * 1000;
}

void MetricCache::RemoveEntry(const std::string& path) const {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        F1METRICS_WARN("Cannot remove cache entry {}: {}", path, ec.message());
    }
}

std::optional<model::MetricResult> MetricCache::Get(const std::string& metric_name,
                                                    const model::MetricParams& params) {
    if (!config_.enabled) {
        return std::nullopt;
    }

    std::string fingerprint = Fingerprint(metric_name, params);
    std::string path = EntryPath(fingerprint);

    std::error_code ec;
    if (!fs::exists(path, ec)) {
        F1METRICS_DEBUG("Cache miss for {} ({})", metric_name, fingerprint);
        return std::nullopt;
    }

    auto contents = ReadFile(path);
    if (!contents.ok()) {
        F1METRICS_WARN("Cache read failed for {}: {}", metric_name, contents.error());
        return std::nullopt;
    }

    auto decoded = DecodeEntry(contents.value());
    if (!decoded.ok()) {
        F1METRICS_WARN("Corrupt cache entry {}: {}", path, decoded.error());
        return std::nullopt;
    }
    CacheEntry entry = decoded.take_value();

    if (entry.fingerprint != fingerprint || entry.metric_name != metric_name) {
        F1METRICS_WARN("Cache entry {} belongs to {} ({}), expected {}", path, entry.metric_name,
                       entry.fingerprint, metric_name);
        return std::nullopt;
    }

    if (IsExpired(entry.created_at_ms, clock_())) {
        F1METRICS_DEBUG("Cache entry for {} expired", metric_name);
        RemoveEntry(path);
        return std::nullopt;
    }

    F1METRICS_DEBUG("Cache hit for {} ({})", metric_name, fingerprint);
    return std::move(entry.result);
}

void MetricCache::Set(const std::string& metric_name, const model::MetricParams& params,
                      const model::MetricResult& result) {
    if (!config_.enabled) {
        return;
    }

    CacheEntry entry;
    entry.parameters = params.ToParamMap();
    entry.fingerprint = Fingerprint(metric_name, entry.parameters);
    entry.metric_name = metric_name;
    entry.result = result;
    entry.created_at_ms = clock_();

    auto encoded = EncodeEntry(entry);
    if (!encoded.ok()) {
        F1METRICS_WARN("Not caching {}: {}", metric_name, encoded.error());
        return;
    }

    std::error_code ec;
    fs::create_directories(config_.cache_dir, ec);
    if (ec) {
        F1METRICS_WARN("Cannot create cache directory {}: {}", config_.cache_dir, ec.message());
        return;
    }

    std::string path = EntryPath(entry.fingerprint);
    std::ostringstream temp_name;
    temp_name << path << ".tmp." << std::hash<std::thread::id>()(std::this_thread::get_id())
              << "." << temp_counter_++;
    std::string temp_path = temp_name.str();

    {
        std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
        out << encoded.value();
        out.close();
        if (!out) {
            F1METRICS_WARN("Cache write failed for {}: cannot write {}", metric_name, temp_path);
            RemoveEntry(temp_path);
            return;
        }
    }

    fs::rename(temp_path, path, ec);
    if (ec) {
        F1METRICS_WARN("Cache write failed for {}: {}", metric_name, ec.message());
        RemoveEntry(temp_path);
        return;
    }
    F1METRICS_DEBUG("Cached {} ({})", metric_name, entry.fingerprint);
}

size_t MetricCache::Clear(const std::optional<std::string>& metric_name) {
    std::error_code ec;
    if (!fs::is_directory(config_.cache_dir, ec)) {
        return 0;
    }

    size_t removed = 0;
    fs::directory_iterator it(config_.cache_dir, ec);
    if (ec) {
        F1METRICS_WARN("Cannot list cache directory {}: {}", config_.cache_dir, ec.message());
        return 0;
    }
    for (const auto& file : it) {
        if (!IsEntryFile(file)) {
            continue;
        }
        if (metric_name) {
            auto contents = ReadFile(file.path());
            if (!contents.ok()) {
                continue;
            }
            auto decoded = DecodeEntry(contents.value());
            if (!decoded.ok() || decoded.value().metric_name != *metric_name) {
                continue;
            }
        }
        std::error_code remove_ec;
        if (fs::remove(file.path(), remove_ec)) {
            ++removed;
        } else if (remove_ec) {
            F1METRICS_WARN("Cannot remove cache entry {}: {}", file.path().string(), remove_ec.message());
        }
    }

    if (metric_name) {
        F1METRICS_INFO("Cleared {} cache entries for {}", removed, *metric_name);
    } else {
        F1METRICS_INFO("Cleared {} cache entries", removed);
    }
    return removed;
}

MetricCache::Stats MetricCache::GetStats() const {
    Stats stats;
    stats.enabled = config_.enabled;
    stats.ttl_seconds = config_.ttl_seconds;

    std::error_code ec;
    if (!fs::is_directory(config_.cache_dir, ec)) {
        return stats;
    }
    fs::directory_iterator it(config_.cache_dir, ec);
    if (ec) {
        F1METRICS_WARN("Cannot list cache directory {}: {}", config_.cache_dir, ec.message());
        return stats;
    }

    core::Timestamp now = clock_();
    for (const auto& file : it) {
        if (!IsEntryFile(file)) {
            continue;
        }
        stats.total_entries++;
        std::error_code size_ec;
        auto size = file.file_size(size_ec);
        if (!size_ec) {
            stats.total_bytes += size;
        }
        auto contents = ReadFile(file.path());
        if (!contents.ok()) {
            continue;
        }
        auto decoded = DecodeEntry(contents.value());
        if (decoded.ok() && IsExpired(decoded.value().created_at_ms, now)) {
            stats.expired_entries++;
        }
    }
    return stats;
}

} // namespace cache
} // namespace f1metrics
