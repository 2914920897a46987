#pragma once

#include <atomic>
#include <cstdint>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "f1metrics/data/raw_table.h"

namespace f1metrics {
namespace data {

/**
 * @brief Memoizing loader of the raw CSV tables
 *
 * Tables are read from `<dataset_dir>/<name>` on first use and kept for
 * the lifetime of the store (until Clear). Concurrent first loads of the
 * same table perform a single read; the other callers wait for its
 * outcome. A failed load leaves nothing behind, so the next call retries.
 */
class TableStore {
public:
    /**
     * @brief Construct a store over a dataset directory
     * @param dataset_dir Directory holding the CSV files
     */
    explicit TableStore(std::string dataset_dir);

    ~TableStore() = default;

    // Disable copy constructor and assignment
    TableStore(const TableStore&) = delete;
    TableStore& operator=(const TableStore&) = delete;

    // Disable move constructor and assignment (due to mutex)
    TableStore(TableStore&&) = delete;
    TableStore& operator=(TableStore&&) = delete;

    /**
     * @brief Get a table, reading it on first use
     * @param name Table file name, e.g. "results.csv"
     * @return Shared immutable table
     *
     * @throws core::NotFoundError if the backing file does not exist
     * @throws core::MalformedDataError if the file cannot be parsed, a
     *         required column is missing, or a key column holds a
     *         non-integer value
     */
    std::shared_ptr<const RawTable> Load(const std::string& name);

    /**
     * @brief Evict every memoized table; the next Load re-reads
     *
     * Loads already in flight complete for their own callers but are not
     * memoized.
     */
    void Clear();

    bool IsCached(const std::string& name) const;
    size_t CachedCount() const;

    // Number of physical file reads performed so far
    uint64_t LoadCount() const { return load_count_.load(); }

    const std::string& dataset_dir() const { return dataset_dir_; }

private:
    struct Slot {
        std::shared_future<std::shared_ptr<const RawTable>> table;
        uint64_t generation;
    };

    std::shared_ptr<const RawTable> ReadTable(const std::string& name);

    std::string dataset_dir_;
    mutable std::mutex mutex_;
    std::map<std::string, Slot> slots_;
    uint64_t next_generation_ = 0;
    std::atomic<uint64_t> load_count_{0};
};

} // namespace data
} // namespace f1metrics
