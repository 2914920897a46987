#include "f1metrics/data/table_store.h"

#include <chrono>
#include <filesystem>

#include "f1metrics/common/logger.h"
#include "f1metrics/core/error.h"
#include "f1metrics/data/csv_table_reader.h"
#include "f1metrics/data/schema.h"

namespace fs = std::filesystem;

namespace f1metrics {
namespace data {

TableStore::TableStore(std::string dataset_dir)
    : dataset_dir_(std::move(dataset_dir)) {}

std::shared_ptr<const RawTable> TableStore::Load(const std::string& name) {
    std::promise<std::shared_ptr<const RawTable>> promise;
    uint64_t generation = 0;
    std::shared_future<std::shared_ptr<const RawTable>> pending;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = slots_.find(name);
        if (it != slots_.end()) {
            pending = it->second.table;
        } else {
            generation = ++next_generation_;
            slots_[name] = Slot{promise.get_future().share(), generation};
        }
    }

    if (pending.valid()) {
        // Another caller owns the read; rethrows its failure
        return pending.get();
    }

    try {
        auto table = ReadTable(name);
        promise.set_value(table);
        return table;
    } catch (...) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = slots_.find(name);
            if (it != slots_.end() && it->second.generation == generation) {
                slots_.erase(it);
            }
        }
        promise.set_exception(std::current_exception());
        throw;
    }
}

std::shared_ptr<const RawTable> TableStore::ReadTable(const std::string& name) {
    fs::path path = fs::path(dataset_dir_) / name;
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw core::NotFoundError("table '" + name + "' not found at " + path.string());
    }

    load_count_++;
    CsvTableReader reader;
    auto open_result = reader.Open(path.string());
    if (!open_result.ok()) {
        throw core::MalformedDataError("table '" + name + "': " + open_result.error());
    }

    std::shared_ptr<arrow::Table> arrow_table;
    auto read_result = reader.Read(&arrow_table);
    if (!read_result.ok()) {
        throw core::MalformedDataError("table '" + name + "': " + read_result.error());
    }
    auto close_result = reader.Close();
    if (!close_result.ok()) {
        F1METRICS_WARN("Closing {}: {}", path.string(), close_result.error());
    }

    auto table = std::make_shared<const RawTable>(name, std::move(arrow_table));

    if (const TableSchema* schema = FindSchema(name)) {
        for (const auto& column : schema->required_columns) {
            if (!table->HasColumn(column)) {
                throw core::MalformedDataError("table '" + name + "' is missing required column '" +
                                               column + "'");
            }
        }
        for (const auto& column : schema->key_columns) {
            // Throws on the first null or non-integer key
            table->KeyColumn(column);
        }
    }

    F1METRICS_INFO("Loaded {}: {} rows", name, table->num_rows());
    return table;
}

void TableStore::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    slots_.clear();
    F1METRICS_DEBUG("Table store cleared");
}

bool TableStore::IsCached(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = slots_.find(name);
    if (it == slots_.end()) {
        return false;
    }
    return it->second.table.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

size_t TableStore::CachedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = 0;
    for (const auto& entry : slots_) {
        if (entry.second.table.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
            ++count;
        }
    }
    return count;
}

} // namespace data
} // namespace f1metrics
