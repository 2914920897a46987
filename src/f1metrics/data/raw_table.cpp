#include "f1metrics/data/raw_table.h"
#include "f1metrics/core/error.h"

#include <arrow/api.h>

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>

namespace f1metrics {
namespace data {

namespace {

std::string_view Trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

std::optional<int64_t> IntegralDouble(double v) {
    if (!std::isfinite(v) || v != std::floor(v)) {
        return std::nullopt;
    }
    if (v < static_cast<double>(std::numeric_limits<int64_t>::min()) ||
        v > static_cast<double>(std::numeric_limits<int64_t>::max())) {
        return std::nullopt;
    }
    return static_cast<int64_t>(v);
}

template <typename ArrayType>
const ArrayType& As(const arrow::Array& array) {
    return static_cast<const ArrayType&>(array);
}

// Text form of any cell; used for types without a direct numeric path
std::optional<std::string> CellText(const arrow::Array& array, int64_t i) {
    if (array.IsNull(i)) {
        return std::nullopt;
    }
    switch (array.type_id()) {
        case arrow::Type::STRING:
            return As<arrow::StringArray>(array).GetString(i);
        case arrow::Type::LARGE_STRING:
            return As<arrow::LargeStringArray>(array).GetString(i);
        default: {
            auto scalar = array.GetScalar(i);
            if (!scalar.ok()) {
                return std::nullopt;
            }
            return (*scalar)->ToString();
        }
    }
}

std::optional<int64_t> CellAsInt64(const arrow::Array& array, int64_t i) {
    if (array.IsNull(i)) {
        return std::nullopt;
    }
    switch (array.type_id()) {
        case arrow::Type::INT64:
            return As<arrow::Int64Array>(array).Value(i);
        case arrow::Type::INT32:
            return As<arrow::Int32Array>(array).Value(i);
        case arrow::Type::INT16:
            return As<arrow::Int16Array>(array).Value(i);
        case arrow::Type::DOUBLE:
            return IntegralDouble(As<arrow::DoubleArray>(array).Value(i));
        case arrow::Type::FLOAT:
            return IntegralDouble(As<arrow::FloatArray>(array).Value(i));
        default: {
            auto text = CellText(array, i);
            return text ? CoerceInt64(*text) : std::nullopt;
        }
    }
}

std::optional<double> CellAsDouble(const arrow::Array& array, int64_t i) {
    if (array.IsNull(i)) {
        return std::nullopt;
    }
    switch (array.type_id()) {
        case arrow::Type::DOUBLE: {
            double v = As<arrow::DoubleArray>(array).Value(i);
            return std::isfinite(v) ? std::optional<double>(v) : std::nullopt;
        }
        case arrow::Type::FLOAT: {
            double v = As<arrow::FloatArray>(array).Value(i);
            return std::isfinite(v) ? std::optional<double>(v) : std::nullopt;
        }
        case arrow::Type::INT64:
            return static_cast<double>(As<arrow::Int64Array>(array).Value(i));
        case arrow::Type::INT32:
            return static_cast<double>(As<arrow::Int32Array>(array).Value(i));
        case arrow::Type::INT16:
            return static_cast<double>(As<arrow::Int16Array>(array).Value(i));
        default: {
            auto text = CellText(array, i);
            return text ? CoerceDouble(*text) : std::nullopt;
        }
    }
}

} // namespace

std::optional<int64_t> CoerceInt64(std::string_view text) {
    text = Trim(text);
    if (text.empty()) {
        return std::nullopt;
    }
    std::string buffer(text);
    errno = 0;
    char* end = nullptr;
    long long v = std::strtoll(buffer.c_str(), &end, 10);
    if (errno == 0 && end == buffer.c_str() + buffer.size()) {
        return static_cast<int64_t>(v);
    }
    // "3.0" style integral decimals
    auto d = CoerceDouble(text);
    return d ? IntegralDouble(*d) : std::nullopt;
}

std::optional<double> CoerceDouble(std::string_view text) {
    text = Trim(text);
    if (text.empty()) {
        return std::nullopt;
    }
    std::string buffer(text);
    errno = 0;
    char* end = nullptr;
    double v = std::strtod(buffer.c_str(), &end);
    if (errno != 0 || end != buffer.c_str() + buffer.size() || !std::isfinite(v)) {
        return std::nullopt;
    }
    return v;
}

RawTable::RawTable(std::string name, std::shared_ptr<arrow::Table> table)
    : name_(std::move(name)), table_(std::move(table)) {
    if (!table_) {
        throw core::InternalError("RawTable '" + name_ + "' constructed without data");
    }
}

int64_t RawTable::num_rows() const {
    return table_->num_rows();
}

std::vector<std::string> RawTable::column_names() const {
    return table_->schema()->field_names();
}

bool RawTable::HasColumn(const std::string& column) const {
    return table_->schema()->GetFieldIndex(column) >= 0;
}

namespace {

std::shared_ptr<arrow::ChunkedArray> RequireColumn(const arrow::Table& table,
                                                   const std::string& table_name,
                                                   const std::string& column) {
    auto chunked = table.GetColumnByName(column);
    if (!chunked) {
        throw core::MalformedDataError("table '" + table_name + "' has no column '" + column + "'");
    }
    return chunked;
}

template <typename T, typename CellFn>
std::vector<T> Collect(const arrow::ChunkedArray& chunked, CellFn cell) {
    std::vector<T> out;
    out.reserve(static_cast<size_t>(chunked.length()));
    for (const auto& chunk : chunked.chunks()) {
        for (int64_t i = 0; i < chunk->length(); ++i) {
            out.push_back(cell(*chunk, i));
        }
    }
    return out;
}

} // namespace

std::vector<std::optional<int64_t>> RawTable::Int64Column(const std::string& column) const {
    auto chunked = RequireColumn(*table_, name_, column);
    return Collect<std::optional<int64_t>>(*chunked, CellAsInt64);
}

std::vector<std::optional<double>> RawTable::DoubleColumn(const std::string& column) const {
    auto chunked = RequireColumn(*table_, name_, column);
    return Collect<std::optional<double>>(*chunked, CellAsDouble);
}

std::vector<std::string> RawTable::StringColumn(const std::string& column) const {
    auto chunked = RequireColumn(*table_, name_, column);
    return Collect<std::string>(*chunked, [](const arrow::Array& array, int64_t i) {
        auto text = CellText(array, i);
        return text ? *text : std::string();
    });
}

std::vector<int64_t> RawTable::KeyColumn(const std::string& column) const {
    auto values = Int64Column(column);
    std::vector<int64_t> keys;
    keys.reserve(values.size());
    for (size_t row = 0; row < values.size(); ++row) {
        if (!values[row]) {
            throw core::MalformedDataError("table '" + name_ + "' column '" + column +
                                           "' has a non-integer key at row " + std::to_string(row + 1));
        }
        keys.push_back(*values[row]);
    }
    return keys;
}

} // namespace data
} // namespace f1metrics
