#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace arrow {
class Table;
}

namespace f1metrics {
namespace data {

/**
 * @brief Parse a cell as an integer
 *
 * Accepts surrounding whitespace and integral decimal text such as "3.0".
 * Sentinels ("\N", "Ret", "R", "") and anything else non-numeric yield
 * nullopt. Never throws.
 */
std::optional<int64_t> CoerceInt64(std::string_view text);

/**
 * @brief Parse a cell as a finite floating point number, nullopt otherwise
 */
std::optional<double> CoerceDouble(std::string_view text);

/**
 * @brief Immutable named table loaded from the dataset
 *
 * Wraps an Arrow table and exposes typed, null-aware column accessors.
 * Numeric accessors coerce whatever type Arrow inferred for the column;
 * a cell that cannot be coerced becomes nullopt rather than an error.
 */
class RawTable {
public:
    RawTable(std::string name, std::shared_ptr<arrow::Table> table);

    const std::string& name() const { return name_; }
    int64_t num_rows() const;
    std::vector<std::string> column_names() const;
    bool HasColumn(const std::string& column) const;

    // Accessors throw core::MalformedDataError if the column does not exist
    std::vector<std::optional<int64_t>> Int64Column(const std::string& column) const;
    std::vector<std::optional<double>> DoubleColumn(const std::string& column) const;
    // Null cells map to the empty string
    std::vector<std::string> StringColumn(const std::string& column) const;

    /**
     * @brief Integer column where every row must hold a value
     * @throws core::MalformedDataError naming the first offending row
     */
    std::vector<int64_t> KeyColumn(const std::string& column) const;

    const std::shared_ptr<arrow::Table>& arrow_table() const { return table_; }

private:
    std::string name_;
    std::shared_ptr<arrow::Table> table_;
};

} // namespace data
} // namespace f1metrics
