#pragma once

#include <memory>
#include <string>

#include "f1metrics/core/result.h"

namespace arrow {
class Table;
namespace io {
class ReadableFile;
}
}

namespace f1metrics {
namespace data {

/**
 * @brief Reads one CSV file into an Arrow table
 *
 * The header row names the columns. "\N" and empty cells are read as null;
 * column types are inferred by Arrow.
 */
class CsvTableReader {
public:
    CsvTableReader() = default;
    ~CsvTableReader();

    // Opens a CSV file for reading
    core::Result<void> Open(const std::string& path);

    // Reads the whole file
    core::Result<void> Read(std::shared_ptr<arrow::Table>* out_table);

    // Closes the file
    core::Result<void> Close();

private:
    std::string path_;
    std::shared_ptr<arrow::io::ReadableFile> infile_;
};

} // namespace data
} // namespace f1metrics
