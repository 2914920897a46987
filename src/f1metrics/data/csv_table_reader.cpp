#include "f1metrics/data/csv_table_reader.h"

#include <arrow/api.h>
#include <arrow/csv/api.h>
#include <arrow/io/file.h>

namespace f1metrics {
namespace data {

CsvTableReader::~CsvTableReader() {
    if (infile_) {
        (void)infile_->Close();
    }
}

core::Result<void> CsvTableReader::Open(const std::string& path) {
    auto infile_result = arrow::io::ReadableFile::Open(path);
    if (!infile_result.ok()) {
        return core::Result<void>::error("Failed to open file: " + infile_result.status().ToString());
    }
    infile_ = *infile_result;
    path_ = path;
    return core::Result<void>();
}

core::Result<void> CsvTableReader::Read(std::shared_ptr<arrow::Table>* out_table) {
    if (!infile_) {
        return core::Result<void>::error("Reader not open");
    }

    auto read_options = arrow::csv::ReadOptions::Defaults();
    auto parse_options = arrow::csv::ParseOptions::Defaults();
    auto convert_options = arrow::csv::ConvertOptions::Defaults();
    convert_options.null_values = {"\\N", ""};
    convert_options.strings_can_be_null = true;

    try {
        auto maybe_reader = arrow::csv::TableReader::Make(
            arrow::io::default_io_context(), infile_,
            read_options, parse_options, convert_options);
        if (!maybe_reader.ok()) {
            return core::Result<void>::error("Failed to create CSV reader for " + path_ + ": " +
                                             maybe_reader.status().ToString());
        }

        auto maybe_table = (*maybe_reader)->Read();
        if (!maybe_table.ok()) {
            return core::Result<void>::error("Failed to parse " + path_ + ": " +
                                             maybe_table.status().ToString());
        }
        if (!*maybe_table) {
            return core::Result<void>::error("CSV reader returned null table for " + path_);
        }
        *out_table = *maybe_table;
    } catch (const std::exception& e) {
        return core::Result<void>::error("Exception reading " + path_ + ": " + std::string(e.what()));
    }

    return core::Result<void>();
}

core::Result<void> CsvTableReader::Close() {
    if (infile_) {
        auto status = infile_->Close();
        infile_.reset();
        if (!status.ok()) {
            return core::Result<void>::error("Failed to close file: " + status.ToString());
        }
    }
    return core::Result<void>();
}

} // namespace data
} // namespace f1metrics
