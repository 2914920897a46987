#pragma once

#include <string>
#include <vector>

namespace f1metrics {
namespace data {

// Source table file names
namespace tables {
constexpr const char* kRaces = "races.csv";
constexpr const char* kResults = "results.csv";
constexpr const char* kQualifying = "qualifying.csv";
constexpr const char* kLapTimes = "lap_times.csv";
constexpr const char* kPitStops = "pit_stops.csv";
constexpr const char* kDrivers = "drivers.csv";
constexpr const char* kConstructors = "constructors.csv";
constexpr const char* kConstructorStandings = "constructor_standings.csv";
constexpr const char* kDriverStandings = "driver_standings.csv";
constexpr const char* kStatus = "status.csv";
} // namespace tables

/**
 * @brief Declared schema of a known source table
 */
struct TableSchema {
    std::string name;
    // Columns that must exist
    std::vector<std::string> required_columns;
    // Subset of required columns that must hold an integer in every row
    std::vector<std::string> key_columns;
};

/**
 * @brief Schema of a known table
 * @return nullptr for tables without declared requirements
 */
const TableSchema* FindSchema(const std::string& table_name);

// All known schemas
const std::vector<TableSchema>& KnownSchemas();

} // namespace data
} // namespace f1metrics
