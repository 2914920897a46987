#pragma once

#include <optional>
#include <string>
#include <vector>

#include "f1metrics/core/types.h"

namespace f1metrics {
namespace data {

/**
 * @brief Parameters shared by every derived view
 *
 * All filters are optional and combine conjunctively. Explicit race ids
 * are intersected with the season scope, never used to widen it.
 */
struct ViewQuery {
    std::optional<core::Season> season;
    std::optional<core::DriverId> driver_id;
    std::optional<core::ConstructorId> constructor_id;
    std::optional<std::vector<core::RaceId>> race_ids;
};

struct RaceRow {
    core::RaceId race_id = 0;
    core::Season year = 0;
    int64_t round = 0;
    std::string name;
    std::string date;
};

/**
 * @brief One results row joined with its race and naming context
 *
 * position is null for entries that were not classified (DNF, DSQ, ...).
 */
struct ResultRow {
    core::RaceId race_id = 0;
    core::Season year = 0;
    int64_t round = 0;
    int64_t result_id = 0;
    core::DriverId driver_id = 0;
    core::ConstructorId constructor_id = 0;
    core::StatusId status_id = 0;
    std::optional<int64_t> grid;
    std::optional<int64_t> position;
    std::string position_text;      // Display only
    std::optional<double> points;
    std::optional<std::string> driver_name;
    std::optional<std::string> constructor_name;
    std::optional<std::string> status;
};

/**
 * @brief Joint result of one constructor in one race
 *
 * Positions are taken over classified cars only; drivers_count counts
 * every entry.
 */
struct ConstructorRaceRow {
    core::RaceId race_id = 0;
    core::ConstructorId constructor_id = 0;
    core::Season year = 0;
    int64_t round = 0;
    std::optional<int64_t> best_position;
    std::optional<int64_t> worst_position;
    std::optional<double> mean_position;
    int64_t drivers_count = 0;
    int64_t classified_count = 0;
    std::vector<int64_t> podium_positions;  // Classified positions 1-3, ascending
    double total_points = 0.0;
};

// Final standing of a constructor or driver in one season
struct StandingRow {
    core::Season season = 0;
    int64_t round = 0;              // Round of the race the standing was taken after
    core::RaceId race_id = 0;
    int64_t id = 0;                 // constructorId or driverId
    double points = 0.0;
    std::optional<int64_t> position;
    std::optional<int64_t> wins;
};

struct QualifyingRow {
    core::RaceId race_id = 0;
    core::Season year = 0;
    int64_t round = 0;
    core::DriverId driver_id = 0;
    std::optional<core::ConstructorId> constructor_id;
    std::optional<int64_t> position;
};

struct LapTimeRow {
    core::RaceId race_id = 0;
    core::Season year = 0;
    int64_t round = 0;
    core::DriverId driver_id = 0;
    std::optional<core::ConstructorId> constructor_id;
    int64_t lap = 0;
    std::optional<int64_t> position;
    std::optional<double> milliseconds;
};

struct LapPerformanceRow {
    core::RaceId race_id = 0;
    core::ConstructorId constructor_id = 0;
    core::Season year = 0;
    int64_t round = 0;
    double mean_ms = 0.0;
    double fastest_ms = 0.0;
    double slowest_ms = 0.0;
    std::optional<double> stddev_ms;    // Sample deviation, needs two laps
    int64_t lap_count = 0;
};

struct PitStopRow {
    core::RaceId race_id = 0;
    core::Season year = 0;
    int64_t round = 0;
    core::DriverId driver_id = 0;
    std::optional<core::ConstructorId> constructor_id;
    int64_t stop = 0;
    int64_t lap = 0;
    std::optional<double> milliseconds;
};

// Two drivers of the same constructor in the same race, in results order
struct TeammatePairRow {
    core::RaceId race_id = 0;
    core::Season year = 0;
    int64_t round = 0;
    core::ConstructorId constructor_id = 0;
    core::DriverId driver1_id = 0;
    core::DriverId driver2_id = 0;
    std::optional<int64_t> driver1_position;
    std::optional<int64_t> driver2_position;
};

} // namespace data
} // namespace f1metrics
