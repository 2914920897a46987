#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "f1metrics/core/config.h"
#include "f1metrics/data/table_store.h"
#include "f1metrics/data/views.h"

namespace f1metrics {
namespace data {

/**
 * @brief Builds derived views by joining and aggregating raw tables
 *
 * Every race-derived view is restricted to races with year >= min_year
 * before any join, whatever the query asks for. Views are computed on
 * demand and returned by value; the builder itself holds no state beyond
 * the table store reference.
 *
 * A view whose required table is absent throws core::DataUnavailableError
 * naming the view and the table. Schema faults propagate as
 * core::MalformedDataError.
 */
class ViewBuilder {
public:
    ViewBuilder(TableStore& store, core::DataConfig config);

    // In-scope races sorted by (year, round)
    std::vector<RaceRow> Races(std::optional<core::Season> season = std::nullopt) const;

    /**
     * @brief Race ids matching the season floor, the season and the
     * explicit race id list of the query
     */
    std::vector<core::RaceId> ResolveRaceIds(const ViewQuery& query) const;

    // Results with race context and driver_name
    std::vector<ResultRow> DriverResults(const ViewQuery& query) const;

    // Results with race context and constructor_name; null points become 0
    std::vector<ResultRow> ConstructorResults(const ViewQuery& query) const;

    // ConstructorResults plus status text
    std::vector<ResultRow> ConstructorReliability(const ViewQuery& query) const;

    /**
     * @brief Joint result per (race, constructor)
     *
     * Sorted by (year, round, constructor id).
     */
    std::vector<ConstructorRaceRow> ConstructorPointsByRace(const ViewQuery& query) const;

    // 1-2 finishes: best 1, worst 2, exactly two classified cars
    std::vector<ConstructorRaceRow> ConstructorRaceWins(const ViewQuery& query) const;

    // Races where the constructor's podium finishers occupy positions 1..k, k >= 2
    std::vector<ConstructorRaceRow> ConstructorPodiumLockouts(const ViewQuery& query) const;

    /**
     * @brief Final standing per (season, constructor)
     *
     * The standing of the highest round is kept.
     * @throws core::MalformedDataError on two rows with the same round in one group
     */
    std::vector<StandingRow> ConstructorStandingsBySeason(const ViewQuery& query) const;

    // Same as ConstructorStandingsBySeason, per (season, driver)
    std::vector<StandingRow> DriverStandingsBySeason(const ViewQuery& query) const;

    std::vector<QualifyingRow> QualifyingWithConstructor(const ViewQuery& query) const;
    std::vector<LapTimeRow> LapTimesWithContext(const ViewQuery& query) const;
    std::vector<LapPerformanceRow> ConstructorLapPerformance(const ViewQuery& query) const;
    std::vector<PitStopRow> PitStopStats(const ViewQuery& query) const;
    std::vector<TeammatePairRow> TeammatePairs(const ViewQuery& query) const;

    // "forename surname", or nullopt if the driver is unknown
    std::optional<std::string> DriverName(core::DriverId id) const;
    std::optional<std::string> ConstructorName(core::ConstructorId id) const;

    const core::DataConfig& config() const { return config_; }

private:
    using RaceIndex = std::map<core::RaceId, RaceRow>;
    using DriverRaceKey = std::pair<core::RaceId, core::DriverId>;

    std::shared_ptr<const RawTable> Require(const std::string& view, const std::string& table) const;
    std::vector<RaceRow> ScopedRaces(const std::string& view, const ViewQuery& query) const;
    RaceIndex IndexRaces(const std::string& view, const ViewQuery& query) const;
    std::vector<ResultRow> JoinResults(const std::string& view, const ViewQuery& query) const;
    std::vector<ResultRow> JoinConstructorResults(const std::string& view, const ViewQuery& query) const;
    std::vector<ConstructorRaceRow> Aggregate(const std::string& view, const ViewQuery& query) const;
    std::vector<StandingRow> FinalStandings(const std::string& view, const std::string& table,
                                            const std::string& id_column,
                                            const std::optional<int64_t>& id_filter,
                                            const ViewQuery& query) const;
    std::map<DriverRaceKey, core::ConstructorId> ConstructorByDriverRace(const std::string& view,
                                                                         const RaceIndex& races) const;
    std::vector<LapTimeRow> JoinLapTimes(const std::string& view, const ViewQuery& query) const;

    TableStore& store_;
    core::DataConfig config_;
};

} // namespace data
} // namespace f1metrics
