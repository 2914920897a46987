#include "f1metrics/data/view_builder.h"

#include <algorithm>
#include <cmath>
#include <set>
#include <tuple>

#include "f1metrics/common/logger.h"
#include "f1metrics/core/error.h"
#include "f1metrics/data/schema.h"

namespace f1metrics {
namespace data {

namespace {

const char* kRacesView = "races";
const char* kDriverResultsView = "driver_results";
const char* kConstructorResultsView = "constructor_results";
const char* kReliabilityView = "constructor_reliability";
const char* kPointsByRaceView = "constructor_points_by_race";
const char* kRaceWinsView = "constructor_race_wins";
const char* kLockoutsView = "constructor_podium_lockouts";
const char* kConstructorStandingsView = "constructor_standings";
const char* kDriverStandingsView = "driver_standings";
const char* kQualifyingView = "qualifying";
const char* kLapTimesView = "lap_times";
const char* kLapPerformanceView = "constructor_lap_performance";
const char* kPitStopsView = "pit_stops";
const char* kTeammatePairsView = "teammate_pairs";

bool Matches(const std::optional<int64_t>& filter, int64_t value) {
    return !filter || *filter == value;
}

bool Matches(const std::optional<int64_t>& filter, const std::optional<int64_t>& value) {
    return !filter || (value && *filter == *value);
}

template <typename Row>
void SortByRace(std::vector<Row>& rows) {
    std::stable_sort(rows.begin(), rows.end(), [](const Row& a, const Row& b) {
        return std::tie(a.year, a.round, a.race_id) < std::tie(b.year, b.round, b.race_id);
    });
}

// Optional column as strings; absent column yields empty strings
std::vector<std::string> OptionalStrings(const RawTable& table, const std::string& column) {
    if (table.HasColumn(column)) {
        return table.StringColumn(column);
    }
    return std::vector<std::string>(static_cast<size_t>(table.num_rows()));
}

std::vector<std::optional<int64_t>> OptionalInts(const RawTable& table, const std::string& column) {
    if (table.HasColumn(column)) {
        return table.Int64Column(column);
    }
    return std::vector<std::optional<int64_t>>(static_cast<size_t>(table.num_rows()));
}

} // namespace

ViewBuilder::ViewBuilder(TableStore& store, core::DataConfig config)
    : store_(store), config_(std::move(config)) {}

std::shared_ptr<const RawTable> ViewBuilder::Require(const std::string& view,
                                                     const std::string& table) const {
    try {
        return store_.Load(table);
    } catch (const core::NotFoundError&) {
        F1METRICS_DEBUG("View {} unavailable: {} missing", view, table);
        throw core::DataUnavailableError(view, table);
    }
}

std::vector<RaceRow> ViewBuilder::ScopedRaces(const std::string& view, const ViewQuery& query) const {
    auto races = Require(view, tables::kRaces);
    auto ids = races->KeyColumn("raceId");
    auto years = races->KeyColumn("year");
    auto rounds = races->KeyColumn("round");
    auto names = OptionalStrings(*races, "name");
    auto dates = OptionalStrings(*races, "date");

    std::set<core::RaceId> explicit_ids;
    if (query.race_ids) {
        explicit_ids.insert(query.race_ids->begin(), query.race_ids->end());
    }

    std::vector<RaceRow> rows;
    for (size_t i = 0; i < ids.size(); ++i) {
        if (years[i] < config_.min_year) {
            continue;
        }
        if (query.season && years[i] != *query.season) {
            continue;
        }
        if (query.race_ids && explicit_ids.count(ids[i]) == 0) {
            continue;
        }
        RaceRow row;
        row.race_id = ids[i];
        row.year = years[i];
        row.round = rounds[i];
        row.name = names[i];
        row.date = dates[i];
        rows.push_back(std::move(row));
    }
    SortByRace(rows);
    return rows;
}

ViewBuilder::RaceIndex ViewBuilder::IndexRaces(const std::string& view, const ViewQuery& query) const {
    RaceIndex index;
    for (auto& race : ScopedRaces(view, query)) {
        index.emplace(race.race_id, std::move(race));
    }
    return index;
}

std::vector<RaceRow> ViewBuilder::Races(std::optional<core::Season> season) const {
    ViewQuery query;
    query.season = season;
    return ScopedRaces(kRacesView, query);
}

std::vector<core::RaceId> ViewBuilder::ResolveRaceIds(const ViewQuery& query) const {
    std::vector<core::RaceId> ids;
    for (const auto& race : ScopedRaces(kRacesView, query)) {
        ids.push_back(race.race_id);
    }
    return ids;
}

std::vector<ResultRow> ViewBuilder::JoinResults(const std::string& view, const ViewQuery& query) const {
    auto races = IndexRaces(view, query);
    auto results = Require(view, tables::kResults);

    auto result_ids = results->KeyColumn("resultId");
    auto race_ids = results->KeyColumn("raceId");
    auto driver_ids = results->KeyColumn("driverId");
    auto constructor_ids = results->KeyColumn("constructorId");
    auto status_ids = results->KeyColumn("statusId");
    auto positions = results->Int64Column("position");
    auto points = results->DoubleColumn("points");
    auto grids = OptionalInts(*results, "grid");
    auto position_texts = OptionalStrings(*results, "positionText");

    std::vector<ResultRow> rows;
    for (size_t i = 0; i < race_ids.size(); ++i) {
        auto race = races.find(race_ids[i]);
        if (race == races.end()) {
            continue;
        }
        if (!Matches(query.driver_id, driver_ids[i]) ||
            !Matches(query.constructor_id, constructor_ids[i])) {
            continue;
        }
        ResultRow row;
        row.race_id = race_ids[i];
        row.year = race->second.year;
        row.round = race->second.round;
        row.result_id = result_ids[i];
        row.driver_id = driver_ids[i];
        row.constructor_id = constructor_ids[i];
        row.status_id = status_ids[i];
        row.grid = grids[i];
        row.position = positions[i];
        row.position_text = position_texts[i];
        row.points = points[i];
        rows.push_back(std::move(row));
    }
    SortByRace(rows);
    return rows;
}

std::vector<ResultRow> ViewBuilder::DriverResults(const ViewQuery& query) const {
    auto rows = JoinResults(kDriverResultsView, query);
    auto drivers = Require(kDriverResultsView, tables::kDrivers);

    auto ids = drivers->KeyColumn("driverId");
    auto forenames = drivers->StringColumn("forename");
    auto surnames = drivers->StringColumn("surname");
    std::map<core::DriverId, std::string> names;
    for (size_t i = 0; i < ids.size(); ++i) {
        names.emplace(ids[i], forenames[i] + " " + surnames[i]);
    }

    for (auto& row : rows) {
        auto it = names.find(row.driver_id);
        if (it != names.end()) {
            row.driver_name = it->second;
        }
    }
    return rows;
}

std::vector<ResultRow> ViewBuilder::JoinConstructorResults(const std::string& view,
                                                           const ViewQuery& query) const {
    auto rows = JoinResults(view, query);
    auto constructors = Require(view, tables::kConstructors);

    auto ids = constructors->KeyColumn("constructorId");
    auto names = constructors->StringColumn("name");
    std::map<core::ConstructorId, std::string> by_id;
    for (size_t i = 0; i < ids.size(); ++i) {
        by_id.emplace(ids[i], names[i]);
    }

    for (auto& row : rows) {
        row.points = row.points.value_or(0.0);
        auto it = by_id.find(row.constructor_id);
        if (it != by_id.end()) {
            row.constructor_name = it->second;
        }
    }
    return rows;
}

std::vector<ResultRow> ViewBuilder::ConstructorResults(const ViewQuery& query) const {
    return JoinConstructorResults(kConstructorResultsView, query);
}

std::vector<ResultRow> ViewBuilder::ConstructorReliability(const ViewQuery& query) const {
    auto rows = JoinConstructorResults(kReliabilityView, query);
    auto status = Require(kReliabilityView, tables::kStatus);

    auto ids = status->KeyColumn("statusId");
    auto texts = status->StringColumn("status");
    std::map<core::StatusId, std::string> by_id;
    for (size_t i = 0; i < ids.size(); ++i) {
        by_id.emplace(ids[i], texts[i]);
    }

    for (auto& row : rows) {
        auto it = by_id.find(row.status_id);
        if (it != by_id.end()) {
            row.status = it->second;
        }
    }
    return rows;
}

std::vector<ConstructorRaceRow> ViewBuilder::Aggregate(const std::string& view,
                                                       const ViewQuery& query) const {
    std::map<std::pair<core::RaceId, core::ConstructorId>, ConstructorRaceRow> groups;
    std::map<std::pair<core::RaceId, core::ConstructorId>, double> position_sums;

    for (const auto& row : JoinConstructorResults(view, query)) {
        auto key = std::make_pair(row.race_id, row.constructor_id);
        auto inserted = groups.emplace(key, ConstructorRaceRow());
        ConstructorRaceRow& group = inserted.first->second;
        if (inserted.second) {
            group.race_id = row.race_id;
            group.constructor_id = row.constructor_id;
            group.year = row.year;
            group.round = row.round;
        }

        group.drivers_count++;
        group.total_points += row.points.value_or(0.0);
        if (!row.position) {
            continue;
        }
        int64_t position = *row.position;
        group.classified_count++;
        position_sums[key] += static_cast<double>(position);
        if (!group.best_position || position < *group.best_position) {
            group.best_position = position;
        }
        if (!group.worst_position || position > *group.worst_position) {
            group.worst_position = position;
        }
        if (position >= 1 && position <= 3) {
            group.podium_positions.push_back(position);
        }
    }

    std::vector<ConstructorRaceRow> rows;
    rows.reserve(groups.size());
    for (auto& entry : groups) {
        ConstructorRaceRow& group = entry.second;
        if (group.classified_count > 0) {
            group.mean_position = position_sums[entry.first] / static_cast<double>(group.classified_count);
        }
        std::sort(group.podium_positions.begin(), group.podium_positions.end());
        rows.push_back(std::move(group));
    }
    std::stable_sort(rows.begin(), rows.end(), [](const ConstructorRaceRow& a, const ConstructorRaceRow& b) {
        return std::tie(a.year, a.round, a.race_id, a.constructor_id) <
               std::tie(b.year, b.round, b.race_id, b.constructor_id);
    });
    return rows;
}

std::vector<ConstructorRaceRow> ViewBuilder::ConstructorPointsByRace(const ViewQuery& query) const {
    return Aggregate(kPointsByRaceView, query);
}

std::vector<ConstructorRaceRow> ViewBuilder::ConstructorRaceWins(const ViewQuery& query) const {
    std::vector<ConstructorRaceRow> wins;
    for (auto& row : Aggregate(kRaceWinsView, query)) {
        if (row.best_position == 1 && row.worst_position == 2 && row.classified_count == 2) {
            wins.push_back(std::move(row));
        }
    }
    return wins;
}

std::vector<ConstructorRaceRow> ViewBuilder::ConstructorPodiumLockouts(const ViewQuery& query) const {
    std::vector<ConstructorRaceRow> lockouts;
    for (auto& row : Aggregate(kLockoutsView, query)) {
        const auto& podium = row.podium_positions;
        if (podium.size() < 2) {
            continue;
        }
        bool contiguous = true;
        for (size_t i = 0; i < podium.size(); ++i) {
            if (podium[i] != static_cast<int64_t>(i + 1)) {
                contiguous = false;
                break;
            }
        }
        if (contiguous) {
            lockouts.push_back(std::move(row));
        }
    }
    return lockouts;
}

std::vector<StandingRow> ViewBuilder::FinalStandings(const std::string& view, const std::string& table,
                                                     const std::string& id_column,
                                                     const std::optional<int64_t>& id_filter,
                                                     const ViewQuery& query) const {
    auto races = IndexRaces(view, query);
    auto standings = Require(view, table);

    auto race_ids = standings->KeyColumn("raceId");
    auto ids = standings->KeyColumn(id_column);
    auto points = standings->DoubleColumn("points");
    auto positions = standings->Int64Column("position");
    auto wins = standings->Int64Column("wins");

    std::map<std::pair<core::Season, int64_t>, StandingRow> finals;
    std::map<std::pair<core::Season, int64_t>, std::set<int64_t>> rounds_seen;
    for (size_t i = 0; i < race_ids.size(); ++i) {
        auto race = races.find(race_ids[i]);
        if (race == races.end() || !Matches(id_filter, ids[i])) {
            continue;
        }
        StandingRow row;
        row.season = race->second.year;
        row.round = race->second.round;
        row.race_id = race_ids[i];
        row.id = ids[i];
        row.points = points[i].value_or(0.0);
        row.position = positions[i];
        row.wins = wins[i];

        auto key = std::make_pair(row.season, row.id);
        if (!rounds_seen[key].insert(row.round).second) {
            throw core::MalformedDataError("table '" + table + "' has two standings for " + id_column +
                                           " " + std::to_string(row.id) + " in season " +
                                           std::to_string(row.season) + " round " +
                                           std::to_string(row.round));
        }
        auto it = finals.find(key);
        if (it == finals.end()) {
            finals.emplace(key, std::move(row));
        } else if (row.round > it->second.round) {
            it->second = std::move(row);
        }
    }

    std::vector<StandingRow> rows;
    rows.reserve(finals.size());
    for (auto& entry : finals) {
        rows.push_back(std::move(entry.second));
    }
    return rows;
}

std::vector<StandingRow> ViewBuilder::ConstructorStandingsBySeason(const ViewQuery& query) const {
    return FinalStandings(kConstructorStandingsView, tables::kConstructorStandings, "constructorId",
                          query.constructor_id, query);
}

std::vector<StandingRow> ViewBuilder::DriverStandingsBySeason(const ViewQuery& query) const {
    return FinalStandings(kDriverStandingsView, tables::kDriverStandings, "driverId",
                          query.driver_id, query);
}

std::map<ViewBuilder::DriverRaceKey, core::ConstructorId>
ViewBuilder::ConstructorByDriverRace(const std::string& view, const RaceIndex& races) const {
    auto results = Require(view, tables::kResults);
    auto race_ids = results->KeyColumn("raceId");
    auto driver_ids = results->KeyColumn("driverId");
    auto constructor_ids = results->KeyColumn("constructorId");

    std::map<DriverRaceKey, core::ConstructorId> mapping;
    for (size_t i = 0; i < race_ids.size(); ++i) {
        if (races.count(race_ids[i]) == 0) {
            continue;
        }
        // First results row wins for shared drives
        mapping.emplace(std::make_pair(race_ids[i], driver_ids[i]), constructor_ids[i]);
    }
    return mapping;
}

std::vector<QualifyingRow> ViewBuilder::QualifyingWithConstructor(const ViewQuery& query) const {
    auto races = IndexRaces(kQualifyingView, query);
    auto qualifying = Require(kQualifyingView, tables::kQualifying);

    auto race_ids = qualifying->KeyColumn("raceId");
    auto driver_ids = qualifying->KeyColumn("driverId");
    auto positions = qualifying->Int64Column("position");

    std::vector<std::optional<int64_t>> own_constructors;
    std::map<DriverRaceKey, core::ConstructorId> mapping;
    bool has_constructor = qualifying->HasColumn("constructorId");
    if (has_constructor) {
        own_constructors = qualifying->Int64Column("constructorId");
    } else {
        mapping = ConstructorByDriverRace(kQualifyingView, races);
    }

    std::vector<QualifyingRow> rows;
    for (size_t i = 0; i < race_ids.size(); ++i) {
        auto race = races.find(race_ids[i]);
        if (race == races.end() || !Matches(query.driver_id, driver_ids[i])) {
            continue;
        }
        QualifyingRow row;
        row.race_id = race_ids[i];
        row.year = race->second.year;
        row.round = race->second.round;
        row.driver_id = driver_ids[i];
        row.position = positions[i];
        if (has_constructor) {
            row.constructor_id = own_constructors[i];
        } else {
            auto it = mapping.find(std::make_pair(race_ids[i], driver_ids[i]));
            if (it != mapping.end()) {
                row.constructor_id = it->second;
            }
        }
        if (!Matches(query.constructor_id, row.constructor_id)) {
            continue;
        }
        rows.push_back(std::move(row));
    }
    SortByRace(rows);
    return rows;
}

std::vector<LapTimeRow> ViewBuilder::JoinLapTimes(const std::string& view, const ViewQuery& query) const {
    auto races = IndexRaces(view, query);
    auto laps = Require(view, tables::kLapTimes);
    auto mapping = ConstructorByDriverRace(view, races);

    auto race_ids = laps->KeyColumn("raceId");
    auto driver_ids = laps->KeyColumn("driverId");
    auto lap_numbers = laps->KeyColumn("lap");
    auto milliseconds = laps->DoubleColumn("milliseconds");
    auto positions = OptionalInts(*laps, "position");

    std::vector<LapTimeRow> rows;
    for (size_t i = 0; i < race_ids.size(); ++i) {
        auto race = races.find(race_ids[i]);
        if (race == races.end() || !Matches(query.driver_id, driver_ids[i])) {
            continue;
        }
        LapTimeRow row;
        row.race_id = race_ids[i];
        row.year = race->second.year;
        row.round = race->second.round;
        row.driver_id = driver_ids[i];
        row.lap = lap_numbers[i];
        row.position = positions[i];
        row.milliseconds = milliseconds[i];
        auto it = mapping.find(std::make_pair(race_ids[i], driver_ids[i]));
        if (it != mapping.end()) {
            row.constructor_id = it->second;
        }
        if (!Matches(query.constructor_id, row.constructor_id)) {
            continue;
        }
        rows.push_back(std::move(row));
    }
    SortByRace(rows);
    return rows;
}

std::vector<LapTimeRow> ViewBuilder::LapTimesWithContext(const ViewQuery& query) const {
    return JoinLapTimes(kLapTimesView, query);
}

std::vector<LapPerformanceRow> ViewBuilder::ConstructorLapPerformance(const ViewQuery& query) const {
    std::map<std::pair<core::RaceId, core::ConstructorId>, std::vector<double>> samples;
    std::map<std::pair<core::RaceId, core::ConstructorId>, LapPerformanceRow> groups;

    for (const auto& lap : JoinLapTimes(kLapPerformanceView, query)) {
        if (!lap.constructor_id || !lap.milliseconds) {
            continue;
        }
        auto key = std::make_pair(lap.race_id, *lap.constructor_id);
        auto inserted = groups.emplace(key, LapPerformanceRow());
        if (inserted.second) {
            LapPerformanceRow& row = inserted.first->second;
            row.race_id = lap.race_id;
            row.constructor_id = *lap.constructor_id;
            row.year = lap.year;
            row.round = lap.round;
        }
        samples[key].push_back(*lap.milliseconds);
    }

    std::vector<LapPerformanceRow> rows;
    rows.reserve(groups.size());
    for (auto& entry : groups) {
        const auto& values = samples[entry.first];
        LapPerformanceRow& row = entry.second;
        double sum = 0.0;
        row.fastest_ms = values.front();
        row.slowest_ms = values.front();
        for (double v : values) {
            sum += v;
            row.fastest_ms = std::min(row.fastest_ms, v);
            row.slowest_ms = std::max(row.slowest_ms, v);
        }
        row.lap_count = static_cast<int64_t>(values.size());
        row.mean_ms = sum / static_cast<double>(values.size());
        if (values.size() >= 2) {
            double squares = 0.0;
            for (double v : values) {
                squares += (v - row.mean_ms) * (v - row.mean_ms);
            }
            row.stddev_ms = std::sqrt(squares / static_cast<double>(values.size() - 1));
        }
        rows.push_back(std::move(row));
    }
    std::stable_sort(rows.begin(), rows.end(), [](const LapPerformanceRow& a, const LapPerformanceRow& b) {
        return std::tie(a.year, a.round, a.race_id, a.constructor_id) <
               std::tie(b.year, b.round, b.race_id, b.constructor_id);
    });
    return rows;
}

std::vector<PitStopRow> ViewBuilder::PitStopStats(const ViewQuery& query) const {
    auto races = IndexRaces(kPitStopsView, query);
    auto stops = Require(kPitStopsView, tables::kPitStops);
    auto mapping = ConstructorByDriverRace(kPitStopsView, races);

    auto race_ids = stops->KeyColumn("raceId");
    auto driver_ids = stops->KeyColumn("driverId");
    auto stop_numbers = stops->KeyColumn("stop");
    auto laps = stops->KeyColumn("lap");
    auto milliseconds = stops->DoubleColumn("milliseconds");

    std::vector<PitStopRow> rows;
    for (size_t i = 0; i < race_ids.size(); ++i) {
        auto race = races.find(race_ids[i]);
        if (race == races.end() || !Matches(query.driver_id, driver_ids[i])) {
            continue;
        }
        PitStopRow row;
        row.race_id = race_ids[i];
        row.year = race->second.year;
        row.round = race->second.round;
        row.driver_id = driver_ids[i];
        row.stop = stop_numbers[i];
        row.lap = laps[i];
        row.milliseconds = milliseconds[i];
        auto it = mapping.find(std::make_pair(race_ids[i], driver_ids[i]));
        if (it != mapping.end()) {
            row.constructor_id = it->second;
        }
        if (!Matches(query.constructor_id, row.constructor_id)) {
            continue;
        }
        rows.push_back(std::move(row));
    }
    SortByRace(rows);
    return rows;
}

std::vector<TeammatePairRow> ViewBuilder::TeammatePairs(const ViewQuery& query) const {
    // Group on the full line-up; the driver filter applies to the pairs
    ViewQuery lineup = query;
    lineup.driver_id.reset();

    std::map<std::pair<core::RaceId, core::ConstructorId>, std::vector<ResultRow>> groups;
    for (auto& row : JoinResults(kTeammatePairsView, lineup)) {
        groups[std::make_pair(row.race_id, row.constructor_id)].push_back(std::move(row));
    }

    std::vector<TeammatePairRow> pairs;
    for (const auto& entry : groups) {
        const auto& entries = entry.second;
        if (entries.size() != 2) {
            continue;
        }
        if (query.driver_id && entries[0].driver_id != *query.driver_id &&
            entries[1].driver_id != *query.driver_id) {
            continue;
        }
        TeammatePairRow pair;
        pair.race_id = entries[0].race_id;
        pair.year = entries[0].year;
        pair.round = entries[0].round;
        pair.constructor_id = entries[0].constructor_id;
        pair.driver1_id = entries[0].driver_id;
        pair.driver2_id = entries[1].driver_id;
        pair.driver1_position = entries[0].position;
        pair.driver2_position = entries[1].position;
        pairs.push_back(pair);
    }
    SortByRace(pairs);
    return pairs;
}

std::optional<std::string> ViewBuilder::DriverName(core::DriverId id) const {
    auto drivers = Require("driver_name", tables::kDrivers);
    auto ids = drivers->KeyColumn("driverId");
    for (size_t i = 0; i < ids.size(); ++i) {
        if (ids[i] == id) {
            auto forenames = drivers->StringColumn("forename");
            auto surnames = drivers->StringColumn("surname");
            return forenames[i] + " " + surnames[i];
        }
    }
    return std::nullopt;
}

std::optional<std::string> ViewBuilder::ConstructorName(core::ConstructorId id) const {
    auto constructors = Require("constructor_name", tables::kConstructors);
    auto ids = constructors->KeyColumn("constructorId");
    for (size_t i = 0; i < ids.size(); ++i) {
        if (ids[i] == id) {
            return constructors->StringColumn("name")[i];
        }
    }
    return std::nullopt;
}

} // namespace data
} // namespace f1metrics
