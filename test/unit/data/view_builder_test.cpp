#include <gtest/gtest.h>

#include <cmath>

#include "f1metrics/core/config.h"
#include "f1metrics/core/error.h"
#include "f1metrics/data/table_store.h"
#include "f1metrics/data/view_builder.h"
#include "test_util/dataset_fixture.h"
#include "test_util/temp_dir.h"

namespace f1metrics {
namespace data {
namespace {

class ViewBuilderTest : public ::testing::Test {
protected:
    ViewBuilderTest()
        : dir_("f1metrics_views"),
          store_(dir_.str()),
          views_(store_, Config()) {}

    void SetUp() override {
        testutil::WriteSampleDataset(dir_.path());
    }

    core::DataConfig Config() const {
        core::DataConfig config = core::DataConfig::Default();
        config.dataset_dir = dir_.str();
        return config;
    }

    static ViewQuery Constructor(core::ConstructorId id) {
        ViewQuery query;
        query.constructor_id = id;
        return query;
    }

    testutil::ScopedTempDir dir_;
    TableStore store_;
    ViewBuilder views_;
};

TEST_F(ViewBuilderTest, SeasonFloorExcludesOldRaces) {
    auto races = views_.Races();
    ASSERT_EQ(races.size(), 3u);
    EXPECT_EQ(races[0].race_id, 10);
    EXPECT_EQ(races[1].race_id, 11);
    EXPECT_EQ(races[2].race_id, 20);
    EXPECT_EQ(races[0].name, "Alpha Grand Prix");

    // Asking for a season below the floor yields nothing
    EXPECT_TRUE(views_.Races(2010).empty());

    ViewQuery query;
    query.race_ids = std::vector<core::RaceId>{1, 10};
    EXPECT_EQ(views_.ResolveRaceIds(query), (std::vector<core::RaceId>{10}));
}

TEST_F(ViewBuilderTest, SeasonFloorAppliesToJoinedViews) {
    ViewQuery query;
    query.driver_id = 1;
    auto results = views_.DriverResults(query);
    ASSERT_EQ(results.size(), 3u);
    for (const auto& row : results) {
        EXPECT_GE(row.year, 2011);
    }

    auto standings = views_.ConstructorStandingsBySeason(Constructor(1));
    for (const auto& row : standings) {
        EXPECT_GE(row.season, 2011);
    }
}

TEST_F(ViewBuilderTest, SeasonFloorAppliesToEveryView) {
    // Give race 1 (2010) rows in every race-keyed table
    testutil::WriteTable(dir_.path(), "qualifying.csv",
                         std::string(testutil::dataset::kQualifying) + "90,1,1,1,44,1\n91,1,2,1,77,2\n");
    testutil::WriteTable(dir_.path(), "lap_times.csv",
                         std::string(testutil::dataset::kLapTimes) + "1,1,1,1,99000\n1,2,1,2,99500\n");
    testutil::WriteTable(dir_.path(), "pit_stops.csv",
                         std::string(testutil::dataset::kPitStops) + "1,1,1,15,2100\n");

    ViewQuery all;
    ViewQuery mercedes = Constructor(1);
    auto in_scope = [](core::RaceId race_id, core::Season year) {
        return race_id != 1 && year >= 2011;
    };

    for (const auto& row : views_.QualifyingWithConstructor(all)) {
        EXPECT_TRUE(in_scope(row.race_id, row.year)) << "qualifying race " << row.race_id;
    }
    for (const auto& row : views_.LapTimesWithContext(all)) {
        EXPECT_TRUE(in_scope(row.race_id, row.year)) << "lap race " << row.race_id;
    }
    for (const auto& row : views_.ConstructorLapPerformance(mercedes)) {
        EXPECT_TRUE(in_scope(row.race_id, row.year)) << "lap performance race " << row.race_id;
    }
    for (const auto& row : views_.PitStopStats(all)) {
        EXPECT_TRUE(in_scope(row.race_id, row.year)) << "pit stop race " << row.race_id;
    }
    for (const auto& row : views_.TeammatePairs(all)) {
        EXPECT_TRUE(in_scope(row.race_id, row.year)) << "teammate race " << row.race_id;
    }
    for (const auto& row : views_.ConstructorPointsByRace(mercedes)) {
        EXPECT_TRUE(in_scope(row.race_id, row.year)) << "constructor race " << row.race_id;
    }
    for (const auto& row : views_.ConstructorResults(mercedes)) {
        EXPECT_TRUE(in_scope(row.race_id, row.year)) << "constructor result race " << row.race_id;
    }
    for (const auto& row : views_.ConstructorRaceWins(mercedes)) {
        EXPECT_NE(row.race_id, 1);
    }
    for (const auto& row : views_.ConstructorPodiumLockouts(mercedes)) {
        EXPECT_NE(row.race_id, 1);
    }

    EXPECT_EQ(views_.QualifyingWithConstructor(all).size(), 12u);
    EXPECT_EQ(views_.PitStopStats(all).size(), 5u);
    EXPECT_EQ(views_.ConstructorPointsByRace(mercedes).size(), 3u);
}

TEST_F(ViewBuilderTest, LowerFloorIncludesOldRaces) {
    core::DataConfig config = Config();
    config.min_year = 2000;
    ViewBuilder views(store_, config);
    EXPECT_EQ(views.Races().size(), 4u);
}

TEST_F(ViewBuilderTest, RaceIdsIntersectSeason) {
    ViewQuery query;
    query.season = 2020;
    query.race_ids = std::vector<core::RaceId>{11, 20};
    EXPECT_EQ(views_.ResolveRaceIds(query), (std::vector<core::RaceId>{11}));
}

TEST_F(ViewBuilderTest, DriverResultsCarryContext) {
    ViewQuery query;
    query.driver_id = 2;
    query.season = 2020;
    auto results = views_.DriverResults(query);
    ASSERT_EQ(results.size(), 2u);

    EXPECT_EQ(results[0].race_id, 10);
    EXPECT_EQ(results[0].round, 1);
    EXPECT_EQ(results[0].position, 2);
    EXPECT_EQ(results[0].driver_name, std::optional<std::string>("Valtteri Bottas"));

    // DNF: "\N" position with positionText "R"
    EXPECT_EQ(results[1].race_id, 11);
    EXPECT_FALSE(results[1].position.has_value());
    EXPECT_EQ(results[1].position_text, "R");
    EXPECT_EQ(results[1].status_id, 6);
}

TEST_F(ViewBuilderTest, ConstructorResultsWithStatus) {
    ViewQuery query = Constructor(2);
    query.season = 2020;
    auto results = views_.ConstructorReliability(query);
    ASSERT_EQ(results.size(), 4u);
    for (const auto& row : results) {
        EXPECT_EQ(row.constructor_name, std::optional<std::string>("Red Bull"));
        ASSERT_TRUE(row.points.has_value());
    }
    // Driver 4 retired with an engine failure in race 10
    const auto& retired = results[1];
    EXPECT_EQ(retired.driver_id, 4);
    EXPECT_FALSE(retired.position.has_value());
    EXPECT_EQ(retired.status, std::optional<std::string>("Engine"));
}

TEST_F(ViewBuilderTest, PointsByRaceAggregates) {
    auto races = views_.ConstructorPointsByRace(Constructor(1));
    ASSERT_EQ(races.size(), 3u);

    const auto& first = races[0];
    EXPECT_EQ(first.race_id, 10);
    EXPECT_EQ(first.best_position, 1);
    EXPECT_EQ(first.worst_position, 2);
    EXPECT_EQ(first.drivers_count, 2);
    EXPECT_EQ(first.classified_count, 2);
    EXPECT_DOUBLE_EQ(first.total_points, 43.0);
    ASSERT_TRUE(first.mean_position.has_value());
    EXPECT_DOUBLE_EQ(*first.mean_position, 1.5);

    // One retirement: only the classified car counts for positions
    const auto& second = races[1];
    EXPECT_EQ(second.best_position, 2);
    EXPECT_EQ(second.worst_position, 2);
    EXPECT_EQ(second.drivers_count, 2);
    EXPECT_EQ(second.classified_count, 1);
    EXPECT_DOUBLE_EQ(second.total_points, 18.0);
}

TEST_F(ViewBuilderTest, OneTwoFinishes) {
    auto mercedes = views_.ConstructorRaceWins(Constructor(1));
    ASSERT_EQ(mercedes.size(), 1u);
    EXPECT_EQ(mercedes[0].race_id, 10);

    auto red_bull = views_.ConstructorRaceWins(Constructor(2));
    ASSERT_EQ(red_bull.size(), 1u);
    EXPECT_EQ(red_bull[0].race_id, 20);
}

TEST_F(ViewBuilderTest, PodiumLockoutsNeedContiguousPositions) {
    // Red Bull finished 1-3 in race 11, which is not a lockout
    auto lockouts = views_.ConstructorPodiumLockouts(Constructor(2));
    ASSERT_EQ(lockouts.size(), 1u);
    EXPECT_EQ(lockouts[0].race_id, 20);
    EXPECT_EQ(lockouts[0].podium_positions, (std::vector<int64_t>{1, 2}));
}

TEST_F(ViewBuilderTest, StandingsUseLastRound) {
    auto standings = views_.ConstructorStandingsBySeason(Constructor(1));
    ASSERT_EQ(standings.size(), 2u);

    EXPECT_EQ(standings[0].season, 2020);
    EXPECT_EQ(standings[0].round, 2);
    EXPECT_DOUBLE_EQ(standings[0].points, 61.0);
    EXPECT_EQ(standings[0].position, 1);

    EXPECT_EQ(standings[1].season, 2021);
    EXPECT_EQ(standings[1].position, 2);
}

TEST_F(ViewBuilderTest, DriverStandings) {
    ViewQuery query;
    query.driver_id = 2;
    auto standings = views_.DriverStandingsBySeason(query);
    ASSERT_EQ(standings.size(), 1u);
    EXPECT_EQ(standings[0].position, 4);
    EXPECT_DOUBLE_EQ(standings[0].points, 18.0);
}

TEST_F(ViewBuilderTest, QualifyingUsesOwnConstructorColumn) {
    ViewQuery query = Constructor(2);
    query.season = 2021;
    auto rows = views_.QualifyingWithConstructor(query);
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].position, 1);
    EXPECT_FALSE(rows[1].position.has_value());
}

TEST_F(ViewBuilderTest, QualifyingFallsBackToResultsForConstructor) {
    testutil::WriteTable(dir_.path(), "qualifying.csv",
                         "qualifyId,raceId,driverId,position\n"
                         "1,10,1,1\n"
                         "2,10,3,2\n");
    auto rows = views_.QualifyingWithConstructor(Constructor(2));
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].driver_id, 3);
    EXPECT_EQ(rows[0].constructor_id, 2);
}

TEST_F(ViewBuilderTest, LapTimesJoinConstructorFromResults) {
    auto laps = views_.LapTimesWithContext(Constructor(1));
    ASSERT_EQ(laps.size(), 6u);
    for (const auto& lap : laps) {
        EXPECT_EQ(lap.constructor_id, 1);
    }
    EXPECT_EQ(laps.back().race_id, 20);
}

TEST_F(ViewBuilderTest, LapPerformancePerRace) {
    auto races = views_.ConstructorLapPerformance(Constructor(1));
    ASSERT_EQ(races.size(), 2u);

    EXPECT_EQ(races[0].race_id, 10);
    EXPECT_EQ(races[0].lap_count, 4);
    EXPECT_DOUBLE_EQ(races[0].mean_ms, 91500.0);
    EXPECT_DOUBLE_EQ(races[0].fastest_ms, 90000.0);
    EXPECT_DOUBLE_EQ(races[0].slowest_ms, 93000.0);
    ASSERT_TRUE(races[0].stddev_ms.has_value());
    EXPECT_NEAR(*races[0].stddev_ms, std::sqrt(5000000.0 / 3.0), 1e-6);

    // Red Bull has a single lap in race 10: no deviation
    auto red_bull = views_.ConstructorLapPerformance(Constructor(2));
    ASSERT_EQ(red_bull.size(), 1u);
    EXPECT_FALSE(red_bull[0].stddev_ms.has_value());
}

TEST_F(ViewBuilderTest, PitStopsCarryConstructor) {
    auto stops = views_.PitStopStats(Constructor(1));
    ASSERT_EQ(stops.size(), 4u);
    EXPECT_EQ(stops.back().race_id, 11);
    EXPECT_EQ(stops.back().milliseconds, std::optional<double>(2800.0));
}

TEST_F(ViewBuilderTest, TeammatePairs) {
    ViewQuery query;
    query.driver_id = 1;
    auto pairs = views_.TeammatePairs(query);
    ASSERT_EQ(pairs.size(), 3u);
    EXPECT_EQ(pairs[0].driver1_id, 1);
    EXPECT_EQ(pairs[0].driver2_id, 2);
    EXPECT_FALSE(pairs[1].driver2_position.has_value());
    EXPECT_EQ(pairs[2].driver1_position, 4);
}

TEST_F(ViewBuilderTest, Names) {
    EXPECT_EQ(views_.DriverName(3), std::optional<std::string>("Max Verstappen"));
    EXPECT_EQ(views_.ConstructorName(1), std::optional<std::string>("Mercedes"));
    EXPECT_FALSE(views_.DriverName(99).has_value());
}

TEST_F(ViewBuilderTest, MissingTableIsDataUnavailable) {
    testutil::RemoveTable(dir_.path(), "pit_stops.csv");
    try {
        views_.PitStopStats(Constructor(1));
        FAIL() << "expected DataUnavailableError";
    } catch (const core::DataUnavailableError& e) {
        EXPECT_EQ(e.view(), "pit_stops");
        EXPECT_EQ(e.table(), "pit_stops.csv");
    }
}

TEST_F(ViewBuilderTest, EmptyScopeYieldsEmptyViews) {
    ViewQuery query = Constructor(1);
    query.season = 2030;
    EXPECT_TRUE(views_.ConstructorPointsByRace(query).empty());
    EXPECT_TRUE(views_.PitStopStats(query).empty());
    EXPECT_TRUE(views_.ConstructorStandingsBySeason(query).empty());
}

class StandingsTest : public ::testing::Test {
protected:
    StandingsTest() : dir_("f1metrics_standings") {}

    void SetUp() override {
        // Race ids deliberately out of round order
        testutil::WriteTable(dir_.path(), "races.csv",
                             "raceId,year,round\n"
                             "300,2019,3\n"
                             "301,2019,1\n"
                             "302,2019,2\n");
    }

    testutil::ScopedTempDir dir_;
};

TEST_F(StandingsTest, LastRoundNotSum) {
    testutil::WriteTable(dir_.path(), "constructor_standings.csv",
                         "constructorStandingsId,raceId,constructorId,points,position,wins\n"
                         "1,301,7,10,3,0\n"
                         "2,300,7,40,2,1\n"
                         "3,302,7,25,2,1\n");
    TableStore store(dir_.str());
    ViewBuilder views(store, core::DataConfig::Default());

    ViewQuery query;
    query.constructor_id = 7;
    auto standings = views.ConstructorStandingsBySeason(query);
    ASSERT_EQ(standings.size(), 1u);
    EXPECT_EQ(standings[0].season, 2019);
    EXPECT_EQ(standings[0].round, 3);
    EXPECT_DOUBLE_EQ(standings[0].points, 40.0);
}

TEST_F(StandingsTest, DuplicateRoundIsMalformed) {
    testutil::WriteTable(dir_.path(), "constructor_standings.csv",
                         "constructorStandingsId,raceId,constructorId,points,position,wins\n"
                         "1,300,7,40,2,1\n"
                         "2,300,7,41,1,1\n");
    TableStore store(dir_.str());
    ViewBuilder views(store, core::DataConfig::Default());
    EXPECT_THROW(views.ConstructorStandingsBySeason(ViewQuery()), core::MalformedDataError);
}

TEST_F(StandingsTest, DuplicateEarlierRoundIsMalformed) {
    // Rounds 1, 2, 1: the repeat is below the latest round already seen
    testutil::WriteTable(dir_.path(), "constructor_standings.csv",
                         "constructorStandingsId,raceId,constructorId,points,position,wins\n"
                         "1,301,7,10,3,0\n"
                         "2,302,7,25,2,1\n"
                         "3,301,7,12,3,0\n");
    TableStore store(dir_.str());
    ViewBuilder views(store, core::DataConfig::Default());
    EXPECT_THROW(views.ConstructorStandingsBySeason(ViewQuery()), core::MalformedDataError);
}

TEST_F(StandingsTest, SameRoundForDifferentConstructorsIsFine) {
    testutil::WriteTable(dir_.path(), "constructor_standings.csv",
                         "constructorStandingsId,raceId,constructorId,points,position,wins\n"
                         "1,301,7,10,1,1\n"
                         "2,301,8,6,2,0\n"
                         "3,302,7,25,1,2\n");
    TableStore store(dir_.str());
    ViewBuilder views(store, core::DataConfig::Default());
    auto standings = views.ConstructorStandingsBySeason(ViewQuery());
    ASSERT_EQ(standings.size(), 2u);
    EXPECT_EQ(standings[0].id, 7);
    EXPECT_EQ(standings[0].round, 2);
    EXPECT_EQ(standings[1].id, 8);
    EXPECT_EQ(standings[1].round, 1);
}

} // namespace
} // namespace data
} // namespace f1metrics
