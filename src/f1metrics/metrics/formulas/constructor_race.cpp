#include "f1metrics/metrics/registry.h"
#include "f1metrics/metrics/formulas/formula_helpers.h"
#include "f1metrics/data/schema.h"

namespace f1metrics {
namespace metrics {

using namespace formulas;

namespace {

const std::vector<std::string> kResultTables = {
    data::tables::kResults, data::tables::kRaces, data::tables::kConstructors};

MetricResult WinRate(const MetricContext& context, const MetricParams& params) {
    auto races = context.views.ConstructorPointsByRace(ConstructorQuery(params));
    if (races.empty()) {
        return NoData("No race data found");
    }

    size_t wins = 0;
    for (const auto& race : races) {
        if (race.best_position == 1) {
            wins++;
        }
    }
    return Value(MetricValue(Round(Percent(wins, races.size()), 1)), Metadata{
        {"total_races", MetricValue(races.size())},
        {"wins", MetricValue(wins)},
    });
}

MetricResult PodiumRate(const MetricContext& context, const MetricParams& params) {
    auto races = context.views.ConstructorPointsByRace(ConstructorQuery(params));
    if (races.empty()) {
        return NoData("No race data found");
    }

    size_t by_position[4] = {0, 0, 0, 0};
    for (const auto& race : races) {
        if (race.best_position && *race.best_position >= 1 && *race.best_position <= 3) {
            by_position[*race.best_position]++;
        }
    }
    size_t podiums = by_position[1] + by_position[2] + by_position[3];

    return Value(MetricValue(Round(Percent(podiums, races.size()), 1)), Metadata{
        {"total_races", MetricValue(races.size())},
        {"podiums", MetricValue(podiums)},
        {"position_breakdown", MetricValue(Metadata{
            {"P1", MetricValue(by_position[1])},
            {"P2", MetricValue(by_position[2])},
            {"P3", MetricValue(by_position[3])},
        })},
    });
}

MetricResult RaceWins(const MetricContext& context, const MetricParams& params) {
    auto one_twos = context.views.ConstructorRaceWins(ConstructorQuery(params));
    size_t count = one_twos.size();
    return Value(MetricValue(count), Metadata{
        {"one_two_finishes", MetricValue(count)},
        {"seasons_with_wins", DistinctYears(one_twos)},
    });
}

MetricResult PodiumLockouts(const MetricContext& context, const MetricParams& params) {
    auto lockouts = context.views.ConstructorPodiumLockouts(ConstructorQuery(params));
    size_t count = lockouts.size();

    size_t full = 0;
    for (const auto& race : lockouts) {
        if (race.podium_positions.size() == 3) {
            full++;
        }
    }
    return Value(MetricValue(count), Metadata{
        {"full_podium_lockouts", MetricValue(full)},
        {"seasons_with_lockouts", DistinctYears(lockouts)},
    });
}

MetricResult AverageFinishPosition(const MetricContext& context, const MetricParams& params) {
    auto races = context.views.ConstructorPointsByRace(ConstructorQuery(params));
    if (races.empty()) {
        return NoData("No race data found");
    }

    std::vector<double> best_positions;
    std::optional<int64_t> best;
    for (const auto& race : races) {
        if (!race.best_position) {
            continue;
        }
        best_positions.push_back(static_cast<double>(*race.best_position));
        best = best ? std::min(*best, *race.best_position) : *race.best_position;
    }

    return Value(Rounded(Mean(best_positions), 2), Metadata{
        {"total_races", MetricValue(races.size())},
        {"races_finished", MetricValue(best_positions.size())},
        {"best_finish", OptionalInt(best)},
    });
}

MetricResult PointsScoringRate(const MetricContext& context, const MetricParams& params) {
    auto races = context.views.ConstructorPointsByRace(ConstructorQuery(params));
    if (races.empty()) {
        return NoData("No race data found");
    }

    size_t scoring = 0;
    std::vector<double> points;
    for (const auto& race : races) {
        points.push_back(race.total_points);
        if (race.total_points > 0) {
            scoring++;
        }
    }

    return Value(MetricValue(Round(Percent(scoring, races.size()), 1)), Metadata{
        {"total_races", MetricValue(races.size())},
        {"points_scoring_races", MetricValue(scoring)},
        {"average_points_per_race", Rounded(Mean(points), 2)},
    });
}

MetricResult DoublePodiums(const MetricContext& context, const MetricParams& params) {
    auto races = context.views.ConstructorPointsByRace(ConstructorQuery(params));
    if (races.empty()) {
        return NoData("No race data found");
    }

    size_t doubles = 0;
    for (const auto& race : races) {
        if (race.podium_positions.size() >= 2) {
            doubles++;
        }
    }
    return Value(MetricValue(doubles), Metadata{
        {"total_races", MetricValue(races.size())},
        {"double_podium_rate", MetricValue(Round(Percent(doubles, races.size()), 1))},
    });
}

// Longest run of consecutive race wins in (year, round) order
MetricResult RaceWinStreak(const MetricContext& context, const MetricParams& params) {
    auto races = context.views.ConstructorPointsByRace(ConstructorQuery(params));
    if (races.empty()) {
        return NoData("No race data found");
    }

    MetricValue::List streaks;
    int64_t longest = 0;
    int64_t current = 0;
    size_t wins = 0;
    for (const auto& race : races) {
        if (race.best_position == 1) {
            current++;
            wins++;
            continue;
        }
        if (current > 0) {
            streaks.emplace_back(current);
            longest = std::max(longest, current);
        }
        current = 0;
    }
    if (current > 0) {
        streaks.emplace_back(current);
        longest = std::max(longest, current);
    }

    size_t count = streaks.size();
    return Value(MetricValue(longest), Metadata{
        {"total_races", MetricValue(races.size())},
        {"total_wins", MetricValue(wins)},
        {"win_streaks", MetricValue(std::move(streaks))},
        {"number_of_streaks", MetricValue(count)},
    });
}

MetricDefinition Race(const std::string& name, const std::string& description,
                      const std::string& unit, MetricFormula formula) {
    MetricDefinition definition;
    definition.name = name;
    definition.description = description;
    definition.unit = unit;
    definition.kind = MetricKind::CONSTRUCTOR;
    definition.required_tables = kResultTables;
    definition.formula = std::move(formula);
    return definition;
}

} // namespace

void RegisterConstructorRaceMetrics(MetricRegistry& registry) {
    registry.Register(Race("constructor_win_rate",
                           "Percentage of races won by either car", "percentage", WinRate));
    registry.Register(Race("constructor_podium_rate",
                           "Percentage of races with at least one car on the podium",
                           "percentage", PodiumRate));
    registry.Register(Race("constructor_race_wins",
                           "Number of 1-2 finishes", "races", RaceWins));
    registry.Register(Race("constructor_podium_lockouts",
                           "Number of races where the team's cars filled the top podium places",
                           "races", PodiumLockouts));
    registry.Register(Race("constructor_average_finish_position",
                           "Average finish position of the team's best car", "position",
                           AverageFinishPosition));
    registry.Register(Race("constructor_points_scoring_rate",
                           "Percentage of races in which the team scored points", "percentage",
                           PointsScoringRate));
    registry.Register(Race("constructor_double_podiums",
                           "Number of races with at least two cars on the podium", "races",
                           DoublePodiums));
    registry.Register(Race("constructor_race_win_streak",
                           "Longest run of consecutive race wins", "races", RaceWinStreak));
}

} // namespace metrics
} // namespace f1metrics
