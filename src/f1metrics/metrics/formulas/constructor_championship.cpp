#include "f1metrics/metrics/registry.h"
#include "f1metrics/metrics/formulas/formula_helpers.h"
#include "f1metrics/data/schema.h"

namespace f1metrics {
namespace metrics {

using namespace formulas;

namespace {

MetricResult ChampionshipPosition(const MetricContext& context, const MetricParams& params) {
    auto standings = context.views.ConstructorStandingsBySeason(ConstructorQuery(params));
    if (standings.empty()) {
        return NoData(params.season ? "No standings for " + std::to_string(*params.season)
                                    : std::string("Constructor not found in standings"));
    }

    if (params.season) {
        const auto& standing = standings.front();
        return Value(OptionalInt(standing.position), Metadata{
            {"season", MetricValue(standing.season)},
            {"points", MetricValue(standing.points)},
            {"wins", OptionalInt(standing.wins)},
        });
    }

    std::optional<int64_t> best;
    std::optional<core::Season> best_season;
    size_t championships = 0;
    Metadata by_year;
    for (const auto& standing : standings) {
        by_year.emplace_back(std::to_string(standing.season), OptionalInt(standing.position));
        if (!standing.position) {
            continue;
        }
        if (!best || *standing.position < *best) {
            best = standing.position;
            best_season = standing.season;
        }
        if (*standing.position == 1) {
            championships++;
        }
    }

    return Value(OptionalInt(best), Metadata{
        {"best_season", MetricValue(best_season)},
        {"positions_by_year", MetricValue(std::move(by_year))},
        {"championships", MetricValue(championships)},
    });
}

MetricResult ChampionshipWins(const MetricContext& context, const MetricParams& params) {
    auto standings = context.views.ConstructorStandingsBySeason(ConstructorQuery(params));

    MetricValue::List years;
    std::optional<core::Season> last;
    for (const auto& standing : standings) {
        if (standing.position == 1) {
            years.emplace_back(standing.season);
            last = standing.season;
        }
    }

    if (years.empty()) {
        return Value(MetricValue(0), Metadata{
            {"seasons_analyzed", MetricValue(standings.size())},
            {"note", MetricValue("No championships won")},
        });
    }
    size_t count = years.size();
    return Value(MetricValue(count), Metadata{
        {"seasons_analyzed", MetricValue(standings.size())},
        {"championship_years", MetricValue(std::move(years))},
        {"last_championship", MetricValue(last)},
    });
}

MetricResult PointsPerSeason(const MetricContext& context, const MetricParams& params) {
    auto races = context.views.ConstructorPointsByRace(ConstructorQuery(params));
    if (races.empty()) {
        return NoData("No points data found");
    }

    // Ordered by season
    std::map<core::Season, std::pair<double, size_t>> seasons;
    for (const auto& race : races) {
        auto& season = seasons[race.year];
        season.first += race.total_points;
        season.second++;
    }

    if (params.season) {
        const auto& season = seasons.begin()->second;
        return Value(MetricValue(season.first), Metadata{
            {"season", MetricValue(seasons.begin()->first)},
            {"races", MetricValue(season.second)},
            {"points_per_race", MetricValue(Round(season.first / static_cast<double>(season.second), 2))},
        });
    }

    std::vector<double> totals;
    double best = 0.0;
    Metadata by_year;
    for (const auto& season : seasons) {
        totals.push_back(season.second.first);
        best = std::max(best, season.second.first);
        by_year.emplace_back(std::to_string(season.first), MetricValue(season.second.first));
    }
    double total = 0.0;
    for (double t : totals) {
        total += t;
    }

    return Value(Rounded(Mean(totals), 1), Metadata{
        {"seasons_count", MetricValue(seasons.size())},
        {"total_points", MetricValue(total)},
        {"best_season", MetricValue(best)},
        {"points_by_year", MetricValue(std::move(by_year))},
    });
}

MetricResult PointsPerRace(const MetricContext& context, const MetricParams& params) {
    auto races = context.views.ConstructorPointsByRace(ConstructorQuery(params));
    if (races.empty()) {
        return NoData("No points data found");
    }

    std::vector<double> points;
    double total = 0.0;
    double max_race = 0.0;
    size_t scoring = 0;
    for (const auto& race : races) {
        points.push_back(race.total_points);
        total += race.total_points;
        max_race = std::max(max_race, race.total_points);
        if (race.total_points > 0) {
            scoring++;
        }
    }

    return Value(Rounded(Mean(points), 2), Metadata{
        {"total_races", MetricValue(races.size())},
        {"total_points", MetricValue(total)},
        {"max_points_race", MetricValue(max_race)},
        {"points_scoring_rate", MetricValue(Round(Percent(scoring, races.size()), 1))},
    });
}

MetricResult TopThreeFinishes(const MetricContext& context, const MetricParams& params) {
    auto standings = context.views.ConstructorStandingsBySeason(ConstructorQuery(params));
    if (standings.empty()) {
        return NoData("Constructor not found in standings");
    }

    MetricValue::List years_by_position[4];
    std::optional<int64_t> best;
    for (const auto& standing : standings) {
        if (!standing.position) {
            continue;
        }
        int64_t position = *standing.position;
        best = best ? std::min(*best, position) : position;
        if (position >= 1 && position <= 3) {
            years_by_position[position].emplace_back(standing.season);
        }
    }

    size_t top_three = years_by_position[1].size() + years_by_position[2].size() +
                       years_by_position[3].size();
    Metadata breakdown;
    for (int position = 1; position <= 3; ++position) {
        if (years_by_position[position].empty()) {
            continue;
        }
        size_t count = years_by_position[position].size();
        breakdown.emplace_back("P" + std::to_string(position), MetricValue(Metadata{
            {"count", MetricValue(count)},
            {"years", MetricValue(std::move(years_by_position[position]))},
        }));
    }

    return Value(MetricValue(Round(Percent(top_three, standings.size()), 1)), Metadata{
        {"total_seasons", MetricValue(standings.size())},
        {"top_three_count", MetricValue(top_three)},
        {"position_breakdown", MetricValue(std::move(breakdown))},
        {"best_position", OptionalInt(best)},
    });
}

MetricDefinition Championship(const std::string& name, const std::string& description,
                              const std::string& unit, std::vector<std::string> tables,
                              MetricFormula formula) {
    MetricDefinition definition;
    definition.name = name;
    definition.description = description;
    definition.unit = unit;
    definition.kind = MetricKind::CONSTRUCTOR;
    definition.required_tables = std::move(tables);
    definition.formula = std::move(formula);
    return definition;
}

} // namespace

void RegisterConstructorChampionshipMetrics(MetricRegistry& registry) {
    const std::vector<std::string> standings = {data::tables::kConstructorStandings, data::tables::kRaces};
    const std::vector<std::string> results = {data::tables::kResults, data::tables::kRaces,
                                              data::tables::kConstructors};

    registry.Register(Championship("constructor_championship_position",
                                   "Final championship position for the season", "position",
                                   standings, ChampionshipPosition));
    registry.Register(Championship("constructor_championship_wins",
                                   "Number of constructor championships won", "championships",
                                   standings, ChampionshipWins));
    registry.Register(Championship("constructor_points_per_season",
                                   "Points scored in the season, or average points per season",
                                   "points", results, PointsPerSeason));
    registry.Register(Championship("constructor_points_per_race",
                                   "Average points scored per race", "points/race",
                                   results, PointsPerRace));
    registry.Register(Championship("constructor_top_three_finishes",
                                   "Percentage of seasons finishing in the top three of the championship",
                                   "percentage", standings, TopThreeFinishes));
}

} // namespace metrics
} // namespace f1metrics
