#include "f1metrics/metrics/registry.h"
#include "f1metrics/metrics/formulas/formula_helpers.h"
#include "f1metrics/data/schema.h"

namespace f1metrics {
namespace metrics {

using namespace formulas;

namespace {

// Best qualifying position of the constructor's cars per race, race order kept
std::vector<int64_t> BestPerRace(const MetricContext& context, const MetricParams& params) {
    auto rows = context.views.QualifyingWithConstructor(ConstructorQuery(params));

    std::vector<core::RaceId> order;
    std::map<core::RaceId, int64_t> best;
    for (const auto& row : rows) {
        if (!row.position) {
            continue;
        }
        auto inserted = best.emplace(row.race_id, *row.position);
        if (inserted.second) {
            order.push_back(row.race_id);
        } else {
            inserted.first->second = std::min(inserted.first->second, *row.position);
        }
    }

    std::vector<int64_t> positions;
    positions.reserve(order.size());
    for (auto race_id : order) {
        positions.push_back(best[race_id]);
    }
    return positions;
}

MetricResult PolePositionRate(const MetricContext& context, const MetricParams& params) {
    auto positions = BestPerRace(context, params);
    if (positions.empty()) {
        return NoData("No qualifying data found");
    }
    size_t poles = static_cast<size_t>(std::count(positions.begin(), positions.end(), 1));
    return Value(MetricValue(Round(Percent(poles, positions.size()), 1)), Metadata{
        {"total_qualifyings", MetricValue(positions.size())},
        {"pole_positions", MetricValue(poles)},
    });
}

MetricResult AverageQualifyingPosition(const MetricContext& context, const MetricParams& params) {
    auto positions = BestPerRace(context, params);
    if (positions.empty()) {
        return NoData("No qualifying data found");
    }
    std::vector<double> values(positions.begin(), positions.end());
    return Value(Rounded(Mean(values), 2), Metadata{
        {"total_qualifyings", MetricValue(positions.size())},
        {"best_qualifying", MetricValue(*std::min_element(positions.begin(), positions.end()))},
        {"worst_qualifying", MetricValue(*std::max_element(positions.begin(), positions.end()))},
    });
}

MetricResult TopTenQualifyingRate(const MetricContext& context, const MetricParams& params) {
    auto positions = BestPerRace(context, params);
    if (positions.empty()) {
        return NoData("No qualifying data found");
    }

    size_t pole = 0;
    size_t front_row = 0;
    size_t top_five = 0;
    size_t top_ten = 0;
    for (auto position : positions) {
        if (position == 1) {
            pole++;
        }
        if (position <= 2) {
            front_row++;
        }
        if (position <= 5) {
            top_five++;
        }
        if (position <= 10) {
            top_ten++;
        }
    }

    return Value(MetricValue(Round(Percent(top_ten, positions.size()), 1)), Metadata{
        {"total_qualifyings", MetricValue(positions.size())},
        {"top_ten_qualifyings", MetricValue(top_ten)},
        {"position_breakdown", MetricValue(Metadata{
            {"pole", MetricValue(pole)},
            {"front_row", MetricValue(front_row)},
            {"top_5", MetricValue(top_five)},
            {"top_10", MetricValue(top_ten)},
        })},
    });
}

MetricResult FrontRowLockouts(const MetricContext& context, const MetricParams& params) {
    auto rows = context.views.QualifyingWithConstructor(ConstructorQuery(params));
    if (rows.empty()) {
        return NoData("No qualifying data found");
    }

    // Cars on the front row per race
    std::map<core::RaceId, size_t> front_row;
    std::map<core::RaceId, core::Season> years;
    for (const auto& row : rows) {
        size_t& cars = front_row[row.race_id];
        years[row.race_id] = row.year;
        if (row.position && *row.position <= 2) {
            cars++;
        }
    }

    size_t lockouts = 0;
    std::set<core::Season> seasons;
    for (const auto& race : front_row) {
        if (race.second >= 2) {
            lockouts++;
            seasons.insert(years[race.first]);
        }
    }
    MetricValue::List season_list(seasons.begin(), seasons.end());

    return Value(MetricValue(lockouts), Metadata{
        {"total_qualifyings", MetricValue(front_row.size())},
        {"front_row_lockouts", MetricValue(lockouts)},
        {"seasons_with_lockouts", MetricValue(std::move(season_list))},
    });
}

MetricResult FrontRowStartRate(const MetricContext& context, const MetricParams& params) {
    auto positions = BestPerRace(context, params);
    if (positions.empty()) {
        return NoData("No qualifying data found");
    }

    size_t poles = 0;
    size_t second = 0;
    for (auto position : positions) {
        if (position == 1) {
            poles++;
        } else if (position == 2) {
            second++;
        }
    }
    return Value(MetricValue(Round(Percent(poles + second, positions.size()), 1)), Metadata{
        {"total_qualifyings", MetricValue(positions.size())},
        {"front_row_starts", MetricValue(poles + second)},
        {"pole_positions", MetricValue(poles)},
        {"p2_starts", MetricValue(second)},
    });
}

/**
 * Sample deviation of the best qualifying position per race.
 *
 * Fewer than three sessions give no value; the deviation of two points
 * says nothing about consistency.
 */
MetricResult QualifyingConsistency(const MetricContext& context, const MetricParams& params) {
    auto positions = BestPerRace(context, params);
    if (positions.size() < 3) {
        return NoData("Insufficient data for consistency calculation");
    }

    std::vector<double> values(positions.begin(), positions.end());
    double deviation = *SampleStdDev(values);
    int64_t range = *std::max_element(positions.begin(), positions.end()) -
                    *std::min_element(positions.begin(), positions.end());

    std::string rating = deviation < 3.0 ? "High" : deviation < 6.0 ? "Medium" : "Low";
    return Value(MetricValue(Round(deviation, 2)), Metadata{
        {"total_qualifyings", MetricValue(positions.size())},
        {"position_range", MetricValue(range)},
        {"average_position", Rounded(Mean(values), 2)},
        {"consistency_rating", MetricValue(rating)},
    });
}

// Grid average minus the team's best position, averaged over races; positive is better
MetricResult QualifyingAdvantage(const MetricContext& context, const MetricParams& params) {
    data::ViewQuery field_query = ConstructorQuery(params);
    field_query.constructor_id.reset();
    auto field = context.views.QualifyingWithConstructor(field_query);

    std::map<core::RaceId, std::vector<double>> grid;
    std::map<core::RaceId, int64_t> best;
    std::vector<core::RaceId> order;
    for (const auto& row : field) {
        if (!row.position || *row.position <= 0) {
            continue;
        }
        grid[row.race_id].push_back(static_cast<double>(*row.position));
        if (row.constructor_id != params.constructor_id) {
            continue;
        }
        auto inserted = best.emplace(row.race_id, *row.position);
        if (inserted.second) {
            order.push_back(row.race_id);
        } else {
            inserted.first->second = std::min(inserted.first->second, *row.position);
        }
    }
    if (order.empty()) {
        return NoData("No qualifying data found");
    }

    std::vector<double> advantages;
    for (auto race_id : order) {
        advantages.push_back(*Mean(grid[race_id]) - static_cast<double>(best[race_id]));
    }
    double average = *Mean(advantages);

    std::string level;
    if (average > 5.0) {
        level = "Excellent";
    } else if (average > 2.0) {
        level = "Good";
    } else if (average > -2.0) {
        level = "Average";
    } else {
        level = "Below Average";
    }

    return Value(MetricValue(Round(average, 2)), Metadata{
        {"total_qualifyings", MetricValue(advantages.size())},
        {"performance_level", MetricValue(level)},
        {"best_advantage", MetricValue(Round(*std::max_element(advantages.begin(), advantages.end()), 2))},
        {"worst_advantage", MetricValue(Round(*std::min_element(advantages.begin(), advantages.end()), 2))},
    });
}

MetricDefinition Qualifying(const std::string& name, const std::string& description,
                            const std::string& unit, MetricFormula formula) {
    MetricDefinition definition;
    definition.name = name;
    definition.description = description;
    definition.unit = unit;
    definition.kind = MetricKind::CONSTRUCTOR;
    definition.required_tables = {data::tables::kQualifying, data::tables::kResults,
                                  data::tables::kRaces, data::tables::kConstructors};
    definition.formula = std::move(formula);
    return definition;
}

} // namespace

void RegisterConstructorQualifyingMetrics(MetricRegistry& registry) {
    registry.Register(Qualifying("constructor_pole_position_rate",
                                 "Percentage of qualifying sessions where either car took pole",
                                 "percentage", PolePositionRate));
    registry.Register(Qualifying("constructor_average_qualifying_position",
                                 "Average qualifying position of the team's best car",
                                 "position", AverageQualifyingPosition));
    registry.Register(Qualifying("constructor_top_ten_qualifying_rate",
                                 "Percentage of qualifying sessions with a car in the top ten",
                                 "percentage", TopTenQualifyingRate));
    registry.Register(Qualifying("constructor_front_row_lockouts",
                                 "Number of qualifying sessions where the team took both front row places",
                                 "races", FrontRowLockouts));
    registry.Register(Qualifying("constructor_front_row_start_rate",
                                 "Percentage of qualifying sessions with a car on the front row",
                                 "percentage", FrontRowStartRate));
    registry.Register(Qualifying("constructor_qualifying_consistency",
                                 "Standard deviation of the best qualifying position, lower is steadier",
                                 "positions", QualifyingConsistency));
    registry.Register(Qualifying("constructor_qualifying_advantage",
                                 "Average positions the best car qualified ahead of the grid average",
                                 "positions", QualifyingAdvantage));
}

} // namespace metrics
} // namespace f1metrics
