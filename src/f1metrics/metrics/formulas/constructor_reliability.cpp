#include "f1metrics/metrics/registry.h"
#include "f1metrics/metrics/formulas/formula_helpers.h"
#include "f1metrics/data/schema.h"

#include <cctype>

namespace f1metrics {
namespace metrics {

using namespace formulas;

namespace {

const char* const kMechanicalKeywords[] = {
    "engine", "gearbox", "transmission", "clutch", "hydraulics", "electrical", "brakes",
    "suspension", "power unit", "ers", "turbo", "battery", "mgu-k", "mgu-h",
};

std::string Lower(const std::string& text) {
    std::string lower(text);
    for (auto& c : lower) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return lower;
}

bool IsMechanical(const std::string& status) {
    std::string lower = Lower(status);
    for (const char* keyword : kMechanicalKeywords) {
        if (lower.find(keyword) != std::string::npos) {
            return true;
        }
    }
    return false;
}

MetricResult DnfRate(const MetricContext& context, const MetricParams& params) {
    auto results = context.views.ConstructorResults(ConstructorQuery(params));
    if (results.empty()) {
        return NoData("No race results found");
    }

    size_t dnfs = 0;
    for (const auto& row : results) {
        if (!row.position) {
            dnfs++;
        }
    }
    double rate = Percent(dnfs, results.size());
    return Value(MetricValue(Round(rate, 1)), Metadata{
        {"total_entries", MetricValue(results.size())},
        {"dnfs", MetricValue(dnfs)},
        {"finishes", MetricValue(results.size() - dnfs)},
        {"finish_rate", MetricValue(Round(100.0 - rate, 1))},
    });
}

MetricResult FinishRate(const MetricContext& context, const MetricParams& params) {
    auto races = context.views.ConstructorPointsByRace(ConstructorQuery(params));
    if (races.empty()) {
        return NoData("No race data found");
    }

    size_t all_finished = 0;
    size_t at_least_one = 0;
    size_t none = 0;
    for (const auto& race : races) {
        if (race.classified_count == race.drivers_count) {
            all_finished++;
        }
        if (race.classified_count > 0) {
            at_least_one++;
        } else {
            none++;
        }
    }

    return Value(MetricValue(Round(Percent(all_finished, races.size()), 1)), Metadata{
        {"total_races", MetricValue(races.size())},
        {"both_cars_finish", MetricValue(all_finished)},
        {"at_least_one_finish", MetricValue(at_least_one)},
        {"no_finishers", MetricValue(none)},
    });
}

MetricResult MechanicalFailureRate(const MetricContext& context, const MetricParams& params) {
    auto results = context.views.ConstructorReliability(ConstructorQuery(params));
    if (results.empty()) {
        return NoData("No race results found");
    }

    size_t mechanical = 0;
    // Keeps first-seen status order
    Metadata breakdown;
    for (const auto& row : results) {
        if (row.position || !row.status || !IsMechanical(*row.status)) {
            continue;
        }
        mechanical++;
        auto it = std::find_if(breakdown.begin(), breakdown.end(),
                               [&row](const Metadata::value_type& entry) {
                                   return entry.first == *row.status;
                               });
        if (it == breakdown.end()) {
            breakdown.emplace_back(*row.status, MetricValue(1));
        } else {
            it->second = MetricValue(it->second.getInt() + 1);
        }
    }

    return Value(MetricValue(Round(Percent(mechanical, results.size()), 1)), Metadata{
        {"total_entries", MetricValue(results.size())},
        {"mechanical_failures", MetricValue(mechanical)},
        {"failure_breakdown", MetricValue(std::move(breakdown))},
    });
}

/**
 * Weighted blend of three per-entry rates, 0-100.
 *
 * Classified finishes weigh 40%, points finishes 35% and classified
 * finishes in the top fifteen 25%.
 */
MetricResult ReliabilityIndex(const MetricContext& context, const MetricParams& params) {
    auto results = context.views.ConstructorResults(ConstructorQuery(params));
    if (results.empty()) {
        return NoData("No race results found");
    }

    size_t finishes = 0;
    size_t points_finishes = 0;
    size_t competitive = 0;
    for (const auto& row : results) {
        if (row.position && *row.position > 0) {
            finishes++;
            if (*row.position <= 15) {
                competitive++;
            }
        }
        if (row.points && *row.points > 0) {
            points_finishes++;
        }
    }

    double finish_rate = Percent(finishes, results.size());
    double points_rate = Percent(points_finishes, results.size());
    double competitive_rate = Percent(competitive, results.size());
    double index = finish_rate * 0.4 + points_rate * 0.35 + competitive_rate * 0.25;

    std::string grade;
    if (index >= 90.0) {
        grade = "Excellent";
    } else if (index >= 80.0) {
        grade = "Very Good";
    } else if (index >= 70.0) {
        grade = "Good";
    } else if (index >= 60.0) {
        grade = "Average";
    } else {
        grade = "Poor";
    }

    return Value(MetricValue(Round(index, 1)), Metadata{
        {"total_entries", MetricValue(results.size())},
        {"finish_rate", MetricValue(Round(finish_rate, 1))},
        {"points_reliability", MetricValue(Round(points_rate, 1))},
        {"competitive_reliability", MetricValue(Round(competitive_rate, 1))},
        {"reliability_grade", MetricValue(grade)},
    });
}

// Finish rate per season, averaged over the seasons in scope
MetricResult AverageReliability(const MetricContext& context, const MetricParams& params) {
    auto results = context.views.ConstructorResults(ConstructorQuery(params));
    if (results.empty()) {
        return NoData("No race results found");
    }

    // season -> (entries, finishes)
    std::map<core::Season, std::pair<size_t, size_t>> seasons;
    for (const auto& row : results) {
        auto& season = seasons[row.year];
        season.first++;
        if (row.position && *row.position > 0) {
            season.second++;
        }
    }

    if (params.season) {
        const auto& season = seasons.begin()->second;
        return Value(MetricValue(Round(Percent(season.second, season.first), 1)), Metadata{
            {"season", MetricValue(seasons.begin()->first)},
            {"total_entries", MetricValue(season.first)},
            {"finishes", MetricValue(season.second)},
        });
    }

    std::vector<double> rates;
    Metadata by_year;
    core::Season best_season = seasons.begin()->first;
    core::Season worst_season = seasons.begin()->first;
    double best = -1.0;
    double worst = 101.0;
    for (const auto& season : seasons) {
        double rate = Percent(season.second.second, season.second.first);
        rates.push_back(rate);
        by_year.emplace_back(std::to_string(season.first), MetricValue(Round(rate, 1)));
        if (rate > best) {
            best = rate;
            best_season = season.first;
        }
        if (rate < worst) {
            worst = rate;
            worst_season = season.first;
        }
    }

    return Value(Rounded(Mean(rates), 1), Metadata{
        {"seasons_analyzed", MetricValue(seasons.size())},
        {"reliability_by_year", MetricValue(std::move(by_year))},
        {"best_season", MetricValue(best_season)},
        {"worst_season", MetricValue(worst_season)},
    });
}

MetricDefinition Reliability(const std::string& name, const std::string& description,
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

void RegisterConstructorReliabilityMetrics(MetricRegistry& registry) {
    const std::vector<std::string> results = {data::tables::kResults, data::tables::kRaces,
                                              data::tables::kConstructors};

    registry.Register(Reliability("constructor_dnf_rate",
                                  "Percentage of entries that did not finish", "percentage",
                                  results, DnfRate));
    registry.Register(Reliability("constructor_finish_rate",
                                  "Percentage of races where every car was classified",
                                  "percentage", results, FinishRate));
    registry.Register(Reliability("constructor_mechanical_failure_rate",
                                  "Percentage of entries retired by a mechanical failure",
                                  "percentage",
                                  {data::tables::kResults, data::tables::kRaces,
                                   data::tables::kConstructors, data::tables::kStatus},
                                  MechanicalFailureRate));
    registry.Register(Reliability("constructor_reliability_index",
                                  "Composite reliability score from finishing, scoring and top fifteen rates",
                                  "index", results, ReliabilityIndex));
    registry.Register(Reliability("constructor_average_reliability",
                                  "Finish rate of the season, or averaged across seasons",
                                  "percentage", results, AverageReliability));
}

} // namespace metrics
} // namespace f1metrics
