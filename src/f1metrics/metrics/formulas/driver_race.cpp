#include "f1metrics/metrics/registry.h"
#include "f1metrics/metrics/formulas/formula_helpers.h"
#include "f1metrics/data/schema.h"

namespace f1metrics {
namespace metrics {

using namespace formulas;

namespace {

const std::vector<std::string> kResultTables = {
    data::tables::kResults, data::tables::kRaces, data::tables::kDrivers};

MetricResult AverageFinishPosition(const MetricContext& context, const MetricParams& params) {
    auto results = context.views.DriverResults(DriverQuery(params));
    if (results.empty()) {
        return NoData("No race results found");
    }

    std::vector<double> positions;
    std::optional<int64_t> best;
    std::optional<int64_t> worst;
    for (const auto& row : results) {
        if (!row.position) {
            continue;
        }
        positions.push_back(static_cast<double>(*row.position));
        best = best ? std::min(*best, *row.position) : *row.position;
        worst = worst ? std::max(*worst, *row.position) : *row.position;
    }

    return Value(Rounded(Mean(positions), 2), Metadata{
        {"total_races", MetricValue(results.size())},
        {"finished_races", MetricValue(positions.size())},
        {"dnf_count", MetricValue(results.size() - positions.size())},
        {"best_finish", OptionalInt(best)},
        {"worst_finish", OptionalInt(worst)},
    });
}

MetricResult PointsPerRace(const MetricContext& context, const MetricParams& params) {
    auto results = context.views.DriverResults(DriverQuery(params));
    if (results.empty()) {
        return NoData("No race results found");
    }

    std::vector<double> points;
    size_t scoring = 0;
    double best_haul = 0.0;
    double total = 0.0;
    for (const auto& row : results) {
        double p = row.points.value_or(0.0);
        points.push_back(p);
        total += p;
        best_haul = std::max(best_haul, p);
        if (p > 0) {
            scoring++;
        }
    }

    return Value(Rounded(Mean(points), 2), Metadata{
        {"total_races", MetricValue(results.size())},
        {"total_points", MetricValue(total)},
        {"points_scoring_races", MetricValue(scoring)},
        {"best_points_haul", MetricValue(best_haul)},
    });
}

MetricResult DnfRate(const MetricContext& context, const MetricParams& params) {
    auto results = context.views.DriverResults(DriverQuery(params));
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

    return Value(MetricValue(Round(rate, 2)), Metadata{
        {"total_races", MetricValue(results.size())},
        {"dnf_count", MetricValue(dnfs)},
        {"finish_rate", MetricValue(Round(100.0 - rate, 2))},
    });
}

MetricResult PodiumRate(const MetricContext& context, const MetricParams& params) {
    auto results = context.views.DriverResults(DriverQuery(params));
    if (results.empty()) {
        return NoData("No race results found");
    }

    size_t by_position[4] = {0, 0, 0, 0};
    for (const auto& row : results) {
        if (row.position && *row.position >= 1 && *row.position <= 3) {
            by_position[*row.position]++;
        }
    }
    size_t podiums = by_position[1] + by_position[2] + by_position[3];

    return Value(MetricValue(Round(Percent(podiums, results.size()), 2)), Metadata{
        {"total_races", MetricValue(results.size())},
        {"podium_count", MetricValue(podiums)},
        {"wins", MetricValue(by_position[1])},
        {"second_places", MetricValue(by_position[2])},
        {"third_places", MetricValue(by_position[3])},
        {"win_rate", MetricValue(Round(Percent(by_position[1], results.size()), 2))},
    });
}

MetricDefinition Driver(const std::string& name, const std::string& description,
                        const std::string& unit, MetricFormula formula) {
    MetricDefinition definition;
    definition.name = name;
    definition.description = description;
    definition.unit = unit;
    definition.kind = MetricKind::DRIVER;
    definition.required_tables = kResultTables;
    definition.formula = std::move(formula);
    return definition;
}

} // namespace

void RegisterDriverRaceMetrics(MetricRegistry& registry) {
    registry.Register(Driver("average_finish_position",
                             "Average race finish position (DNFs excluded from position calculation)",
                             "position", AverageFinishPosition));
    registry.Register(Driver("points_per_race", "Average championship points scored per race",
                             "points/race", PointsPerRace));
    registry.Register(Driver("dnf_rate", "Percentage of races that ended in DNF (Did Not Finish)",
                             "percentage", DnfRate));
    registry.Register(Driver("podium_rate", "Percentage of races resulting in podium finish (top 3)",
                             "percentage", PodiumRate));
}

} // namespace metrics
} // namespace f1metrics
