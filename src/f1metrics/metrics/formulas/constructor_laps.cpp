#include "f1metrics/metrics/registry.h"
#include "f1metrics/metrics/formulas/formula_helpers.h"
#include "f1metrics/data/schema.h"

namespace f1metrics {
namespace metrics {

using namespace formulas;

namespace {

MetricResult AverageLapTime(const MetricContext& context, const MetricParams& params) {
    auto races = context.views.ConstructorLapPerformance(ConstructorQuery(params));
    if (races.empty()) {
        return NoData("No lap time data found");
    }

    double total_ms = 0.0;
    int64_t laps = 0;
    double fastest = races.front().fastest_ms;
    double slowest = races.front().slowest_ms;
    for (const auto& race : races) {
        total_ms += race.mean_ms * static_cast<double>(race.lap_count);
        laps += race.lap_count;
        fastest = std::min(fastest, race.fastest_ms);
        slowest = std::max(slowest, race.slowest_ms);
    }

    return Value(MetricValue(Round(total_ms / static_cast<double>(laps) / 1000.0, 3)), Metadata{
        {"total_laps", MetricValue(laps)},
        {"fastest_lap", MetricValue(Round(fastest / 1000.0, 3))},
        {"slowest_lap", MetricValue(Round(slowest / 1000.0, 3))},
        {"races_analyzed", MetricValue(races.size())},
    });
}

MetricResult FastestLap(const MetricContext& context, const MetricParams& params) {
    auto laps = context.views.LapTimesWithContext(ConstructorQuery(params));

    const data::LapTimeRow* fastest = nullptr;
    for (const auto& lap : laps) {
        if (!lap.milliseconds) {
            continue;
        }
        if (!fastest || *lap.milliseconds < *fastest->milliseconds) {
            fastest = &lap;
        }
    }
    if (!fastest) {
        return NoData("No lap time data found");
    }

    return Value(MetricValue(Round(*fastest->milliseconds / 1000.0, 3)), Metadata{
        {"race_id", MetricValue(fastest->race_id)},
        {"lap", MetricValue(fastest->lap)},
        {"year", MetricValue(fastest->year)},
        {"driver_id", MetricValue(fastest->driver_id)},
    });
}

// Mean of per-race sample deviations; races with a single lap carry none
MetricResult LapTimeConsistency(const MetricContext& context, const MetricParams& params) {
    auto races = context.views.ConstructorLapPerformance(ConstructorQuery(params));

    std::vector<double> deviations;
    for (const auto& race : races) {
        if (race.stddev_ms) {
            deviations.push_back(*race.stddev_ms / 1000.0);
        }
    }
    if (deviations.empty()) {
        return NoData("Not enough lap time data found");
    }

    return Value(Rounded(Mean(deviations), 3), Metadata{
        {"races_analyzed", MetricValue(deviations.size())},
        {"most_consistent_race", MetricValue(Round(*std::min_element(deviations.begin(), deviations.end()), 3))},
        {"least_consistent_race", MetricValue(Round(*std::max_element(deviations.begin(), deviations.end()), 3))},
    });
}

MetricDefinition Lap(const std::string& name, const std::string& description,
                     MetricFormula formula) {
    MetricDefinition definition;
    definition.name = name;
    definition.description = description;
    definition.unit = "seconds";
    definition.kind = MetricKind::CONSTRUCTOR;
    definition.required_tables = {data::tables::kLapTimes, data::tables::kResults,
                                  data::tables::kRaces, data::tables::kConstructors};
    definition.formula = std::move(formula);
    return definition;
}

} // namespace

void RegisterConstructorLapMetrics(MetricRegistry& registry) {
    registry.Register(Lap("constructor_average_lap_time",
                          "Average lap time across all of the team's laps", AverageLapTime));
    registry.Register(Lap("constructor_fastest_lap",
                          "Fastest lap set by either car", FastestLap));
    registry.Register(Lap("constructor_lap_time_consistency",
                          "Average per-race standard deviation of lap times (lower is more consistent)",
                          LapTimeConsistency));
}

} // namespace metrics
} // namespace f1metrics
