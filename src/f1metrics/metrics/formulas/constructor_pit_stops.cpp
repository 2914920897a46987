#include "f1metrics/metrics/registry.h"
#include "f1metrics/metrics/formulas/formula_helpers.h"
#include "f1metrics/data/schema.h"

namespace f1metrics {
namespace metrics {

using namespace formulas;

namespace {

// Stops at or above this are red-flag or drive-through outliers
constexpr double kOutlierMs = 60000.0;
constexpr double kSubThreeMs = 3000.0;

std::vector<data::PitStopRow> TimedStops(const MetricContext& context, const MetricParams& params) {
    auto stops = context.views.PitStopStats(ConstructorQuery(params));
    std::vector<data::PitStopRow> timed;
    for (auto& stop : stops) {
        if (stop.milliseconds) {
            timed.push_back(std::move(stop));
        }
    }
    return timed;
}

MetricResult AveragePitStopTime(const MetricContext& context, const MetricParams& params) {
    auto stops = TimedStops(context, params);
    if (stops.empty()) {
        return NoData("No pit stop data found");
    }

    std::vector<double> seconds;
    for (const auto& stop : stops) {
        if (*stop.milliseconds < kOutlierMs) {
            seconds.push_back(*stop.milliseconds / 1000.0);
        }
    }
    if (seconds.empty()) {
        return NoData("No pit stops below the outlier threshold");
    }

    return Value(Rounded(Mean(seconds), 3), Metadata{
        {"total_stops", MetricValue(seconds.size())},
        {"stops_before_filtering", MetricValue(stops.size())},
        {"outliers_filtered", MetricValue(stops.size() - seconds.size())},
        {"fastest_stop", MetricValue(Round(*std::min_element(seconds.begin(), seconds.end()), 3))},
        {"slowest_stop", MetricValue(Round(*std::max_element(seconds.begin(), seconds.end()), 3))},
        {"seasons_analyzed", DistinctYears(stops)},
    });
}

MetricResult FastestPitStop(const MetricContext& context, const MetricParams& params) {
    auto stops = TimedStops(context, params);

    const data::PitStopRow* fastest = nullptr;
    size_t counted = 0;
    for (const auto& stop : stops) {
        if (*stop.milliseconds >= kOutlierMs) {
            continue;
        }
        counted++;
        if (!fastest || *stop.milliseconds < *fastest->milliseconds) {
            fastest = &stop;
        }
    }
    if (!fastest) {
        return NoData("No pit stop data found");
    }

    return Value(MetricValue(Round(*fastest->milliseconds / 1000.0, 3)), Metadata{
        {"race_id", MetricValue(fastest->race_id)},
        {"lap", MetricValue(fastest->lap)},
        {"year", MetricValue(fastest->year)},
        {"driver_id", MetricValue(fastest->driver_id)},
        {"total_stops", MetricValue(counted)},
    });
}

MetricResult SubThreeSecondStops(const MetricContext& context, const MetricParams& params) {
    auto stops = TimedStops(context, params);
    if (stops.empty()) {
        return NoData("No pit stop data found");
    }

    size_t sub_three = 0;
    std::vector<double> seconds;
    for (const auto& stop : stops) {
        seconds.push_back(*stop.milliseconds / 1000.0);
        if (*stop.milliseconds < kSubThreeMs) {
            sub_three++;
        }
    }

    return Value(MetricValue(Round(Percent(sub_three, stops.size()), 1)), Metadata{
        {"sub_three_stops", MetricValue(sub_three)},
        {"total_stops", MetricValue(stops.size())},
        {"average_time", Rounded(Mean(seconds), 3)},
    });
}

MetricResult PitStopConsistency(const MetricContext& context, const MetricParams& params) {
    auto stops = TimedStops(context, params);

    std::vector<double> seconds;
    for (const auto& stop : stops) {
        if (*stop.milliseconds < kOutlierMs) {
            seconds.push_back(*stop.milliseconds / 1000.0);
        }
    }
    if (seconds.size() < 2) {
        return NoData("Insufficient pit stop data for consistency analysis");
    }

    double deviation = *SampleStdDev(seconds);
    double mean = *Mean(seconds);
    double variation = mean > 0.0 ? deviation / mean * 100.0 : 0.0;

    std::string grade;
    if (variation < 5.0) {
        grade = "Excellent";
    } else if (variation < 10.0) {
        grade = "Good";
    } else if (variation < 15.0) {
        grade = "Average";
    } else {
        grade = "Poor";
    }

    return Value(MetricValue(Round(deviation, 3)), Metadata{
        {"mean_time", MetricValue(Round(mean, 3))},
        {"coefficient_of_variation", MetricValue(Round(variation, 1))},
        {"total_stops", MetricValue(seconds.size())},
        {"outliers_filtered", MetricValue(stops.size() - seconds.size())},
        {"consistency_grade", MetricValue(grade)},
    });
}

// Every recorded stop counts, timed or not; races without stops are not in the average
MetricResult AveragePitStopsPerRace(const MetricContext& context, const MetricParams& params) {
    auto stops = context.views.PitStopStats(ConstructorQuery(params));
    if (stops.empty()) {
        return NoData("No pit stop data found");
    }

    std::map<core::RaceId, int64_t> per_race;
    for (const auto& stop : stops) {
        per_race[stop.race_id]++;
    }

    std::vector<double> counts;
    int64_t most = 0;
    int64_t fewest = per_race.begin()->second;
    for (const auto& race : per_race) {
        counts.push_back(static_cast<double>(race.second));
        most = std::max(most, race.second);
        fewest = std::min(fewest, race.second);
    }

    return Value(Rounded(Mean(counts), 2), Metadata{
        {"total_races", MetricValue(per_race.size())},
        {"total_stops", MetricValue(stops.size())},
        {"max_stops_in_race", MetricValue(most)},
        {"min_stops_in_race", MetricValue(fewest)},
    });
}

MetricDefinition PitStop(const std::string& name, const std::string& description,
                         const std::string& unit, MetricFormula formula) {
    MetricDefinition definition;
    definition.name = name;
    definition.description = description;
    definition.unit = unit;
    definition.kind = MetricKind::CONSTRUCTOR;
    definition.required_tables = {data::tables::kPitStops, data::tables::kResults,
                                  data::tables::kRaces, data::tables::kConstructors};
    definition.formula = std::move(formula);
    return definition;
}

} // namespace

void RegisterConstructorPitStopMetrics(MetricRegistry& registry) {
    registry.Register(PitStop("constructor_average_pit_stop_time",
                              "Average pit stop duration, outliers above 60 seconds excluded",
                              "seconds", AveragePitStopTime));
    registry.Register(PitStop("constructor_fastest_pit_stop",
                              "Fastest recorded pit stop", "seconds", FastestPitStop));
    registry.Register(PitStop("constructor_sub_three_second_stops",
                              "Percentage of pit stops completed in under three seconds",
                              "percentage", SubThreeSecondStops));
    registry.Register(PitStop("constructor_pit_stop_consistency",
                              "Standard deviation of pit stop times, outliers excluded",
                              "seconds", PitStopConsistency));
    registry.Register(PitStop("constructor_average_pit_stops_per_race",
                              "Average number of pit stops per race", "stops",
                              AveragePitStopsPerRace));
}

} // namespace metrics
} // namespace f1metrics
