#include "f1metrics/metrics/registry.h"
#include "f1metrics/metrics/formulas/formula_helpers.h"
#include "f1metrics/data/schema.h"

namespace f1metrics {
namespace metrics {

using namespace formulas;

namespace {

struct QualifyingSample {
    size_t sessions = 0;
    std::vector<double> positions;
    std::optional<int64_t> best;
    std::optional<int64_t> worst;
};

QualifyingSample Sample(const std::vector<data::QualifyingRow>& rows) {
    QualifyingSample sample;
    sample.sessions = rows.size();
    for (const auto& row : rows) {
        if (!row.position) {
            continue;
        }
        sample.positions.push_back(static_cast<double>(*row.position));
        sample.best = sample.best ? std::min(*sample.best, *row.position) : *row.position;
        sample.worst = sample.worst ? std::max(*sample.worst, *row.position) : *row.position;
    }
    return sample;
}

MetricResult QualifyingPositionAverage(const MetricContext& context, const MetricParams& params) {
    auto rows = context.views.QualifyingWithConstructor(DriverQuery(params));
    if (rows.empty()) {
        return NoData("No qualifying data found");
    }
    auto sample = Sample(rows);
    return Value(Rounded(Mean(sample.positions), 2), Metadata{
        {"total_qualifyings", MetricValue(sample.sessions)},
        {"valid_positions", MetricValue(sample.positions.size())},
        {"best_position", OptionalInt(sample.best)},
        {"worst_position", OptionalInt(sample.worst)},
    });
}

MetricResult QualifyingConsistency(const MetricContext& context, const MetricParams& params) {
    auto rows = context.views.QualifyingWithConstructor(DriverQuery(params));
    if (rows.empty()) {
        return NoData("No qualifying data found");
    }
    auto sample = Sample(rows);
    std::optional<int64_t> range;
    if (sample.best) {
        range = *sample.worst - *sample.best;
    }
    return Value(Rounded(SampleStdDev(sample.positions), 2), Metadata{
        {"total_qualifyings", MetricValue(sample.sessions)},
        {"valid_positions", MetricValue(sample.positions.size())},
        {"position_range", OptionalInt(range)},
    });
}

MetricResult PolePositionRate(const MetricContext& context, const MetricParams& params) {
    auto rows = context.views.QualifyingWithConstructor(DriverQuery(params));
    if (rows.empty()) {
        return NoData("No qualifying data found");
    }
    auto sample = Sample(rows);
    size_t poles = static_cast<size_t>(
        std::count(sample.positions.begin(), sample.positions.end(), 1.0));
    return Value(MetricValue(Round(Percent(poles, sample.positions.size()), 2)), Metadata{
        {"total_qualifyings", MetricValue(sample.positions.size())},
        {"pole_positions", MetricValue(poles)},
    });
}

MetricDefinition Qualifying(const std::string& name, const std::string& description,
                            const std::string& unit, MetricFormula formula) {
    MetricDefinition definition;
    definition.name = name;
    definition.description = description;
    definition.unit = unit;
    definition.kind = MetricKind::DRIVER;
    definition.required_tables = {data::tables::kQualifying, data::tables::kRaces,
                                  data::tables::kDrivers};
    definition.formula = std::move(formula);
    return definition;
}

} // namespace

void RegisterDriverQualifyingMetrics(MetricRegistry& registry) {
    registry.Register(Qualifying("qualifying_position_average",
                                 "Average qualifying position across selected races",
                                 "position", QualifyingPositionAverage));
    registry.Register(Qualifying("qualifying_consistency",
                                 "Standard deviation of qualifying positions (lower is more consistent)",
                                 "positions", QualifyingConsistency));
    registry.Register(Qualifying("pole_position_rate",
                                 "Percentage of qualifying sessions resulting in pole position",
                                 "percentage", PolePositionRate));
}

} // namespace metrics
} // namespace f1metrics
