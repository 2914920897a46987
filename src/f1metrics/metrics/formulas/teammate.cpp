#include "f1metrics/metrics/registry.h"
#include "f1metrics/metrics/formulas/formula_helpers.h"
#include "f1metrics/data/schema.h"

namespace f1metrics {
namespace metrics {

using namespace formulas;

namespace {

struct HeadToHead {
    core::DriverId teammate_id;
    bool driver_ahead;
};

/**
 * @brief Summarize head-to-head outcomes against every teammate
 *
 * Value is the overall percentage of comparisons won; the record and a
 * per-teammate breakdown keyed by driver id go into metadata.
 */
MetricResult Summarize(const MetricContext& context, const std::vector<HeadToHead>& comparisons) {
    if (comparisons.empty()) {
        return NoData("No valid teammate comparisons found");
    }

    size_t wins = 0;
    // Keeps first-seen teammate order
    std::vector<core::DriverId> teammates;
    std::map<core::DriverId, std::pair<size_t, size_t>> by_teammate;
    for (const auto& comparison : comparisons) {
        if (comparison.driver_ahead) {
            wins++;
        }
        auto inserted = by_teammate.emplace(comparison.teammate_id, std::make_pair(size_t(0), size_t(0)));
        if (inserted.second) {
            teammates.push_back(comparison.teammate_id);
        }
        inserted.first->second.second++;
        if (comparison.driver_ahead) {
            inserted.first->second.first++;
        }
    }

    Metadata breakdown;
    for (auto teammate_id : teammates) {
        const auto& record = by_teammate[teammate_id];
        auto name = context.views.DriverName(teammate_id);
        breakdown.emplace_back(std::to_string(teammate_id), MetricValue(Metadata{
            {"driver_id", MetricValue(teammate_id)},
            {"name", name ? MetricValue(*name) : MetricValue()},
            {"wins", MetricValue(record.first)},
            {"total", MetricValue(record.second)},
            {"win_rate", MetricValue(Round(Percent(record.first, record.second), 2))},
        }));
    }

    size_t total = comparisons.size();
    return Value(MetricValue(Round(Percent(wins, total), 2)), Metadata{
        {"wins", MetricValue(wins)},
        {"losses", MetricValue(total - wins)},
        {"total", MetricValue(total)},
        {"record", MetricValue(std::to_string(wins) + "-" + std::to_string(total - wins))},
        {"unique_teammates", MetricValue(teammates.size())},
        {"teammate_breakdown", MetricValue(std::move(breakdown))},
    });
}

MetricResult TeammateRaceComparison(const MetricContext& context, const MetricParams& params) {
    core::DriverId driver_id = *params.driver_id;
    auto pairs = context.views.TeammatePairs(DriverQuery(params));

    std::vector<HeadToHead> comparisons;
    for (const auto& pair : pairs) {
        bool first = pair.driver1_id == driver_id;
        const auto& own = first ? pair.driver1_position : pair.driver2_position;
        const auto& other = first ? pair.driver2_position : pair.driver1_position;
        core::DriverId teammate = first ? pair.driver2_id : pair.driver1_id;

        if (!own && !other) {
            // Both retired
            continue;
        }
        bool ahead = own && (!other || *own < *other);
        comparisons.push_back(HeadToHead{teammate, ahead});
    }
    return Summarize(context, comparisons);
}

MetricResult TeammateQualifyingComparison(const MetricContext& context, const MetricParams& params) {
    core::DriverId driver_id = *params.driver_id;
    data::ViewQuery query = DriverQuery(params);
    query.driver_id.reset();
    auto rows = context.views.QualifyingWithConstructor(query);

    std::map<std::pair<core::RaceId, core::ConstructorId>, std::vector<const data::QualifyingRow*>> lineups;
    for (const auto& row : rows) {
        if (row.constructor_id) {
            lineups[std::make_pair(row.race_id, *row.constructor_id)].push_back(&row);
        }
    }

    std::vector<HeadToHead> comparisons;
    for (const auto& row : rows) {
        if (row.driver_id != driver_id || !row.constructor_id || !row.position) {
            continue;
        }
        for (const auto* other : lineups[std::make_pair(row.race_id, *row.constructor_id)]) {
            if (other->driver_id == driver_id || !other->position) {
                continue;
            }
            comparisons.push_back(HeadToHead{other->driver_id, *row.position < *other->position});
            break;
        }
    }
    return Summarize(context, comparisons);
}

MetricDefinition Teammate(const std::string& name, const std::string& description,
                          std::vector<std::string> tables, MetricFormula formula) {
    MetricDefinition definition;
    definition.name = name;
    definition.description = description;
    definition.unit = "percentage";
    definition.kind = MetricKind::DRIVER;
    definition.required_tables = std::move(tables);
    definition.required_params = {"driver_id"};
    definition.formula = std::move(formula);
    return definition;
}

} // namespace

void RegisterTeammateMetrics(MetricRegistry& registry) {
    registry.Register(Teammate("teammate_race_comparison",
                               "Head-to-head race finishing record against teammates",
                               {data::tables::kResults, data::tables::kRaces, data::tables::kDrivers},
                               TeammateRaceComparison));
    registry.Register(Teammate("teammate_qualifying_comparison",
                               "Head-to-head qualifying record against teammates",
                               {data::tables::kQualifying, data::tables::kResults, data::tables::kRaces,
                                data::tables::kDrivers},
                               TeammateQualifyingComparison));
}

} // namespace metrics
} // namespace f1metrics
