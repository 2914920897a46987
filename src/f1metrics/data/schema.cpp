#include "f1metrics/data/schema.h"

namespace f1metrics {
namespace data {

const std::vector<TableSchema>& KnownSchemas() {
    static const std::vector<TableSchema> schemas = {
        {tables::kRaces,
         {"raceId", "year", "round"},
         {"raceId", "year", "round"}},
        {tables::kResults,
         {"resultId", "raceId", "driverId", "constructorId", "position", "points", "statusId"},
         {"resultId", "raceId", "driverId", "constructorId", "statusId"}},
        {tables::kQualifying,
         {"qualifyId", "raceId", "driverId", "position"},
         {"qualifyId", "raceId", "driverId"}},
        {tables::kLapTimes,
         {"raceId", "driverId", "lap", "milliseconds"},
         {"raceId", "driverId", "lap"}},
        {tables::kPitStops,
         {"raceId", "driverId", "stop", "lap", "milliseconds"},
         {"raceId", "driverId", "stop", "lap"}},
        {tables::kDrivers,
         {"driverId", "forename", "surname"},
         {"driverId"}},
        {tables::kConstructors,
         {"constructorId", "name"},
         {"constructorId"}},
        {tables::kConstructorStandings,
         {"raceId", "constructorId", "points", "position", "wins"},
         {"raceId", "constructorId"}},
        {tables::kDriverStandings,
         {"raceId", "driverId", "points", "position", "wins"},
         {"raceId", "driverId"}},
        {tables::kStatus,
         {"statusId", "status"},
         {"statusId"}},
    };
    return schemas;
}

const TableSchema* FindSchema(const std::string& table_name) {
    for (const auto& schema : KnownSchemas()) {
        if (schema.name == table_name) {
            return &schema;
        }
    }
    return nullptr;
}

} // namespace data
} // namespace f1metrics
