#include "f1metrics/model/metric_params.h"

#include <algorithm>
#include <sstream>

namespace f1metrics {
namespace model {

ParamMap MetricParams::ToParamMap() const {
    ParamMap params;
    params["driver_id"] = MetricValue(driver_id);
    params["constructor_id"] = MetricValue(constructor_id);
    params["season"] = MetricValue(season);

    if (race_ids) {
        std::vector<core::RaceId> ids = *race_ids;
        std::sort(ids.begin(), ids.end());
        ids.erase(std::unique(ids.begin(), ids.end()), ids.end());
        MetricValue::List list;
        list.reserve(ids.size());
        for (auto id : ids) {
            list.emplace_back(id);
        }
        params["race_ids"] = MetricValue(std::move(list));
    } else {
        params["race_ids"] = MetricValue();
    }
    return params;
}

std::string MetricParams::ToString() const {
    std::ostringstream out;
    auto put = [&out](const char* name, const std::optional<int64_t>& v) {
        out << name << "=";
        if (v) out << *v; else out << "none";
    };
    put("driver_id", driver_id);
    out << " ";
    put("constructor_id", constructor_id);
    out << " ";
    put("season", season);
    out << " race_ids=";
    if (race_ids) {
        out << "[";
        for (size_t i = 0; i < race_ids->size(); ++i) {
            if (i > 0) out << ",";
            out << (*race_ids)[i];
        }
        out << "]";
    } else {
        out << "none";
    }
    return out.str();
}

} // namespace model
} // namespace f1metrics
