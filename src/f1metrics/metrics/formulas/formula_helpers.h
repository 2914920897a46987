#pragma once

#include <algorithm>
#include <cmath>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "f1metrics/data/views.h"
#include "f1metrics/metrics/metric.h"
#include "f1metrics/model/metric_params.h"
#include "f1metrics/model/metric_result.h"

namespace f1metrics {
namespace metrics {
namespace formulas {

using model::Metadata;
using model::MetricParams;
using model::MetricResult;
using model::MetricValue;

inline double Round(double value, int digits) {
    double factor = std::pow(10.0, digits);
    return std::round(value * factor) / factor;
}

inline std::optional<double> Mean(const std::vector<double>& values) {
    if (values.empty()) {
        return std::nullopt;
    }
    double sum = 0.0;
    for (double v : values) {
        sum += v;
    }
    return sum / static_cast<double>(values.size());
}

// Sample standard deviation (n - 1); needs two values
inline std::optional<double> SampleStdDev(const std::vector<double>& values) {
    if (values.size() < 2) {
        return std::nullopt;
    }
    double mean = *Mean(values);
    double squares = 0.0;
    for (double v : values) {
        squares += (v - mean) * (v - mean);
    }
    return std::sqrt(squares / static_cast<double>(values.size() - 1));
}

// Percentage 0-100; zero when whole is zero
inline double Percent(size_t part, size_t whole) {
    if (whole == 0) {
        return 0.0;
    }
    return static_cast<double>(part) / static_cast<double>(whole) * 100.0;
}

inline MetricValue Rounded(const std::optional<double>& value, int digits) {
    if (!value) {
        return MetricValue();
    }
    return MetricValue(Round(*value, digits));
}

// Null result explaining why nothing could be computed
inline MetricResult NoData(const std::string& message) {
    MetricResult result;
    result.metadata = Metadata{{"message", MetricValue(message)}};
    return result;
}

inline MetricResult Value(MetricValue value, Metadata metadata) {
    MetricResult result;
    result.value = std::move(value);
    result.metadata = std::move(metadata);
    return result;
}

// Query for driver metrics: every parameter filters
inline data::ViewQuery DriverQuery(const MetricParams& params) {
    data::ViewQuery query;
    query.season = params.season;
    query.driver_id = params.driver_id;
    query.constructor_id = params.constructor_id;
    query.race_ids = params.race_ids;
    return query;
}

// Query for constructor metrics: the driver parameter does not apply
inline data::ViewQuery ConstructorQuery(const MetricParams& params) {
    data::ViewQuery query = DriverQuery(params);
    query.driver_id.reset();
    return query;
}

template <typename Row>
MetricValue DistinctYears(const std::vector<Row>& rows) {
    std::set<core::Season> years;
    for (const auto& row : rows) {
        years.insert(row.year);
    }
    MetricValue::List list;
    for (auto year : years) {
        list.emplace_back(year);
    }
    return MetricValue(std::move(list));
}

inline MetricValue OptionalInt(const std::optional<int64_t>& value) {
    return MetricValue(value);
}

} // namespace formulas
} // namespace metrics
} // namespace f1metrics
