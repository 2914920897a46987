#include "f1metrics/model/metric_value.h"

namespace f1metrics {
namespace model {

const MetricValue* MetricValue::find(const std::string& key) const {
    if (kind_ != Kind::MAP) {
        return nullptr;
    }
    for (const auto& field : map_) {
        if (field.first == key) {
            return &field.second;
        }
    }
    return nullptr;
}

void MetricValue::set(const std::string& key, MetricValue value) {
    if (kind_ == Kind::NONE) {
        kind_ = Kind::MAP;
    }
    if (kind_ != Kind::MAP) {
        return;
    }
    for (auto& field : map_) {
        if (field.first == key) {
            field.second = std::move(value);
            return;
        }
    }
    map_.emplace_back(key, std::move(value));
}

bool MetricValue::operator==(const MetricValue& other) const {
    if (kind_ != other.kind_) {
        return false;
    }
    switch (kind_) {
        case Kind::NONE:
            return true;
        case Kind::BOOL:
            return bool_ == other.bool_;
        case Kind::INT:
            return int_ == other.int_;
        case Kind::DOUBLE:
            return double_ == other.double_;
        case Kind::STRING:
            return string_ == other.string_;
        case Kind::LIST:
            return list_ == other.list_;
        case Kind::MAP:
            return map_ == other.map_;
    }
    return false;
}

std::string MetricValue::kind_name() const {
    switch (kind_) {
        case Kind::NONE: return "null";
        case Kind::BOOL: return "bool";
        case Kind::INT: return "int";
        case Kind::DOUBLE: return "double";
        case Kind::STRING: return "string";
        case Kind::LIST: return "list";
        case Kind::MAP: return "map";
    }
    return "unknown";
}

} // namespace model
} // namespace f1metrics
