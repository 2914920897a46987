#include "f1metrics/cache/value_json.h"

#include <cmath>

namespace f1metrics {
namespace cache {

namespace {

using model::MetricResult;
using model::MetricValue;

rapidjson::Value String(const std::string& text, JsonAllocator& allocator) {
    return rapidjson::Value(text.c_str(), static_cast<rapidjson::SizeType>(text.size()), allocator);
}

template <typename T>
rapidjson::Value OptionalInt(const std::optional<T>& v) {
    rapidjson::Value out;
    if (v) {
        out.SetInt64(static_cast<int64_t>(*v));
    }
    return out;
}

rapidjson::Value OptionalString(const std::optional<std::string>& v, JsonAllocator& allocator) {
    if (!v) {
        return rapidjson::Value();
    }
    return String(*v, allocator);
}

// Reads an optional integer member; a missing member or null is nullopt
core::Result<std::optional<int64_t>> ReadOptionalInt(const rapidjson::Value& object, const char* name) {
    auto it = object.FindMember(name);
    if (it == object.MemberEnd() || it->value.IsNull()) {
        return core::Result<std::optional<int64_t>>(std::nullopt);
    }
    if (!it->value.IsInt64()) {
        return core::Result<std::optional<int64_t>>::error(std::string("field '") + name +
                                                           "' is not an integer");
    }
    return core::Result<std::optional<int64_t>>(std::optional<int64_t>(it->value.GetInt64()));
}

core::Result<std::optional<std::string>> ReadOptionalString(const rapidjson::Value& object,
                                                            const char* name) {
    auto it = object.FindMember(name);
    if (it == object.MemberEnd() || it->value.IsNull()) {
        return core::Result<std::optional<std::string>>(std::nullopt);
    }
    if (!it->value.IsString()) {
        return core::Result<std::optional<std::string>>::error(std::string("field '") + name +
                                                               "' is not a string");
    }
    return core::Result<std::optional<std::string>>(
        std::optional<std::string>(std::string(it->value.GetString(), it->value.GetStringLength())));
}

} // namespace

core::Result<void> ValueToJson(const MetricValue& value, rapidjson::Value* out,
                               JsonAllocator& allocator) {
    switch (value.kind()) {
        case MetricValue::Kind::NONE:
            out->SetNull();
            break;
        case MetricValue::Kind::BOOL:
            out->SetBool(value.getBool());
            break;
        case MetricValue::Kind::INT:
            out->SetInt64(value.getInt());
            break;
        case MetricValue::Kind::DOUBLE:
            if (!std::isfinite(value.getDouble())) {
                return core::Result<void>::error("non-finite number cannot be encoded");
            }
            out->SetDouble(value.getDouble());
            break;
        case MetricValue::Kind::STRING:
            *out = String(value.getString(), allocator);
            break;
        case MetricValue::Kind::LIST: {
            out->SetArray();
            for (const auto& item : value.getList()) {
                rapidjson::Value element;
                auto result = ValueToJson(item, &element, allocator);
                if (!result.ok()) {
                    return result;
                }
                out->PushBack(element, allocator);
            }
            break;
        }
        case MetricValue::Kind::MAP: {
            out->SetObject();
            for (const auto& field : value.getMap()) {
                rapidjson::Value element;
                auto result = ValueToJson(field.second, &element, allocator);
                if (!result.ok()) {
                    return core::Result<void>::error("'" + field.first + "': " + result.error());
                }
                out->AddMember(String(field.first, allocator), element, allocator);
            }
            break;
        }
    }
    return core::Result<void>();
}

core::Result<MetricValue> ValueFromJson(const rapidjson::Value& json) {
    if (json.IsNull()) {
        return core::Result<MetricValue>(MetricValue());
    }
    if (json.IsBool()) {
        return core::Result<MetricValue>(MetricValue(json.GetBool()));
    }
    if (json.IsInt64()) {
        return core::Result<MetricValue>(MetricValue(static_cast<long long>(json.GetInt64())));
    }
    if (json.IsNumber()) {
        return core::Result<MetricValue>(MetricValue(json.GetDouble()));
    }
    if (json.IsString()) {
        return core::Result<MetricValue>(MetricValue(std::string(json.GetString(), json.GetStringLength())));
    }
    if (json.IsArray()) {
        MetricValue::List list;
        for (const auto& item : json.GetArray()) {
            auto element = ValueFromJson(item);
            if (!element.ok()) {
                return element;
            }
            list.push_back(element.take_value());
        }
        return core::Result<MetricValue>(MetricValue(std::move(list)));
    }
    MetricValue::Map map;
    for (const auto& member : json.GetObject()) {
        auto element = ValueFromJson(member.value);
        if (!element.ok()) {
            return element;
        }
        map.emplace_back(std::string(member.name.GetString(), member.name.GetStringLength()),
                         element.take_value());
    }
    return core::Result<MetricValue>(MetricValue(std::move(map)));
}

core::Result<void> ResultToJson(const MetricResult& result, rapidjson::Value* out,
                                JsonAllocator& allocator) {
    out->SetObject();
    out->AddMember("metric_name", String(result.metric_name, allocator), allocator);

    rapidjson::Value value;
    auto encoded = ValueToJson(result.value, &value, allocator);
    if (!encoded.ok()) {
        return core::Result<void>::error("value: " + encoded.error());
    }
    out->AddMember("value", value, allocator);

    out->AddMember("driver_id", OptionalInt(result.driver_id), allocator);
    out->AddMember("driver_name", OptionalString(result.driver_name, allocator), allocator);
    out->AddMember("constructor_id", OptionalInt(result.constructor_id), allocator);
    out->AddMember("constructor_name", OptionalString(result.constructor_name, allocator), allocator);
    out->AddMember("season", OptionalInt(result.season), allocator);

    rapidjson::Value metadata;
    if (result.metadata) {
        auto meta = ValueToJson(MetricValue(*result.metadata), &metadata, allocator);
        if (!meta.ok()) {
            return core::Result<void>::error("metadata: " + meta.error());
        }
    }
    out->AddMember("metadata", metadata, allocator);
    return core::Result<void>();
}

core::Result<MetricResult> ResultFromJson(const rapidjson::Value& json) {
    if (!json.IsObject()) {
        return core::Result<MetricResult>::error("result is not an object");
    }
    auto name = json.FindMember("metric_name");
    if (name == json.MemberEnd() || !name->value.IsString()) {
        return core::Result<MetricResult>::error("result has no metric_name");
    }
    auto value_member = json.FindMember("value");
    if (value_member == json.MemberEnd()) {
        return core::Result<MetricResult>::error("result has no value");
    }
    auto value = ValueFromJson(value_member->value);
    if (!value.ok()) {
        return core::Result<MetricResult>::error(value.error());
    }

    MetricResult result(name->value.GetString(), value.take_value());

    auto driver_id = ReadOptionalInt(json, "driver_id");
    auto constructor_id = ReadOptionalInt(json, "constructor_id");
    auto season = ReadOptionalInt(json, "season");
    auto driver_name = ReadOptionalString(json, "driver_name");
    auto constructor_name = ReadOptionalString(json, "constructor_name");
    if (!driver_id.ok()) return core::Result<MetricResult>::error(driver_id.error());
    if (!constructor_id.ok()) return core::Result<MetricResult>::error(constructor_id.error());
    if (!season.ok()) return core::Result<MetricResult>::error(season.error());
    if (!driver_name.ok()) return core::Result<MetricResult>::error(driver_name.error());
    if (!constructor_name.ok()) return core::Result<MetricResult>::error(constructor_name.error());
    result.driver_id = driver_id.value();
    result.constructor_id = constructor_id.value();
    result.season = season.value();
    result.driver_name = driver_name.value();
    result.constructor_name = constructor_name.value();

    auto metadata = json.FindMember("metadata");
    if (metadata != json.MemberEnd() && !metadata->value.IsNull()) {
        if (!metadata->value.IsObject()) {
            return core::Result<MetricResult>::error("metadata is not an object");
        }
        auto decoded = ValueFromJson(metadata->value);
        if (!decoded.ok()) {
            return core::Result<MetricResult>::error(decoded.error());
        }
        result.metadata = decoded.value().getMap();
    }
    return core::Result<MetricResult>(std::move(result));
}

} // namespace cache
} // namespace f1metrics
