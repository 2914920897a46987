#include "f1metrics/cache/fingerprint.h"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>

#include <openssl/sha.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include "f1metrics/cache/value_json.h"

namespace f1metrics {
namespace cache {

namespace {

using model::MetricValue;

MetricValue Normalize(const MetricValue& value) {
    switch (value.kind()) {
        case MetricValue::Kind::DOUBLE: {
            double d = value.getDouble();
            if (std::isfinite(d) && d == std::floor(d) &&
                d >= static_cast<double>(std::numeric_limits<int64_t>::min()) &&
                d < static_cast<double>(std::numeric_limits<int64_t>::max())) {
                return MetricValue(static_cast<long long>(d));
            }
            return value;
        }
        case MetricValue::Kind::LIST: {
            MetricValue::List list;
            for (const auto& item : value.getList()) {
                list.push_back(Normalize(item));
            }
            return MetricValue(std::move(list));
        }
        case MetricValue::Kind::MAP: {
            MetricValue::Map map;
            for (const auto& field : value.getMap()) {
                map.emplace_back(field.first, Normalize(field.second));
            }
            std::stable_sort(map.begin(), map.end(),
                             [](const auto& a, const auto& b) { return a.first < b.first; });
            return MetricValue(std::move(map));
        }
        default:
            return value;
    }
}

} // namespace

std::string CanonicalRequest(const std::string& metric_name, const model::ParamMap& params) {
    // ParamMap is already ordered by key
    MetricValue::Map param_fields;
    for (const auto& param : params) {
        param_fields.emplace_back(param.first, param.second);
    }
    MetricValue request(MetricValue::Map{
        {"metric", MetricValue(metric_name)},
        {"params", MetricValue(std::move(param_fields))},
    });

    rapidjson::Document doc;
    rapidjson::Value json;
    auto encoded = ValueToJson(Normalize(request), &json, doc.GetAllocator());
    if (!encoded.ok()) {
        // Non-finite parameter values still need a stable key
        std::ostringstream fallback;
        fallback << metric_name << "|unencodable|" << encoded.error();
        return fallback.str();
    }

    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    json.Accept(writer);
    return std::string(buffer.GetString(), buffer.GetSize());
}

std::string Fingerprint(const std::string& metric_name, const model::ParamMap& params) {
    std::string canonical = CanonicalRequest(metric_name, params);

    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(canonical.c_str()),
           canonical.length(), hash);

    std::stringstream ss;
    for (int i = 0; i < SHA256_DIGEST_LENGTH; i++) {
        ss << std::hex << std::setw(2) << std::setfill('0')
           << static_cast<int>(hash[i]);
    }
    return ss.str().substr(0, kFingerprintLength);
}

} // namespace cache
} // namespace f1metrics
