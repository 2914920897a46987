#include "f1metrics/cache/entry_codec.h"

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include "f1metrics/cache/value_json.h"

namespace f1metrics {
namespace cache {

namespace {

template <typename Writer>
std::string Write(const rapidjson::Value& json) {
    rapidjson::StringBuffer buffer;
    Writer writer(buffer);
    json.Accept(writer);
    return std::string(buffer.GetString(), buffer.GetSize());
}

} // namespace

core::Result<std::string> EncodeEntry(const CacheEntry& entry) {
    rapidjson::Document doc;
    doc.SetObject();
    auto& allocator = doc.GetAllocator();

    doc.AddMember("fingerprint", rapidjson::Value(entry.fingerprint.c_str(), allocator).Move(), allocator);
    doc.AddMember("metric_name", rapidjson::Value(entry.metric_name.c_str(), allocator).Move(), allocator);

    rapidjson::Value parameters(rapidjson::kObjectType);
    for (const auto& param : entry.parameters) {
        rapidjson::Value value;
        auto encoded = ValueToJson(param.second, &value, allocator);
        if (!encoded.ok()) {
            return core::Result<std::string>::error("parameter '" + param.first + "': " + encoded.error());
        }
        parameters.AddMember(rapidjson::Value(param.first.c_str(), allocator).Move(), value, allocator);
    }
    doc.AddMember("parameters", parameters, allocator);

    rapidjson::Value result;
    auto encoded = ResultToJson(entry.result, &result, allocator);
    if (!encoded.ok()) {
        return core::Result<std::string>::error(encoded.error());
    }
    doc.AddMember("result", result, allocator);
    doc.AddMember("created_at", static_cast<int64_t>(entry.created_at_ms), allocator);

    return core::Result<std::string>(Write<rapidjson::Writer<rapidjson::StringBuffer>>(doc));
}

core::Result<CacheEntry> DecodeEntry(const std::string& text) {
    rapidjson::Document doc;
    doc.Parse(text.c_str(), text.size());
    if (doc.HasParseError()) {
        return core::Result<CacheEntry>::error(std::string("invalid JSON at offset ") +
                                               std::to_string(doc.GetErrorOffset()) + ": " +
                                               rapidjson::GetParseError_En(doc.GetParseError()));
    }
    if (!doc.IsObject()) {
        return core::Result<CacheEntry>::error("entry is not an object");
    }

    auto fingerprint = doc.FindMember("fingerprint");
    auto metric_name = doc.FindMember("metric_name");
    auto parameters = doc.FindMember("parameters");
    auto result = doc.FindMember("result");
    auto created_at = doc.FindMember("created_at");
    if (fingerprint == doc.MemberEnd() || !fingerprint->value.IsString()) {
        return core::Result<CacheEntry>::error("entry has no fingerprint");
    }
    if (metric_name == doc.MemberEnd() || !metric_name->value.IsString()) {
        return core::Result<CacheEntry>::error("entry has no metric_name");
    }
    if (parameters == doc.MemberEnd() || !parameters->value.IsObject()) {
        return core::Result<CacheEntry>::error("entry has no parameters");
    }
    if (result == doc.MemberEnd()) {
        return core::Result<CacheEntry>::error("entry has no result");
    }
    if (created_at == doc.MemberEnd() || !created_at->value.IsInt64()) {
        return core::Result<CacheEntry>::error("entry has no created_at");
    }

    CacheEntry entry;
    entry.fingerprint = fingerprint->value.GetString();
    entry.metric_name = metric_name->value.GetString();
    entry.created_at_ms = created_at->value.GetInt64();

    for (const auto& member : parameters->value.GetObject()) {
        auto value = ValueFromJson(member.value);
        if (!value.ok()) {
            return core::Result<CacheEntry>::error(value.error());
        }
        entry.parameters[member.name.GetString()] = value.take_value();
    }

    auto decoded = ResultFromJson(result->value);
    if (!decoded.ok()) {
        return core::Result<CacheEntry>::error("result: " + decoded.error());
    }
    entry.result = decoded.take_value();
    return core::Result<CacheEntry>(std::move(entry));
}

core::Result<std::string> EncodeResult(const model::MetricResult& result, bool pretty) {
    rapidjson::Document doc;
    auto encoded = ResultToJson(result, &doc, doc.GetAllocator());
    if (!encoded.ok()) {
        return core::Result<std::string>::error(encoded.error());
    }
    if (pretty) {
        return core::Result<std::string>(Write<rapidjson::PrettyWriter<rapidjson::StringBuffer>>(doc));
    }
    return core::Result<std::string>(Write<rapidjson::Writer<rapidjson::StringBuffer>>(doc));
}

} // namespace cache
} // namespace f1metrics
