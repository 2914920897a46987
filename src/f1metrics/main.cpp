#include <cerrno>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include <rapidjson/document.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <spdlog/spdlog.h>

#include "f1metrics/cache/metric_cache.h"
#include "f1metrics/cache/value_json.h"
#include "f1metrics/common/logger.h"
#include "f1metrics/core/config.h"
#include "f1metrics/core/error.h"
#include "f1metrics/data/table_store.h"
#include "f1metrics/data/view_builder.h"
#include "f1metrics/metrics/metric_service.h"
#include "f1metrics/metrics/registry.h"

namespace {

using rapidjson::Document;
using rapidjson::Value;

bool ParseInt(const std::string& text, int64_t* out) {
    if (text.empty()) {
        return false;
    }
    errno = 0;
    char* end = nullptr;
    long long parsed = std::strtoll(text.c_str(), &end, 10);
    if (errno != 0 || end == nullptr || *end != '\0') {
        return false;
    }
    *out = static_cast<int64_t>(parsed);
    return true;
}

bool ParseIdList(const std::string& text, std::vector<int64_t>* out) {
    std::stringstream stream(text);
    std::string item;
    while (std::getline(stream, item, ',')) {
        int64_t id = 0;
        if (!ParseInt(item, &id)) {
            return false;
        }
        out->push_back(id);
    }
    return !out->empty();
}

void PrintUsage(const char* program) {
    std::cout << "Usage: " << program << " [OPTIONS] COMMAND [ARGS]" << std::endl;
    std::cout << "Commands:" << std::endl;
    std::cout << "  list                 List available metrics" << std::endl;
    std::cout << "  info METRIC          Describe a metric" << std::endl;
    std::cout << "  calc METRIC          Calculate one metric" << std::endl;
    std::cout << "  bulk METRIC...       Calculate several metrics" << std::endl;
    std::cout << "  cache-stats          Show metric cache statistics" << std::endl;
    std::cout << "  cache-clear [METRIC] Clear the metric cache, or one metric's entries" << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --dataset-dir DIR    Directory of CSV tables (default: dataset)" << std::endl;
    std::cout << "  --cache-dir DIR      Metric cache directory (default: cache)" << std::endl;
    std::cout << "  --min-year N         Earliest season considered (default: 2011)" << std::endl;
    std::cout << "  --cache-ttl SECONDS  Cache entry lifetime (default: 3600)" << std::endl;
    std::cout << "  --no-cache           Disable the metric cache" << std::endl;
    std::cout << "  --log-level LEVEL    Log level (trace, debug, info, warn, error, off)" << std::endl;
    std::cout << "  --driver ID          Driver id parameter" << std::endl;
    std::cout << "  --constructor ID     Constructor id parameter" << std::endl;
    std::cout << "  --season YEAR        Season parameter" << std::endl;
    std::cout << "  --races ID[,ID...]   Restrict to these race ids" << std::endl;
    std::cout << "  --help, -h           Show this help message" << std::endl;
}

void Print(const Value& json) {
    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
    json.Accept(writer);
    std::cout << buffer.GetString() << std::endl;
}

Value StringArray(const std::vector<std::string>& items, f1metrics::cache::JsonAllocator& allocator) {
    Value array(rapidjson::kArrayType);
    for (const auto& item : items) {
        array.PushBack(Value(item.c_str(), allocator), allocator);
    }
    return array;
}

Value ResultJson(const f1metrics::model::MetricResult& result, f1metrics::cache::JsonAllocator& allocator) {
    Value json;
    auto converted = f1metrics::cache::ResultToJson(result, &json, allocator);
    if (!converted.ok()) {
        throw f1metrics::core::InternalError("Cannot encode result of " + result.metric_name + ": " +
                                             converted.error());
    }
    return json;
}

int RunList(f1metrics::metrics::MetricService& service) {
    auto names = service.AvailableMetrics();
    Document doc(rapidjson::kObjectType);
    auto& allocator = doc.GetAllocator();
    doc.AddMember("driver_metrics", StringArray(names.driver_metrics, allocator), allocator);
    doc.AddMember("constructor_metrics", StringArray(names.constructor_metrics, allocator), allocator);
    Print(doc);
    return 0;
}

int RunInfo(f1metrics::metrics::MetricService& service, const std::string& name) {
    auto info = service.Describe(name);
    Document doc(rapidjson::kObjectType);
    auto& allocator = doc.GetAllocator();
    doc.AddMember("name", Value(info.name.c_str(), allocator), allocator);
    doc.AddMember("description", Value(info.description.c_str(), allocator), allocator);
    doc.AddMember("unit", Value(info.unit.c_str(), allocator), allocator);
    doc.AddMember("kind", Value(f1metrics::metrics::MetricKindName(info.kind).c_str(), allocator), allocator);
    doc.AddMember("required_tables", StringArray(info.required_tables, allocator), allocator);
    doc.AddMember("required_params", StringArray(info.required_params, allocator), allocator);
    Print(doc);
    return 0;
}

int RunCalc(f1metrics::metrics::MetricService& service, const std::string& name,
            const f1metrics::model::MetricParams& params) {
    auto result = service.Calculate(name, params);
    Document doc;
    Value json = ResultJson(result, doc.GetAllocator());
    Print(json);
    return 0;
}

int RunBulk(f1metrics::metrics::MetricService& service, const std::vector<std::string>& names,
            const f1metrics::model::MetricParams& params) {
    auto bulk = service.CalculateBulk(names, params);
    Document doc(rapidjson::kObjectType);
    auto& allocator = doc.GetAllocator();

    Value results(rapidjson::kArrayType);
    for (const auto& result : bulk.results) {
        results.PushBack(ResultJson(result, allocator), allocator);
    }
    Value errors(rapidjson::kArrayType);
    for (const auto& error : bulk.errors) {
        Value entry(rapidjson::kObjectType);
        entry.AddMember("metric_name", Value(error.metric_name.c_str(), allocator), allocator);
        entry.AddMember("message", Value(error.message.c_str(), allocator), allocator);
        errors.PushBack(entry, allocator);
    }
    doc.AddMember("results", results, allocator);
    doc.AddMember("errors", errors, allocator);
    Print(doc);
    return bulk.Succeeded() ? 0 : 1;
}

int RunCacheStats(f1metrics::metrics::MetricService& service) {
    auto stats = service.CacheStats();
    Document doc(rapidjson::kObjectType);
    auto& allocator = doc.GetAllocator();
    doc.AddMember("enabled", stats.enabled, allocator);
    doc.AddMember("ttl_seconds", static_cast<int64_t>(stats.ttl_seconds), allocator);
    doc.AddMember("total_entries", static_cast<uint64_t>(stats.total_entries), allocator);
    doc.AddMember("total_bytes", static_cast<uint64_t>(stats.total_bytes), allocator);
    doc.AddMember("expired_entries", static_cast<uint64_t>(stats.expired_entries), allocator);
    Print(doc);
    return 0;
}

int RunCacheClear(f1metrics::metrics::MetricService& service, const std::optional<std::string>& name) {
    size_t removed = service.ClearCache(name);
    Document doc(rapidjson::kObjectType);
    auto& allocator = doc.GetAllocator();
    doc.AddMember("removed", static_cast<uint64_t>(removed), allocator);
    if (name) {
        doc.AddMember("metric_name", Value(name->c_str(), allocator), allocator);
    }
    Print(doc);
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    f1metrics::common::Logger::Init();

    f1metrics::core::Config config = f1metrics::core::Config::Default();
    f1metrics::model::MetricParams params;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        int64_t number = 0;
        if (arg == "--dataset-dir" && i + 1 < argc) {
            config.data.dataset_dir = argv[++i];
        } else if (arg == "--cache-dir" && i + 1 < argc) {
            config.cache.cache_dir = argv[++i];
        } else if (arg == "--min-year" && i + 1 < argc) {
            if (!ParseInt(argv[++i], &number)) {
                std::cerr << "Invalid --min-year: " << argv[i] << std::endl;
                return 1;
            }
            config.data.min_year = number;
        } else if (arg == "--cache-ttl" && i + 1 < argc) {
            if (!ParseInt(argv[++i], &number)) {
                std::cerr << "Invalid --cache-ttl: " << argv[i] << std::endl;
                return 1;
            }
            config.cache.ttl_seconds = number;
        } else if (arg == "--no-cache") {
            config.cache.enabled = false;
        } else if (arg == "--log-level" && i + 1 < argc) {
            config.log_level = argv[++i];
        } else if (arg == "--driver" && i + 1 < argc) {
            if (!ParseInt(argv[++i], &number)) {
                std::cerr << "Invalid --driver: " << argv[i] << std::endl;
                return 1;
            }
            params.driver_id = number;
        } else if (arg == "--constructor" && i + 1 < argc) {
            if (!ParseInt(argv[++i], &number)) {
                std::cerr << "Invalid --constructor: " << argv[i] << std::endl;
                return 1;
            }
            params.constructor_id = number;
        } else if (arg == "--season" && i + 1 < argc) {
            if (!ParseInt(argv[++i], &number)) {
                std::cerr << "Invalid --season: " << argv[i] << std::endl;
                return 1;
            }
            params.season = number;
        } else if (arg == "--races" && i + 1 < argc) {
            std::vector<int64_t> ids;
            if (!ParseIdList(argv[++i], &ids)) {
                std::cerr << "Invalid --races: " << argv[i] << std::endl;
                return 1;
            }
            params.race_ids = ids;
        } else if (arg == "--help" || arg == "-h") {
            PrintUsage(argv[0]);
            return 0;
        } else if (arg.size() > 1 && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << std::endl;
            std::cerr << "Use --help for usage information" << std::endl;
            return 1;
        } else {
            positional.push_back(arg);
        }
    }

    auto valid = config.Validate();
    if (!valid.ok()) {
        std::cerr << "Invalid configuration: " << valid.error() << std::endl;
        return 1;
    }
    f1metrics::common::Logger::SetLevel(config.log_level);

    if (positional.empty()) {
        PrintUsage(argv[0]);
        return 1;
    }
    const std::string command = positional.front();
    std::vector<std::string> args(positional.begin() + 1, positional.end());

    try {
        f1metrics::data::TableStore store(config.data.dataset_dir);
        f1metrics::data::ViewBuilder views(store, config.data);
        f1metrics::cache::MetricCache cache(config.cache);
        f1metrics::metrics::MetricRegistry registry;
        f1metrics::metrics::RegisterBuiltinMetrics(registry);
        f1metrics::metrics::MetricService service(registry, store, views, cache);

        if (command == "list" && args.empty()) {
            return RunList(service);
        } else if (command == "info" && args.size() == 1) {
            return RunInfo(service, args[0]);
        } else if (command == "calc" && args.size() == 1) {
            return RunCalc(service, args[0], params);
        } else if (command == "bulk" && !args.empty()) {
            return RunBulk(service, args, params);
        } else if (command == "cache-stats" && args.empty()) {
            return RunCacheStats(service);
        } else if (command == "cache-clear" && args.size() <= 1) {
            std::optional<std::string> name;
            if (!args.empty()) {
                name = args[0];
            }
            return RunCacheClear(service, name);
        }
        std::cerr << "Invalid command: " << command << std::endl;
        std::cerr << "Use --help for usage information" << std::endl;
        return 1;
    } catch (const f1metrics::core::Error& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
