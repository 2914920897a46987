#ifndef F1METRICS_COMMON_LOGGER_H_
#define F1METRICS_COMMON_LOGGER_H_

#include <string>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/ostr.h>

namespace f1metrics {
namespace common {

class Logger {
public:
    static void Init();
    static void SetLevel(spdlog::level::level_enum level);
    // Accepts trace, debug, info, warn, error, off. Returns false for anything else.
    static bool SetLevel(const std::string& level);
};

} // namespace common
} // namespace f1metrics

// Macros for convenient logging
#define F1METRICS_TRACE(...) spdlog::trace(__VA_ARGS__)
#define F1METRICS_DEBUG(...) spdlog::debug(__VA_ARGS__)
#define F1METRICS_INFO(...)  spdlog::info(__VA_ARGS__)
#define F1METRICS_WARN(...)  spdlog::warn(__VA_ARGS__)
#define F1METRICS_ERROR(...) spdlog::error(__VA_ARGS__)
#define F1METRICS_CRITICAL(...) spdlog::critical(__VA_ARGS__)

#endif // F1METRICS_COMMON_LOGGER_H_
