#include "f1metrics/common/logger.h"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <iostream>

namespace f1metrics {
namespace common {

void Logger::Init() {
    try {
        // Logs go to stderr so that command output on stdout stays machine readable
        auto console = spdlog::stderr_color_mt("console");
        spdlog::set_default_logger(console);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [thread %t] %v");
        spdlog::set_level(spdlog::level::info);
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
    }
}

void Logger::SetLevel(spdlog::level::level_enum level) {
    spdlog::set_level(level);
}

bool Logger::SetLevel(const std::string& level) {
    if (level == "trace") SetLevel(spdlog::level::trace);
    else if (level == "debug") SetLevel(spdlog::level::debug);
    else if (level == "info") SetLevel(spdlog::level::info);
    else if (level == "warn") SetLevel(spdlog::level::warn);
    else if (level == "error") SetLevel(spdlog::level::err);
    else if (level == "off") SetLevel(spdlog::level::off);
    else return false;
    return true;
}

} // namespace common
} // namespace f1metrics
