#include "radlink/utils/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <algorithm>
#include <array>
#include <cctype>
#include <string_view>

namespace radlink::utils {

namespace {

constexpr const char* LOGGER_NAME = "radlink";
constexpr const char* DEFAULT_PATTERN = "[%H:%M:%S.%e] [radlink] [%^%l%$] %v";

struct LevelName {
    LogLevel level;
    std::string_view name;
    spdlog::level::level_enum spd;
};

constexpr std::array<LevelName, 7> LEVELS = {{
    {LogLevel::TRACE, "trace", spdlog::level::trace},
    {LogLevel::DEBUG, "debug", spdlog::level::debug},
    {LogLevel::INFO, "info", spdlog::level::info},
    {LogLevel::WARN, "warn", spdlog::level::warn},
    {LogLevel::ERROR, "error", spdlog::level::err},
    {LogLevel::CRITICAL, "critical", spdlog::level::critical},
    {LogLevel::OFF, "off", spdlog::level::off},
}};

const LevelName& entry_for(LogLevel level) {
    for (const auto& entry : LEVELS) {
        if (entry.level == level) {
            return entry;
        }
    }
    return LEVELS[2];
}

}  // namespace

void init_logging(LogLevel level, const std::string& pattern) {
    auto logger = spdlog::get(LOGGER_NAME);
    if (!logger) {
        logger = spdlog::stdout_color_mt(LOGGER_NAME);
    }
    spdlog::set_default_logger(logger);
    spdlog::set_level(entry_for(level).spd);
    spdlog::set_pattern(pattern.empty() ? DEFAULT_PATTERN : pattern);
}

const char* log_level_to_string(LogLevel level) {
    return entry_for(level).name.data();
}

LogLevel string_to_log_level(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lower == "warning") return LogLevel::WARN;
    if (lower == "err") return LogLevel::ERROR;
    if (lower == "fatal") return LogLevel::CRITICAL;
    if (lower == "none") return LogLevel::OFF;
    for (const auto& entry : LEVELS) {
        if (entry.name == lower) {
            return entry.level;
        }
    }
    return LogLevel::INFO;
}

}  // namespace radlink::utils
