#pragma once

#include <spdlog/spdlog.h>
#include <string>

namespace radlink::utils {

enum class LogLevel {
    TRACE,
    DEBUG,
    INFO,
    WARN,
    ERROR,
    CRITICAL,
    OFF
};

// Install the colour console logger "radlink" as the spdlog default. Calling
// it again only changes the level and pattern.
void init_logging(LogLevel level = LogLevel::INFO, const std::string& pattern = "");

// Name used in the [logging] config section
const char* log_level_to_string(LogLevel level);

// Case-insensitive; unknown names map to INFO
LogLevel string_to_log_level(const std::string& str);

}  // namespace radlink::utils
