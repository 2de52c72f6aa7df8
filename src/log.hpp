#pragma once
#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>

namespace ssmpatch {

struct LogField {
    std::string key;
    std::string value;
};

LogField str_field(const std::string& key, const std::string& value);
LogField int_field(const std::string& key, int64_t value);

// Accepts spdlog names ("warn", "err") and the CLI names
// (DEBUG, INFO, WARNING, ERROR, CRITICAL), case-insensitive.
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& name);

// Install the stderr logger. Unknown level names fall back to info.
void init_logging(const std::string& level);

void log(spdlog::level::level_enum level, const std::string& message,
         std::initializer_list<LogField> fields = {});

inline void log_debug(const std::string& message, std::initializer_list<LogField> fields = {}) {
    log(spdlog::level::debug, message, fields);
}

inline void log_info(const std::string& message, std::initializer_list<LogField> fields = {}) {
    log(spdlog::level::info, message, fields);
}

inline void log_warn(const std::string& message, std::initializer_list<LogField> fields = {}) {
    log(spdlog::level::warn, message, fields);
}

inline void log_error(const std::string& message, std::initializer_list<LogField> fields = {}) {
    log(spdlog::level::err, message, fields);
}

} // namespace ssmpatch
