#include "log.hpp"
#include "util.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <sstream>

namespace ssmpatch {

namespace {

constexpr const char* kLoggerName = "ssmpatch";
constexpr const char* kPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

std::string serialize_fields(std::initializer_list<LogField> fields) {
    std::ostringstream out;
    bool first = true;
    for (const auto& f : fields) {
        if (!first) out << ' ';
        first = false;
        out << f.key << '=' << f.value;
    }
    return out.str();
}

} // namespace

LogField str_field(const std::string& key, const std::string& value) {
    return {key, value};
}

LogField int_field(const std::string& key, int64_t value) {
    return {key, std::to_string(value)};
}

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& name) {
    std::string n = to_lower(trim(name));
    if (n == "debug") return spdlog::level::debug;
    if (n == "info") return spdlog::level::info;
    if (n == "warning" || n == "warn") return spdlog::level::warn;
    if (n == "error" || n == "err") return spdlog::level::err;
    if (n == "critical") return spdlog::level::critical;
    if (n == "trace") return spdlog::level::trace;
    if (n == "off") return spdlog::level::off;
    return std::nullopt;
}

void init_logging(const std::string& level) {
    auto logger = spdlog::get(kLoggerName);
    if (!logger) {
        logger = spdlog::stderr_color_mt(kLoggerName);
    }
    logger->set_pattern(kPattern);
    logger->set_level(parse_log_level(level).value_or(spdlog::level::info));
    spdlog::set_default_logger(logger);
    spdlog::flush_on(spdlog::level::warn);
}

void log(spdlog::level::level_enum level, const std::string& message,
         std::initializer_list<LogField> fields) {
    auto serialized = serialize_fields(fields);
    if (serialized.empty()) {
        spdlog::log(level, "{}", message);
        return;
    }
    spdlog::log(level, "{} {}", message, serialized);
}

} // namespace ssmpatch
