#include "config.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "ownership.hpp"
#include "util.hpp"

#include <cstdint>
#include <cstdlib>
#include <limits>
#include <fstream>

namespace ssmpatch {

nlohmann::json Config::defaults_json() {
    return {
        {"region", ""},
        {"profile", "default"},
        {"endpoint", ""},
        {"log_level", "info"},
        {"max_workers", 4},
        {"request_timeout", 30},
        {"window", {
            {"name_prefix", "patching"},
            {"duration_hours", 3},
            {"cutoff_hours", 1},
            {"allow_unassociated_targets", false}
        }},
        {"task", {
            {"action", "AWS-RunPatchBaseline"},
            {"operation", "Install"},
            {"max_concurrency", "50%"},
            {"max_errors", "25%"},
            {"priority", 1}
        }}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                     const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

// Saturates instead of wrapping so validate() sees the out-of-range value
template <typename T>
static T clamped_integer(const nlohmann::json& value) {
    int64_t n = value.get<int64_t>();
    if (value.is_number_unsigned() && value.get<uint64_t>() > INT64_MAX) n = INT64_MAX;
    if (n < static_cast<int64_t>(std::numeric_limits<T>::min()))
        return std::numeric_limits<T>::min();
    if (n > static_cast<int64_t>(std::numeric_limits<T>::max()))
        return std::numeric_limits<T>::max();
    return static_cast<T>(n);
}

std::string config_path() {
    if (auto p = env_value("SSMPATCH_CONFIG")) return expand_home(*p);
    return expand_home("~/.ssmpatch/config.json");
}

Config Config::load() {
    nlohmann::json j = nlohmann::json::object();

    std::string path = config_path();
    std::ifstream file(path);
    if (file.is_open()) {
        try {
            j = nlohmann::json::parse(file);
            if (!j.is_object()) {
                log_warn("config file is not a JSON object, using defaults",
                         {str_field("path", path)});
                j = nlohmann::json::object();
            }
        } catch (const nlohmann::json::parse_error& e) {
            log_warn("malformed config file, using defaults",
                     {str_field("path", path), str_field("error", e.what())});
            j = nlohmann::json::object();
        }
    }
    return from_json(j);
}

Config Config::from_json(const nlohmann::json& doc) {
    Config cfg;
    nlohmann::json j = merge_defaults(doc.is_object() ? doc : nlohmann::json::object(),
                                      defaults_json());

    if (j["region"].is_string())
        cfg.region = j["region"].get<std::string>();
    if (j["profile"].is_string() && !j["profile"].get<std::string>().empty())
        cfg.profile = j["profile"].get<std::string>();
    if (j["endpoint"].is_string())
        cfg.endpoint = j["endpoint"].get<std::string>();
    if (j["log_level"].is_string())
        cfg.log_level = j["log_level"].get<std::string>();
    if (j["max_workers"].is_number_integer())
        cfg.max_workers = clamped_integer<uint32_t>(j["max_workers"]);
    if (j["request_timeout"].is_number_integer())
        cfg.request_timeout = clamped_integer<long>(j["request_timeout"]);

    if (j["window"].is_object()) {
        auto& w = j["window"];
        if (w.contains("name_prefix") && w["name_prefix"].is_string())
            cfg.window.name_prefix = w["name_prefix"].get<std::string>();
        if (w.contains("duration_hours") && w["duration_hours"].is_number_integer())
            cfg.window.duration_hours = clamped_integer<int>(w["duration_hours"]);
        if (w.contains("cutoff_hours") && w["cutoff_hours"].is_number_integer())
            cfg.window.cutoff_hours = clamped_integer<int>(w["cutoff_hours"]);
        if (w.contains("allow_unassociated_targets") && w["allow_unassociated_targets"].is_boolean())
            cfg.window.allow_unassociated_targets = w["allow_unassociated_targets"].get<bool>();
    }

    if (j["task"].is_object()) {
        auto& t = j["task"];
        if (t.contains("action") && t["action"].is_string())
            cfg.task.action = t["action"].get<std::string>();
        if (t.contains("operation") && t["operation"].is_string())
            cfg.task.operation = t["operation"].get<std::string>();
        if (t.contains("max_concurrency") && t["max_concurrency"].is_string())
            cfg.task.max_concurrency = t["max_concurrency"].get<std::string>();
        if (t.contains("max_errors") && t["max_errors"].is_string())
            cfg.task.max_errors = t["max_errors"].get<std::string>();
        if (t.contains("priority") && t["priority"].is_number_integer())
            cfg.task.priority = clamped_integer<int>(t["priority"]);
    }

    // Environment variables always override config file
    if (auto v = env_value("AWS_PROFILE"))
        cfg.profile = *v;
    if (auto v = env_value("SSMPATCH_ENDPOINT"))
        cfg.endpoint = *v;
    if (auto v = env_value("SSMPATCH_LOG_LEVEL"))
        cfg.log_level = *v;
    if (auto v = env_value("SSMPATCH_MAX_WORKERS")) {
        char* end = nullptr;
        unsigned long n = std::strtoul(v->c_str(), &end, 10);
        if (end && *end == '\0')
            cfg.max_workers = static_cast<uint32_t>(n);
    }

    return cfg;
}

void Config::validate() const {
    if (window.duration_hours < 1 || window.duration_hours > 24) {
        throw ConfigurationError("window.duration_hours must be 1-24, got " +
                                 std::to_string(window.duration_hours));
    }
    if (window.cutoff_hours < 0 || window.cutoff_hours >= window.duration_hours) {
        throw ConfigurationError("window.cutoff_hours must be >= 0 and less than "
                                 "window.duration_hours, got " +
                                 std::to_string(window.cutoff_hours));
    }
    if (task.priority < 0) {
        throw ConfigurationError("task.priority must be >= 0, got " +
                                 std::to_string(task.priority));
    }
    if (window.name_prefix.empty()) {
        throw ConfigurationError("window.name_prefix must not be empty");
    }
    // Anything else would make the created windows look foreign to cleanup
    if (!is_patching_action(task.action)) {
        throw ConfigurationError("task.action must be " + std::string(kRunPatchBaselineAction) +
                                 " or " + kApplyPatchBaselineAction + ", got '" +
                                 task.action + "'");
    }
    validate_connection();
}

void Config::validate_connection() const {
    if (max_workers < 1) {
        throw ConfigurationError("max_workers must be at least 1");
    }
    // 0 would disable the HTTP timeout entirely
    if (request_timeout < 1) {
        throw ConfigurationError("request_timeout must be at least 1 second");
    }
}

} // namespace ssmpatch
