#pragma once
#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace ssmpatch {

struct WindowConfig {
    std::string name_prefix = "patching";
    int duration_hours = 3;
    int cutoff_hours = 1;
    bool allow_unassociated_targets = false;
};

struct TaskConfig {
    std::string action = "AWS-RunPatchBaseline";
    std::string operation = "Install";
    std::string max_concurrency = "50%";
    std::string max_errors = "25%";
    int priority = 1;
};

struct Config {
    std::string region;          // empty = resolve from the AWS chain
    std::string profile = "default";
    std::string endpoint;        // empty = regional SSM endpoint
    std::string log_level = "info";
    uint32_t max_workers = 4;
    long request_timeout = 30;   // seconds

    WindowConfig window;
    TaskConfig task;

    // Load from ~/.ssmpatch/config.json (or SSMPATCH_CONFIG) + env vars
    static Config load();

    // Parse a config document merged over defaults_json(), then apply env vars
    static Config from_json(const nlohmann::json& j);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Throws ConfigurationError for out-of-range values
    void validate() const;

    // The subset cleanup depends on: worker count and request timeout
    void validate_connection() const;
};

std::string config_path();

} // namespace ssmpatch
