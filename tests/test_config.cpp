#include <catch2/catch_test_macros.hpp>
#include "config.hpp"
#include "errors.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits>
#include <unistd.h>
#include <nlohmann/json.hpp>

using namespace ssmpatch;

// Clears the env overrides, restores nothing: tests set what they need
static void clear_config_env() {
    unsetenv("AWS_PROFILE");
    unsetenv("SSMPATCH_ENDPOINT");
    unsetenv("SSMPATCH_LOG_LEVEL");
    unsetenv("SSMPATCH_MAX_WORKERS");
    unsetenv("SSMPATCH_CONFIG");
}

// ── Default values ───────────────────────────────────────────────

TEST_CASE("Config: default values", "[config]") {
    Config cfg;
    REQUIRE(cfg.region.empty());
    REQUIRE(cfg.profile == "default");
    REQUIRE(cfg.max_workers == 4);
    REQUIRE(cfg.request_timeout == 30);
    REQUIRE(cfg.window.name_prefix == "patching");
    REQUIRE(cfg.window.duration_hours == 3);
    REQUIRE(cfg.window.cutoff_hours == 1);
    REQUIRE(cfg.task.action == "AWS-RunPatchBaseline");
    REQUIRE(cfg.task.operation == "Install");
    REQUIRE_NOTHROW(cfg.validate());
}

TEST_CASE("Config::from_json: empty document gives defaults", "[config]") {
    clear_config_env();
    Config cfg = Config::from_json(nlohmann::json::object());
    REQUIRE(cfg.profile == "default");
    REQUIRE(cfg.window.duration_hours == 3);
    REQUIRE(cfg.task.max_concurrency == "50%");
    REQUIRE(cfg.task.max_errors == "25%");

    Config from_array = Config::from_json(nlohmann::json::array());
    REQUIRE(from_array.log_level == "info");
}

TEST_CASE("Config::from_json: values override defaults", "[config]") {
    clear_config_env();
    auto j = nlohmann::json::parse(R"({
        "region": "eu-west-1",
        "profile": "ops",
        "max_workers": 8,
        "request_timeout": 10,
        "window": { "name_prefix": "prod", "duration_hours": 5 },
        "task": { "action": "AWS-ApplyPatchBaseline", "operation": "Scan", "priority": 2 }
    })");

    Config cfg = Config::from_json(j);
    REQUIRE(cfg.region == "eu-west-1");
    REQUIRE(cfg.profile == "ops");
    REQUIRE(cfg.max_workers == 8);
    REQUIRE(cfg.request_timeout == 10);
    REQUIRE(cfg.window.name_prefix == "prod");
    REQUIRE(cfg.window.duration_hours == 5);
    REQUIRE(cfg.window.cutoff_hours == 1);
    REQUIRE(cfg.task.action == "AWS-ApplyPatchBaseline");
    REQUIRE(cfg.task.operation == "Scan");
    REQUIRE(cfg.task.priority == 2);
    REQUIRE(cfg.task.max_errors == "25%");
}

TEST_CASE("Config::from_json: wrong types keep defaults", "[config]") {
    clear_config_env();
    auto j = nlohmann::json::parse(R"({
        "max_workers": "many",
        "window": { "duration_hours": "three" },
        "task": { "priority": "high" }
    })");
    Config cfg = Config::from_json(j);
    REQUIRE(cfg.max_workers == 4);
    REQUIRE(cfg.window.duration_hours == 3);
    REQUIRE(cfg.task.priority == 1);
}

TEST_CASE("Config::from_json: environment overrides the document", "[config]") {
    clear_config_env();
    setenv("AWS_PROFILE", "env-profile", 1);
    setenv("SSMPATCH_ENDPOINT", "http://localhost:4566/", 1);
    setenv("SSMPATCH_LOG_LEVEL", "debug", 1);
    setenv("SSMPATCH_MAX_WORKERS", "2", 1);

    Config cfg = Config::from_json({{"profile", "file-profile"}, {"log_level", "error"}});
    REQUIRE(cfg.profile == "env-profile");
    REQUIRE(cfg.endpoint == "http://localhost:4566/");
    REQUIRE(cfg.log_level == "debug");
    REQUIRE(cfg.max_workers == 2);

    setenv("SSMPATCH_MAX_WORKERS", "lots", 1);
    REQUIRE(Config::from_json(nlohmann::json::object()).max_workers == 4);
    clear_config_env();
}

// ── Config::load ────────────────────────────────────────────────

static std::string make_temp_dir() {
    auto path = std::filesystem::temp_directory_path() / "ssmpatch_cfg_XXXXXX";
    std::string tmpl = path.string();
    char* result = mkdtemp(tmpl.data());
    return result ? std::string(result) : "";
}

TEST_CASE("Config::load: reads the file named by SSMPATCH_CONFIG", "[config]") {
    clear_config_env();
    std::string dir = make_temp_dir();
    REQUIRE_FALSE(dir.empty());
    std::string path = dir + "/config.json";
    {
        std::ofstream f(path);
        f << R"({"region": "ap-southeast-2", "window": {"cutoff_hours": 0}})";
    }
    setenv("SSMPATCH_CONFIG", path.c_str(), 1);

    REQUIRE(config_path() == path);
    Config cfg = Config::load();
    REQUIRE(cfg.region == "ap-southeast-2");
    REQUIRE(cfg.window.cutoff_hours == 0);

    unsetenv("SSMPATCH_CONFIG");
    std::filesystem::remove_all(dir);
}

TEST_CASE("Config::load: malformed or missing file falls back to defaults", "[config]") {
    clear_config_env();
    std::string dir = make_temp_dir();
    std::string path = dir + "/config.json";
    {
        std::ofstream f(path);
        f << "{ not json";
    }
    setenv("SSMPATCH_CONFIG", path.c_str(), 1);
    REQUIRE(Config::load().window.name_prefix == "patching");

    setenv("SSMPATCH_CONFIG", (dir + "/absent.json").c_str(), 1);
    REQUIRE(Config::load().profile == "default");
    REQUIRE_FALSE(std::filesystem::exists(dir + "/absent.json"));

    unsetenv("SSMPATCH_CONFIG");
    std::filesystem::remove_all(dir);
}

// ── validate ─────────────────────────────────────────────────────

TEST_CASE("Config::validate: rejects out-of-range values", "[config]") {
    Config cfg;
    cfg.window.duration_hours = 0;
    REQUIRE_THROWS_AS(cfg.validate(), ConfigurationError);

    cfg = Config{};
    cfg.window.duration_hours = 25;
    REQUIRE_THROWS_AS(cfg.validate(), ConfigurationError);

    cfg = Config{};
    cfg.window.cutoff_hours = 3;
    REQUIRE_THROWS_AS(cfg.validate(), ConfigurationError);

    cfg = Config{};
    cfg.window.name_prefix = "";
    REQUIRE_THROWS_AS(cfg.validate(), ConfigurationError);

    cfg = Config{};
    cfg.max_workers = 0;
    REQUIRE_THROWS_AS(cfg.validate(), ConfigurationError);

    cfg = Config{};
    cfg.request_timeout = 0;
    REQUIRE_THROWS_AS(cfg.validate(), ConfigurationError);
}

TEST_CASE("Config::validate: task action must be a patching document", "[config]") {
    Config cfg;
    cfg.task.action = "AWS-RunShellScript";
    REQUIRE_THROWS_AS(cfg.validate(), ConfigurationError);

    cfg.task.action = "AWS-ApplyPatchBaseline";
    REQUIRE_NOTHROW(cfg.validate());
}

TEST_CASE("Config::validate_connection: checks only workers and timeout", "[config]") {
    Config cfg;
    cfg.window.duration_hours = 0;
    cfg.task.action = "AWS-RunShellScript";
    REQUIRE_NOTHROW(cfg.validate_connection());

    cfg.request_timeout = 0;
    REQUIRE_THROWS_AS(cfg.validate_connection(), ConfigurationError);
    cfg.request_timeout = -5;
    REQUIRE_THROWS_AS(cfg.validate_connection(), ConfigurationError);

    cfg.request_timeout = 30;
    cfg.max_workers = 0;
    REQUIRE_THROWS_AS(cfg.validate_connection(), ConfigurationError);
}

TEST_CASE("Config::from_json: negative timeout is rejected by validation", "[config]") {
    clear_config_env();
    Config cfg = Config::from_json(nlohmann::json::parse(R"({"request_timeout": -1})"));
    REQUIRE(cfg.request_timeout == -1);
    REQUIRE_THROWS_AS(cfg.validate_connection(), ConfigurationError);
}

TEST_CASE("Config::from_json: oversized integers do not wrap into range", "[config]") {
    clear_config_env();
    // 2^32 + 3 would narrow to 3 hours; 2^32 + 1 would narrow to 1 worker
    auto j = nlohmann::json::parse(R"({
        "max_workers": 4294967297,
        "window": { "duration_hours": 4294967299, "cutoff_hours": -4294967295 },
        "task": { "priority": 9223372036854775807 }
    })");
    Config cfg = Config::from_json(j);

    REQUIRE(cfg.window.duration_hours == std::numeric_limits<int>::max());
    REQUIRE(cfg.window.cutoff_hours == std::numeric_limits<int>::min());
    REQUIRE(cfg.task.priority == std::numeric_limits<int>::max());
    REQUIRE(cfg.max_workers == std::numeric_limits<uint32_t>::max());
    REQUIRE_THROWS_AS(cfg.validate(), ConfigurationError);
}

TEST_CASE("Config::validate: negative task priority", "[config]") {
    Config cfg;
    cfg.task.priority = -1;
    REQUIRE_THROWS_AS(cfg.validate(), ConfigurationError);
    cfg.task.priority = 0;
    REQUIRE_NOTHROW(cfg.validate());
}
