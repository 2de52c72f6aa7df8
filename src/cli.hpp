#pragma once
#include "schedule.hpp"
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace ssmpatch {

constexpr int kExitOk = 0;
constexpr int kExitResourceFailures = 1;
constexpr int kExitConfigError = 2;
constexpr int kExitAuthError = 10;

struct SetupOptions {
    std::vector<int> weeks = {1, 2};
    std::vector<Weekday> weekdays = {Weekday::Tuesday, Weekday::Wednesday};
    std::vector<int> hours = {3, 4};
    std::optional<std::string> timezone;
    std::optional<std::string> region;
    std::string baseline_file = "baseline.json";
    std::optional<std::string> log_level;
    bool help = false;

    ScheduleExpansionRequest expansion_request() const;
};

struct CleanupOptions {
    std::optional<std::string> region;
    std::optional<std::string> log_level;
    bool help = false;
};

// "1,2" or "1 2" -> {1, 2}. Throws ConfigurationError on non-integers.
std::vector<int> parse_int_list(const std::string& text, const std::string& what);

// "Tue,Wed" -> {Tuesday, Wednesday}. Throws ConfigurationError on unknown names.
std::vector<Weekday> parse_weekday_list(const std::string& text);

// Repeating a list option appends to it; the first occurrence replaces the
// default. Unknown options and missing values throw ConfigurationError.
SetupOptions parse_setup_args(int argc, const char* const argv[]);
CleanupOptions parse_cleanup_args(int argc, const char* const argv[]);

void print_setup_usage(std::ostream& out);
void print_cleanup_usage(std::ostream& out);

} // namespace ssmpatch
