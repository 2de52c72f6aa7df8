#include "cli.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "util.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>

namespace ssmpatch {

namespace {

std::vector<std::string> list_items(const std::string& text) {
    std::string normalized = text;
    for (char& c : normalized) {
        if (c == ',' || c == '\t') c = ' ';
    }
    std::vector<std::string> items;
    for (const auto& part : split(normalized, ' ')) {
        std::string t = trim(part);
        if (!t.empty()) items.push_back(t);
    }
    return items;
}

bool is_flag(const char* arg, const char* short_name, const char* long_name) {
    return (short_name && std::strcmp(arg, short_name) == 0) ||
           std::strcmp(arg, long_name) == 0;
}

std::string take_value(int argc, const char* const argv[], int& i) {
    if (i + 1 >= argc) {
        throw ConfigurationError(std::string("Missing value for ") + argv[i]);
    }
    return argv[++i];
}

std::string checked_log_level(const std::string& level) {
    if (!parse_log_level(level)) {
        throw ConfigurationError("Invalid log level '" + level +
                                 "' (expected DEBUG, INFO, WARNING, ERROR or CRITICAL)");
    }
    return level;
}

template <typename T>
void append_list(std::vector<T>& target, bool& given, const std::vector<T>& items) {
    if (!given) {
        target.clear();
        given = true;
    }
    target.insert(target.end(), items.begin(), items.end());
}

} // namespace

ScheduleExpansionRequest SetupOptions::expansion_request() const {
    return {weeks, weekdays, hours, timezone};
}

std::vector<int> parse_int_list(const std::string& text, const std::string& what) {
    std::vector<int> values;
    for (const auto& item : list_items(text)) {
        errno = 0;
        char* end = nullptr;
        long v = std::strtol(item.c_str(), &end, 10);
        if (errno != 0 || end == item.c_str() || *end != '\0' || v < -1000 || v > 1000) {
            throw ConfigurationError("Invalid " + what + " value: '" + item + "'");
        }
        values.push_back(static_cast<int>(v));
    }
    return values;
}

std::vector<Weekday> parse_weekday_list(const std::string& text) {
    std::vector<Weekday> days;
    for (const auto& item : list_items(text)) {
        auto day = parse_weekday(item);
        if (!day) throw ConfigurationError("Invalid weekday: '" + item + "'");
        days.push_back(*day);
    }
    return days;
}

SetupOptions parse_setup_args(int argc, const char* const argv[]) {
    SetupOptions opts;
    bool weeks_given = false;
    bool days_given = false;
    bool hours_given = false;

    for (int i = 1; i < argc; i++) {
        const char* arg = argv[i];
        if (is_flag(arg, "-h", "--help")) {
            opts.help = true;
        } else if (is_flag(arg, "-w", "--weeks")) {
            append_list(opts.weeks, weeks_given, parse_int_list(take_value(argc, argv, i), "week"));
        } else if (is_flag(arg, "-d", "--days")) {
            append_list(opts.weekdays, days_given, parse_weekday_list(take_value(argc, argv, i)));
        } else if (is_flag(arg, "-H", "--hours")) {
            append_list(opts.hours, hours_given, parse_int_list(take_value(argc, argv, i), "hour"));
        } else if (is_flag(arg, "-t", "--timezone")) {
            std::string tz = trim(take_value(argc, argv, i));
            if (tz.empty()) opts.timezone.reset();
            else opts.timezone = tz;
        } else if (is_flag(arg, "-r", "--region")) {
            opts.region = take_value(argc, argv, i);
        } else if (is_flag(arg, "-b", "--baseline-file")) {
            opts.baseline_file = take_value(argc, argv, i);
        } else if (is_flag(arg, "-l", "--loglevel")) {
            opts.log_level = checked_log_level(take_value(argc, argv, i));
        } else {
            throw ConfigurationError(std::string("Unknown option: ") + arg);
        }
    }
    return opts;
}

CleanupOptions parse_cleanup_args(int argc, const char* const argv[]) {
    CleanupOptions opts;
    for (int i = 1; i < argc; i++) {
        const char* arg = argv[i];
        if (is_flag(arg, "-h", "--help")) {
            opts.help = true;
        } else if (is_flag(arg, "-r", "--region")) {
            opts.region = take_value(argc, argv, i);
        } else if (is_flag(arg, "-l", "--loglevel")) {
            opts.log_level = checked_log_level(take_value(argc, argv, i));
        } else {
            throw ConfigurationError(std::string("Unknown option: ") + arg);
        }
    }
    return opts;
}

void print_setup_usage(std::ostream& out) {
    out << "Usage: ssm-patching-setup [options]\n"
        << "\n"
        << "Create SSM Patch Manager resources for simple automated patching.\n"
        << "\n"
        << "Options:\n"
        << "  -w, --weeks LIST         Week-of-month ordinals 1-5 (default: 1,2)\n"
        << "  -d, --days LIST          Weekdays, e.g. Tue,Wed (default: Tue,Wed)\n"
        << "  -H, --hours LIST         Hours of day 0-23 (default: 3,4)\n"
        << "  -t, --timezone TZ        IANA timezone (default: remote default)\n"
        << "  -r, --region REGION      AWS region override\n"
        << "  -b, --baseline-file PATH Patch baseline JSON (default: baseline.json)\n"
        << "  -l, --loglevel LEVEL     DEBUG, INFO, WARNING, ERROR, CRITICAL\n"
        << "  -h, --help               Show this help\n"
        << "\n"
        << "Environment variables:\n"
        << "  AWS_ACCESS_KEY_ID, AWS_SECRET_ACCESS_KEY, AWS_SESSION_TOKEN\n"
        << "  AWS_REGION, AWS_DEFAULT_REGION, AWS_PROFILE\n"
        << "  SSMPATCH_CONFIG        Config file (default: ~/.ssmpatch/config.json)\n"
        << "  SSMPATCH_ENDPOINT      SSM endpoint override\n"
        << "  SSMPATCH_LOG_LEVEL     Log level when --loglevel is not given\n"
        << "  SSMPATCH_MAX_WORKERS   Concurrent remote calls\n";
}

void print_cleanup_usage(std::ostream& out) {
    out << "Usage: ssm-patching-cleanup [options]\n"
        << "\n"
        << "Destroy SSM Patch Manager resources:\n"
        << "  - tasks running AWS-ApplyPatchBaseline or AWS-RunPatchBaseline\n"
        << "  - maintenance windows with no tasks or only such patching tasks\n"
        << "  - all patch baseline registrations for patch groups\n"
        << "  - all custom patch baselines\n"
        << "Windows carrying any other task are left untouched.\n"
        << "\n"
        << "Options:\n"
        << "  -r, --region REGION      AWS region override\n"
        << "  -l, --loglevel LEVEL     DEBUG, INFO, WARNING, ERROR, CRITICAL\n"
        << "  -h, --help               Show this help\n";
}

} // namespace ssmpatch
