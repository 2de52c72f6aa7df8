#include "schedule.hpp"
#include "errors.hpp"
#include "util.hpp"

namespace ssmpatch {

namespace {

struct WeekdayName {
    Weekday day;
    const char* full;
    const char* abbrev;
};

constexpr WeekdayName kWeekdays[] = {
    {Weekday::Monday, "Monday", "MON"},
    {Weekday::Tuesday, "Tuesday", "TUE"},
    {Weekday::Wednesday, "Wednesday", "WED"},
    {Weekday::Thursday, "Thursday", "THU"},
    {Weekday::Friday, "Friday", "FRI"},
    {Weekday::Saturday, "Saturday", "SAT"},
    {Weekday::Sunday, "Sunday", "SUN"},
};

void check_week(int week) {
    if (week < kMinWeek || week > kMaxWeek) {
        throw ConfigurationError("Week ordinal out of range (" + std::to_string(kMinWeek) +
                                 "-" + std::to_string(kMaxWeek) + "): " +
                                 std::to_string(week));
    }
}

void check_hour(int hour) {
    if (hour < kMinHour || hour > kMaxHour) {
        throw ConfigurationError("Hour out of range (" + std::to_string(kMinHour) + "-" +
                                 std::to_string(kMaxHour) + "): " + std::to_string(hour));
    }
}

} // namespace

const char* weekday_to_string(Weekday day) {
    return kWeekdays[static_cast<int>(day)].full;
}

const char* weekday_abbrev(Weekday day) {
    return kWeekdays[static_cast<int>(day)].abbrev;
}

std::optional<Weekday> parse_weekday(const std::string& name) {
    std::string n = to_lower(trim(name));
    if (n.empty()) return std::nullopt;
    for (const auto& w : kWeekdays) {
        if (n == to_lower(w.full) || n == to_lower(w.abbrev)) return w.day;
    }
    return std::nullopt;
}

// ── RecurrenceSpec ───────────────────────────────────────────────

RecurrenceSpec::RecurrenceSpec(int week, Weekday weekday, int hour,
                               std::optional<std::string> timezone)
    : week_(week), weekday_(weekday), hour_(hour), timezone_(std::move(timezone)) {
    check_week(week_);
    check_hour(hour_);
    int day = static_cast<int>(weekday_);
    if (day < 0 || day > 6) {
        throw ConfigurationError("Weekday out of range: " + std::to_string(day));
    }
    if (timezone_ && timezone_->empty()) timezone_.reset();
}

bool RecurrenceSpec::operator==(const RecurrenceSpec& other) const {
    return week_ == other.week_ && weekday_ == other.weekday_ &&
           hour_ == other.hour_ && timezone_ == other.timezone_;
}

bool RecurrenceSpec::operator<(const RecurrenceSpec& other) const {
    if (week_ != other.week_) return week_ < other.week_;
    if (weekday_ != other.weekday_) return weekday_ < other.weekday_;
    if (hour_ != other.hour_) return hour_ < other.hour_;
    return timezone_ < other.timezone_;
}

// ── Expansion ────────────────────────────────────────────────────

std::vector<RecurrenceSpec> expand(const std::set<int>& weeks,
                                   const std::set<Weekday>& weekdays,
                                   const std::set<int>& hours,
                                   const std::optional<std::string>& timezone) {
    if (weeks.empty()) throw ConfigurationError("No week ordinals given");
    if (weekdays.empty()) throw ConfigurationError("No weekdays given");
    if (hours.empty()) throw ConfigurationError("No hours given");

    // Validate everything up front so a bad value never yields a partial result
    for (int w : weeks) check_week(w);
    for (int h : hours) check_hour(h);

    std::vector<RecurrenceSpec> specs;
    specs.reserve(weeks.size() * weekdays.size() * hours.size());

    // std::set iterates ascending, so the outer loop gives the week grouping
    for (int week : weeks) {
        for (Weekday day : weekdays) {
            for (int hour : hours) {
                specs.emplace_back(week, day, hour, timezone);
            }
        }
    }
    return specs;
}

std::vector<RecurrenceSpec> expand(const ScheduleExpansionRequest& request) {
    std::set<int> weeks(request.weeks.begin(), request.weeks.end());
    std::set<Weekday> weekdays(request.weekdays.begin(), request.weekdays.end());
    std::set<int> hours(request.hours.begin(), request.hours.end());
    return expand(weeks, weekdays, hours, request.timezone);
}

} // namespace ssmpatch
