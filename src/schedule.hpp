#pragma once
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace ssmpatch {

enum class Weekday { Monday = 0, Tuesday, Wednesday, Thursday, Friday, Saturday, Sunday };

constexpr int kMinWeek = 1;
constexpr int kMaxWeek = 5;
constexpr int kMinHour = 0;
constexpr int kMaxHour = 23;

const char* weekday_to_string(Weekday day);

// Three-letter uppercase name ("TUE"), as used in cron day-of-week fields
const char* weekday_abbrev(Weekday day);

// Accepts full or three-letter names, any case ("Tue", "tuesday", "TUE")
std::optional<Weekday> parse_weekday(const std::string& name);

// One concrete schedule: the Nth `weekday` of each month at `hour`, in
// `timezone` (nullopt = the remote scheduler's default zone).
// Values are validated on construction and never change afterwards.
class RecurrenceSpec {
public:
    RecurrenceSpec(int week, Weekday weekday, int hour,
                   std::optional<std::string> timezone = std::nullopt);

    int week() const { return week_; }
    Weekday weekday() const { return weekday_; }
    int hour() const { return hour_; }
    const std::optional<std::string>& timezone() const { return timezone_; }

    bool operator==(const RecurrenceSpec& other) const;
    bool operator!=(const RecurrenceSpec& other) const { return !(*this == other); }
    bool operator<(const RecurrenceSpec& other) const;

private:
    int week_;
    Weekday weekday_;
    int hour_;
    std::optional<std::string> timezone_;
};

// Raw user input; the lists may contain duplicates.
struct ScheduleExpansionRequest {
    std::vector<int> weeks;
    std::vector<Weekday> weekdays;
    std::vector<int> hours;
    std::optional<std::string> timezone;
};

// Cross product weeks x weekdays x hours, one RecurrenceSpec per combination.
// Every recurrence for week k precedes every recurrence for week k+1. Order of
// (weekday, hour) pairs within a week is unspecified.
// Throws ConfigurationError on an empty set or an out-of-range week/hour.
std::vector<RecurrenceSpec> expand(const std::set<int>& weeks,
                                   const std::set<Weekday>& weekdays,
                                   const std::set<int>& hours,
                                   const std::optional<std::string>& timezone);

std::vector<RecurrenceSpec> expand(const ScheduleExpansionRequest& request);

} // namespace ssmpatch
