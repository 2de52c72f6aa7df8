#include "schedule_format.hpp"
#include "util.hpp"

#include <cstdio>

namespace ssmpatch {

namespace {

const char* ordinal_suffix(int n) {
    switch (n) {
        case 1: return "st";
        case 2: return "nd";
        case 3: return "rd";
        default: return "th";
    }
}

} // namespace

std::string schedule_expression(const RecurrenceSpec& spec) {
    return "cron(0 " + std::to_string(spec.hour()) + " ? * " +
           weekday_abbrev(spec.weekday()) + "#" + std::to_string(spec.week()) + " *)";
}

std::string window_name(const std::string& prefix, const RecurrenceSpec& spec) {
    char hhmm[8];
    std::snprintf(hhmm, sizeof(hhmm), "%02d00", spec.hour());
    return prefix + "-week" + std::to_string(spec.week()) + "-" +
           to_lower(weekday_abbrev(spec.weekday())) + "-" + hhmm;
}

std::string window_description(const RecurrenceSpec& spec) {
    char hhmm[8];
    std::snprintf(hhmm, sizeof(hhmm), "%02d:00", spec.hour());
    return std::string("Patching on the ") + std::to_string(spec.week()) +
           ordinal_suffix(spec.week()) + " " + weekday_to_string(spec.weekday()) +
           " of each month at " + hhmm + " (" +
           spec.timezone().value_or("default timezone") + ")";
}

} // namespace ssmpatch
