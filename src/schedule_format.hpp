#pragma once
#include "schedule.hpp"
#include <string>

namespace ssmpatch {

// SSM maintenance window schedule: "cron(0 3 ? * TUE#1 *)".
// Day-of-month is '?' and day-of-week is DDD#N so the remote evaluator picks
// the Nth such weekday of every month.
std::string schedule_expression(const RecurrenceSpec& spec);

// "<prefix>-week1-tue-0300"
std::string window_name(const std::string& prefix, const RecurrenceSpec& spec);

std::string window_description(const RecurrenceSpec& spec);

} // namespace ssmpatch
