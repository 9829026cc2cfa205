#pragma once
#include <ctime>
#include <string>

namespace gitstack::timeutil {

// Minutes east of UTC (e.g., +180 = +0300). Uses the local timezone at `t`.
auto local_utc_offset_minutes(std::time_t time) -> int;

// Format ±HHMM from minutes (e.g., +180 -> "+0300", -420 -> "-0700")
auto tz_offset_string(int minutes) -> std::string;

// "1714412345 +0300" for the given instant in the local timezone
auto make_timestamp(std::time_t when) -> std::string;

} // namespace gitstack::timeutil
