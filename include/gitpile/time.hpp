#pragma once
#include <ctime>
#include <string>

namespace gitpile::timeutil {

// Minutes east of UTC (e.g., +180 = +0300). Uses the local timezone at `t`.
auto local_utc_offset_minutes(std::time_t time) -> int;

// Format ±HHMM from minutes (e.g., +180 -> "+0300", -420 -> "-0700")
auto tz_offset_string(int minutes) -> std::string;

// "Mon, 19 Oct 2026 14:03:11 +0300" as used in mail Date: headers
auto rfc2822_date(std::time_t when, int tz_minutes) -> std::string;

} // namespace gitpile::timeutil
