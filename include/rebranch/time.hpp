#pragma once
#include "rebranch/config.hpp"

#include <ctime>
#include <string>

namespace rebranch::timeutil {

// Minutes east of UTC (e.g. +180 = +0300) for the local timezone at `t`.
auto local_utc_offset_minutes(std::time_t time) -> int;

// ±HHMM from minutes (+180 -> "+0300", -420 -> "-0700")
auto tz_offset_string(int minutes) -> std::string;

// "Name <email> 1714412345 +0300"
auto make_signature(const Identity& identity, std::time_t when, int tz_minutes) -> std::string;

// make_signature for the current time in the local timezone
auto signature_now(const Identity& identity) -> std::string;

} // namespace rebranch::timeutil
