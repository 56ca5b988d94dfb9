#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace gitactivity {

using TimePoint = std::chrono::system_clock::time_point;

std::optional<TimePoint> parse_timestamp(std::string_view text);

std::string format_utc_date(TimePoint tp); // YYYY-MM-DD
std::string format_utc_time(TimePoint tp); // HH:MM:SS

// Raw git date form: "<epoch-seconds> +0000".
std::string format_git_date(TimePoint tp);

} // namespace gitactivity
