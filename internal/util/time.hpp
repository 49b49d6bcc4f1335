#pragma once

#include <chrono>
#include <optional>
#include <string_view>

namespace kinship::util {

/*
  Time utilities. Single place to control the clock source.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using Date      = std::chrono::year_month_day;

TimePoint Now();

// Current calendar date in UTC.
Date Today();

// Accepts "YYYY-MM-DD"; anything else, including impossible dates, yields nullopt.
std::optional<Date> ParseIsoDate(std::string_view text);

// Completed years from `from` to `to`; negative when `to` precedes `from`.
int YearsBetween(const Date& from, const Date& to);

} // namespace kinship::util
