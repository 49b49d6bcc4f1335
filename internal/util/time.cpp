#include "time.hpp"

#include <charconv>

namespace kinship::util {

namespace {

bool ParseField(std::string_view text, int& out) {
  if (text.empty()) return false;
  const auto* begin  = text.data();
  const auto* end    = text.data() + text.size();
  auto [ptr, ec]     = std::from_chars(begin, end, out);
  return ec == std::errc() && ptr == end;
}

} // namespace

TimePoint Now() {
  return Clock::now();
}

Date Today() {
  return Date{std::chrono::floor<std::chrono::days>(Now())};
}

std::optional<Date> ParseIsoDate(std::string_view text) {
  if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
    return std::nullopt;
  }

  int year  = 0;
  int month = 0;
  int day   = 0;
  if (!ParseField(text.substr(0, 4), year) || !ParseField(text.substr(5, 2), month) || !ParseField(text.substr(8, 2), day)) {
    return std::nullopt;
  }

  Date date{std::chrono::year{year}, std::chrono::month{static_cast<unsigned>(month)}, std::chrono::day{static_cast<unsigned>(day)}};
  if (!date.ok()) {
    return std::nullopt;
  }
  return date;
}

int YearsBetween(const Date& from, const Date& to) {
  int years = static_cast<int>(to.year()) - static_cast<int>(from.year());
  if (to.month() < from.month() || (to.month() == from.month() && to.day() < from.day())) {
    --years;
  }
  return years;
}

} // namespace kinship::util
