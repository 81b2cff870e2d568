#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace dtparse {

  bool
  is_leap_year(int32_t year);

  int
  days_in_month(int32_t year, int month);

  // Year of the system clock, UTC.
  int32_t
  current_year();

  // Expands a year below 100 into [current_year - 50, current_year + 49].
  int32_t
  expand_two_digit_year(int32_t year, int32_t current_year);

  // Fraction digits (1-9) to microseconds, truncating past six digits.
  int32_t
  fraction_to_microseconds(std::string_view digits);

  enum class offset_syntax {
    strict,  // +HH, +HHMM, +HH:MM
    lenient, // also +H
  };

  struct utc_offset {
    int32_t seconds;
    std::size_t consumed;
  };

  // Parses a signed offset at the start of str. Returns nullopt when str
  // does not start with an offset; throws parse_error when the shape
  // matches but hours or minutes are out of range.
  std::optional<utc_offset>
  parse_utc_offset(std::string_view str, offset_syntax syntax);

  int
  iso_weeks_in_year(int32_t year);

  // Gregorian date of an ISO week date (weekday 1 = Monday).
  std::chrono::year_month_day
  iso_week_date(int32_t year, int week, int weekday);

  // Gregorian date of day-of-year yday (1-based).
  std::chrono::year_month_day
  ordinal_date(int32_t year, int yday);

} // namespace dtparse
