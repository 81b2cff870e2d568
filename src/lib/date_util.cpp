#include <dtparse/date_util.hpp>

#include <dtparse/parse_error.hpp>

#include <string>

namespace dtparse {

  namespace {

    bool
    is_digit(char c) {
      return c >= '0' && c <= '9';
    }

    int
    digit_pair(std::string_view str, std::size_t pos) {
      return (str[pos] - '0') * 10 + (str[pos + 1] - '0');
    }

  } // namespace

  bool
  is_leap_year(int32_t year) {
    if (year < 0) { year = -(year + 1); }
    return (year % 4 == 0 && year % 100 != 0) || (year % 400 == 0);
  }

  int
  days_in_month(int32_t year, int month) {
    static constexpr int table[] = {0,  31, 28, 31, 30, 31, 30,
                                    31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12) {
      throw parse_error(parse_errc::ambiguous_or_invalid_numeric,
                        "month out of range: " + std::to_string(month));
    }
    if (month == 2 && is_leap_year(year)) { return 29; }
    return table[month];
  }

  int32_t
  current_year() {
    using namespace std::chrono;
    year_month_day today{floor<days>(system_clock::now())};
    return static_cast<int32_t>(static_cast<int>(today.year()));
  }

  int32_t
  expand_two_digit_year(int32_t year, int32_t current_year) {
    if (year < 0 || year >= 100) { return year; }
    int32_t result = year + current_year / 100 * 100;
    if (result >= current_year + 50) {
      result -= 100;
    } else if (result < current_year - 50) {
      result += 100;
    }
    return result;
  }

  int32_t
  fraction_to_microseconds(std::string_view digits) {
    if (digits.empty() || digits.size() > 9) {
      throw parse_error(parse_errc::ambiguous_or_invalid_numeric,
                        "fractional seconds must have 1 to 9 digits");
    }
    int32_t micros = 0;
    int count = 0;
    for (char c : digits) {
      if (!is_digit(c)) {
        throw parse_error(parse_errc::ambiguous_or_invalid_numeric,
                          "fractional seconds must be digits");
      }
      if (count < 6) {
        micros = micros * 10 + (c - '0');
        ++count;
      }
    }
    while (count < 6) {
      micros *= 10;
      ++count;
    }
    return micros;
  }

  std::optional<utc_offset>
  parse_utc_offset(std::string_view str, offset_syntax syntax) {
    if (str.empty() || (str[0] != '+' && str[0] != '-')) {
      return std::nullopt;
    }
    bool neg = str[0] == '-';

    std::size_t pos = 1;
    while (pos < str.size() && is_digit(str[pos])) {
      ++pos;
    }
    std::size_t ndigits = pos - 1;

    int hours = 0;
    int minutes = 0;
    if (ndigits == 4) {
      hours = digit_pair(str, 1);
      minutes = digit_pair(str, 3);
    } else if (ndigits == 2 ||
               (ndigits == 1 && syntax == offset_syntax::lenient)) {
      hours = ndigits == 2 ? digit_pair(str, 1) : str[1] - '0';
      // Optional ":MM"
      if (pos + 2 < str.size() && str[pos] == ':' && is_digit(str[pos + 1]) &&
          is_digit(str[pos + 2]) &&
          (pos + 3 == str.size() || !is_digit(str[pos + 3]))) {
        minutes = digit_pair(str, pos + 1);
        pos += 3;
      }
    } else {
      return std::nullopt;
    }

    if (hours > 23 || minutes > 59) {
      throw parse_error(parse_errc::ambiguous_or_invalid_numeric,
                        "utc offset out of range: " +
                            std::string(str.substr(0, pos)));
    }

    int32_t seconds = hours * 3600 + minutes * 60;
    return utc_offset{neg ? -seconds : seconds, pos};
  }

  int
  iso_weeks_in_year(int32_t year) {
    using namespace std::chrono;
    weekday jan1{sys_days{std::chrono::year{year} / January / 1}};
    if (jan1 == Thursday) { return 53; }
    if (jan1 == Wednesday && is_leap_year(year)) { return 53; }
    return 52;
  }

  std::chrono::year_month_day
  iso_week_date(int32_t year, int week, int day) {
    using namespace std::chrono;
    if (week < 1 || week > iso_weeks_in_year(year)) {
      throw parse_error(parse_errc::invalid_week_date,
                        "week out of range for " + std::to_string(year) +
                            ": " + std::to_string(week));
    }
    if (day < 1 || day > 7) {
      throw parse_error(parse_errc::invalid_week_date,
                        "day of week out of range: " + std::to_string(day));
    }
    // Week 1 is the week holding January 4th.
    sys_days jan4{std::chrono::year{year} / January / 4};
    sys_days week1 = jan4 - days{weekday{jan4}.iso_encoding() - 1};
    return year_month_day{week1 + days{(week - 1) * 7 + (day - 1)}};
  }

  std::chrono::year_month_day
  ordinal_date(int32_t year, int yday) {
    using namespace std::chrono;
    int max_day = is_leap_year(year) ? 366 : 365;
    if (yday < 1 || yday > max_day) {
      throw parse_error(parse_errc::ambiguous_or_invalid_numeric,
                        "day of year out of range: " + std::to_string(yday));
    }
    sys_days jan1{std::chrono::year{year} / January / 1};
    return year_month_day{jan1 + days{yday - 1}};
  }

} // namespace dtparse
