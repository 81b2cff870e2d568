#include <dtparse/iso_parser.hpp>

#include <dtparse/date_util.hpp>
#include <dtparse/parse_error.hpp>

#include <stdexcept>
#include <string>

namespace dtparse {

  namespace {

    [[noreturn]] void
    malformed(std::string_view input, const std::string& what) {
      throw parse_error(parse_errc::malformed_iso_grammar,
                        "iso: " + what + " in '" + std::string(input) + "'");
    }

    [[noreturn]] void
    out_of_range(const std::string& what, int value) {
      throw parse_error(parse_errc::ambiguous_or_invalid_numeric,
                        "iso: " + what + " out of range: " +
                            std::to_string(value));
    }

    bool
    is_digit(char c) {
      return c >= '0' && c <= '9';
    }

    std::string_view
    rtrim(std::string_view str) {
      while (!str.empty() &&
             (str.back() == ' ' || str.back() == '\t' || str.back() == '\n' ||
              str.back() == '\r' || str.back() == '\f' || str.back() == '\v')) {
        str.remove_suffix(1);
      }
      return str;
    }

    // Exactly `n` digits available at `pos`.
    bool
    digits_at(std::string_view str, std::size_t pos, std::size_t n) {
      if (pos + n > str.size()) { return false; }
      for (std::size_t i = pos; i < pos + n; ++i) {
        if (!is_digit(str[i])) { return false; }
      }
      return true;
    }

    int
    read_fixed(std::string_view str, std::size_t pos, std::size_t n) {
      int value = 0;
      for (std::size_t i = pos; i < pos + n; ++i) {
        value = value * 10 + (str[i] - '0');
      }
      return value;
    }

    // -----------------------------------------------------------------------
    // Dates
    // -----------------------------------------------------------------------

    struct date_part {
      int32_t year = 1;
      int month = 1;
      int day = 1;
      std::size_t consumed = 0;
    };

    date_part
    from_ymd(std::chrono::year_month_day ymd, std::size_t consumed) {
      return {static_cast<int32_t>(static_cast<int>(ymd.year())),
              static_cast<int>(static_cast<unsigned>(ymd.month())),
              static_cast<int>(static_cast<unsigned>(ymd.day())), consumed};
    }

    // YYYY, YYYY-MM, YYYY-MM-DD, YYYYMMDD. nullopt when the shape does not
    // match, so the week and ordinal forms get a try.
    std::optional<date_part>
    parse_common_date(std::string_view str) {
      if (!digits_at(str, 0, 4)) { return std::nullopt; }
      date_part d;
      d.year = read_fixed(str, 0, 4);
      std::size_t pos = 4;
      if (pos == str.size()) {
        d.consumed = pos;
        return d;
      }

      bool has_sep = str[pos] == '-';
      if (has_sep) { ++pos; }

      if (!digits_at(str, pos, 2)) { return std::nullopt; }
      d.month = read_fixed(str, pos, 2);
      pos += 2;
      if (pos == str.size()) {
        // YYYYMM is not allowed.
        if (!has_sep) { return std::nullopt; }
        d.consumed = pos;
        return d;
      }

      if (has_sep) {
        if (str[pos] != '-') { return std::nullopt; }
        ++pos;
      }

      if (!digits_at(str, pos, 2)) { return std::nullopt; }
      d.day = read_fixed(str, pos, 2);
      d.consumed = pos + 2;
      return d;
    }

    // YYYY-Www[-D], YYYYWww[D], YYYY-DDD, YYYYDDD
    date_part
    parse_uncommon_date(std::string_view str) {
      if (!digits_at(str, 0, 4)) { malformed(str, "expected a 4-digit year"); }
      int32_t year = read_fixed(str, 0, 4);
      bool has_sep = str.size() > 4 && str[4] == '-';
      std::size_t pos = has_sep ? 5 : 4;

      if (pos < str.size() && str[pos] == 'W') {
        ++pos;
        if (!digits_at(str, pos, 2)) { malformed(str, "invalid week number"); }
        int week = read_fixed(str, pos, 2);
        pos += 2;

        int day = 1;
        if (pos < str.size()) {
          char c = str[pos];
          if (has_sep && c == '-') {
            if (!digits_at(str, pos + 1, 1)) {
              malformed(str, "invalid week day");
            }
            day = read_fixed(str, pos + 1, 1);
            pos += 2;
          } else if (!has_sep && is_digit(c)) {
            day = read_fixed(str, pos, 1);
            pos += 1;
          } else if (c == '-' || is_digit(c)) {
            malformed(str, "inconsistent use of dash separator");
          }
        }
        return from_ymd(iso_week_date(year, week, day), pos);
      }

      if (!digits_at(str, pos, 3)) { malformed(str, "invalid date"); }
      int yday = read_fixed(str, pos, 3);
      return from_ymd(ordinal_date(year, yday), pos + 3);
    }

    date_part
    parse_date(std::string_view str) {
      auto common = parse_common_date(str);
      if (!common) { return parse_uncommon_date(str); }

      if (common->year < 1) { out_of_range("year", common->year); }
      if (common->month < 1 || common->month > 12) {
        out_of_range("month", common->month);
      }
      if (common->day < 1 ||
          common->day > days_in_month(common->year, common->month)) {
        out_of_range("day", common->day);
      }
      return *common;
    }

    // -----------------------------------------------------------------------
    // Times
    // -----------------------------------------------------------------------

    struct time_part {
      int hour = 0;
      int minute = 0;
      int second = 0;
      int32_t microsecond = 0;
      std::optional<int32_t> tzoffset;
      std::optional<std::string> tzname;
    };

    void
    parse_zone(std::string_view str, std::optional<int32_t>& tzoffset,
               std::optional<std::string>& tzname) {
      if (str == "Z" || str == "z") {
        tzoffset = 0;
        tzname = "UTC";
        return;
      }
      auto offset = parse_utc_offset(str, offset_syntax::strict);
      if (!offset || offset->consumed != str.size()) {
        malformed(str, "invalid time zone designator");
      }
      tzoffset = offset->seconds;
    }

    time_part
    parse_time(std::string_view str) {
      if (str.size() < 2) { malformed(str, "time too short"); }

      time_part t;
      std::size_t pos = 0;
      bool has_sep = false;
      int comp = -1;
      while (pos < str.size() && comp < 4) {
        ++comp;
        char c = str[pos];

        // A zone may only follow the hour.
        if (comp > 0 && (c == '+' || c == '-' || c == 'Z' || c == 'z')) {
          parse_zone(str.substr(pos), t.tzoffset, t.tzname);
          pos = str.size();
          break;
        }

        if (comp == 3) {
          // Fraction, only after the seconds.
          if (c != '.' && c != ',') { continue; }
          std::size_t start = pos + 1;
          std::size_t end = start;
          while (end < str.size() && is_digit(str[end])) {
            ++end;
          }
          if (end == start || end - start > 9) {
            malformed(str, "fraction must have 1 to 9 digits");
          }
          t.microsecond =
              fraction_to_microseconds(str.substr(start, end - start));
          pos = end;
          continue;
        }
        if (comp == 4) { break; }

        if (comp == 1 && c == ':') {
          has_sep = true;
          ++pos;
        } else if (comp == 2 && has_sep) {
          if (c != ':') {
            malformed(str, "inconsistent use of colon separator");
          }
          ++pos;
        }

        if (!digits_at(str, pos, 2)) { malformed(str, "expected two digits"); }
        int value = read_fixed(str, pos, 2);
        pos += 2;
        switch (comp) {
          case 0:
            t.hour = value;
            break;
          case 1:
            t.minute = value;
            break;
          default:
            t.second = value;
            break;
        }
      }

      if (pos < str.size()) { malformed(str, "unused components"); }

      if (t.hour == 24) {
        if (t.minute != 0 || t.second != 0 || t.microsecond != 0) {
          malformed(str, "hour may only be 24 at 24:00:00");
        }
      } else if (t.hour > 23) {
        out_of_range("hour", t.hour);
      }
      if (t.minute > 59) { out_of_range("minute", t.minute); }
      if (t.second > 59) { out_of_range("second", t.second); }
      return t;
    }

    void
    fill_time(parse_result& r, const time_part& t) {
      r.hour = t.hour;
      r.minute = t.minute;
      r.second = t.second;
      r.microsecond = t.microsecond;
      r.tzoffset = t.tzoffset;
      r.tzname = t.tzname;
    }

  } // namespace

  iso_parser::iso_parser(char date_time_separator)
      : sep_(date_time_separator) {
    if (static_cast<unsigned char>(sep_) >= 128 || is_digit(sep_)) {
      throw std::invalid_argument(
          "separator must be a single non-numeric ASCII character");
    }
  }

  parse_result
  iso_parser::isoparse(std::string_view input) const {
    std::string_view str = rtrim(input);
    date_part d = parse_date(str);

    parse_result result;
    if (d.consumed < str.size()) {
      if (str[d.consumed] != sep_) {
        malformed(str, "unknown components after the date");
      }
      time_part t = parse_time(str.substr(d.consumed + 1));
      if (t.hour == 24) {
        using namespace std::chrono;
        t.hour = 0;
        sys_days next = sys_days{year{d.year} / d.month / d.day} + days{1};
        d = from_ymd(year_month_day{next}, d.consumed);
      }
      fill_time(result, t);
    }
    result.year = d.year;
    result.month = d.month;
    result.day = d.day;
    return result;
  }

  parse_result
  iso_parser::parse_isodate(std::string_view input) const {
    std::string_view str = rtrim(input);
    date_part d = parse_date(str);
    if (d.consumed < str.size()) {
      malformed(str, "unknown components after the date");
    }
    parse_result result;
    result.year = d.year;
    result.month = d.month;
    result.day = d.day;
    return result;
  }

  parse_result
  iso_parser::parse_isotime(std::string_view input) const {
    time_part t = parse_time(rtrim(input));
    if (t.hour == 24) { t.hour = 0; }
    parse_result result;
    fill_time(result, t);
    return result;
  }

  parse_result
  iso_parser::parse_tzstr(std::string_view input) const {
    parse_result result;
    parse_zone(rtrim(input), result.tzoffset, result.tzname);
    return result;
  }

  parse_result
  isoparse(std::string_view input, char date_time_separator) {
    return iso_parser(date_time_separator).isoparse(input);
  }

  parse_result
  parse_isodate(std::string_view input) {
    return iso_parser().parse_isodate(input);
  }

  parse_result
  parse_isotime(std::string_view input) {
    return iso_parser().parse_isotime(input);
  }

} // namespace dtparse
