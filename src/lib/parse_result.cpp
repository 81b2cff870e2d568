#include <dtparse/parse_result.hpp>

#include <type_traits>

namespace dtparse {

  namespace {

    template <typename T>
    void
    append_field(std::string& out, const char* name,
                 const std::optional<T>& value) {
      if (!value.has_value()) { return; }
      if (out.size() > 1) { out += ", "; }
      out += name;
      out += '=';
      if constexpr (std::is_same_v<T, std::string>) {
        out += '"';
        out += *value;
        out += '"';
      } else {
        out += std::to_string(*value);
      }
    }

  } // namespace

  bool
  parse_result::has_date() const {
    return year.has_value() || month.has_value() || day.has_value();
  }

  bool
  parse_result::has_time() const {
    return hour.has_value() || minute.has_value() || second.has_value() ||
           microsecond.has_value();
  }

  std::string
  parse_result::to_string() const {
    std::string result = "{";
    append_field(result, "year", year);
    append_field(result, "month", month);
    append_field(result, "day", day);
    append_field(result, "hour", hour);
    append_field(result, "minute", minute);
    append_field(result, "second", second);
    append_field(result, "microsecond", microsecond);
    append_field(result, "weekday", weekday);
    append_field(result, "tzoffset", tzoffset);
    append_field(result, "tzname", tzname);
    result += '}';
    return result;
  }

} // namespace dtparse
