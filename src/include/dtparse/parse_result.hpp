#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

namespace dtparse {

  // Components recovered from one input string. Every field is optional;
  // filling unset fields and resolving the zone is left to the caller.
  struct parse_result {
    std::optional<int32_t> year;
    std::optional<int> month;
    std::optional<int> day;
    std::optional<int> hour;
    std::optional<int> minute;
    std::optional<int> second;
    std::optional<int32_t> microsecond;
    // Monday is 0.
    std::optional<int> weekday;
    // Seconds east of UTC.
    std::optional<int32_t> tzoffset;
    std::optional<std::string> tzname;

    bool
    has_date() const;
    bool
    has_time() const;

    std::string
    to_string() const;

    bool
    operator==(const parse_result& other) const = default;

    friend std::ostream&
    operator<<(std::ostream& os, const parse_result& r) {
      return os << r.to_string();
    }
  };

} // namespace dtparse
