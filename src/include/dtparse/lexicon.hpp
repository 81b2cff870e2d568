#pragma once

#include <optional>
#include <string_view>

namespace dtparse {

  enum class meridiem { am, pm };

  enum class hms_label { hour = 0, minute = 1, second = 2 };

  // All lookups are ASCII case-insensitive.

  // 1..12
  std::optional<int>
  lookup_month(std::string_view word);

  // 0 (Monday) .. 6 (Sunday)
  std::optional<int>
  lookup_weekday(std::string_view word);

  std::optional<meridiem>
  lookup_ampm(std::string_view word);

  std::optional<hms_label>
  lookup_hms(std::string_view word);

  // Filler tokens that never carry a component: whitespace, date
  // punctuation and words such as "at", "on", "of".
  bool
  is_jump(std::string_view word);

  bool
  is_pertain(std::string_view word);

  bool
  is_ordinal_suffix(std::string_view word);

  // Zone names that denote a zero offset (UTC, GMT, Z).
  bool
  is_utc_zone(std::string_view word);

} // namespace dtparse
