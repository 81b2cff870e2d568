#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace dtparse::detail {

  enum class ymd_label { none, year, month, day };

  struct resolved_ymd {
    std::optional<int32_t> year;
    std::optional<int> month;
    std::optional<int> day;
  };

  // Collects up to three date candidates in input order, remembering which
  // positions are known (a month name, a four-digit year, an ordinal day),
  // and assigns the rest with the day-first / year-first rules.
  class ymd_resolver {
  public:
    // Throws parse_error when a labelled position is already taken.
    void
    append(int32_t value, std::size_t ndigits,
           ymd_label label = ymd_label::none);

    bool
    could_be_day(int32_t value) const;

    std::size_t
    size() const {
      return values_.size();
    }

    bool
    empty() const {
      return values_.empty();
    }

    // Two-digit years are expanded against `current_year`.
    resolved_ymd
    resolve(bool yearfirst, bool dayfirst, int32_t current_year) const;

  private:
    std::vector<int32_t> values_;
    bool century_specified_ = false;
    std::optional<std::size_t> year_idx_;
    std::optional<std::size_t> month_idx_;
    std::optional<std::size_t> day_idx_;

    int32_t
    at(std::size_t i) const {
      return values_[i];
    }

    resolved_ymd
    resolve_from_labels() const;

    resolved_ymd
    resolve_three(bool yearfirst, bool dayfirst) const;
  };

} // namespace dtparse::detail
