#include "ymd_resolver.hpp"

#include <dtparse/date_util.hpp>
#include <dtparse/parse_error.hpp>

#include <string>

namespace dtparse::detail {

  namespace {

    [[noreturn]] void
    already_set(const char* what) {
      throw parse_error(parse_errc::ambiguous_or_invalid_numeric,
                        std::string(what) + " is already set");
    }

  } // namespace

  void
  ymd_resolver::append(int32_t value, std::size_t ndigits, ymd_label label) {
    if (ndigits > 2) {
      century_specified_ = true;
      if (label != ymd_label::none && label != ymd_label::year) {
        throw parse_error(parse_errc::ambiguous_or_invalid_numeric,
                          "value " + std::to_string(value) +
                              " can only be a year");
      }
      label = ymd_label::year;
    }

    std::size_t idx = values_.size();
    switch (label) {
      case ymd_label::year:
        if (year_idx_) { already_set("year"); }
        year_idx_ = idx;
        break;
      case ymd_label::month:
        if (month_idx_) { already_set("month"); }
        month_idx_ = idx;
        break;
      case ymd_label::day:
        if (day_idx_) { already_set("day"); }
        day_idx_ = idx;
        break;
      case ymd_label::none:
        break;
    }
    values_.push_back(value);
  }

  bool
  ymd_resolver::could_be_day(int32_t value) const {
    if (day_idx_) { return false; }
    if (!month_idx_) { return value >= 1 && value <= 31; }
    int month = at(*month_idx_);
    int32_t year = year_idx_ ? at(*year_idx_) : 2000;
    return value >= 1 && value <= days_in_month(year, month);
  }

  resolved_ymd
  ymd_resolver::resolve_from_labels() const {
    std::optional<std::size_t> y = year_idx_;
    std::optional<std::size_t> m = month_idx_;
    std::optional<std::size_t> d = day_idx_;

    // Three values with two known positions: the third takes the rest.
    if (values_.size() == 3) {
      std::size_t missing = 0;
      for (std::size_t i = 0; i < 3; ++i) {
        if (i != y && i != m && i != d) { missing = i; }
      }
      if (!y) {
        y = missing;
      } else if (!m) {
        m = missing;
      } else if (!d) {
        d = missing;
      }
    }

    resolved_ymd out;
    if (y) { out.year = at(*y); }
    if (m) { out.month = at(*m); }
    if (d) { out.day = at(*d); }
    return out;
  }

  resolved_ymd
  ymd_resolver::resolve_three(bool yearfirst, bool dayfirst) const {
    resolved_ymd out;
    int32_t v0 = at(0);
    int32_t v1 = at(1);
    int32_t v2 = at(2);

    if (month_idx_ == 0) {
      out.month = v0;
      if (v1 > 31) {
        // Apr-2003-25
        out.year = v1;
        out.day = v2;
      } else {
        out.day = v1;
        out.year = v2;
      }
      return out;
    }

    if (month_idx_ == 1) {
      out.month = v1;
      if (v0 > 31 || (yearfirst && v2 <= 31)) {
        // 99-Jan-01
        out.year = v0;
        out.day = v2;
      } else {
        // 01-Jan-01
        out.day = v0;
        out.year = v2;
      }
      return out;
    }

    if (month_idx_ == 2) {
      out.month = v2;
      if (v1 > 31) {
        // 01-99-Jan
        out.day = v0;
        out.year = v1;
      } else {
        // 99-01-Jan
        out.year = v0;
        out.day = v1;
      }
      return out;
    }

    // A four-digit year fixes its own position; the other two read
    // month-day unless day-first applies or the first cannot be a month.
    if (year_idx_) {
      int32_t a = 0;
      int32_t b = 0;
      bool first = true;
      for (std::size_t i = 0; i < 3; ++i) {
        if (i == *year_idx_) { continue; }
        (first ? a : b) = at(i);
        first = false;
      }
      out.year = at(*year_idx_);
      if (a > 12 || (dayfirst && b <= 12)) {
        out.day = a;
        out.month = b;
      } else {
        out.month = a;
        out.day = b;
      }
      return out;
    }

    if (v0 > 31 || (yearfirst && v1 <= 12 && v2 <= 31)) {
      // 99-01-01
      out.year = v0;
      if (dayfirst && v2 <= 12) {
        out.day = v1;
        out.month = v2;
      } else {
        out.month = v1;
        out.day = v2;
      }
    } else if (v0 > 12 || (dayfirst && v1 <= 12)) {
      // 13-01-01
      out.day = v0;
      out.month = v1;
      out.year = v2;
    } else {
      // 01-13-01
      out.month = v0;
      out.day = v1;
      out.year = v2;
    }
    return out;
  }

  resolved_ymd
  ymd_resolver::resolve(bool yearfirst, bool dayfirst,
                        int32_t current_year) const {
    std::size_t labelled = (year_idx_ ? 1 : 0) + (month_idx_ ? 1 : 0) +
                           (day_idx_ ? 1 : 0);
    std::size_t n = values_.size();

    if (n > 3) {
      throw parse_error(parse_errc::ambiguous_or_invalid_numeric,
                        "more than three date values");
    }

    resolved_ymd out;
    if ((n == labelled && n > 0) || (n == 3 && labelled == 2)) {
      out = resolve_from_labels();
    } else if (n == 1 || (month_idx_ && n == 2)) {
      // One value, or two with a month name.
      int32_t other = 0;
      if (month_idx_) {
        out.month = at(*month_idx_);
        other = at(*month_idx_ == 0 ? n - 1 : *month_idx_ - 1);
      } else {
        other = at(0);
      }
      if (n > 1 || !month_idx_) {
        if (other > 31) {
          out.year = other;
        } else {
          out.day = other;
        }
      }
    } else if (n == 2) {
      int32_t v0 = at(0);
      int32_t v1 = at(1);
      if (v0 > 31) {
        // 99-01
        out.year = v0;
        out.month = v1;
      } else if (v1 > 31) {
        // 01-99
        out.month = v0;
        out.year = v1;
      } else if (dayfirst && v1 <= 12) {
        // 13-01
        out.day = v0;
        out.month = v1;
      } else {
        // 01-13
        out.month = v0;
        out.day = v1;
      }
    } else if (n == 3) {
      out = resolve_three(yearfirst, dayfirst);
    }

    if (out.year && !century_specified_) {
      out.year = expand_two_digit_year(*out.year, current_year);
    }
    return out;
  }

} // namespace dtparse::detail
