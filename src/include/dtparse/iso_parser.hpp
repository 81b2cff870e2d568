#pragma once

#include <dtparse/parse_result.hpp>

#include <string_view>

namespace dtparse {

  // Strict ISO-8601 parser. Accepts calendar dates (YYYY, YYYY-MM,
  // YYYY-MM-DD, YYYYMMDD), week dates (YYYY-Www[-D], YYYYWww[D]), ordinal
  // dates (YYYY-DDD, YYYYDDD), times HH[:MM[:SS[.f]]] or HH[MM[SS[.f]]],
  // and Z / +HH[:MM] / +HHMM / +HH zone designators. Reduced dates resolve
  // to the first day of the period.
  //
  // Nothing is guessed: input that does not match the grammar throws
  // parse_error. Trailing whitespace is ignored.
  class iso_parser {
  public:
    // `date_time_separator` must be a single non-digit ASCII character;
    // throws std::invalid_argument otherwise.
    explicit iso_parser(char date_time_separator = 'T');

    char
    separator() const {
      return sep_;
    }

    // Date, optionally followed by the separator and a time. 24:00 rolls
    // over to midnight of the next day.
    parse_result
    isoparse(std::string_view input) const;

    parse_result
    parse_isodate(std::string_view input) const;

    // 24:00 is returned as hour 0.
    parse_result
    parse_isotime(std::string_view input) const;

    // Zone designator only; sets tzoffset, and tzname "UTC" for Z.
    parse_result
    parse_tzstr(std::string_view input) const;

  private:
    char sep_;
  };

  parse_result
  isoparse(std::string_view input, char date_time_separator = 'T');

  parse_result
  parse_isodate(std::string_view input);

  parse_result
  parse_isotime(std::string_view input);

} // namespace dtparse
