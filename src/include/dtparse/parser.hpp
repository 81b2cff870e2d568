#pragma once

#include <dtparse/parse_result.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace dtparse {

  struct parser_options {
    // "01/05/09" reads day before month.
    bool dayfirst = false;
    // "01/05/09" reads the year first.
    bool yearfirst = false;
    // Text that cannot be attributed is ignored instead of rejected.
    bool fuzzy = false;
    // Also report the ignored text; requires `fuzzy`.
    bool fuzzy_with_tokens = false;
  };

  struct fuzzy_result {
    parse_result result;
    std::vector<std::string> skipped_tokens;
  };

  // Format-free date/time parser. Assigns meaning to the numbers, names
  // and zone designators found in free text; ambiguous numeric dates are
  // settled by `dayfirst` / `yearfirst`.
  //
  // Throws parse_error when nothing usable is found, a value is out of
  // range or conflicts with another, or (without `fuzzy`) when a token
  // cannot be attributed. Throws std::invalid_argument for inconsistent
  // options.
  class parser {
  public:
    explicit parser(parser_options options = {});

    const parser_options&
    options() const {
      return options_;
    }

    parse_result
    parse(std::string_view input) const;

    // Requires `fuzzy`; the result lists every token that was ignored.
    fuzzy_result
    parse_fuzzy_with_tokens(std::string_view input) const;

  private:
    parser_options options_;
  };

  parse_result
  parse(std::string_view input, parser_options options = {});

  fuzzy_result
  parse_fuzzy_with_tokens(std::string_view input, parser_options options);

  // Time of day only. Tries the ISO time grammar first, then a fuzzy
  // heuristic parse; fails unless an hour was found. Date fields are
  // never returned.
  parse_result
  parse_time(std::string_view input);

} // namespace dtparse
