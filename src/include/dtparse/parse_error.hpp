#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace dtparse {

  enum class parse_errc {
    no_components_found,
    ambiguous_or_invalid_numeric,
    unrecognized_token,
    malformed_iso_grammar,
    invalid_week_date,
  };

  std::string_view
  to_string(parse_errc code);

  class parse_error : public std::invalid_argument {
    parse_errc code_;

  public:
    parse_error(parse_errc code, const std::string& message);

    parse_errc
    code() const noexcept;
  };

} // namespace dtparse
