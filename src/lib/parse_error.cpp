#include <dtparse/parse_error.hpp>

namespace dtparse {

  std::string_view
  to_string(parse_errc code) {
    switch (code) {
      case parse_errc::no_components_found:
        return "no_components_found";
      case parse_errc::ambiguous_or_invalid_numeric:
        return "ambiguous_or_invalid_numeric";
      case parse_errc::unrecognized_token:
        return "unrecognized_token";
      case parse_errc::malformed_iso_grammar:
        return "malformed_iso_grammar";
      case parse_errc::invalid_week_date:
        return "invalid_week_date";
    }
    return "unknown";
  }

  parse_error::parse_error(parse_errc code, const std::string& message)
      : std::invalid_argument(message), code_(code) {}

  parse_errc
  parse_error::code() const noexcept {
    return code_;
  }

} // namespace dtparse
