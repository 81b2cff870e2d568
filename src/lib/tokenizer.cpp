#include <dtparse/token.hpp>

namespace dtparse {

  namespace {

    token_kind
    classify(char c) {
      if (c >= '0' && c <= '9') { return token_kind::digits; }
      if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z')) {
        return token_kind::letters;
      }
      return token_kind::separator;
    }

  } // namespace

  std::vector<token>
  tokenize(std::string_view input) {
    std::vector<token> result;
    std::size_t pos = 0;
    while (pos < input.size()) {
      std::size_t start = pos;
      token_kind kind = classify(input[pos]);
      ++pos;
      if (kind != token_kind::separator) {
        while (pos < input.size() && classify(input[pos]) == kind) {
          ++pos;
        }
      }
      result.push_back(
          {kind, std::string(input.substr(start, pos - start)), start});
    }
    return result;
  }

} // namespace dtparse
