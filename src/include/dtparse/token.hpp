#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace dtparse {

  enum class token_kind { digits, letters, separator };

  struct token {
    token_kind kind = token_kind::separator;
    std::string text;
    // Byte offset of the first character in the input.
    std::size_t offset = 0;

    bool
    operator==(const token& other) const = default;
  };

  // Splits input into digit runs, letter runs and single-character
  // separators. Never fails.
  std::vector<token>
  tokenize(std::string_view input);

} // namespace dtparse
