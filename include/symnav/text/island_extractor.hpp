#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace symnav::text {

// The identifier expression under the cursor
struct Island {
  // Full island text: the dotted path, or the quoted name without delimiters
  std::string identifier;

  // 0-based column of the first segment, or of the opening delimiter when
  // quoted
  std::size_t column = 0;

  // Dotted segments in source order; a single element when quoted
  std::vector<std::string> qualifiers;

  bool quoted = false;

  friend auto operator==(const Island&, const Island&) -> bool = default;
};

// Letters, `_` and non-ASCII bytes
auto IsIdentifierStartCharacter(char c) -> bool;

// Start characters plus digits and `'`
auto IsIdentifierPartCharacter(char c) -> bool;

// Island around `column` of `line_text`. A column right after the end of an
// identifier resolves to that identifier. Returns nullopt when no identifier
// touches the column.
auto ExtractIsland(std::string_view line_text, std::size_t column)
    -> std::optional<Island>;

}  // namespace symnav::text
