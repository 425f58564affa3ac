#pragma once

#include <cstddef>
#include <expected>
#include <string>
#include <string_view>

#include "symnav/core/document.hpp"
#include "symnav/error/error.hpp"
#include "symnav/oracle/source_range.hpp"
#include "symnav/text/line_index.hpp"

namespace symnav::text {

// One line of a document
struct TextLine {
  // 1-based, as the oracle counts lines
  int number = 1;
  TextSpan span;
  std::string text;
};

// Offset to oracle position. Valid offsets are 0..text.size(); the caret may
// sit at the end of the text.
auto ToOraclePosition(std::string_view text, std::size_t offset)
    -> std::expected<OraclePosition, NavError>;

// Same, over an index already built for the text
auto ToOraclePosition(const LineIndex& index, std::size_t offset)
    -> std::expected<OraclePosition, NavError>;

// Map an oracle range onto `text`, which need not be the text the range was
// computed against. Columns past a line's end clamp to that end.
auto ToDocumentSpan(std::string_view text, const OracleRange& range)
    -> std::expected<TextSpan, NavError>;

// The line containing `offset`
auto LineAt(std::string_view text, std::size_t offset)
    -> std::expected<TextLine, NavError>;

// `index` must have been built over `text`
auto LineAt(std::string_view text, const LineIndex& index, std::size_t offset)
    -> std::expected<TextLine, NavError>;

}  // namespace symnav::text
