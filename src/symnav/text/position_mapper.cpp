#include "symnav/text/position_mapper.hpp"

#include <algorithm>

#include <fmt/format.h>

#include "symnav/text/line_index.hpp"

namespace symnav::text {

namespace {

auto CheckOffset(std::size_t text_size, std::size_t offset)
    -> std::expected<void, NavError> {
  if (offset > text_size) {
    return NavError::UnexpectedFromCode(
        NavErrorCode::kInvalidOffset,
        fmt::format("{} > {}", offset, text_size));
  }
  return {};
}

auto ToOffset(const LineIndex& index, const OraclePosition& pos)
    -> std::expected<std::size_t, NavError> {
  if (pos.line < 1 || static_cast<std::size_t>(pos.line) > index.LineCount()) {
    return NavError::UnexpectedFromCode(
        NavErrorCode::kRangeOutOfDocument,
        fmt::format("line {} of {}", pos.line, index.LineCount()));
  }
  auto span = index.LineSpan(static_cast<std::size_t>(pos.line - 1));
  auto column = static_cast<std::size_t>(std::max(pos.column, 0));
  return span.start + std::min(column, span.Length());
}

}  // namespace

auto ToOraclePosition(std::string_view text, std::size_t offset)
    -> std::expected<OraclePosition, NavError> {
  if (auto valid = CheckOffset(text.size(), offset); !valid) {
    return std::unexpected(valid.error());
  }
  return ToOraclePosition(LineIndex(text), offset);
}

auto ToOraclePosition(const LineIndex& index, std::size_t offset)
    -> std::expected<OraclePosition, NavError> {
  if (auto valid = CheckOffset(index.TextSize(), offset); !valid) {
    return std::unexpected(valid.error());
  }

  auto line = index.LineNumberOf(offset);
  auto span = index.LineSpan(line);
  return OraclePosition{
      .line = static_cast<int>(line) + 1,
      .column = static_cast<int>(offset - span.start),
  };
}

auto ToDocumentSpan(std::string_view text, const OracleRange& range)
    -> std::expected<TextSpan, NavError> {
  LineIndex index(text);

  auto start = ToOffset(index, range.start);
  if (!start) {
    return std::unexpected(start.error());
  }
  auto end = ToOffset(index, range.end);
  if (!end) {
    return std::unexpected(end.error());
  }
  if (*end < *start) {
    return NavError::UnexpectedFromCode(
        NavErrorCode::kRangeOutOfDocument,
        fmt::format("inverted range {}", range));
  }
  return TextSpan{.start = *start, .end = *end};
}

auto LineAt(std::string_view text, std::size_t offset)
    -> std::expected<TextLine, NavError> {
  if (auto valid = CheckOffset(text.size(), offset); !valid) {
    return std::unexpected(valid.error());
  }
  return LineAt(text, LineIndex(text), offset);
}

auto LineAt(std::string_view text, const LineIndex& index, std::size_t offset)
    -> std::expected<TextLine, NavError> {
  if (auto valid = CheckOffset(index.TextSize(), offset); !valid) {
    return std::unexpected(valid.error());
  }

  auto line = index.LineNumberOf(offset);
  auto span = index.LineSpan(line);
  return TextLine{
      .number = static_cast<int>(line) + 1,
      .span = span,
      .text = std::string(text.substr(span.start, span.Length())),
  };
}

}  // namespace symnav::text
