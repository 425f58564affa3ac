#pragma once

#include <string>

#include <fmt/format.h>

namespace symnav {

// Oracle coordinates: 1-based line, 0-based column
struct OraclePosition {
  int line = 1;
  int column = 0;

  friend auto operator==(const OraclePosition&, const OraclePosition&)
      -> bool = default;
};

// A range in the oracle's coordinates. `file_name` is whatever the oracle
// reports and may be relative or unnormalized.
struct OracleRange {
  std::string file_name;
  OraclePosition start;
  OraclePosition end;

  friend auto operator==(const OracleRange&, const OracleRange&)
      -> bool = default;
};

}  // namespace symnav

template <>
struct fmt::formatter<symnav::OraclePosition> {
  constexpr auto parse(fmt::format_parse_context& ctx) {
    return ctx.begin();
  }

  template <typename FormatContext>
  auto format(const symnav::OraclePosition& pos, FormatContext& ctx) const {
    return fmt::format_to(ctx.out(), "({},{})", pos.line, pos.column);
  }
};

template <>
struct fmt::formatter<symnav::OracleRange> {
  constexpr auto parse(fmt::format_parse_context& ctx) {
    return ctx.begin();
  }

  template <typename FormatContext>
  auto format(const symnav::OracleRange& range, FormatContext& ctx) const {
    return fmt::format_to(
        ctx.out(), "{}{}-{}", range.file_name, range.start, range.end);
  }
};
