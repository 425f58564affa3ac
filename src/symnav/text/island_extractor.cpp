#include "symnav/text/island_extractor.hpp"

#include <cctype>
#include <deque>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace symnav::text {

namespace {

constexpr std::string_view kQuoteDelimiter = "``";

struct Segment {
  std::size_t start = 0;
  std::size_t end = 0;
};

// Quoted island when `column` lies within a ``...`` pair, delimiters included.
// The position right after the closing delimiter counts too, unless an
// identifier character starts there.
auto FindQuotedIsland(std::string_view line, std::size_t column)
    -> std::optional<std::optional<Island>> {
  std::size_t search_from = 0;
  while (true) {
    auto open = line.find(kQuoteDelimiter, search_from);
    if (open == std::string_view::npos || open > column) {
      return std::nullopt;
    }
    auto close = line.find(kQuoteDelimiter, open + kQuoteDelimiter.size());
    if (close == std::string_view::npos) {
      return std::nullopt;
    }
    auto pair_end = close + kQuoteDelimiter.size();
    auto inside = column < pair_end ||
                  (column == pair_end &&
                   (column == line.size() ||
                    !IsIdentifierPartCharacter(line[column])));
    if (inside) {
      auto name_start = open + kQuoteDelimiter.size();
      auto name = std::string(line.substr(name_start, close - name_start));
      if (name.empty()) {
        return std::optional<Island>{};
      }
      return std::optional<Island>{Island{
          .identifier = name,
          .column = open,
          .qualifiers = {name},
          .quoted = true,
      }};
    }
    search_from = pair_end;
  }
}

// Maximal run of identifier part characters containing `pos`
auto RunAround(std::string_view line, std::size_t pos) -> Segment {
  Segment run{.start = pos, .end = pos + 1};
  while (run.start > 0 && IsIdentifierPartCharacter(line[run.start - 1])) {
    --run.start;
  }
  while (run.end < line.size() && IsIdentifierPartCharacter(line[run.end])) {
    ++run.end;
  }
  return run;
}

}  // namespace

auto IsIdentifierStartCharacter(char c) -> bool {
  auto byte = static_cast<unsigned char>(c);
  return byte >= 0x80 || std::isalpha(byte) != 0 || c == '_';
}

auto IsIdentifierPartCharacter(char c) -> bool {
  auto byte = static_cast<unsigned char>(c);
  return IsIdentifierStartCharacter(c) || std::isdigit(byte) != 0 || c == '\'';
}

auto ExtractIsland(std::string_view line_text, std::size_t column)
    -> std::optional<Island> {
  if (line_text.empty() || column > line_text.size()) {
    return std::nullopt;
  }

  if (auto quoted = FindQuotedIsland(line_text, column)) {
    return *quoted;
  }

  std::size_t anchor = 0;
  if (column < line_text.size() &&
      IsIdentifierPartCharacter(line_text[column])) {
    anchor = column;
  } else if (column > 0 && IsIdentifierPartCharacter(line_text[column - 1])) {
    anchor = column - 1;
  } else {
    return std::nullopt;
  }

  auto current = RunAround(line_text, anchor);
  if (!IsIdentifierStartCharacter(line_text[current.start])) {
    return std::nullopt;
  }

  std::deque<Segment> segments{current};

  // Extend left over "prev." while the previous segment is well formed
  while (true) {
    auto first = segments.front();
    if (first.start < 2 || line_text[first.start - 1] != '.' ||
        !IsIdentifierPartCharacter(line_text[first.start - 2])) {
      break;
    }
    auto previous = RunAround(line_text, first.start - 2);
    if (!IsIdentifierStartCharacter(line_text[previous.start])) {
      break;
    }
    segments.push_front(previous);
  }

  // Extend right over ".next"
  while (true) {
    auto last = segments.back();
    if (last.end + 1 >= line_text.size() || line_text[last.end] != '.' ||
        !IsIdentifierStartCharacter(line_text[last.end + 1])) {
      break;
    }
    segments.push_back(RunAround(line_text, last.end + 1));
  }

  Island island{
      .identifier = {},
      .column = segments.front().start,
      .qualifiers = {},
      .quoted = false,
  };
  for (const auto& segment : segments) {
    island.qualifiers.emplace_back(
        line_text.substr(segment.start, segment.end - segment.start));
  }
  island.identifier = fmt::format("{}", fmt::join(island.qualifiers, "."));
  return island;
}

}  // namespace symnav::text
