#include "symnav/text/line_index.hpp"

#include <algorithm>
#include <iterator>

namespace symnav::text {

LineIndex::LineIndex(std::string_view text) : text_size_(text.size()) {
  line_starts_.push_back(0);
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (text[i] != '\n' && text[i] != '\r') {
      continue;
    }
    line_ends_.push_back(i);
    if (text[i] == '\r' && i + 1 < text.size() && text[i + 1] == '\n') {
      ++i;
    }
    line_starts_.push_back(i + 1);
  }
  line_ends_.push_back(text.size());
}

auto LineIndex::LineNumberOf(std::size_t offset) const -> std::size_t {
  // Last line start <= offset
  auto it = std::ranges::upper_bound(line_starts_, offset);
  return static_cast<std::size_t>(std::distance(line_starts_.begin(), it)) - 1;
}

auto LineIndex::LineSpan(std::size_t line) const -> TextSpan {
  return TextSpan{.start = line_starts_[line], .end = line_ends_[line]};
}

}  // namespace symnav::text
