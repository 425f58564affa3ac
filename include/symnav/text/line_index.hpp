#pragma once

#include <cstddef>
#include <string_view>
#include <vector>

#include "symnav/core/document.hpp"

namespace symnav::text {

// Precomputed line boundaries of a text. Recognizes "\n", "\r\n" and a lone
// "\r" as line breaks. Text ending in a break has a final empty line.
class LineIndex {
 public:
  explicit LineIndex(std::string_view text);

  [[nodiscard]] auto LineCount() const -> std::size_t {
    return line_starts_.size();
  }

  [[nodiscard]] auto TextSize() const -> std::size_t {
    return text_size_;
  }

  // 0-based line containing `offset`; offsets past the end map to the last
  // line
  [[nodiscard]] auto LineNumberOf(std::size_t offset) const -> std::size_t;

  // Content of the 0-based `line`, excluding its line break. The line must
  // exist.
  [[nodiscard]] auto LineSpan(std::size_t line) const -> TextSpan;

 private:
  std::size_t text_size_ = 0;
  std::vector<std::size_t> line_starts_;
  std::vector<std::size_t> line_ends_;
};

}  // namespace symnav::text
