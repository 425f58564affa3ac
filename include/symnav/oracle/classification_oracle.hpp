#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <asio.hpp>

#include "symnav/core/document.hpp"
#include "symnav/utils/cancellation.hpp"
#include "symnav/utils/canonical_path.hpp"

namespace symnav {

enum class ClassificationKind {
  kIdentifier,
  kKeyword,
  kComment,
  kString,
  kNumber,
  kOperator,
  kPunctuation,
  kPreprocessor,
  kText,
};

inline auto ToString(ClassificationKind kind) -> std::string_view {
  switch (kind) {
    case ClassificationKind::kIdentifier:
      return "identifier";
    case ClassificationKind::kKeyword:
      return "keyword";
    case ClassificationKind::kComment:
      return "comment";
    case ClassificationKind::kString:
      return "string";
    case ClassificationKind::kNumber:
      return "number";
    case ClassificationKind::kOperator:
      return "operator";
    case ClassificationKind::kPunctuation:
      return "punctuation";
    case ClassificationKind::kPreprocessor:
      return "preprocessor";
    case ClassificationKind::kText:
      return "text";
  }
  return "unknown";
}

struct ClassifiedSpan {
  TextSpan span;
  ClassificationKind kind = ClassificationKind::kText;
};

// Lexical classifier provided by the language toolchain. Spans are document
// offsets and may be overlapping or unordered.
class ClassificationOracle {
 public:
  ClassificationOracle() = default;
  ClassificationOracle(const ClassificationOracle&) = default;
  ClassificationOracle(ClassificationOracle&&) = delete;
  auto operator=(const ClassificationOracle&)
      -> ClassificationOracle& = default;
  auto operator=(ClassificationOracle&&) -> ClassificationOracle& = delete;
  virtual ~ClassificationOracle() = default;

  // Classify the text of `line_span`. `defines` select the active
  // conditional-compilation regions.
  virtual auto ClassifyLine(
      DocumentId document, std::shared_ptr<const DocumentSnapshot> snapshot,
      CanonicalPath file_path, TextSpan line_span,
      std::vector<std::string> defines, utils::CancellationToken token)
      -> asio::awaitable<std::vector<ClassifiedSpan>> = 0;
};

}  // namespace symnav
