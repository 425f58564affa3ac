#pragma once

#include <cstddef>
#include <expected>
#include <memory>
#include <string>
#include <vector>

#include <asio.hpp>
#include <spdlog/spdlog.h>

#include "symnav/core/document.hpp"
#include "symnav/error/error.hpp"
#include "symnav/oracle/classification_oracle.hpp"
#include "symnav/utils/cancellation.hpp"
#include "symnav/utils/canonical_path.hpp"

namespace symnav::features {

// Gate that keeps resolution out of comments, strings and keywords
class ClassificationFilter {
 public:
  explicit ClassificationFilter(
      std::shared_ptr<ClassificationOracle> oracle,
      std::shared_ptr<spdlog::logger> logger = nullptr);

  // True only if the first classified span containing `offset` is an
  // identifier. Fails with kInvalidOffset, kCancelled or kOracleFailure.
  auto IsIdentifierSpan(
      DocumentId document, std::shared_ptr<const DocumentSnapshot> snapshot,
      CanonicalPath file_path, std::size_t offset,
      std::vector<std::string> defines, utils::CancellationToken token)
      -> asio::awaitable<std::expected<bool, NavError>>;

  // Same, for a caller that already knows the span of the line holding
  // `offset`
  auto IsIdentifierSpan(
      DocumentId document, std::shared_ptr<const DocumentSnapshot> snapshot,
      CanonicalPath file_path, TextSpan line_span, std::size_t offset,
      std::vector<std::string> defines, utils::CancellationToken token)
      -> asio::awaitable<std::expected<bool, NavError>>;

  // Pure part of IsIdentifierSpan
  static auto IsIdentifierAt(
      const std::vector<ClassifiedSpan>& spans, std::size_t offset) -> bool;

 private:
  std::shared_ptr<ClassificationOracle> oracle_;
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace symnav::features
