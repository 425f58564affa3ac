#include "symnav/features/classification_filter.hpp"

#include <algorithm>
#include <optional>
#include <utility>

#include "symnav/text/position_mapper.hpp"

namespace symnav::features {

ClassificationFilter::ClassificationFilter(
    std::shared_ptr<ClassificationOracle> oracle,
    std::shared_ptr<spdlog::logger> logger)
    : oracle_(std::move(oracle)),
      logger_(logger ? logger : spdlog::default_logger()) {
}

auto ClassificationFilter::IsIdentifierSpan(
    DocumentId document, std::shared_ptr<const DocumentSnapshot> snapshot,
    CanonicalPath file_path, std::size_t offset,
    std::vector<std::string> defines, utils::CancellationToken token)
    -> asio::awaitable<std::expected<bool, NavError>> {
  auto line = text::LineAt(snapshot->text, offset);
  if (!line) {
    co_return std::unexpected(line.error());
  }
  co_return co_await IsIdentifierSpan(
      document, std::move(snapshot), std::move(file_path), line->span, offset,
      std::move(defines), token);
}

auto ClassificationFilter::IsIdentifierSpan(
    DocumentId document, std::shared_ptr<const DocumentSnapshot> snapshot,
    CanonicalPath file_path, TextSpan line_span, std::size_t offset,
    std::vector<std::string> defines, utils::CancellationToken token)
    -> asio::awaitable<std::expected<bool, NavError>> {
  std::vector<ClassifiedSpan> spans;
  std::optional<std::string> failure;
  try {
    spans = co_await oracle_->ClassifyLine(
        document, snapshot, file_path, line_span, std::move(defines), token);
  } catch (const std::exception& e) {
    failure = e.what();
  } catch (...) {
    failure = "unknown exception";
  }
  if (failure) {
    logger_->error("ClassificationFilter oracle failed: {}", *failure);
    co_return NavError::UnexpectedFromCode(
        NavErrorCode::kOracleFailure, *failure);
  }
  if (token.IsCancellationRequested()) {
    co_return NavError::UnexpectedFromCode(NavErrorCode::kCancelled);
  }

  auto is_identifier = IsIdentifierAt(spans, offset);
  logger_->debug(
      "ClassificationFilter {}:{} classified {} spans, identifier: {}",
      file_path, offset, spans.size(), is_identifier);
  co_return is_identifier;
}

auto ClassificationFilter::IsIdentifierAt(
    const std::vector<ClassifiedSpan>& spans, std::size_t offset) -> bool {
  auto it = std::ranges::find_if(spans, [offset](const ClassifiedSpan& s) {
    return s.span.Contains(offset);
  });
  return it != spans.end() && it->kind == ClassificationKind::kIdentifier;
}

}  // namespace symnav::features
