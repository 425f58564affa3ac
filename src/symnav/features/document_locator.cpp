#include "symnav/features/document_locator.hpp"

#include <utility>

#include "symnav/text/position_mapper.hpp"
#include "symnav/utils/path_utils.hpp"

namespace symnav::features {

DocumentLocator::DocumentLocator(
    std::shared_ptr<SolutionGraph> graph, TieBreakPolicy policy,
    std::shared_ptr<spdlog::logger> logger)
    : graph_(std::move(graph)),
      policy_(policy),
      logger_(logger ? logger : spdlog::default_logger()) {
}

auto DocumentLocator::Locate(
    OracleRange range, ProjectId requesting_project,
    utils::CancellationToken token)
    -> asio::awaitable<std::optional<NavigableItem>> {
  auto normalized = TryNormalizePath(range.file_name);
  if (!normalized) {
    logger_->debug(
        "DocumentLocator cannot normalize '{}', using it as is",
        range.file_name);
  }
  auto path = CanonicalPath::FromNormalized(
      normalized ? std::move(*normalized)
                 : std::filesystem::path(range.file_name));

  auto candidates = graph_->GetDocumentIdsWithFilePath(path);
  auto chosen =
      ChooseDocument(*graph_, candidates, policy_, requesting_project);
  if (!chosen) {
    logger_->debug("DocumentLocator: {} is not in the solution", path);
    co_return std::nullopt;
  }

  auto snapshot = co_await graph_->GetTextAsync(*chosen, token);
  if (token.IsCancellationRequested() || !snapshot) {
    co_return std::nullopt;
  }

  auto span = text::ToDocumentSpan(snapshot->text, range);
  if (!span) {
    logger_->warn(
        "DocumentLocator cannot map {} onto document {}: {}", range, *chosen,
        span.error().Message());
    co_return std::nullopt;
  }

  co_return NavigableItem{
      .document = *chosen,
      .file_path = path,
      .span = *span,
      .display_string = snapshot->text.substr(span->start, span->Length()),
  };
}

auto DocumentLocator::ChooseDocument(
    const SolutionGraph& graph, const std::vector<DocumentId>& candidates,
    TieBreakPolicy policy, ProjectId requesting_project)
    -> std::optional<DocumentId> {
  if (candidates.empty()) {
    return std::nullopt;
  }

  if (policy == TieBreakPolicy::kPreferSameProject) {
    for (const auto& id : candidates) {
      auto info = graph.GetDocument(id);
      if (info && info->project == requesting_project) {
        return id;
      }
    }
  }
  return candidates.front();
}

}  // namespace symnav::features
