#pragma once

#include <memory>
#include <optional>
#include <vector>

#include <asio.hpp>
#include <spdlog/spdlog.h>

#include "symnav/core/document.hpp"
#include "symnav/core/navigable_item.hpp"
#include "symnav/core/project_options.hpp"
#include "symnav/core/solution_graph.hpp"
#include "symnav/oracle/source_range.hpp"
#include "symnav/utils/cancellation.hpp"

namespace symnav::features {

// Maps an oracle range onto a document known to the solution graph
class DocumentLocator {
 public:
  DocumentLocator(
      std::shared_ptr<SolutionGraph> graph,
      TieBreakPolicy policy = TieBreakPolicy::kFirstMatch,
      std::shared_ptr<spdlog::logger> logger = nullptr);

  // nullopt if the file is outside the graph, the text is gone, or the range
  // does not fit the current text
  auto Locate(
      OracleRange range, ProjectId requesting_project,
      utils::CancellationToken token)
      -> asio::awaitable<std::optional<NavigableItem>>;

  // Picks one of `candidates` (in graph enumeration order) per `policy`
  static auto ChooseDocument(
      const SolutionGraph& graph, const std::vector<DocumentId>& candidates,
      TieBreakPolicy policy, ProjectId requesting_project)
      -> std::optional<DocumentId>;

 private:
  std::shared_ptr<SolutionGraph> graph_;
  TieBreakPolicy policy_;
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace symnav::features
