#pragma once

#include <memory>
#include <optional>
#include <vector>

#include <asio.hpp>

#include "symnav/core/document.hpp"
#include "symnav/core/project_options.hpp"
#include "symnav/utils/canonical_path.hpp"
#include "symnav/utils/cancellation.hpp"

namespace symnav {

// The host's view of projects and documents. Implementations must be safe to
// query from the executor running the resolution pipeline.
class SolutionGraph {
 public:
  SolutionGraph() = default;
  SolutionGraph(const SolutionGraph&) = default;
  SolutionGraph(SolutionGraph&&) = delete;
  auto operator=(const SolutionGraph&) -> SolutionGraph& = default;
  auto operator=(SolutionGraph&&) -> SolutionGraph& = delete;
  virtual ~SolutionGraph() = default;

  virtual auto GetDocument(DocumentId id) const
      -> std::optional<DocumentInfo> = 0;

  // Every document registered under `path`, in enumeration order
  virtual auto GetDocumentIdsWithFilePath(const CanonicalPath& path) const
      -> std::vector<DocumentId> = 0;

  // nullopt while the project's options are unknown to the host
  virtual auto GetProjectOptions(ProjectId project) const
      -> std::optional<ProjectOptions> = 0;

  // Current text and version of a document; null if the document is unknown
  virtual auto GetTextAsync(DocumentId id, utils::CancellationToken token)
      -> asio::awaitable<std::shared_ptr<const DocumentSnapshot>> = 0;
};

}  // namespace symnav
