#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "symnav/core/solution_graph.hpp"

namespace symnav {

// Thread-safe in-memory SolutionGraph populated directly by the host.
// Documents enumerate in registration order.
class Workspace : public SolutionGraph {
 public:
  explicit Workspace(std::shared_ptr<spdlog::logger> logger = nullptr);

  // Register a project. Its options stay unknown until SetProjectOptions.
  auto AddProject(std::string project_file_name) -> ProjectId;

  // Returns false if the project is unknown
  auto SetProjectOptions(ProjectId project, std::vector<std::string> options)
      -> bool;

  // Returns nullopt if the project is unknown. The document starts at
  // version 1.
  auto AddDocument(ProjectId project, CanonicalPath path, std::string text)
      -> std::optional<DocumentId>;

  // Replace a document's text. Returns the new version, or nullopt if the
  // document is unknown.
  auto UpdateText(DocumentId id, std::string text) -> std::optional<int>;

  auto RemoveDocument(DocumentId id) -> bool;

  auto DocumentCount() const -> std::size_t;

  // SolutionGraph implementation
  auto GetDocument(DocumentId id) const
      -> std::optional<DocumentInfo> override;

  auto GetDocumentIdsWithFilePath(const CanonicalPath& path) const
      -> std::vector<DocumentId> override;

  auto GetProjectOptions(ProjectId project) const
      -> std::optional<ProjectOptions> override;

  auto GetTextAsync(DocumentId id, utils::CancellationToken token)
      -> asio::awaitable<std::shared_ptr<const DocumentSnapshot>> override;

 private:
  struct ProjectEntry {
    std::string project_file_name;
    std::optional<std::vector<std::string>> other_options;
  };

  struct DocumentEntry {
    DocumentInfo info;
    std::shared_ptr<const DocumentSnapshot> snapshot;
  };

  std::shared_ptr<spdlog::logger> logger_;

  mutable std::mutex mutex_;

  // Keyed by id value; ids are issued in increasing order
  std::map<std::uint64_t, ProjectEntry> projects_;
  std::map<std::uint64_t, DocumentEntry> documents_;
  std::uint64_t next_project_id_ = 1;
  std::uint64_t next_document_id_ = 1;
};

}  // namespace symnav
