#include "symnav/core/workspace.hpp"

#include <utility>

namespace symnav {

Workspace::Workspace(std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? logger : spdlog::default_logger()) {
}

auto Workspace::AddProject(std::string project_file_name) -> ProjectId {
  std::lock_guard<std::mutex> lock(mutex_);
  auto id = ProjectId{.value = next_project_id_++};
  logger_->debug("Workspace added project {}: {}", id, project_file_name);
  projects_.emplace(
      id.value, ProjectEntry{
                    .project_file_name = std::move(project_file_name),
                    .other_options = std::nullopt,
                });
  return id;
}

auto Workspace::SetProjectOptions(
    ProjectId project, std::vector<std::string> options) -> bool {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = projects_.find(project.value);
  if (it == projects_.end()) {
    logger_->warn("Workspace cannot set options of unknown project {}", project);
    return false;
  }
  it->second.other_options = std::move(options);
  return true;
}

auto Workspace::AddDocument(
    ProjectId project, CanonicalPath path, std::string text)
    -> std::optional<DocumentId> {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!projects_.contains(project.value)) {
    logger_->warn(
        "Workspace cannot add {} to unknown project {}", path, project);
    return std::nullopt;
  }

  auto id = DocumentId{.value = next_document_id_++};
  documents_.emplace(
      id.value,
      DocumentEntry{
          .info = DocumentInfo{.id = id, .project = project, .path = path},
          .snapshot = std::make_shared<const DocumentSnapshot>(
              DocumentSnapshot{.text = std::move(text), .version = 1}),
      });
  logger_->debug("Workspace added document {}: {}", id, path);
  return id;
}

auto Workspace::UpdateText(DocumentId id, std::string text)
    -> std::optional<int> {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = documents_.find(id.value);
  if (it == documents_.end()) {
    return std::nullopt;
  }

  // Snapshots are immutable; readers holding the old one keep it alive
  auto version = it->second.snapshot->version + 1;
  it->second.snapshot = std::make_shared<const DocumentSnapshot>(
      DocumentSnapshot{.text = std::move(text), .version = version});
  return version;
}

auto Workspace::RemoveDocument(DocumentId id) -> bool {
  std::lock_guard<std::mutex> lock(mutex_);
  return documents_.erase(id.value) > 0;
}

auto Workspace::DocumentCount() const -> std::size_t {
  std::lock_guard<std::mutex> lock(mutex_);
  return documents_.size();
}

auto Workspace::GetDocument(DocumentId id) const
    -> std::optional<DocumentInfo> {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = documents_.find(id.value);
  if (it == documents_.end()) {
    return std::nullopt;
  }
  return it->second.info;
}

auto Workspace::GetDocumentIdsWithFilePath(const CanonicalPath& path) const
    -> std::vector<DocumentId> {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<DocumentId> ids;
  for (const auto& [_, entry] : documents_) {
    if (entry.info.path == path) {
      ids.push_back(entry.info.id);
    }
  }
  return ids;
}

auto Workspace::GetProjectOptions(ProjectId project) const
    -> std::optional<ProjectOptions> {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = projects_.find(project.value);
  if (it == projects_.end() || !it->second.other_options) {
    return std::nullopt;
  }

  ProjectOptions options{
      .project = project,
      .project_file_name = it->second.project_file_name,
      .source_files = {},
      .other_options = *it->second.other_options,
  };
  for (const auto& [_, entry] : documents_) {
    if (entry.info.project == project) {
      options.source_files.push_back(entry.info.path);
    }
  }
  return options;
}

auto Workspace::GetTextAsync(DocumentId id, utils::CancellationToken token)
    -> asio::awaitable<std::shared_ptr<const DocumentSnapshot>> {
  if (token.IsCancellationRequested()) {
    co_return nullptr;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  auto it = documents_.find(id.value);
  if (it == documents_.end()) {
    co_return nullptr;
  }
  co_return it->second.snapshot;
}

}  // namespace symnav
