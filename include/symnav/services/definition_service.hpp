#pragma once

#include <cstddef>
#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <asio.hpp>
#include <spdlog/spdlog.h>

#include "symnav/core/document.hpp"
#include "symnav/core/navigable_item.hpp"
#include "symnav/core/project_options.hpp"
#include "symnav/core/solution_graph.hpp"
#include "symnav/error/error.hpp"
#include "symnav/features/definition_resolver.hpp"
#include "symnav/features/document_locator.hpp"
#include "symnav/oracle/classification_oracle.hpp"
#include "symnav/oracle/language_oracle.hpp"
#include "symnav/utils/cancellation.hpp"

namespace symnav::services {

// Go-to-definition entry points for the host. No error or exception escapes
// this class; every failure is logged and reported as "no result".
class DefinitionService
    : public std::enable_shared_from_this<DefinitionService> {
 public:
  // Outbound UI message: display text of the first item, then all items
  using NavigationPresenter = std::function<void(
      std::string display_string, std::vector<NavigableItem> items)>;

  // Without a logger, the service logs to the shared "symnav" stderr logger
  // at settings.log_level.
  static auto Create(
      asio::any_io_executor executor, std::shared_ptr<SolutionGraph> graph,
      std::shared_ptr<ClassificationOracle> classifier,
      std::shared_ptr<LanguageOracle> language_oracle,
      NavigationSettings settings = {},
      std::shared_ptr<spdlog::logger> logger = nullptr)
      -> std::shared_ptr<DefinitionService>;

  DefinitionService(const DefinitionService&) = delete;
  DefinitionService(DefinitionService&&) = delete;
  auto operator=(const DefinitionService&) -> DefinitionService& = delete;
  auto operator=(DefinitionService&&) -> DefinitionService& = delete;
  ~DefinitionService() = default;

  auto SetNavigationPresenter(NavigationPresenter presenter) -> void;

  // Zero or one item
  auto FindDefinitionsAsync(
      DocumentId document, std::size_t offset, utils::CancellationToken token)
      -> asio::awaitable<std::vector<NavigableItem>>;

  // Blocks until the pipeline finishes on the service executor or `token`
  // is cancelled. On success the presenter receives the result. Must not be
  // called from a thread that drives the service executor.
  auto TryGoToDefinition(
      DocumentId document, std::size_t offset, utils::CancellationToken token)
      -> bool;

 private:
  DefinitionService(
      asio::any_io_executor executor, std::shared_ptr<SolutionGraph> graph,
      std::shared_ptr<ClassificationOracle> classifier,
      std::shared_ptr<LanguageOracle> language_oracle,
      NavigationSettings settings, std::shared_ptr<spdlog::logger> logger);

  auto ResolveAndLocate(
      DocumentId document, std::size_t offset, utils::CancellationToken token)
      -> asio::awaitable<std::expected<std::optional<NavigableItem>, NavError>>;

  asio::any_io_executor executor_;
  std::shared_ptr<SolutionGraph> graph_;
  NavigationSettings settings_;
  std::shared_ptr<spdlog::logger> logger_;

  features::DefinitionResolver resolver_;
  features::DocumentLocator locator_;

  std::mutex presenter_mutex_;
  NavigationPresenter presenter_;
};

}  // namespace symnav::services
