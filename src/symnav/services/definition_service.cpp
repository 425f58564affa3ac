#include "symnav/services/definition_service.hpp"

#include <condition_variable>
#include <exception>
#include <utility>

#include <fmt/format.h>

#include "symnav/core/compilation_defines.hpp"
#include "symnav/utils/logging.hpp"
#include "symnav/utils/scoped_timer.hpp"

namespace symnav::services {

DefinitionService::DefinitionService(
    asio::any_io_executor executor, std::shared_ptr<SolutionGraph> graph,
    std::shared_ptr<ClassificationOracle> classifier,
    std::shared_ptr<LanguageOracle> language_oracle,
    NavigationSettings settings, std::shared_ptr<spdlog::logger> logger)
    : executor_(std::move(executor)),
      graph_(std::move(graph)),
      settings_(std::move(settings)),
      logger_(
          logger ? logger
                 : utils::CreateLogger(
                       "symnav", settings_.log_level.value_or(
                                     utils::GetLogLevelFromEnv()))),
      resolver_(std::move(classifier), std::move(language_oracle), logger_),
      locator_(graph_, settings_.tie_break, logger_) {
}

auto DefinitionService::Create(
    asio::any_io_executor executor, std::shared_ptr<SolutionGraph> graph,
    std::shared_ptr<ClassificationOracle> classifier,
    std::shared_ptr<LanguageOracle> language_oracle,
    NavigationSettings settings, std::shared_ptr<spdlog::logger> logger)
    -> std::shared_ptr<DefinitionService> {
  return std::shared_ptr<DefinitionService>(new DefinitionService(
      std::move(executor), std::move(graph), std::move(classifier),
      std::move(language_oracle), std::move(settings), std::move(logger)));
}

auto DefinitionService::SetNavigationPresenter(NavigationPresenter presenter)
    -> void {
  std::lock_guard<std::mutex> lock(presenter_mutex_);
  presenter_ = std::move(presenter);
}

auto DefinitionService::FindDefinitionsAsync(
    DocumentId document, std::size_t offset, utils::CancellationToken token)
    -> asio::awaitable<std::vector<NavigableItem>> {
  utils::ScopedTimer timer("FindDefinitionsAsync", logger_);

  std::optional<std::expected<std::optional<NavigableItem>, NavError>> result;
  try {
    result = co_await ResolveAndLocate(document, offset, token);
  } catch (const std::exception& e) {
    logger_->error(
        "DefinitionService fault resolving document {} at {}: {}", document,
        offset, e.what());
    co_return std::vector<NavigableItem>{};
  } catch (...) {
    logger_->error(
        "DefinitionService unknown fault resolving document {} at {}",
        document, offset);
    co_return std::vector<NavigableItem>{};
  }

  if (!*result) {
    const auto& error = result->error();
    if (error.Code() == NavErrorCode::kCancelled ||
        error.Code() == NavErrorCode::kTypecheckAborted) {
      logger_->debug("DefinitionService: {}", error.Message());
    } else {
      logger_->warn("DefinitionService: {}", error.Message());
    }
    co_return std::vector<NavigableItem>{};
  }

  std::vector<NavigableItem> items;
  if (result->value()) {
    items.push_back(std::move(*result->value()));
  }
  co_return items;
}

auto DefinitionService::ResolveAndLocate(
    DocumentId document, std::size_t offset, utils::CancellationToken token)
    -> asio::awaitable<
        std::expected<std::optional<NavigableItem>, NavError>> {
  auto info = graph_->GetDocument(document);
  if (!info) {
    co_return NavError::UnexpectedFromCode(
        NavErrorCode::kDocumentNotFound, fmt::format("{}", document));
  }

  auto options = graph_->GetProjectOptions(info->project);
  if (!options) {
    co_return NavError::UnexpectedFromCode(
        NavErrorCode::kProjectNotConfigured,
        fmt::format("project {}", info->project));
  }
  options->other_options.insert(
      options->other_options.end(), settings_.extra_options.begin(),
      settings_.extra_options.end());

  auto snapshot = co_await graph_->GetTextAsync(document, token);
  if (token.IsCancellationRequested()) {
    co_return NavError::UnexpectedFromCode(NavErrorCode::kCancelled);
  }
  if (!snapshot) {
    co_return NavError::UnexpectedFromCode(
        NavErrorCode::kDocumentNotFound, fmt::format("{} has no text", document));
  }

  auto defines = GetCompilationDefinesForEditing(
      info->path.Path(), options->other_options, settings_.script_extensions,
      settings_.extra_defines);

  auto resolution = co_await resolver_.FindDefinition(
      features::DefinitionRequest{
          .document = document,
          .file_path = info->path,
          .snapshot = snapshot,
          .offset = offset,
          .defines = std::move(defines),
          .options = std::move(*options),
      },
      token);
  if (!resolution) {
    co_return std::unexpected(resolution.error());
  }
  if (!resolution->IsFound()) {
    logger_->debug(
        "DefinitionService: {} at {}: {}", info->path, offset,
        features::ToString(*resolution->Reason()));
    co_return std::nullopt;
  }

  auto item =
      co_await locator_.Locate(*resolution->Range(), info->project, token);
  if (token.IsCancellationRequested()) {
    co_return NavError::UnexpectedFromCode(NavErrorCode::kCancelled);
  }
  co_return item;
}

auto DefinitionService::TryGoToDefinition(
    DocumentId document, std::size_t offset, utils::CancellationToken token)
    -> bool {
  struct WaitState {
    std::mutex mutex;
    std::condition_variable cv;
    bool completed = false;
    bool faulted = false;
    std::vector<NavigableItem> items;
  };
  auto state = std::make_shared<WaitState>();

  // Wake the wait as soon as the host cancels
  auto registration = token.OnCancel([state]() {
    std::lock_guard<std::mutex> lock(state->mutex);
    state->cv.notify_all();
  });

  asio::co_spawn(
      executor_,
      [self = shared_from_this(), document, offset, token]() {
        return self->FindDefinitionsAsync(document, offset, token);
      },
      [state](std::exception_ptr error, std::vector<NavigableItem> items) {
        std::lock_guard<std::mutex> lock(state->mutex);
        state->completed = true;
        state->faulted = error != nullptr;
        state->items = std::move(items);
        state->cv.notify_all();
      });

  std::vector<NavigableItem> items;
  {
    std::unique_lock<std::mutex> lock(state->mutex);
    state->cv.wait(lock, [&state, &token]() {
      return state->completed || token.IsCancellationRequested();
    });
    if (!state->completed) {
      logger_->debug(
          "DefinitionService go-to-definition cancelled for document {}",
          document);
      return false;
    }
    if (state->faulted) {
      logger_->error(
          "DefinitionService go-to-definition faulted for document {}",
          document);
      return false;
    }
    items = std::move(state->items);
  }

  if (items.empty()) {
    return false;
  }

  NavigationPresenter presenter;
  {
    std::lock_guard<std::mutex> lock(presenter_mutex_);
    presenter = presenter_;
  }
  if (presenter) {
    auto display_string = items.front().display_string;
    presenter(std::move(display_string), std::move(items));
  }
  return true;
}

}  // namespace symnav::services
