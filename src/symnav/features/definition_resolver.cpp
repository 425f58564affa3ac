#include "symnav/features/definition_resolver.hpp"

#include <optional>
#include <utility>

#include <fmt/ranges.h>

#include "symnav/text/island_extractor.hpp"
#include "symnav/text/line_index.hpp"
#include "symnav/text/position_mapper.hpp"

namespace symnav::features {

namespace {

// Runs one oracle call, turning a thrown exception into kOracleFailure
template <typename T>
auto GuardOracleCall(
    asio::awaitable<T> call, std::string_view stage,
    std::shared_ptr<spdlog::logger> logger)
    -> asio::awaitable<std::expected<T, NavError>> {
  std::optional<std::string> failure;
  try {
    co_return co_await std::move(call);
  } catch (const std::exception& e) {
    failure = e.what();
  } catch (...) {
    failure = "unknown exception";
  }
  logger->error("DefinitionResolver {} failed: {}", stage, *failure);
  co_return NavError::UnexpectedFromCode(
      NavErrorCode::kOracleFailure, fmt::format("{}: {}", stage, *failure));
}

auto Cancelled() -> std::unexpected<NavError> {
  return NavError::UnexpectedFromCode(NavErrorCode::kCancelled);
}

}  // namespace

DefinitionResolver::DefinitionResolver(
    std::shared_ptr<ClassificationOracle> classifier,
    std::shared_ptr<LanguageOracle> language_oracle,
    std::shared_ptr<spdlog::logger> logger)
    : filter_(std::move(classifier), logger),
      language_oracle_(std::move(language_oracle)),
      logger_(logger ? logger : spdlog::default_logger()) {
}

auto DefinitionResolver::FindDefinition(
    DefinitionRequest request, utils::CancellationToken token)
    -> asio::awaitable<std::expected<ResolutionResult, NavError>> {
  const auto& text = request.snapshot->text;
  const text::LineIndex index(text);

  auto position = text::ToOraclePosition(index, request.offset);
  if (!position) {
    co_return std::unexpected(position.error());
  }
  auto line = text::LineAt(text, index, request.offset);
  if (!line) {
    co_return std::unexpected(line.error());
  }
  logger_->debug(
      "DefinitionResolver resolving {}:{} at {}", request.file_path,
      request.offset, *position);

  auto is_identifier = co_await filter_.IsIdentifierSpan(
      request.document, request.snapshot, request.file_path, line->span,
      request.offset, request.defines, token);
  if (!is_identifier) {
    co_return std::unexpected(is_identifier.error());
  }
  if (!*is_identifier) {
    co_return ResolutionResult::NotFound(NotFoundReason::kNotIdentifier);
  }

  auto island = text::ExtractIsland(
      line->text, static_cast<std::size_t>(position->column));
  if (!island) {
    logger_->debug("DefinitionResolver found no island at {}", *position);
    co_return ResolutionResult::NotFound(NotFoundReason::kNoIsland);
  }
  logger_->debug(
      "DefinitionResolver island [{}] at column {}",
      fmt::join(island->qualifiers, ", "), island->column);

  auto parse = co_await GuardOracleCall(
      language_oracle_->ParseFile(
          request.file_path, text, request.options, token),
      "parse", logger_);
  if (!parse) {
    co_return std::unexpected(parse.error());
  }
  if (token.IsCancellationRequested()) {
    co_return Cancelled();
  }

  auto check = co_await GuardOracleCall(
      language_oracle_->CheckFile(
          *parse, request.file_path, request.snapshot->version, text,
          request.options, token),
      "typecheck", logger_);
  if (!check) {
    co_return std::unexpected(check.error());
  }
  if (token.IsCancellationRequested()) {
    co_return Cancelled();
  }
  if (check->IsAborted()) {
    logger_->debug(
        "DefinitionResolver typecheck aborted for {} v{}", request.file_path,
        request.snapshot->version);
    co_return NavError::UnexpectedFromCode(
        NavErrorCode::kTypecheckAborted,
        fmt::format("{} v{}", request.file_path, request.snapshot->version));
  }

  auto declaration = co_await GuardOracleCall(
      check->Results()->GetDeclarationLocation(
          line->number, static_cast<int>(island->column), line->text,
          island->qualifiers, false, token),
      "declaration lookup", logger_);
  if (!declaration) {
    co_return std::unexpected(declaration.error());
  }
  if (token.IsCancellationRequested()) {
    co_return Cancelled();
  }

  if (!declaration->IsFound()) {
    logger_->debug(
        "DefinitionResolver has no declaration for {}: {}",
        fmt::join(island->qualifiers, "."),
        symnav::ToString(declaration->Reason()));
    co_return ResolutionResult::NotFound(
        NotFoundReason::kNoDeclaration, declaration->Reason());
  }
  logger_->debug(
      "DefinitionResolver found declaration at {}", declaration->Range());
  co_return ResolutionResult::Found(declaration->Range());
}

}  // namespace symnav::features
