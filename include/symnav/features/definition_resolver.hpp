#pragma once

#include <cstddef>
#include <expected>
#include <memory>
#include <string>
#include <vector>

#include <asio.hpp>
#include <spdlog/spdlog.h>

#include "symnav/core/document.hpp"
#include "symnav/core/project_options.hpp"
#include "symnav/error/error.hpp"
#include "symnav/features/classification_filter.hpp"
#include "symnav/features/resolution_result.hpp"
#include "symnav/oracle/language_oracle.hpp"
#include "symnav/utils/cancellation.hpp"
#include "symnav/utils/canonical_path.hpp"

namespace symnav::features {

// Everything one resolution needs, captured before the pipeline starts
struct DefinitionRequest {
  DocumentId document;
  CanonicalPath file_path;
  std::shared_ptr<const DocumentSnapshot> snapshot;
  std::size_t offset = 0;

  // Editing defines for classification
  std::vector<std::string> defines;
  ProjectOptions options;
};

// Runs classify -> island -> parse -> typecheck -> declaration lookup for
// one cursor position
class DefinitionResolver {
 public:
  DefinitionResolver(
      std::shared_ptr<ClassificationOracle> classifier,
      std::shared_ptr<LanguageOracle> language_oracle,
      std::shared_ptr<spdlog::logger> logger = nullptr);

  // NotFound results are normal outcomes. Errors: kInvalidOffset,
  // kTypecheckAborted, kCancelled, kOracleFailure.
  auto FindDefinition(DefinitionRequest request, utils::CancellationToken token)
      -> asio::awaitable<std::expected<ResolutionResult, NavError>>;

 private:
  ClassificationFilter filter_;
  std::shared_ptr<LanguageOracle> language_oracle_;
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace symnav::features
