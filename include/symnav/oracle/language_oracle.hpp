#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <asio.hpp>

#include "symnav/core/project_options.hpp"
#include "symnav/oracle/source_range.hpp"
#include "symnav/utils/cancellation.hpp"
#include "symnav/utils/canonical_path.hpp"

namespace symnav {

// Oracle-owned parse tree handle. Opaque to the navigation pipeline.
class ParseResults {
 public:
  ParseResults() = default;
  ParseResults(const ParseResults&) = default;
  ParseResults(ParseResults&&) = delete;
  auto operator=(const ParseResults&) -> ParseResults& = default;
  auto operator=(ParseResults&&) -> ParseResults& = delete;
  virtual ~ParseResults() = default;
};

enum class DeclNotFoundReason {
  kUnknown,
  kNoSourceCode,
  kProvidedType,
  kProvidedMember,
};

inline auto ToString(DeclNotFoundReason reason) -> std::string_view {
  switch (reason) {
    case DeclNotFoundReason::kUnknown:
      return "unknown";
    case DeclNotFoundReason::kNoSourceCode:
      return "no source code";
    case DeclNotFoundReason::kProvidedType:
      return "provided type";
    case DeclNotFoundReason::kProvidedMember:
      return "provided member";
  }
  return "unknown";
}

// Answer of a declaration lookup
class FindDeclResult {
 public:
  static auto DeclFound(OracleRange range) -> FindDeclResult {
    return FindDeclResult(std::move(range), DeclNotFoundReason::kUnknown);
  }

  static auto DeclNotFound(
      DeclNotFoundReason reason = DeclNotFoundReason::kUnknown)
      -> FindDeclResult {
    return FindDeclResult(std::nullopt, reason);
  }

  [[nodiscard]] auto IsFound() const -> bool {
    return range_.has_value();
  }

  // Only meaningful when IsFound()
  [[nodiscard]] auto Range() const -> const OracleRange& {
    return *range_;
  }

  [[nodiscard]] auto Reason() const -> DeclNotFoundReason {
    return reason_;
  }

 private:
  FindDeclResult(std::optional<OracleRange> range, DeclNotFoundReason reason)
      : range_(std::move(range)), reason_(reason) {
  }

  std::optional<OracleRange> range_;
  DeclNotFoundReason reason_;
};

// Typecheck results of one file version
class CheckResults {
 public:
  CheckResults() = default;
  CheckResults(const CheckResults&) = default;
  CheckResults(CheckResults&&) = delete;
  auto operator=(const CheckResults&) -> CheckResults& = default;
  auto operator=(CheckResults&&) -> CheckResults& = delete;
  virtual ~CheckResults() = default;

  // `line` is 1-based, `column` is the island's 0-based start column.
  // `precise` requests exact overload resolution at the cost of speed.
  virtual auto GetDeclarationLocation(
      int line, int column, std::string line_text,
      std::vector<std::string> qualifiers, bool precise,
      utils::CancellationToken token) -> asio::awaitable<FindDeclResult> = 0;
};

// Typecheck either completes or is abandoned by the oracle
class CheckFileAnswer {
 public:
  static auto Aborted() -> CheckFileAnswer {
    return CheckFileAnswer(nullptr);
  }

  static auto Succeeded(std::shared_ptr<CheckResults> results)
      -> CheckFileAnswer {
    return CheckFileAnswer(std::move(results));
  }

  [[nodiscard]] auto IsAborted() const -> bool {
    return results_ == nullptr;
  }

  [[nodiscard]] auto Results() const -> const std::shared_ptr<CheckResults>& {
    return results_;
  }

 private:
  explicit CheckFileAnswer(std::shared_ptr<CheckResults> results)
      : results_(std::move(results)) {
  }

  std::shared_ptr<CheckResults> results_;
};

// Parse and typecheck services of the language toolchain. Any caching of
// parse trees or check results is the implementation's business.
class LanguageOracle {
 public:
  LanguageOracle() = default;
  LanguageOracle(const LanguageOracle&) = default;
  LanguageOracle(LanguageOracle&&) = delete;
  auto operator=(const LanguageOracle&) -> LanguageOracle& = default;
  auto operator=(LanguageOracle&&) -> LanguageOracle& = delete;
  virtual ~LanguageOracle() = default;

  virtual auto ParseFile(
      CanonicalPath file_path, std::string source, ProjectOptions options,
      utils::CancellationToken token)
      -> asio::awaitable<std::shared_ptr<const ParseResults>> = 0;

  virtual auto CheckFile(
      std::shared_ptr<const ParseResults> parse, CanonicalPath file_path,
      int version, std::string source, ProjectOptions options,
      utils::CancellationToken token) -> asio::awaitable<CheckFileAnswer> = 0;
};

}  // namespace symnav
