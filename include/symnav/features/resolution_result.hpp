#pragma once

#include <optional>
#include <string_view>
#include <utility>

#include "symnav/oracle/language_oracle.hpp"
#include "symnav/oracle/source_range.hpp"

namespace symnav::features {

// Why a well-formed request produced no declaration
enum class NotFoundReason {
  kNotIdentifier,
  kNoIsland,
  kNoDeclaration,
};

inline auto ToString(NotFoundReason reason) -> std::string_view {
  switch (reason) {
    case NotFoundReason::kNotIdentifier:
      return "not an identifier";
    case NotFoundReason::kNoIsland:
      return "no identifier island";
    case NotFoundReason::kNoDeclaration:
      return "no declaration";
  }
  return "unknown";
}

// Outcome of one resolution: the oracle's declaration range, or why none
class ResolutionResult {
 public:
  static auto Found(OracleRange range) -> ResolutionResult {
    return ResolutionResult(std::move(range), std::nullopt, std::nullopt);
  }

  // `oracle_reason` is the language oracle's own account, given only with
  // kNoDeclaration
  static auto NotFound(
      NotFoundReason reason,
      std::optional<DeclNotFoundReason> oracle_reason = std::nullopt)
      -> ResolutionResult {
    return ResolutionResult(std::nullopt, reason, oracle_reason);
  }

  [[nodiscard]] auto IsFound() const -> bool {
    return range_.has_value();
  }

  [[nodiscard]] auto Range() const -> const std::optional<OracleRange>& {
    return range_;
  }

  // nullopt when IsFound()
  [[nodiscard]] auto Reason() const -> std::optional<NotFoundReason> {
    return reason_;
  }

  [[nodiscard]] auto OracleReason() const
      -> std::optional<DeclNotFoundReason> {
    return oracle_reason_;
  }

 private:
  ResolutionResult(
      std::optional<OracleRange> range, std::optional<NotFoundReason> reason,
      std::optional<DeclNotFoundReason> oracle_reason)
      : range_(std::move(range)),
        reason_(reason),
        oracle_reason_(oracle_reason) {
  }

  std::optional<OracleRange> range_;
  std::optional<NotFoundReason> reason_;
  std::optional<DeclNotFoundReason> oracle_reason_;
};

}  // namespace symnav::features
