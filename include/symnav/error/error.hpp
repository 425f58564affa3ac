#pragma once

#include <expected>
#include <string>
#include <string_view>
#include <utility>

namespace symnav {

enum class NavErrorCode {
  // Request preconditions
  kInvalidOffset,
  kDocumentNotFound,
  kProjectNotConfigured,

  // Oracle outcomes
  kTypecheckAborted,
  kOracleFailure,

  // Position mapping onto a target document
  kRangeOutOfDocument,

  // The request's cancellation token fired
  kCancelled,
};

namespace detail {

inline auto DefaultMessageFor(NavErrorCode code) -> std::string_view {
  switch (code) {
    case NavErrorCode::kInvalidOffset:
      return "Offset is outside the document";
    case NavErrorCode::kDocumentNotFound:
      return "Document not found";
    case NavErrorCode::kProjectNotConfigured:
      return "Project has no compilation options";
    case NavErrorCode::kTypecheckAborted:
      return "Typecheck was aborted";
    case NavErrorCode::kOracleFailure:
      return "Language oracle failed";
    case NavErrorCode::kRangeOutOfDocument:
      return "Range is outside the document";
    case NavErrorCode::kCancelled:
      return "Request cancelled";
  }
  return "Unknown error";
}

}  // namespace detail

class NavError {
 public:
  NavError(NavErrorCode code, std::string message)
      : code_(code), message_(std::move(message)) {
  }

  [[nodiscard]] auto Code() const -> NavErrorCode {
    return code_;
  }
  [[nodiscard]] auto Message() const -> const std::string& {
    return message_;
  }

  // Default text for `code`, with `details` appended when given
  static auto FromCode(NavErrorCode code, std::string_view details = {})
      -> NavError {
    std::string message(detail::DefaultMessageFor(code));
    if (!details.empty()) {
      message += ": ";
      message += details;
    }
    return {code, std::move(message)};
  }

  static auto UnexpectedFromCode(
      NavErrorCode code, std::string_view details = {})
      -> std::unexpected<NavError> {
    return std::unexpected<NavError>(FromCode(code, details));
  }

 private:
  NavErrorCode code_;
  std::string message_;
};

}  // namespace symnav
