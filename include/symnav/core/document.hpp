#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

#include <fmt/format.h>

#include "symnav/utils/canonical_path.hpp"

namespace symnav {

// Opaque handles issued by the solution graph
struct ProjectId {
  std::uint64_t value = 0;

  friend auto operator==(const ProjectId&, const ProjectId&) -> bool = default;
  friend auto operator<(const ProjectId& lhs, const ProjectId& rhs) -> bool {
    return lhs.value < rhs.value;
  }
};

struct DocumentId {
  std::uint64_t value = 0;

  friend auto operator==(const DocumentId&, const DocumentId&)
      -> bool = default;
  friend auto operator<(const DocumentId& lhs, const DocumentId& rhs) -> bool {
    return lhs.value < rhs.value;
  }
};

// Half-open [start, end) range of byte offsets into a document's text
struct TextSpan {
  std::size_t start = 0;
  std::size_t end = 0;

  [[nodiscard]] auto Length() const -> std::size_t {
    return end - start;
  }

  [[nodiscard]] auto Contains(std::size_t offset) const -> bool {
    return offset >= start && offset < end;
  }

  friend auto operator==(const TextSpan&, const TextSpan&) -> bool = default;
};

// Identity of a document inside the solution graph
struct DocumentInfo {
  DocumentId id;
  ProjectId project;
  CanonicalPath path;
};

// Text of a document at one version. Versions only ever increase.
struct DocumentSnapshot {
  std::string text;
  int version = 0;
};

}  // namespace symnav

template <>
struct fmt::formatter<symnav::ProjectId> : fmt::formatter<std::uint64_t> {
  template <typename FormatContext>
  auto format(const symnav::ProjectId& id, FormatContext& ctx) const {
    return fmt::formatter<std::uint64_t>::format(id.value, ctx);
  }
};

template <>
struct fmt::formatter<symnav::DocumentId> : fmt::formatter<std::uint64_t> {
  template <typename FormatContext>
  auto format(const symnav::DocumentId& id, FormatContext& ctx) const {
    return fmt::formatter<std::uint64_t>::format(id.value, ctx);
  }
};

template <>
struct std::hash<symnav::DocumentId> {
  auto operator()(const symnav::DocumentId& id) const noexcept -> std::size_t {
    return std::hash<std::uint64_t>{}(id.value);
  }
};
