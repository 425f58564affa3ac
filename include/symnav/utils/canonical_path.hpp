#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include <fmt/format.h>

namespace symnav {

// Absolute, lexically normal file path used as the identity of a document
// file. Symlinks are resolved when the file exists on disk.
class CanonicalPath {
 public:
  CanonicalPath() = default;

  explicit CanonicalPath(std::filesystem::path path);

  static auto FromString(std::string_view path) -> CanonicalPath;

  // Wraps a path the caller has already normalized, as is
  static auto FromNormalized(std::filesystem::path path) -> CanonicalPath;

  auto Path() const -> const std::filesystem::path&;
  auto String() const -> const std::string&;
  auto Filename() const -> std::string;

  auto Empty() const -> bool;

  explicit operator std::string() const {
    return String();
  }

  friend auto operator==(const CanonicalPath& lhs, const CanonicalPath& rhs)
      -> bool {
    return lhs.String() == rhs.String();
  }

  friend auto operator!=(const CanonicalPath& lhs, const CanonicalPath& rhs)
      -> bool {
    return !(lhs == rhs);
  }

  friend auto operator<(const CanonicalPath& lhs, const CanonicalPath& rhs)
      -> bool {
    return lhs.String() < rhs.String();
  }

  auto operator/(std::filesystem::path rhs) const -> CanonicalPath;

 private:
  struct AlreadyNormal {};

  CanonicalPath(AlreadyNormal /*tag*/, std::filesystem::path path);

  std::filesystem::path path_;
  std::string string_;
};

}  // namespace symnav

template <>
struct fmt::formatter<symnav::CanonicalPath> : fmt::formatter<std::string> {
  template <typename FormatContext>
  auto format(const symnav::CanonicalPath& p, FormatContext& ctx) const {
    return fmt::formatter<std::string>::format(p.String(), ctx);
  }
};

template <>
struct std::hash<symnav::CanonicalPath> {
  auto operator()(const symnav::CanonicalPath& path) const noexcept
      -> std::size_t {
    return std::hash<std::string>{}(path.String());
  }
};
