#include "symnav/utils/canonical_path.hpp"

#include <utility>

#include "symnav/utils/path_utils.hpp"

namespace symnav {

CanonicalPath::CanonicalPath(std::filesystem::path path)
    : path_(NormalizePath(std::move(path))), string_(path_.string()) {
}

CanonicalPath::CanonicalPath(AlreadyNormal /*tag*/, std::filesystem::path path)
    : path_(std::move(path)), string_(path_.string()) {
}

auto CanonicalPath::FromNormalized(std::filesystem::path path)
    -> CanonicalPath {
  return CanonicalPath(AlreadyNormal{}, std::move(path));
}

auto CanonicalPath::FromString(std::string_view path) -> CanonicalPath {
  return CanonicalPath(std::filesystem::path(path));
}

auto CanonicalPath::Path() const -> const std::filesystem::path& {
  return path_;
}

auto CanonicalPath::String() const -> const std::string& {
  return string_;
}

auto CanonicalPath::Filename() const -> std::string {
  return path_.filename().string();
}

auto CanonicalPath::Empty() const -> bool {
  return path_.empty();
}

auto CanonicalPath::operator/(std::filesystem::path rhs) const
    -> CanonicalPath {
  return CanonicalPath(path_ / rhs);
}

}  // namespace symnav
