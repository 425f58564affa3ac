#include "symnav/utils/path_utils.hpp"

#include <algorithm>
#include <cctype>
#include <system_error>

namespace symnav {

namespace {

auto ToLower(std::string text) -> std::string {
  std::ranges::transform(
      text, text.begin(), [](unsigned char c) { return std::tolower(c); });
  return text;
}

}  // namespace

auto HasExtension(
    const std::filesystem::path& path,
    const std::vector<std::string>& extensions) -> bool {
  auto ext = ToLower(path.extension().string());
  if (ext.empty()) {
    return false;
  }
  return std::ranges::any_of(extensions, [&ext](const std::string& candidate) {
    return ToLower(candidate) == ext;
  });
}

auto IsScriptFile(
    const std::filesystem::path& path,
    const std::vector<std::string>& script_extensions) -> bool {
  return HasExtension(path, script_extensions);
}

auto TryNormalizePath(const std::filesystem::path& path)
    -> std::optional<std::filesystem::path> {
  if (path.empty()) {
    return std::nullopt;
  }

  std::error_code ec;
  if (std::filesystem::exists(path, ec)) {
    auto canonical = std::filesystem::canonical(path, ec);
    if (!ec) {
      return canonical;
    }
  }

  // Synthetic or not-yet-saved files: absolute + lexical normalization only
  auto absolute = std::filesystem::absolute(path, ec);
  if (ec) {
    return std::nullopt;
  }
  return absolute.lexically_normal();
}

auto NormalizePath(std::filesystem::path path) -> std::filesystem::path {
  auto normalized = TryNormalizePath(path);
  if (!normalized) {
    return path;
  }
  return *normalized;
}

}  // namespace symnav
