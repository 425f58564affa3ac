#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace symnav {

// Case-insensitive extension check; `extensions` include the leading dot
[[nodiscard]] auto HasExtension(
    const std::filesystem::path& path,
    const std::vector<std::string>& extensions) -> bool;

// Script files get the interactive set of editing defines
[[nodiscard]] auto IsScriptFile(
    const std::filesystem::path& path,
    const std::vector<std::string>& script_extensions) -> bool;

// Absolute, lexically normal form of `path`. Existing files are fully
// canonicalized (symlinks resolved). Returns nullopt if the filesystem
// refuses to normalize the path.
[[nodiscard]] auto TryNormalizePath(const std::filesystem::path& path)
    -> std::optional<std::filesystem::path>;

// Lenient variant of TryNormalizePath: falls back to `path` unchanged
[[nodiscard]] auto NormalizePath(std::filesystem::path path)
    -> std::filesystem::path;

}  // namespace symnav
