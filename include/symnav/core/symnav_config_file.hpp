#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "symnav/core/project_options.hpp"
#include "symnav/utils/canonical_path.hpp"

namespace symnav {

// Represents the contents of a .symnav configuration file
class SymnavConfigFile {
 public:
  static constexpr auto kFileName = ".symnav";

  explicit SymnavConfigFile(std::shared_ptr<spdlog::logger> logger = nullptr);

  // Configuration used when the workspace has no .symnav file
  static auto CreateDefault(std::shared_ptr<spdlog::logger> logger = nullptr)
      -> SymnavConfigFile;

  // Returns std::nullopt if the file doesn't exist or is not valid YAML
  static auto LoadFromFile(
      const CanonicalPath& config_path,
      std::shared_ptr<spdlog::logger> logger = nullptr)
      -> std::optional<SymnavConfigFile>;

  // Looks for .symnav in `workspace_root`
  static auto LoadFromWorkspace(
      const CanonicalPath& workspace_root,
      std::shared_ptr<spdlog::logger> logger = nullptr)
      -> std::optional<SymnavConfigFile>;

  [[nodiscard]] auto GetDefines() const -> const std::vector<std::string>& {
    return defines_;
  }

  [[nodiscard]] auto GetOtherOptions() const
      -> const std::vector<std::string>& {
    return other_options_;
  }

  [[nodiscard]] auto GetScriptExtensions() const
      -> const std::vector<std::string>& {
    return script_extensions_;
  }

  [[nodiscard]] auto GetTieBreak() const -> TieBreakPolicy {
    return tie_break_;
  }

  // Unset unless the file names a level. ToNavigationSettings parses it.
  [[nodiscard]] auto GetLogLevel() const -> std::optional<std::string> {
    return log_level_;
  }

  [[nodiscard]] auto ToNavigationSettings() const -> NavigationSettings;

 private:
  std::shared_ptr<spdlog::logger> logger_;

  // Macro definitions (NAME or NAME=value)
  std::vector<std::string> defines_;

  // Flags appended to every project's options
  std::vector<std::string> other_options_;

  std::vector<std::string> script_extensions_ = {".fsx", ".fsscript"};

  TieBreakPolicy tie_break_ = TieBreakPolicy::kFirstMatch;

  std::optional<std::string> log_level_;
};

}  // namespace symnav
