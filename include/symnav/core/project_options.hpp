#pragma once

#include <optional>
#include <string>
#include <vector>

#include <spdlog/common.h>

#include "symnav/core/document.hpp"
#include "symnav/utils/canonical_path.hpp"

namespace symnav {

// Compilation configuration of one project, as handed to the oracle
struct ProjectOptions {
  ProjectId project;
  std::string project_file_name;
  std::vector<CanonicalPath> source_files;

  // Raw compiler flags, e.g. "--define:DEBUG" or "--warnon:1182"
  std::vector<std::string> other_options;
};

// Which document wins when several documents share the definition's path
enum class TieBreakPolicy {
  kFirstMatch,
  kPreferSameProject,
};

// Workspace-level settings applied on top of every project's options
struct NavigationSettings {
  std::vector<std::string> extra_defines;
  std::vector<std::string> extra_options;
  std::vector<std::string> script_extensions = {".fsx", ".fsscript"};
  TieBreakPolicy tie_break = TieBreakPolicy::kFirstMatch;

  // Level of the logger a service builds when the host passes none. Unset
  // means SYMNAV_LOG_LEVEL.
  std::optional<spdlog::level::level_enum> log_level;
};

}  // namespace symnav
