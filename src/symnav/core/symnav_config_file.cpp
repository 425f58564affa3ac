#include "symnav/core/symnav_config_file.hpp"

#include <filesystem>

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include "symnav/utils/logging.hpp"

namespace symnav {

SymnavConfigFile::SymnavConfigFile(std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? logger : spdlog::default_logger()) {
}

auto SymnavConfigFile::CreateDefault(std::shared_ptr<spdlog::logger> logger)
    -> SymnavConfigFile {
  return SymnavConfigFile(logger);
}

auto SymnavConfigFile::LoadFromFile(
    const CanonicalPath& config_path, std::shared_ptr<spdlog::logger> logger)
    -> std::optional<SymnavConfigFile> {
  SymnavConfigFile config(logger);

  if (!std::filesystem::exists(config_path.Path())) {
    config.logger_->debug(
        "No .symnav configuration file found at {}", config_path);
    return std::nullopt;
  }

  try {
    YAML::Node yaml = YAML::LoadFile(config_path.String());

    if (yaml["Defines"]) {
      for (const auto& define : yaml["Defines"]) {
        if (define.IsMap()) {
          // TRACE: 1 -> "TRACE=1"
          for (const auto& kv : define) {
            config.defines_.push_back(
                kv.first.as<std::string>() + "=" +
                kv.second.as<std::string>());
          }
        } else {
          config.defines_.push_back(define.as<std::string>());
        }
      }
    }

    if (yaml["OtherOptions"]) {
      for (const auto& option : yaml["OtherOptions"]) {
        config.other_options_.push_back(option.as<std::string>());
      }
    }

    // An explicit list replaces the defaults, even when empty
    if (yaml["ScriptExtensions"]) {
      config.script_extensions_.clear();
      for (const auto& ext : yaml["ScriptExtensions"]) {
        auto raw = ext.as<std::string>();
        if (!raw.empty() && raw.front() != '.') {
          raw.insert(raw.begin(), '.');
        }
        config.script_extensions_.push_back(raw);
      }
    }

    if (yaml["Navigation"] && yaml["Navigation"]["TieBreak"]) {
      auto policy = yaml["Navigation"]["TieBreak"].as<std::string>();
      if (policy == "SameProject") {
        config.tie_break_ = TieBreakPolicy::kPreferSameProject;
      } else if (policy == "FirstMatch") {
        config.tie_break_ = TieBreakPolicy::kFirstMatch;
      } else {
        config.logger_->warn(
            "Unknown Navigation.TieBreak '{}', using FirstMatch", policy);
      }
    }

    if (yaml["LogLevel"]) {
      config.log_level_ = yaml["LogLevel"].as<std::string>();
    }

    config.logger_->debug("Loaded .symnav configuration from {}", config_path);
    return config;

  } catch (const YAML::Exception& e) {
    config.logger_->error(
        "Error parsing .symnav configuration file: {}", e.what());
    return std::nullopt;
  } catch (const std::exception& e) {
    config.logger_->error(
        "Error loading .symnav configuration file: {}", e.what());
    return std::nullopt;
  }
}

auto SymnavConfigFile::LoadFromWorkspace(
    const CanonicalPath& workspace_root, std::shared_ptr<spdlog::logger> logger)
    -> std::optional<SymnavConfigFile> {
  return LoadFromFile(workspace_root / kFileName, std::move(logger));
}

auto SymnavConfigFile::ToNavigationSettings() const -> NavigationSettings {
  return NavigationSettings{
      .extra_defines = defines_,
      .extra_options = other_options_,
      .script_extensions = script_extensions_,
      .tie_break = tie_break_,
      .log_level = log_level_
                       ? std::optional(utils::ParseLogLevel(*log_level_))
                       : std::nullopt,
  };
}

}  // namespace symnav
