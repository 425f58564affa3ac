#include "symnav/core/symnav_config_file.hpp"

#include <catch2/catch_all.hpp>
#include <spdlog/spdlog.h>

#include "test/symnav/common/file_fixture.hpp"

constexpr auto kLogLevel = spdlog::level::debug;

auto main(int argc, char* argv[]) -> int {
  spdlog::set_level(kLogLevel);
  spdlog::set_pattern("[%l] %v");
  return Catch::Session().run(argc, argv);
}

using symnav::SymnavConfigFile;
using symnav::TieBreakPolicy;
using Strings = std::vector<std::string>;

TEST_CASE("SymnavConfigFile loads every section", "[config]") {
  symnav::test::TempWorkspace fixture("symnav_config_full");
  fixture.WriteFile(".symnav", R"(
Defines:
  - DEBUG
  - TRACE: 1
OtherOptions:
  - --define:EXTRA
  - --warnon:1182
ScriptExtensions:
  - .fsx
  - csx
Navigation:
  TieBreak: SameProject
LogLevel: debug
)");

  auto config = SymnavConfigFile::LoadFromWorkspace(fixture.Root());

  REQUIRE(config.has_value());
  REQUIRE(config->GetDefines() == Strings{"DEBUG", "TRACE=1"});
  REQUIRE(
      config->GetOtherOptions() == Strings{"--define:EXTRA", "--warnon:1182"});
  REQUIRE(config->GetScriptExtensions() == Strings{".fsx", ".csx"});
  REQUIRE(config->GetTieBreak() == TieBreakPolicy::kPreferSameProject);
  REQUIRE(config->GetLogLevel() == "debug");
}

TEST_CASE("SymnavConfigFile converts to navigation settings", "[config]") {
  symnav::test::TempWorkspace fixture("symnav_config_settings");
  auto path = fixture.WriteFile(".symnav", R"(
Defines: [FOO]
OtherOptions: [--define:BAR]
)");

  auto config = SymnavConfigFile::LoadFromFile(path);
  REQUIRE(config.has_value());

  auto settings = config->ToNavigationSettings();
  REQUIRE(settings.extra_defines == Strings{"FOO"});
  REQUIRE(settings.extra_options == Strings{"--define:BAR"});
  REQUIRE(settings.script_extensions == Strings{".fsx", ".fsscript"});
  REQUIRE(settings.tie_break == TieBreakPolicy::kFirstMatch);
  REQUIRE_FALSE(settings.log_level.has_value());
}

TEST_CASE("SymnavConfigFile carries the log level into settings",
          "[config]") {
  symnav::test::TempWorkspace fixture("symnav_config_log_level");
  auto path = fixture.WriteFile(".symnav", "LogLevel: warn\n");

  auto config = SymnavConfigFile::LoadFromFile(path);
  REQUIRE(config.has_value());

  auto settings = config->ToNavigationSettings();
  REQUIRE(settings.log_level == spdlog::level::warn);
}

TEST_CASE("SymnavConfigFile keeps FirstMatch for unknown tie-break",
          "[config]") {
  symnav::test::TempWorkspace fixture("symnav_config_tiebreak");
  auto path = fixture.WriteFile(".symnav", R"(
Navigation:
  TieBreak: Random
)");

  auto config = SymnavConfigFile::LoadFromFile(path);

  REQUIRE(config.has_value());
  REQUIRE(config->GetTieBreak() == TieBreakPolicy::kFirstMatch);
  REQUIRE_FALSE(config->GetLogLevel().has_value());
}

TEST_CASE("SymnavConfigFile returns nullopt for a missing file",
          "[config]") {
  symnav::test::TempWorkspace fixture("symnav_config_missing");

  REQUIRE_FALSE(
      SymnavConfigFile::LoadFromWorkspace(fixture.Root()).has_value());
}

TEST_CASE("SymnavConfigFile returns nullopt for malformed YAML", "[config]") {
  symnav::test::TempWorkspace fixture("symnav_config_malformed");
  auto path = fixture.WriteFile(".symnav", "Defines: [unterminated\n");

  REQUIRE_FALSE(SymnavConfigFile::LoadFromFile(path).has_value());
}

TEST_CASE("SymnavConfigFile default has script extensions only",
          "[config]") {
  auto settings = SymnavConfigFile::CreateDefault().ToNavigationSettings();

  REQUIRE(settings.extra_defines.empty());
  REQUIRE(settings.extra_options.empty());
  REQUIRE(settings.script_extensions == Strings{".fsx", ".fsscript"});
  REQUIRE(settings.tie_break == TieBreakPolicy::kFirstMatch);
}
