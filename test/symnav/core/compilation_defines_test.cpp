#include "symnav/core/compilation_defines.hpp"

#include <catch2/catch_all.hpp>
#include <spdlog/spdlog.h>

constexpr auto kLogLevel = spdlog::level::debug;

auto main(int argc, char* argv[]) -> int {
  spdlog::set_level(kLogLevel);
  spdlog::set_pattern("[%l] %v");
  return Catch::Session().run(argc, argv);
}

using Strings = std::vector<std::string>;

const Strings kScriptExtensions = {".fsx", ".fsscript"};

TEST_CASE("Source files are compiled while editing", "[defines]") {
  auto defines = symnav::GetCompilationDefinesForEditing(
      "/w/Lib.fs", {}, kScriptExtensions);

  REQUIRE(defines == Strings{"COMPILED", "EDITING"});
}

TEST_CASE("Script files are interactive while editing", "[defines]") {
  REQUIRE(
      symnav::GetCompilationDefinesForEditing(
          "/w/build.fsx", {}, kScriptExtensions) ==
      Strings{"INTERACTIVE", "EDITING"});
  REQUIRE(
      symnav::GetCompilationDefinesForEditing(
          "/w/tool.FSSCRIPT", {}, kScriptExtensions) ==
      Strings{"INTERACTIVE", "EDITING"});
}

TEST_CASE("Defines come from every define flag form", "[defines]") {
  Strings options = {
      "--define:DEBUG", "--warnon:1182", "-d:TRACE", "--define", "NETSTANDARD",
      "--optimize+"};

  REQUIRE(
      symnav::ParseDefinesFromOptions(options) ==
      Strings{"DEBUG", "TRACE", "NETSTANDARD"});

  REQUIRE(
      symnav::GetCompilationDefinesForEditing(
          "/w/Lib.fs", options, kScriptExtensions) ==
      Strings{"COMPILED", "EDITING", "DEBUG", "TRACE", "NETSTANDARD"});
}

TEST_CASE("Extra defines are appended without duplicates", "[defines]") {
  auto defines = symnav::GetCompilationDefinesForEditing(
      "/w/Lib.fs", {"--define:DEBUG", "--define:DEBUG"}, kScriptExtensions,
      {"EDITING", "LOCAL", "DEBUG"});

  REQUIRE(defines == Strings{"COMPILED", "EDITING", "DEBUG", "LOCAL"});
}

TEST_CASE("Dangling and empty define flags are ignored", "[defines]") {
  REQUIRE(symnav::ParseDefinesFromOptions({"--define:", "--define"}).empty());
}
