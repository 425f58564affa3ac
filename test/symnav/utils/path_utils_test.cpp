#include "symnav/utils/path_utils.hpp"

#include <filesystem>

#include <catch2/catch_all.hpp>
#include <spdlog/spdlog.h>

#include "symnav/utils/canonical_path.hpp"
#include "test/symnav/common/file_fixture.hpp"

constexpr auto kLogLevel = spdlog::level::debug;

auto main(int argc, char* argv[]) -> int {
  spdlog::set_level(kLogLevel);
  spdlog::set_pattern("[%l] %v");
  return Catch::Session().run(argc, argv);
}

TEST_CASE("HasExtension ignores case", "[path_utils]") {
  std::vector<std::string> extensions = {".fsx", ".fsscript"};

  REQUIRE(symnav::HasExtension("/w/build.FSX", extensions));
  REQUIRE(symnav::HasExtension("tools/run.fsscript", extensions));
  REQUIRE_FALSE(symnav::HasExtension("/w/lib.fs", extensions));
  REQUIRE_FALSE(symnav::HasExtension("/w/Makefile", extensions));
}

TEST_CASE("TryNormalizePath makes missing files absolute and lexical",
          "[path_utils]") {
  auto normalized =
      symnav::TryNormalizePath("/no/such/dir/../file.fs");

  REQUIRE(normalized.has_value());
  REQUIRE(*normalized == std::filesystem::path("/no/such/file.fs"));
}

TEST_CASE("TryNormalizePath rejects empty paths", "[path_utils]") {
  REQUIRE_FALSE(symnav::TryNormalizePath("").has_value());
  REQUIRE(symnav::NormalizePath("").empty());
}

TEST_CASE("TryNormalizePath resolves relative paths of existing files",
          "[path_utils]") {
  symnav::test::TempWorkspace fixture("symnav_path_utils_test");
  auto file = fixture.WriteFile("lib.fs", "module Lib\n");

  auto relative = std::filesystem::relative(
      file.Path(), std::filesystem::current_path());
  auto normalized = symnav::TryNormalizePath(relative);

  REQUIRE(normalized.has_value());
  REQUIRE(*normalized == file.Path());
}

TEST_CASE("CanonicalPath compares normalized paths", "[path_utils]") {
  auto lhs = symnav::CanonicalPath::FromString("/src/a/../b/File.fs");
  auto rhs = symnav::CanonicalPath::FromString("/src/b/File.fs");

  REQUIRE(lhs == rhs);
  REQUIRE(lhs.Filename() == "File.fs");
  REQUIRE(fmt::format("{}", lhs) == "/src/b/File.fs");
  REQUIRE((symnav::CanonicalPath::FromString("/src") / "b/File.fs") == rhs);
}

TEST_CASE("CanonicalPath::FromNormalized keeps the path as given",
          "[path_utils]") {
  auto normal = symnav::CanonicalPath::FromNormalized("/src/b/File.fs");
  REQUIRE(normal == symnav::CanonicalPath::FromString("/src/b/File.fs"));

  auto raw = symnav::CanonicalPath::FromNormalized("/src/a/../b/File.fs");
  REQUIRE(raw.String() == "/src/a/../b/File.fs");
}
