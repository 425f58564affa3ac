#include "symnav/text/island_extractor.hpp"

#include <string>
#include <vector>

#include <catch2/catch_all.hpp>
#include <spdlog/spdlog.h>

constexpr auto kLogLevel = spdlog::level::debug;

auto main(int argc, char* argv[]) -> int {
  spdlog::set_level(kLogLevel);
  spdlog::set_pattern("[%l] %v");
  return Catch::Session().run(argc, argv);
}

using symnav::text::ExtractIsland;
using Qualifiers = std::vector<std::string>;

TEST_CASE("ExtractIsland returns the whole dotted path", "[island]") {
  std::string line = "System.Text.Encoding";

  // Every column on or just after the path yields the same island
  for (std::size_t column = 0; column <= line.size(); ++column) {
    auto island = ExtractIsland(line, column);
    REQUIRE(island.has_value());
    REQUIRE(island->qualifiers == Qualifiers{"System", "Text", "Encoding"});
    REQUIRE(island->column == 0);
    REQUIRE(island->identifier == "System.Text.Encoding");
    REQUIRE_FALSE(island->quoted);
  }
}

TEST_CASE("ExtractIsland reports the column of the first segment",
          "[island]") {
  std::string line = "let y = List.map f xs";

  auto island = ExtractIsland(line, 13);
  REQUIRE(island.has_value());
  REQUIRE(island->qualifiers == Qualifiers{"List", "map"});
  REQUIRE(island->column == 8);
}

TEST_CASE("ExtractIsland keeps quoted identifiers whole", "[island]") {
  std::string line = "``a.b``";

  for (std::size_t column = 0; column <= line.size(); ++column) {
    auto island = ExtractIsland(line, column);
    REQUIRE(island.has_value());
    REQUIRE(island->qualifiers == Qualifiers{"a.b"});
    REQUIRE(island->quoted);
    REQUIRE(island->column == 0);
  }
}

TEST_CASE("ExtractIsland keeps spaces inside quoted identifiers",
          "[island]") {
  std::string line = "let ``my value`` = 42";

  auto island = ExtractIsland(line, 9);
  REQUIRE(island.has_value());
  REQUIRE(island->identifier == "my value");
  REQUIRE(island->qualifiers == Qualifiers{"my value"});
  REQUIRE(island->column == 4);
}

TEST_CASE("ExtractIsland prefers an identifier right after a quoted one",
          "[island]") {
  std::string line = "``a``b";

  auto island = ExtractIsland(line, 5);
  REQUIRE(island.has_value());
  REQUIRE(island->qualifiers == Qualifiers{"b"});
  REQUIRE(island->column == 5);
  REQUIRE_FALSE(island->quoted);

  // Followed by punctuation, the column past the quotes still counts
  auto quoted = ExtractIsland("``a``)", 5);
  REQUIRE(quoted.has_value());
  REQUIRE(quoted->qualifiers == Qualifiers{"a"});
  REQUIRE(quoted->quoted);
}

TEST_CASE("ExtractIsland finds nothing inside empty quotes", "[island]") {
  REQUIRE_FALSE(ExtractIsland("x = ````", 5).has_value());
}

TEST_CASE("ExtractIsland tolerates a column just past an identifier",
          "[island]") {
  std::string line = "foo + bar";

  auto island = ExtractIsland(line, 3);
  REQUIRE(island.has_value());
  REQUIRE(island->qualifiers == Qualifiers{"foo"});
}

TEST_CASE("ExtractIsland finds nothing on whitespace or punctuation",
          "[island]") {
  std::string line = "a  +  (  ) b";

  REQUIRE_FALSE(ExtractIsland(line, 2).has_value());
  REQUIRE_FALSE(ExtractIsland(line, 4).has_value());
  REQUIRE_FALSE(ExtractIsland(line, 7).has_value());
}

TEST_CASE("ExtractIsland ignores dots without adjacent identifiers",
          "[island]") {
  SECTION("Lone dot") {
    REQUIRE_FALSE(ExtractIsland(" . ", 1).has_value());
  }

  SECTION("Leading dot is not part of the path") {
    auto island = ExtractIsland(".Length", 3);
    REQUIRE(island.has_value());
    REQUIRE(island->qualifiers == Qualifiers{"Length"});
    REQUIRE(island->column == 1);
  }

  SECTION("Trailing dot is not part of the path") {
    auto island = ExtractIsland("xs. ", 1);
    REQUIRE(island.has_value());
    REQUIRE(island->qualifiers == Qualifiers{"xs"});
  }
}

TEST_CASE("ExtractIsland accepts primes, digits and underscores",
          "[island]") {
  auto island = ExtractIsland("let x' = _tmp1.value2", 10);

  REQUIRE(island.has_value());
  REQUIRE(island->qualifiers == Qualifiers{"_tmp1", "value2"});
  REQUIRE(island->column == 9);

  auto primed = ExtractIsland("let x' = 1", 5);
  REQUIRE(primed.has_value());
  REQUIRE(primed->qualifiers == Qualifiers{"x'"});
}

TEST_CASE("ExtractIsland rejects runs starting with a digit", "[island]") {
  REQUIRE_FALSE(ExtractIsland("x = 42", 5).has_value());
}

TEST_CASE("ExtractIsland handles empty lines and columns outside the line",
          "[island]") {
  REQUIRE_FALSE(ExtractIsland("", 0).has_value());
  REQUIRE_FALSE(ExtractIsland("abc", 4).has_value());
}
