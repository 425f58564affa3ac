#pragma once

#include <atomic>
#include <cctype>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <asio.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include "symnav/oracle/classification_oracle.hpp"
#include "symnav/oracle/language_oracle.hpp"
#include "symnav/text/island_extractor.hpp"

namespace symnav::test {

// Minimal lexer for an ML-like language: keywords, `//` comments, string
// and number literals, identifiers and ``quoted identifiers``
class FakeClassifier : public ClassificationOracle {
 public:
  auto ClassifyLine(
      DocumentId /*document*/,
      std::shared_ptr<const DocumentSnapshot> snapshot,
      CanonicalPath /*file_path*/, TextSpan line_span,
      std::vector<std::string> defines, utils::CancellationToken /*token*/)
      -> asio::awaitable<std::vector<ClassifiedSpan>> override {
    ++calls;
    {
      std::lock_guard<std::mutex> lock(mutex);
      last_defines = std::move(defines);
    }
    if (throw_on_classify) {
      throw std::runtime_error("classifier crashed");
    }
    co_return Classify(snapshot->text, line_span);
  }

  static auto Classify(std::string_view text, TextSpan line_span)
      -> std::vector<ClassifiedSpan> {
    static const std::set<std::string_view> kKeywords = {
        "let", "in", "if", "then", "else", "match", "with",
        "fun", "open", "module", "type", "do", "rec"};

    std::vector<ClassifiedSpan> spans;
    auto add = [&spans](std::size_t start, std::size_t end,
                        ClassificationKind kind) {
      spans.push_back(
          ClassifiedSpan{.span = {.start = start, .end = end}, .kind = kind});
    };

    std::size_t i = line_span.start;
    const std::size_t end = line_span.end;
    while (i < end) {
      char c = text[i];
      if (c == ' ' || c == '\t') {
        ++i;
      } else if (text.substr(i, 2) == "//") {
        add(i, end, ClassificationKind::kComment);
        i = end;
      } else if (c == '#') {
        add(i, end, ClassificationKind::kPreprocessor);
        i = end;
      } else if (c == '"') {
        auto close = text.find('"', i + 1);
        auto stop = (close == std::string_view::npos || close >= end)
                        ? end
                        : close + 1;
        add(i, stop, ClassificationKind::kString);
        i = stop;
      } else if (text.substr(i, 2) == "``") {
        auto close = text.find("``", i + 2);
        auto stop = (close == std::string_view::npos || close + 2 > end)
                        ? end
                        : close + 2;
        add(i, stop, ClassificationKind::kIdentifier);
        i = stop;
      } else if (std::isdigit(static_cast<unsigned char>(c)) != 0) {
        auto start = i;
        while (i < end && std::isdigit(static_cast<unsigned char>(text[i])) != 0) {
          ++i;
        }
        add(start, i, ClassificationKind::kNumber);
      } else if (text::IsIdentifierStartCharacter(c)) {
        auto start = i;
        while (i < end && text::IsIdentifierPartCharacter(text[i])) {
          ++i;
        }
        auto word = text.substr(start, i - start);
        add(start, i,
            kKeywords.contains(word) ? ClassificationKind::kKeyword
                                     : ClassificationKind::kIdentifier);
      } else if (std::string_view("+-*/=<>|&:").find(c) !=
                 std::string_view::npos) {
        add(i, i + 1, ClassificationKind::kOperator);
        ++i;
      } else {
        add(i, i + 1, ClassificationKind::kPunctuation);
        ++i;
      }
    }
    return spans;
  }

  std::atomic<int> calls{0};
  bool throw_on_classify = false;

  std::mutex mutex;
  std::vector<std::string> last_defines;
};

class FakeLanguageOracle;

class FakeParseResults : public ParseResults {};

// One declaration lookup made against FakeCheckResults
struct DeclarationQuery {
  int line = 0;
  int column = 0;
  std::string line_text;
  std::vector<std::string> qualifiers;
  bool precise = true;
};

// Scripted parse/typecheck service. Declarations are keyed by the dotted
// island text.
class FakeLanguageOracle : public LanguageOracle {
 public:
  auto ParseFile(
      CanonicalPath /*file_path*/, std::string /*source*/,
      ProjectOptions options, utils::CancellationToken /*token*/)
      -> asio::awaitable<std::shared_ptr<const ParseResults>> override {
    ++parse_calls;
    {
      std::lock_guard<std::mutex> lock(mutex);
      last_options = options;
    }
    if (throw_on_parse) {
      throw std::runtime_error("parser crashed");
    }
    if (throw_non_std) {
      throw 42;
    }
    co_return std::make_shared<const FakeParseResults>();
  }

  auto CheckFile(
      std::shared_ptr<const ParseResults> /*parse*/, CanonicalPath /*file_path*/,
      int version, std::string /*source*/, ProjectOptions /*options*/,
      utils::CancellationToken /*token*/)
      -> asio::awaitable<CheckFileAnswer> override {
    ++check_calls;
    last_version = version;
    if (on_check) {
      on_check();
    }

    // Hold the typecheck until the test opens the gate
    if (gate) {
      asio::steady_timer timer(co_await asio::this_coro::executor);
      while (!gate->load()) {
        timer.expires_after(std::chrono::milliseconds(1));
        co_await timer.async_wait(asio::use_awaitable);
      }
    }

    if (abort_typecheck) {
      co_return CheckFileAnswer::Aborted();
    }
    co_return CheckFileAnswer::Succeeded(std::make_shared<Results>(*this));
  }

  auto AddDeclaration(std::string island, OracleRange range) -> void {
    std::lock_guard<std::mutex> lock(mutex);
    declarations[std::move(island)] = std::move(range);
  }

  auto LastQuery() -> DeclarationQuery {
    std::lock_guard<std::mutex> lock(mutex);
    return last_query;
  }

  std::atomic<int> parse_calls{0};
  std::atomic<int> check_calls{0};
  std::atomic<int> lookup_calls{0};
  std::atomic<int> last_version{0};

  bool abort_typecheck = false;
  bool throw_on_parse = false;
  // ParseFile throws an int rather than a std::exception
  bool throw_non_std = false;

  // What an unmatched lookup reports
  DeclNotFoundReason not_found_reason = DeclNotFoundReason::kUnknown;

  // Runs when a typecheck starts, before the gate
  std::function<void()> on_check;

  // When set, typecheck suspends until it becomes true
  std::shared_ptr<std::atomic<bool>> gate;

  std::mutex mutex;
  ProjectOptions last_options;
  DeclarationQuery last_query;
  std::map<std::string, OracleRange> declarations;

 private:
  class Results : public CheckResults {
   public:
    explicit Results(FakeLanguageOracle& oracle) : oracle_(oracle) {
    }

    auto GetDeclarationLocation(
        int line, int column, std::string line_text,
        std::vector<std::string> qualifiers, bool precise,
        utils::CancellationToken /*token*/)
        -> asio::awaitable<FindDeclResult> override {
      ++oracle_.lookup_calls;
      std::lock_guard<std::mutex> lock(oracle_.mutex);
      oracle_.last_query = DeclarationQuery{
          .line = line,
          .column = column,
          .line_text = line_text,
          .qualifiers = qualifiers,
          .precise = precise,
      };
      auto key = fmt::format("{}", fmt::join(qualifiers, "."));
      auto it = oracle_.declarations.find(key);
      if (it == oracle_.declarations.end()) {
        co_return FindDeclResult::DeclNotFound(oracle_.not_found_reason);
      }
      co_return FindDeclResult::DeclFound(it->second);
    }

   private:
    FakeLanguageOracle& oracle_;
  };
};

}  // namespace symnav::test
