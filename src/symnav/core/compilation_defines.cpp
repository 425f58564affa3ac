#include "symnav/core/compilation_defines.hpp"

#include <algorithm>
#include <array>
#include <string_view>
#include <utility>

#include "symnav/utils/path_utils.hpp"

namespace symnav {

namespace {

constexpr std::array<std::string_view, 2> kDefinePrefixes = {
    "--define:", "-d:"};

auto AppendUnique(std::vector<std::string>& defines, std::string define)
    -> void {
  if (define.empty()) {
    return;
  }
  if (std::ranges::find(defines, define) == defines.end()) {
    defines.push_back(std::move(define));
  }
}

}  // namespace

auto ParseDefinesFromOptions(const std::vector<std::string>& other_options)
    -> std::vector<std::string> {
  std::vector<std::string> defines;
  for (std::size_t i = 0; i < other_options.size(); ++i) {
    std::string_view option = other_options[i];

    // "--define NAME" takes the symbol from the next option
    if (option == "--define" || option == "-d") {
      if (i + 1 < other_options.size()) {
        defines.push_back(other_options[++i]);
      }
      continue;
    }

    for (auto prefix : kDefinePrefixes) {
      if (option.starts_with(prefix)) {
        auto name = option.substr(prefix.size());
        if (!name.empty()) {
          defines.emplace_back(name);
        }
        break;
      }
    }
  }
  return defines;
}

auto GetCompilationDefinesForEditing(
    const std::filesystem::path& file_name,
    const std::vector<std::string>& other_options,
    const std::vector<std::string>& script_extensions,
    const std::vector<std::string>& extra_defines)
    -> std::vector<std::string> {
  std::vector<std::string> defines;
  AppendUnique(
      defines,
      IsScriptFile(file_name, script_extensions) ? "INTERACTIVE" : "COMPILED");
  AppendUnique(defines, "EDITING");

  for (auto& define : ParseDefinesFromOptions(other_options)) {
    AppendUnique(defines, std::move(define));
  }
  for (const auto& define : extra_defines) {
    AppendUnique(defines, define);
  }
  return defines;
}

}  // namespace symnav
