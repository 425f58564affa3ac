#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace symnav {

// Conditional-compilation symbols active while a file is edited:
// INTERACTIVE for scripts or COMPILED otherwise, then EDITING, then every
// define named by `--define:X`, `-d:X` or `--define X` in `other_options`,
// then `extra_defines`. Duplicates keep their first position.
auto GetCompilationDefinesForEditing(
    const std::filesystem::path& file_name,
    const std::vector<std::string>& other_options,
    const std::vector<std::string>& script_extensions,
    const std::vector<std::string>& extra_defines = {})
    -> std::vector<std::string>;

// Defines named by compiler flags alone, in option order
auto ParseDefinesFromOptions(const std::vector<std::string>& other_options)
    -> std::vector<std::string>;

}  // namespace symnav
