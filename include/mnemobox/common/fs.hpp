#pragma once

#include "mnemobox/common/result.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace mnemobox::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] bool ends_with(const std::string &value, const std::string &suffix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] std::string expand_path(std::string value);
[[nodiscard]] bool is_subpath(const std::filesystem::path &candidate,
                             const std::filesystem::path &parent);

[[nodiscard]] Result<std::string> read_file(const std::filesystem::path &path);
[[nodiscard]] Status write_file(const std::filesystem::path &path, const std::string &content);

/// Searches PATH for an executable named `program`; absolute or relative
/// paths containing a slash are checked as-is.
[[nodiscard]] std::optional<std::filesystem::path> find_executable(const std::string &program);

} // namespace mnemobox::common
