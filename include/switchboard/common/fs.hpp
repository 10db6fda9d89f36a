#pragma once

#include "switchboard/common/result.hpp"
#include <filesystem>
#include <string>

namespace switchboard::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::string> read_file(const std::filesystem::path &path);
/// Expands a leading `~` and `${VAR}` / `$VAR` references.
[[nodiscard]] std::string expand_path(std::string value);

} // namespace switchboard::common
