#pragma once

#include "switchboard/common/result.hpp"
#include "switchboard/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace switchboard::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();

/// Backend ids this build knows how to construct.
[[nodiscard]] const std::vector<std::string> &known_backends();
[[nodiscard]] bool is_cloud_backend(const std::string &id);

/// Parses TOML text into a Config. Backend credentials fall back to the vendor env vars.
[[nodiscard]] common::Result<Config> parse_config(const std::string &toml_text);

/// Reads the config file (a missing file yields defaults), then applies env overrides.
[[nodiscard]] common::Result<Config> load_config();

void apply_env_overrides(Config &config);

/// Hard errors fail; soft problems come back as warnings.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

} // namespace switchboard::config
