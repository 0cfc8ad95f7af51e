#pragma once

#include "mnemobox/common/result.hpp"
#include "mnemobox/config/schema.hpp"
#include "mnemobox/sandbox/policy.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace mnemobox::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
[[nodiscard]] bool config_exists();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();
[[nodiscard]] std::optional<std::filesystem::path> config_path_override();

/// Parses TOML text into a Config; unknown keys are ignored.
[[nodiscard]] common::Result<Config> parse_config(const std::string &content);

/// Reads the config file if present, then applies environment overrides.
[[nodiscard]] common::Result<Config> load_config();

[[nodiscard]] common::Status apply_env_overrides(Config &config);

/// Fails on settings that cannot run; returns warnings for suspicious ones.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

/// The selected preset with every configured override applied.
[[nodiscard]] common::Result<sandbox::PolicyConfig> build_policy(const Config &config);

/// Effective configuration as TOML, with every key spelled out.
[[nodiscard]] std::string render_config(const Config &config, const sandbox::PolicyConfig &policy);

} // namespace mnemobox::config
