#pragma once

#include "skillreg/common/result.hpp"
#include "skillreg/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace skillreg::config {

/// Resolved config file: --config override, then SKILLREG_CONFIG_PATH, then ./skillreg.toml.
/// Empty when none applies.
[[nodiscard]] std::optional<std::filesystem::path> config_path();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();
[[nodiscard]] std::optional<std::filesystem::path> config_path_override();

[[nodiscard]] std::string expand_config_path(const std::string &path);

[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] common::Result<Config> parse_config(const std::string &content);

/// Fails on unusable settings; returns warnings otherwise.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

void apply_env_overrides(Config &config);

} // namespace skillreg::config
