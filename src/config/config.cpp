#include "skillreg/config/config.hpp"

#include "skillreg/common/fs.hpp"
#include "skillreg/common/toml.hpp"

#include <cstdlib>

namespace skillreg::config {

namespace {

constexpr const char *CONFIG_FILENAME = "skillreg.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> explicit_config_path() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("SKILLREG_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::string expand_config_value(const std::string &value) {
  if (value.find('$') == std::string::npos && value.find('~') == std::string::npos) {
    return value;
  }
  return common::expand_path(value);
}

std::filesystem::path normalized_absolute(const std::string &value) {
  std::error_code ec;
  auto path = std::filesystem::absolute(value, ec).lexically_normal();
  if (!path.has_filename()) {
    path = path.parent_path();
  }
  return path;
}

bool is_known_level(const std::string &level) {
  return level == "debug" || level == "info" || level == "warn" || level == "error";
}

} // namespace

std::optional<std::filesystem::path> config_path() {
  if (auto path = explicit_config_path(); path.has_value()) {
    return path;
  }
  std::error_code ec;
  if (std::filesystem::is_regular_file(CONFIG_FILENAME, ec)) {
    return std::filesystem::path(CONFIG_FILENAME);
  }
  return std::nullopt;
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  g_config_path_override = std::move(path);
}

void clear_config_path_override() { g_config_path_override.reset(); }

std::optional<std::filesystem::path> config_path_override() { return g_config_path_override; }

std::string expand_config_path(const std::string &path) { return expand_config_value(path); }

void apply_env_overrides(Config &config) {
  if (const char *dir = std::getenv("SKILLREG_SKILLS_DIR"); dir != nullptr && *dir) {
    config.skills_dir = expand_config_value(dir);
  }
  if (const char *output = std::getenv("SKILLREG_OUTPUT"); output != nullptr && *output) {
    config.output = expand_config_value(output);
  }
}

common::Result<Config> parse_config(const std::string &content) {
  const auto parsed = common::parse_toml(content);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.error());
  }

  const auto &doc = parsed.value();
  Config config;
  config.skills_dir = expand_config_value(doc.get_string("skills_dir", config.skills_dir));
  config.output = expand_config_value(doc.get_string("output", config.output));
  config.declaration_file = doc.get_string("declaration_file", config.declaration_file);
  config.registry.allow_duplicate_ids =
      doc.get_bool("registry.allow_duplicate_ids", config.registry.allow_duplicate_ids);
  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);
  config.observability.level =
      common::to_lower(doc.get_string("observability.level", config.observability.level));
  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  const auto path = config_path();
  if (!path.has_value()) {
    Config config;
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  std::error_code ec;
  if (!std::filesystem::is_regular_file(*path, ec)) {
    return common::Result<Config>::failure("Config file not found: " + path->string());
  }

  auto content = common::read_file(*path);
  if (!content.ok()) {
    return common::Result<Config>::failure("Unable to open config file: " + path->string());
  }

  auto config = parse_config(content.value());
  if (!config.ok()) {
    return common::Result<Config>::failure(path->string() + ": " + config.error());
  }
  apply_env_overrides(config.value());
  return config;
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  std::vector<std::string> warnings;

  if (common::trim(config.skills_dir).empty()) {
    return common::Result<std::vector<std::string>>::failure("skills_dir must not be empty");
  }
  if (common::trim(config.output).empty()) {
    return common::Result<std::vector<std::string>>::failure("output must not be empty");
  }
  const std::string declaration = common::trim(config.declaration_file);
  if (declaration.empty()) {
    return common::Result<std::vector<std::string>>::failure(
        "declaration_file must not be empty");
  }
  if (declaration.find('/') != std::string::npos || declaration.find('\\') != std::string::npos) {
    return common::Result<std::vector<std::string>>::failure(
        "declaration_file must be a bare file name: " + declaration);
  }
  if (!is_known_level(common::to_lower(config.observability.level))) {
    return common::Result<std::vector<std::string>>::failure("Invalid observability.level: " +
                                                              config.observability.level);
  }

  const auto root = normalized_absolute(config.skills_dir);
  const auto output = normalized_absolute(config.output);
  if (common::is_subpath(output.parent_path(), root) && output.parent_path() != root) {
    warnings.push_back("output " + config.output +
                       " is inside a package directory and will change its content hash");
  }

  return common::Result<std::vector<std::string>>::success(std::move(warnings));
}

} // namespace skillreg::config
