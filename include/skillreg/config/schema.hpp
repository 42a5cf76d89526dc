#pragma once

#include <string>

namespace skillreg::config {

struct RegistryConfig {
  bool allow_duplicate_ids = false;
};

struct ObservabilityConfig {
  std::string backend = "log";
  std::string level = "info";
};

struct Config {
  std::string skills_dir = "registry/skills";
  std::string output = "registry/registry.json";
  std::string declaration_file = "SKILL.md";
  RegistryConfig registry;
  ObservabilityConfig observability;
};

} // namespace skillreg::config
