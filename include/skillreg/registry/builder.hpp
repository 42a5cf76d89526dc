#pragma once

#include "skillreg/common/result.hpp"
#include "skillreg/skills/metadata.hpp"
#include "skillreg/skills/skill.hpp"

#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace skillreg::registry {

struct BuildOptions {
  std::string declaration_file = skills::DEFAULT_DECLARATION_FILE;
  bool allow_duplicate_ids = false;
};

/// Everything one run produced. Records are in scan (directory name) order.
struct BuildOutcome {
  std::vector<skills::SkillRecord> records;
  std::vector<skills::ValidationError> errors;
  std::size_t packages_scanned = 0;

  [[nodiscard]] bool ok() const { return errors.empty(); }
};

using PackageResult = common::Result<skills::SkillRecord, skills::ValidationError>;

class RegistryBuilder {
public:
  using ProgressCallback = std::function<void(const skills::PackageDirectory &)>;

  explicit RegistryBuilder(std::filesystem::path skills_root, BuildOptions options = {});

  void set_progress_callback(ProgressCallback callback);

  /// Scan, parse and hash every package. Fails only when the root itself is unusable;
  /// per-package problems are collected in BuildOutcome::errors.
  [[nodiscard]] common::Result<BuildOutcome> build() const;

  /// Parse then hash one package. The hasher is not run when parsing fails.
  [[nodiscard]] PackageResult process_package(const skills::PackageDirectory &package) const;

  [[nodiscard]] const std::filesystem::path &skills_root() const { return skills_root_; }

private:
  std::filesystem::path skills_root_;
  BuildOptions options_;
  ProgressCallback progress_;
};

} // namespace skillreg::registry
