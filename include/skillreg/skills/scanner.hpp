#pragma once

#include "skillreg/common/result.hpp"
#include "skillreg/skills/skill.hpp"

#include <filesystem>
#include <vector>

namespace skillreg::skills {

class DirectoryScanner {
public:
  /// Immediate subdirectories of `root`, sorted byte-wise by name. Plain files and links to
  /// non-directories are skipped. Fails if `root` is missing or not a directory; that failure
  /// aborts the whole run.
  [[nodiscard]] static common::Result<std::vector<PackageDirectory>>
  scan(const std::filesystem::path &root);
};

} // namespace skillreg::skills
