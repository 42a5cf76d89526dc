#pragma once

#include "skillreg/common/result.hpp"
#include "skillreg/skills/skill.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace skillreg::registry {

/// `{"skills": [...]}` with two-space indentation and a trailing newline.
[[nodiscard]] std::string render_registry_json(const std::vector<skills::SkillRecord> &records);

/// Render and replace `output` in full (temp file, then rename).
[[nodiscard]] common::Status write_registry(const std::filesystem::path &output,
                                            const std::vector<skills::SkillRecord> &records);

} // namespace skillreg::registry
