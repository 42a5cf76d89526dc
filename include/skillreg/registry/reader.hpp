#pragma once

#include "skillreg/common/result.hpp"
#include "skillreg/skills/skill.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace skillreg::registry {

[[nodiscard]] common::Result<std::vector<skills::SkillRecord>>
parse_registry_json(const std::string &json);

[[nodiscard]] common::Result<std::vector<skills::SkillRecord>>
read_registry(const std::filesystem::path &path);

enum class DriftKind {
  Added,
  Removed,
  Changed,
  Moved,
};

[[nodiscard]] std::string_view drift_kind_to_string(DriftKind kind);

struct RegistryDrift {
  std::string id;
  DriftKind kind = DriftKind::Changed;
  std::vector<std::string> fields; // for Changed, in record field order
};

/// Compare a recorded registry against a fresh build. The n-th record with a given id is
/// matched with the n-th record of that id on the other side. Matched records whose relative
/// order differs are reported as Moved.
[[nodiscard]] std::vector<RegistryDrift>
diff_registries(const std::vector<skills::SkillRecord> &recorded,
                const std::vector<skills::SkillRecord> &current);

} // namespace skillreg::registry
