#pragma once

#include "skillreg/common/result.hpp"
#include "skillreg/skills/skill.hpp"

#include <array>
#include <string>

namespace skillreg::skills {

inline constexpr const char *DEFAULT_DECLARATION_FILE = "SKILL.md";
inline constexpr const char *FRONTMATTER_FENCE = "---";
inline constexpr std::array<const char *, 4> REQUIRED_FIELDS = {"name", "description", "version",
                                                                "author"};

using MetadataResult = common::Result<SkillMetadata, ValidationError>;

struct MetadataParseOptions {
  std::string declaration_file = DEFAULT_DECLARATION_FILE;
};

class MetadataParser {
public:
  /// Locate and validate the declaration file of one package.
  [[nodiscard]] static MetadataResult parse_package(const PackageDirectory &package,
                                                    const MetadataParseOptions &options = {});

  /// Validate declaration file content. `package` is only used to label errors.
  [[nodiscard]] static MetadataResult parse_declaration(const std::string &package,
                                                        const std::string &content,
                                                        const std::string &declaration_file =
                                                            DEFAULT_DECLARATION_FILE);
};

} // namespace skillreg::skills
