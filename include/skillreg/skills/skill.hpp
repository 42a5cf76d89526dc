#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace skillreg::skills {

/// One candidate package: `<skills-root>/<name>/`.
struct PackageDirectory {
  std::string name;
  std::filesystem::path path;
};

enum class ErrorKind {
  MissingDeclarationFile,
  MissingFrontmatter,
  MalformedFrontmatterFormat,
  ParseError,
  NotAMapping,
  MissingRequiredField,
  InvalidFieldType,
  ContentReadError,
  DuplicateId,
};

[[nodiscard]] std::string_view error_kind_to_string(ErrorKind kind);

/// Per-package, recoverable failure. `field` is set for MissingRequiredField and
/// InvalidFieldType.
struct ValidationError {
  std::string package;
  ErrorKind kind = ErrorKind::MissingDeclarationFile;
  std::string field;
  std::string message;
};

/// Typed projection of a declaration block. Produced only by MetadataParser.
struct SkillMetadata {
  std::string name;
  std::string description;
  std::string version;
  std::string author;
  std::vector<std::string> requires_env;
  bool has_execution = false;
};

struct SkillRecord {
  std::string id;
  std::string description;
  std::string version;
  std::string author;
  std::string content_hash;
  std::vector<std::string> requires_env;
  bool has_execution_manifest = false;

  bool operator==(const SkillRecord &) const = default;
};

} // namespace skillreg::skills
