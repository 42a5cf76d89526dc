#include "skillreg/skills/skill.hpp"

namespace skillreg::skills {

std::string_view error_kind_to_string(const ErrorKind kind) {
  switch (kind) {
  case ErrorKind::MissingDeclarationFile:
    return "MissingDeclarationFile";
  case ErrorKind::MissingFrontmatter:
    return "MissingFrontmatter";
  case ErrorKind::MalformedFrontmatterFormat:
    return "MalformedFrontmatterFormat";
  case ErrorKind::ParseError:
    return "ParseError";
  case ErrorKind::NotAMapping:
    return "NotAMapping";
  case ErrorKind::MissingRequiredField:
    return "MissingRequiredField";
  case ErrorKind::InvalidFieldType:
    return "InvalidFieldType";
  case ErrorKind::ContentReadError:
    return "ContentReadError";
  case ErrorKind::DuplicateId:
    return "DuplicateId";
  }
  return "Unknown";
}

} // namespace skillreg::skills
