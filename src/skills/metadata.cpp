#include "skillreg/skills/metadata.hpp"

#include "skillreg/common/fs.hpp"
#include "skillreg/common/json_util.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <array>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace skillreg::skills {

namespace {

MetadataResult fail(const std::string &package, const ErrorKind kind, std::string message,
                    std::string field = "") {
  return MetadataResult::failure(ValidationError{.package = package,
                                                 .kind = kind,
                                                 .field = std::move(field),
                                                 .message = std::move(message)});
}

std::string node_type_name(const YAML::Node &node) {
  switch (node.Type()) {
  case YAML::NodeType::Null:
    return "null";
  case YAML::NodeType::Scalar:
    return "a scalar";
  case YAML::NodeType::Sequence:
    return "a sequence";
  case YAML::NodeType::Map:
    return "a mapping";
  case YAML::NodeType::Undefined:
    break;
  }
  return "undefined";
}

constexpr std::size_t MAX_NESTING = 64;
constexpr std::string_view CORE_TAG_PREFIX = "tag:yaml.org,2002:";
// the tags a safe loader resolves; anything else would construct an application object
constexpr std::array<std::string_view, 14> SAFE_CORE_TAGS = {
    "null", "bool", "int",  "float", "binary", "timestamp", "omap",
    "pairs", "set", "str", "seq",   "map",    "merge",     "value"};

using NodeResult = common::Result<YAML::Node>;

bool is_safe_tag(const std::string &tag) {
  if (tag.empty() || tag == "?" || tag == "!") {
    return true;
  }
  if (!common::starts_with(tag, std::string(CORE_TAG_PREFIX))) {
    return false;
  }
  const std::string_view name = std::string_view(tag).substr(CORE_TAG_PREFIX.size());
  return std::find(SAFE_CORE_TAGS.begin(), SAFE_CORE_TAGS.end(), name) != SAFE_CORE_TAGS.end();
}

bool is_merge_key(const YAML::Node &key) {
  return key.IsScalar() && key.Scalar() == "<<" &&
         (key.Tag() == "?" || key.Tag() == std::string(CORE_TAG_PREFIX) + "merge");
}

/// Location in the declaration file. The body starts on the fence line, so body line N is
/// file line N + 1.
std::string where(const YAML::Node &node) {
  const YAML::Mark mark = node.Mark();
  if (mark.is_null()) {
    return "";
  }
  return " at line " + std::to_string(mark.line + 1) + ", column " +
         std::to_string(mark.column + 1);
}

NodeResult normalize(const YAML::Node &node, std::size_t depth);

/// Rebuilds a mapping with plain string keys. Later `<<` sources never override keys that are
/// set explicitly or by an earlier source.
NodeResult normalize_map(const YAML::Node &node, const std::size_t depth) {
  YAML::Node out(YAML::NodeType::Map);
  std::unordered_set<std::string> seen;
  std::vector<YAML::Node> merge_sources;

  for (const auto &entry : node) {
    const YAML::Node &key = entry.first;
    if (!is_safe_tag(key.Tag())) {
      return NodeResult::failure("unsupported tag '" + key.Tag() + "'" + where(key));
    }

    if (is_merge_key(key)) {
      auto merged = normalize(entry.second, depth + 1);
      if (!merged.ok()) {
        return merged;
      }
      if (merged.value().IsMap()) {
        merge_sources.push_back(merged.value());
        continue;
      }
      if (!merged.value().IsSequence()) {
        return NodeResult::failure("merge value must be a mapping or a list of mappings" +
                                   where(entry.second));
      }
      for (const auto &item : merged.value()) {
        if (!item.IsMap()) {
          return NodeResult::failure("merge list must contain only mappings" +
                                     where(entry.second));
        }
        merge_sources.push_back(item);
      }
      continue;
    }

    if (!key.IsScalar() && !key.IsNull()) {
      return NodeResult::failure("mapping key must be a scalar, got " + node_type_name(key) +
                                 where(key));
    }
    const std::string text = key.IsNull() ? "~" : key.Scalar();
    if (!seen.insert(text).second) {
      return NodeResult::failure("duplicate key '" + text + "'" + where(key));
    }

    auto value = normalize(entry.second, depth + 1);
    if (!value.ok()) {
      return value;
    }
    out[text] = value.value();
  }

  for (const auto &source : merge_sources) {
    for (const auto &entry : source) {
      const std::string text = entry.first.Scalar();
      if (seen.insert(text).second) {
        out[text] = entry.second;
      }
    }
  }
  return NodeResult::success(out);
}

/// Applies safe-loader rules yaml-cpp does not enforce: only core tags, scalar and unique
/// mapping keys, and `<<` merge keys expanded.
NodeResult normalize(const YAML::Node &node, const std::size_t depth) {
  if (depth > MAX_NESTING) {
    return NodeResult::failure("nesting deeper than " + std::to_string(MAX_NESTING) + " levels" +
                               where(node));
  }
  if (!is_safe_tag(node.Tag())) {
    return NodeResult::failure("unsupported tag '" + node.Tag() + "'" + where(node));
  }

  if (node.IsMap()) {
    return normalize_map(node, depth);
  }
  if (node.IsSequence()) {
    YAML::Node out(YAML::NodeType::Sequence);
    for (const auto &item : node) {
      auto normalized = normalize(item, depth + 1);
      if (!normalized.ok()) {
        return normalized;
      }
      out.push_back(normalized.value());
    }
    return NodeResult::success(out);
  }
  return NodeResult::success(node);
}

} // namespace

MetadataResult MetadataParser::parse_declaration(const std::string &package,
                                                 const std::string &content,
                                                 const std::string &declaration_file) {
  if (const auto bad = common::find_invalid_utf8(content); bad.has_value()) {
    return fail(package, ErrorKind::ParseError,
                declaration_file + " is not valid UTF-8 (byte offset " + std::to_string(*bad) +
                    ")");
  }

  const std::string fence = FRONTMATTER_FENCE;
  if (!common::starts_with(content, fence)) {
    return fail(package, ErrorKind::MissingFrontmatter,
                declaration_file + " missing frontmatter");
  }

  // fence, body, rest: the body ends at the next fence anywhere in the file
  const auto close = content.find(fence, fence.size());
  if (close == std::string::npos) {
    return fail(package, ErrorKind::MalformedFrontmatterFormat, "Invalid frontmatter format");
  }
  const std::string body = content.substr(fence.size(), close - fence.size());

  YAML::Node parsed;
  try {
    parsed = YAML::Load(body);
  } catch (const YAML::Exception &ex) {
    return fail(package, ErrorKind::ParseError, std::string("YAML parse error: ") + ex.what());
  }

  auto normalized = normalize(parsed, 0);
  if (!normalized.ok()) {
    return fail(package, ErrorKind::ParseError, "YAML parse error: " + normalized.error());
  }

  const YAML::Node &doc = normalized.value();
  if (!doc.IsMap()) {
    return fail(package, ErrorKind::NotAMapping,
                "Frontmatter is " + node_type_name(doc) + ", expected a mapping");
  }

  for (const char *field : REQUIRED_FIELDS) {
    if (!doc[field]) {
      return fail(package, ErrorKind::MissingRequiredField,
                  std::string("Missing required field '") + field + "'", field);
    }
  }
  for (const char *field : REQUIRED_FIELDS) {
    if (!doc[field].IsScalar()) {
      return fail(package, ErrorKind::InvalidFieldType,
                  std::string("Field '") + field + "' must be a string, got " +
                      node_type_name(doc[field]),
                  field);
    }
  }

  SkillMetadata metadata;
  metadata.name = doc["name"].Scalar();
  metadata.description = doc["description"].Scalar();
  metadata.version = doc["version"].Scalar();
  metadata.author = doc["author"].Scalar();

  if (const YAML::Node env = doc["requires_env"]; env && !env.IsNull()) {
    if (!env.IsSequence()) {
      return fail(package, ErrorKind::InvalidFieldType,
                  "Field 'requires_env' must be a sequence of strings, got " +
                      node_type_name(env),
                  "requires_env");
    }
    for (const auto &item : env) {
      if (!item.IsScalar()) {
        return fail(package, ErrorKind::InvalidFieldType,
                    "Field 'requires_env' must only contain strings, found " +
                        node_type_name(item),
                    "requires_env");
      }
      metadata.requires_env.push_back(item.Scalar());
    }
  }
  metadata.has_execution = static_cast<bool>(doc["execution"]);

  return MetadataResult::success(std::move(metadata));
}

MetadataResult MetadataParser::parse_package(const PackageDirectory &package,
                                             const MetadataParseOptions &options) {
  const auto declaration = package.path / options.declaration_file;
  std::error_code ec;
  if (!std::filesystem::is_regular_file(declaration, ec)) {
    return fail(package.name, ErrorKind::MissingDeclarationFile,
                "No " + options.declaration_file + " found");
  }

  auto content = common::read_file(declaration);
  if (!content.ok()) {
    return fail(package.name, ErrorKind::MissingDeclarationFile, content.error());
  }
  return parse_declaration(package.name, content.value(), options.declaration_file);
}

} // namespace skillreg::skills
