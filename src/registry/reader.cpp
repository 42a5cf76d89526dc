#include "skillreg/registry/reader.hpp"

#include "skillreg/common/fs.hpp"
#include "skillreg/common/json_util.hpp"

#include <algorithm>
#include <array>
#include <map>
#include <set>
#include <unordered_map>
#include <utility>

namespace skillreg::registry {

namespace {

constexpr std::array<const char *, 5> STRING_FIELDS = {"id", "description", "version", "author",
                                                       "contentHash"};

/// (id, how many earlier records share that id)
using OccurrenceKey = std::pair<std::string, std::size_t>;

std::vector<OccurrenceKey> occurrence_keys(const std::vector<skills::SkillRecord> &records) {
  std::unordered_map<std::string, std::size_t> seen;
  std::vector<OccurrenceKey> keys;
  keys.reserve(records.size());
  for (const auto &record : records) {
    keys.emplace_back(record.id, seen[record.id]++);
  }
  return keys;
}

std::vector<std::string> changed_fields(const skills::SkillRecord &old,
                                        const skills::SkillRecord &record) {
  std::vector<std::string> fields;
  if (old.description != record.description) {
    fields.emplace_back("description");
  }
  if (old.version != record.version) {
    fields.emplace_back("version");
  }
  if (old.author != record.author) {
    fields.emplace_back("author");
  }
  if (old.content_hash != record.content_hash) {
    fields.emplace_back("contentHash");
  }
  if (old.requires_env != record.requires_env) {
    fields.emplace_back("requiresEnv");
  }
  if (old.has_execution_manifest != record.has_execution_manifest) {
    fields.emplace_back("hasExecutionManifest");
  }
  return fields;
}

} // namespace

common::Result<std::vector<skills::SkillRecord>> parse_registry_json(const std::string &json) {
  using ReadResult = common::Result<std::vector<skills::SkillRecord>>;

  const std::string trimmed = common::trim(json);
  if (trimmed.empty() || trimmed.front() != '{') {
    return ReadResult::failure("registry is not a JSON object");
  }
  const std::string skills_array = common::json_get_array(trimmed, "skills");
  if (skills_array.empty()) {
    return ReadResult::failure("registry has no \"skills\" array");
  }

  std::vector<skills::SkillRecord> records;
  std::size_t index = 0;
  for (const auto &object : common::json_split_top_level_objects(skills_array)) {
    const auto fields = common::json_parse_flat(object);
    for (const char *field : STRING_FIELDS) {
      if (!fields.contains(field)) {
        return ReadResult::failure("skills[" + std::to_string(index) + "] is missing \"" + field +
                                   "\"");
      }
    }

    skills::SkillRecord record;
    record.id = fields.at("id");
    record.description = fields.at("description");
    record.version = fields.at("version");
    record.author = fields.at("author");
    record.content_hash = fields.at("contentHash");
    if (const auto it = fields.find("requiresEnv"); it != fields.end()) {
      record.requires_env = common::json_parse_string_array(it->second);
    }
    if (const auto it = fields.find("hasExecutionManifest"); it != fields.end()) {
      record.has_execution_manifest = it->second == "true";
    }
    records.push_back(std::move(record));
    ++index;
  }

  return ReadResult::success(std::move(records));
}

common::Result<std::vector<skills::SkillRecord>> read_registry(const std::filesystem::path &path) {
  auto content = common::read_file(path);
  if (!content.ok()) {
    return common::Result<std::vector<skills::SkillRecord>>::failure(content.error());
  }
  auto parsed = parse_registry_json(content.value());
  if (!parsed.ok()) {
    return common::Result<std::vector<skills::SkillRecord>>::failure(path.string() + ": " +
                                                                    parsed.error());
  }
  return parsed;
}

std::string_view drift_kind_to_string(const DriftKind kind) {
  switch (kind) {
  case DriftKind::Added:
    return "added";
  case DriftKind::Removed:
    return "removed";
  case DriftKind::Changed:
    return "changed";
  case DriftKind::Moved:
    return "moved";
  }
  return "changed";
}

std::vector<RegistryDrift> diff_registries(const std::vector<skills::SkillRecord> &recorded,
                                           const std::vector<skills::SkillRecord> &current) {
  const auto recorded_keys = occurrence_keys(recorded);
  const auto current_keys = occurrence_keys(current);
  std::map<OccurrenceKey, std::size_t> recorded_index;
  for (std::size_t i = 0; i < recorded_keys.size(); ++i) {
    recorded_index.emplace(recorded_keys[i], i);
  }

  std::vector<RegistryDrift> drift;
  std::set<OccurrenceKey> matched;
  // (recorded position, current position) of every matched record, in current order
  std::vector<std::pair<std::size_t, std::size_t>> pairs;
  for (std::size_t j = 0; j < current.size(); ++j) {
    const auto it = recorded_index.find(current_keys[j]);
    if (it == recorded_index.end()) {
      drift.push_back({.id = current[j].id, .kind = DriftKind::Added, .fields = {}});
      continue;
    }
    matched.insert(current_keys[j]);
    pairs.emplace_back(it->second, j);
    if (auto fields = changed_fields(recorded[it->second], current[j]); !fields.empty()) {
      drift.push_back(
          {.id = current[j].id, .kind = DriftKind::Changed, .fields = std::move(fields)});
    }
  }

  std::vector<std::size_t> expected_order;
  expected_order.reserve(pairs.size());
  for (const auto &pair : pairs) {
    expected_order.push_back(pair.first);
  }
  std::sort(expected_order.begin(), expected_order.end());
  for (std::size_t k = 0; k < pairs.size(); ++k) {
    if (pairs[k].first != expected_order[k]) {
      drift.push_back({.id = current[pairs[k].second].id, .kind = DriftKind::Moved, .fields = {}});
    }
  }

  for (std::size_t i = 0; i < recorded.size(); ++i) {
    if (!matched.contains(recorded_keys[i])) {
      drift.push_back({.id = recorded[i].id, .kind = DriftKind::Removed, .fields = {}});
    }
  }
  return drift;
}

} // namespace skillreg::registry
