#include "skillreg/registry/emitter.hpp"

#include "skillreg/common/fs.hpp"
#include "skillreg/common/json_util.hpp"

#include <sstream>

namespace skillreg::registry {

namespace {

std::string quoted(const std::string &value) { return "\"" + common::json_escape(value) + "\""; }

void write_string_array(std::ostringstream &json, const std::vector<std::string> &values,
                        const std::string &indent) {
  if (values.empty()) {
    json << "[]";
    return;
  }
  json << "[\n";
  for (std::size_t i = 0; i < values.size(); ++i) {
    json << indent << "  " << quoted(values[i]);
    json << (i + 1 < values.size() ? ",\n" : "\n");
  }
  json << indent << "]";
}

} // namespace

std::string render_registry_json(const std::vector<skills::SkillRecord> &records) {
  std::ostringstream json;
  json << "{\n";
  json << "  \"skills\": ";
  if (records.empty()) {
    json << "[]\n";
    json << "}\n";
    return json.str();
  }

  json << "[\n";
  for (std::size_t i = 0; i < records.size(); ++i) {
    const auto &record = records[i];
    json << "    {\n";
    json << "      \"id\": " << quoted(record.id) << ",\n";
    json << "      \"description\": " << quoted(record.description) << ",\n";
    json << "      \"version\": " << quoted(record.version) << ",\n";
    json << "      \"author\": " << quoted(record.author) << ",\n";
    json << "      \"contentHash\": " << quoted(record.content_hash) << ",\n";
    json << "      \"requiresEnv\": ";
    write_string_array(json, record.requires_env, "      ");
    json << ",\n";
    json << "      \"hasExecutionManifest\": "
         << (record.has_execution_manifest ? "true" : "false") << "\n";
    json << "    }" << (i + 1 < records.size() ? ",\n" : "\n");
  }
  json << "  ]\n";
  json << "}\n";
  return json.str();
}

common::Status write_registry(const std::filesystem::path &output,
                              const std::vector<skills::SkillRecord> &records) {
  return common::write_file_atomic(output, render_registry_json(records));
}

} // namespace skillreg::registry
