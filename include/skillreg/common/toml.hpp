#pragma once

#include "skillreg/common/result.hpp"

#include <string>
#include <unordered_map>

namespace skillreg::common {

/// A decoded `key = value` right-hand side. Quoted strings keep `quoted` so that `"true"`
/// never reads as a boolean.
struct TomlValue {
  std::string text;
  bool quoted = false;
};

/// Flat view of a TOML document: `[section]` keys are stored as `section.key`.
struct TomlDocument {
  std::unordered_map<std::string, TomlValue> values;

  [[nodiscard]] std::string get_string(const std::string &key,
                                       const std::string &fallback = "") const;
  [[nodiscard]] bool get_bool(const std::string &key, bool fallback) const;
};

/// Sections, `key = value` pairs, `#` comments, basic (`"..."`) and literal (`'...'`) strings
/// and bare scalars. Arrays, inline tables and multi-line strings are not supported.
[[nodiscard]] Result<TomlDocument> parse_toml(const std::string &content);

} // namespace skillreg::common
