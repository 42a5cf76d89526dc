#include "skillreg/common/toml.hpp"

#include "skillreg/common/fs.hpp"

#include <sstream>

namespace skillreg::common {

namespace {

/// Decodes the value part of a line, including any trailing comment. Sets `error` when the
/// value is malformed.
TomlValue read_value(const std::string &raw, std::string &error) {
  const std::string text = trim(raw);
  TomlValue value;
  if (text.empty()) {
    error = "missing value";
    return value;
  }

  const char quote = text.front();
  if (quote != '"' && quote != '\'') {
    const auto comment = text.find('#');
    value.text = trim(text.substr(0, comment));
    return value;
  }

  value.quoted = true;
  std::size_t i = 1;
  for (; i < text.size() && text[i] != quote; ++i) {
    if (quote == '\'' || text[i] != '\\' || i + 1 >= text.size()) {
      value.text.push_back(text[i]);
      continue;
    }
    const char escaped = text[++i];
    value.text.push_back(escaped == 'n' ? '\n' : escaped == 't' ? '\t' : escaped);
  }
  if (i >= text.size()) {
    error = "unterminated string";
    return value;
  }

  const std::string rest = trim(text.substr(i + 1));
  if (!rest.empty() && rest.front() != '#') {
    error = "unexpected text after string";
  }
  return value;
}

} // namespace

std::string TomlDocument::get_string(const std::string &key, const std::string &fallback) const {
  const auto it = values.find(key);
  return it == values.end() ? fallback : it->second.text;
}

bool TomlDocument::get_bool(const std::string &key, const bool fallback) const {
  const auto it = values.find(key);
  if (it == values.end() || it->second.quoted) {
    return fallback;
  }
  if (it->second.text == "true") {
    return true;
  }
  return it->second.text == "false" ? false : fallback;
}

Result<TomlDocument> parse_toml(const std::string &content) {
  TomlDocument document;
  std::istringstream stream(content);
  std::string line;
  std::string section;
  std::size_t line_number = 0;

  const auto fail = [&line_number](const std::string &what) {
    return Result<TomlDocument>::failure(what + " at line " + std::to_string(line_number));
  };

  while (std::getline(stream, line)) {
    ++line_number;
    const std::string clean = trim(line);
    if (clean.empty() || clean.front() == '#') {
      continue;
    }

    if (clean.front() == '[') {
      const auto close = clean.find(']');
      if (close == std::string::npos) {
        return fail("Unterminated section header");
      }
      section = trim(clean.substr(1, close - 1));
      if (section.empty()) {
        return fail("Invalid empty section");
      }
      continue;
    }

    const auto equals = clean.find('=');
    if (equals == std::string::npos) {
      return fail("Invalid key/value");
    }
    const std::string key = trim(clean.substr(0, equals));
    if (key.empty()) {
      return fail("Missing key");
    }

    std::string error;
    TomlValue value = read_value(clean.substr(equals + 1), error);
    if (!error.empty()) {
      return fail("Invalid value for '" + key + "' (" + error + ")");
    }

    const std::string full_key = section.empty() ? key : section + "." + key;
    if (!document.values.emplace(full_key, std::move(value)).second) {
      return fail("Duplicate key '" + full_key + "'");
    }
  }

  return Result<TomlDocument>::success(std::move(document));
}

} // namespace skillreg::common
