#include "skillreg/common/json_util.hpp"

#include <cctype>
#include <cstdint>
#include <cstdio>

namespace skillreg::common {

namespace {

void append_utf8(std::string &out, std::uint32_t cp) {
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

bool parse_hex4(const std::string &raw, std::size_t pos, std::uint32_t &out) {
  if (pos + 4 > raw.size()) {
    return false;
  }
  std::uint32_t value = 0;
  for (std::size_t i = pos; i < pos + 4; ++i) {
    const char ch = raw[i];
    value <<= 4;
    if (ch >= '0' && ch <= '9') {
      value |= static_cast<std::uint32_t>(ch - '0');
    } else if (ch >= 'a' && ch <= 'f') {
      value |= static_cast<std::uint32_t>(ch - 'a' + 10);
    } else if (ch >= 'A' && ch <= 'F') {
      value |= static_cast<std::uint32_t>(ch - 'A' + 10);
    } else {
      return false;
    }
  }
  out = value;
  return true;
}

/// Tracks string literals while scanning raw JSON. Returns true when `ch` belongs to a string
/// (including its quotes) and must not be read as structure.
class StringState {
public:
  bool consume(const char ch) {
    if (in_string_) {
      if (escaped_) {
        escaped_ = false;
      } else if (ch == '\\') {
        escaped_ = true;
      } else if (ch == '"') {
        in_string_ = false;
      }
      return true;
    }
    if (ch == '"') {
      in_string_ = true;
      return true;
    }
    return false;
  }

private:
  bool in_string_ = false;
  bool escaped_ = false;
};

} // namespace

std::string json_escape(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size() + 8);
  for (const char ch : value) {
    switch (ch) {
    case '"':
      escaped += "\\\"";
      break;
    case '\\':
      escaped += "\\\\";
      break;
    case '\n':
      escaped += "\\n";
      break;
    case '\r':
      escaped += "\\r";
      break;
    case '\t':
      escaped += "\\t";
      break;
    case '\b':
      escaped += "\\b";
      break;
    case '\f':
      escaped += "\\f";
      break;
    default:
      if (static_cast<unsigned char>(ch) < 0x20) {
        char buf[8];
        std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned int>(ch));
        escaped += buf;
      } else {
        escaped.push_back(ch);
      }
      break;
    }
  }
  return escaped;
}

std::optional<std::size_t> find_invalid_utf8(const std::string &text) {
  std::size_t i = 0;
  while (i < text.size()) {
    const auto lead = static_cast<unsigned char>(text[i]);
    if (lead < 0x80) {
      ++i;
      continue;
    }

    std::size_t length = 0;
    // bounds for the second byte; later continuation bytes are always 0x80..0xBF
    unsigned char low = 0x80;
    unsigned char high = 0xBF;
    if (lead >= 0xC2 && lead <= 0xDF) {
      length = 2;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
      length = 3;
      low = lead == 0xE0 ? 0xA0 : 0x80;
      high = lead == 0xED ? 0x9F : 0xBF;
    } else if (lead >= 0xF0 && lead <= 0xF4) {
      length = 4;
      low = lead == 0xF0 ? 0x90 : 0x80;
      high = lead == 0xF4 ? 0x8F : 0xBF;
    } else {
      return i;
    }

    if (i + length > text.size()) {
      return i;
    }
    for (std::size_t k = 1; k < length; ++k) {
      const auto byte = static_cast<unsigned char>(text[i + k]);
      const unsigned char min = k == 1 ? low : 0x80;
      const unsigned char max = k == 1 ? high : 0xBF;
      if (byte < min || byte > max) {
        return i;
      }
    }
    i += length;
  }
  return std::nullopt;
}

std::string json_unescape(const std::string &raw) {
  std::string out;
  out.reserve(raw.size());
  for (std::size_t i = 0; i < raw.size(); ++i) {
    const char ch = raw[i];
    if (ch != '\\' || i + 1 >= raw.size()) {
      out.push_back(ch);
      continue;
    }
    const char next = raw[++i];
    switch (next) {
    case 'n':
      out.push_back('\n');
      break;
    case 'r':
      out.push_back('\r');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'b':
      out.push_back('\b');
      break;
    case 'f':
      out.push_back('\f');
      break;
    case 'u': {
      std::uint32_t cp = 0;
      if (!parse_hex4(raw, i + 1, cp)) {
        out.push_back(next);
        break;
      }
      i += 4;
      // surrogate pair
      std::uint32_t low = 0;
      if (cp >= 0xD800 && cp <= 0xDBFF && i + 2 < raw.size() && raw[i + 1] == '\\' &&
          raw[i + 2] == 'u' && parse_hex4(raw, i + 3, low) && low >= 0xDC00 && low <= 0xDFFF) {
        cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
        i += 6;
      }
      append_utf8(out, cp);
      break;
    }
    default:
      out.push_back(next);
      break;
    }
  }
  return out;
}

std::size_t json_find_key(const std::string &json, const std::string &key, std::size_t from) {
  const std::string quoted = "\"" + key + "\"";
  return json.find(quoted, from);
}

std::size_t json_skip_ws(const std::string &text, std::size_t pos) {
  while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])) != 0) {
    ++pos;
  }
  return pos;
}

std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos) {
  bool escaped = false;
  for (std::size_t i = quote_pos + 1; i < json.size(); ++i) {
    const char ch = json[i];
    if (!escaped && ch == '"') {
      return i;
    }
    if (!escaped && ch == '\\') {
      escaped = true;
      continue;
    }
    escaped = false;
  }
  return std::string::npos;
}

std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                      const char open_ch, const char close_ch) {
  if (open_pos >= json.size() || json[open_pos] != open_ch) {
    return std::string::npos;
  }
  std::size_t depth = 0;
  StringState strings;
  for (std::size_t i = open_pos; i < json.size(); ++i) {
    const char ch = json[i];
    if (strings.consume(ch)) {
      continue;
    }
    if (ch == open_ch) {
      ++depth;
    } else if (ch == close_ch) {
      if (depth == 0) {
        return std::string::npos;
      }
      if (--depth == 0) {
        return i;
      }
    }
  }
  return std::string::npos;
}

std::string json_get_array(const std::string &json, const std::string &field) {
  const auto key_pos = json_find_key(json, field);
  if (key_pos == std::string::npos) {
    return "";
  }
  const auto colon = json.find(':', key_pos + field.size() + 2);
  if (colon == std::string::npos) {
    return "";
  }
  std::size_t pos = json_skip_ws(json, colon + 1);
  if (pos >= json.size() || json[pos] != '[') {
    return "";
  }
  const auto end = json_find_matching_token(json, pos, '[', ']');
  if (end == std::string::npos || end < pos) {
    return "";
  }
  return json.substr(pos, end - pos + 1);
}

std::vector<std::string> json_parse_string_array(const std::string &array_json) {
  if (array_json.size() < 2 || array_json.front() != '[') {
    return {};
  }

  std::vector<std::string> out;
  std::size_t pos = 1; // skip opening [
  while (pos < array_json.size()) {
    pos = json_skip_ws(array_json, pos);
    if (pos >= array_json.size() || array_json[pos] == ']') {
      break;
    }
    if (array_json[pos] == ',') {
      ++pos;
      continue;
    }
    if (array_json[pos] == '"') {
      const auto end = json_find_string_end(array_json, pos);
      if (end == std::string::npos || end <= pos) {
        break;
      }
      out.push_back(json_unescape(array_json.substr(pos + 1, end - pos - 1)));
      pos = end + 1;
    } else {
      ++pos;
    }
  }
  return out;
}

JsonFlatMap json_parse_flat(const std::string &json) {
  JsonFlatMap result;
  if (json.size() < 2 || json.front() != '{') {
    return result;
  }

  std::size_t pos = 1; // skip opening {
  while (pos < json.size()) {
    pos = json_skip_ws(json, pos);
    if (pos >= json.size() || json[pos] == '}') {
      break;
    }
    if (json[pos] == ',') {
      ++pos;
      continue;
    }

    // expect key
    if (json[pos] != '"') {
      ++pos;
      continue;
    }
    const auto key_end = json_find_string_end(json, pos);
    if (key_end == std::string::npos) {
      break;
    }
    const std::string key = json_unescape(json.substr(pos + 1, key_end - pos - 1));
    pos = key_end + 1;

    // expect colon
    pos = json_skip_ws(json, pos);
    if (pos >= json.size() || json[pos] != ':') {
      break;
    }
    ++pos;
    pos = json_skip_ws(json, pos);
    if (pos >= json.size()) {
      break;
    }

    // read value
    if (json[pos] == '"') {
      const auto val_end = json_find_string_end(json, pos);
      if (val_end == std::string::npos) {
        break;
      }
      result[key] = json_unescape(json.substr(pos + 1, val_end - pos - 1));
      pos = val_end + 1;
    } else if (json[pos] == '{' || json[pos] == '[') {
      const char open = json[pos];
      const char close = (open == '{') ? '}' : ']';
      const auto end = json_find_matching_token(json, pos, open, close);
      if (end == std::string::npos) {
        break;
      }
      result[key] = json.substr(pos, end - pos + 1);
      pos = end + 1;
    } else {
      // true/false/null/number
      const std::size_t start = pos;
      while (pos < json.size() && json[pos] != ',' && json[pos] != '}' && json[pos] != ']' &&
             std::isspace(static_cast<unsigned char>(json[pos])) == 0) {
        ++pos;
      }
      result[key] = json.substr(start, pos - start);
    }
  }

  return result;
}

std::vector<std::string> json_split_top_level_objects(const std::string &array_json) {
  std::vector<std::string> out;
  if (array_json.size() < 2 || array_json.front() != '[' || array_json.back() != ']') {
    return out;
  }

  StringState strings;
  std::size_t depth = 0;
  std::size_t start = std::string::npos;
  for (std::size_t i = 1; i + 1 < array_json.size(); ++i) {
    const char ch = array_json[i];
    if (strings.consume(ch)) {
      continue;
    }
    if (ch == '{') {
      if (depth++ == 0) {
        start = i;
      }
    } else if (ch == '}' && depth > 0 && --depth == 0 && start != std::string::npos) {
      out.push_back(array_json.substr(start, i - start + 1));
      start = std::string::npos;
    }
  }
  return out;
}

} // namespace skillreg::common
