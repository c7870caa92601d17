#include "warden/common/json_util.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdio>

namespace warden::common {

namespace {

constexpr std::size_t kMaxCanonicalDepth = 64;

int hex_digit(const char ch) {
  if (ch >= '0' && ch <= '9') {
    return ch - '0';
  }
  if (ch >= 'a' && ch <= 'f') {
    return ch - 'a' + 10;
  }
  if (ch >= 'A' && ch <= 'F') {
    return ch - 'A' + 10;
  }
  return -1;
}

bool parse_hex4(const std::string &raw, const std::size_t pos, std::uint32_t &out) {
  if (pos + 4 > raw.size()) {
    return false;
  }
  out = 0;
  for (std::size_t i = pos; i < pos + 4; ++i) {
    const int digit = hex_digit(raw[i]);
    if (digit < 0) {
      return false;
    }
    out = (out << 4U) | static_cast<std::uint32_t>(digit);
  }
  return true;
}

void append_utf8(std::string &out, const std::uint32_t cp) {
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6U)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3FU)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12U)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6U) & 0x3FU)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3FU)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18U)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12U) & 0x3FU)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6U) & 0x3FU)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3FU)));
  }
}

std::size_t find_value_end(const std::string &json, std::size_t pos) {
  if (pos >= json.size()) {
    return std::string::npos;
  }
  const char ch = json[pos];
  if (ch == '"') {
    return json_find_string_end(json, pos);
  }
  if (ch == '{') {
    return json_find_matching_token(json, pos, '{', '}');
  }
  if (ch == '[') {
    return json_find_matching_token(json, pos, '[', ']');
  }
  std::size_t end = pos;
  while (end < json.size() && json[end] != ',' && json[end] != '}' && json[end] != ']' &&
         std::isspace(static_cast<unsigned char>(json[end])) == 0) {
    ++end;
  }
  return end == pos ? std::string::npos : end - 1;
}

bool canonicalize_value(const std::string &text, std::size_t &pos, std::string &out,
                        std::size_t depth);

bool canonicalize_object(const std::string &text, std::size_t &pos, std::string &out,
                         const std::size_t depth) {
  ++pos; // skip {
  std::vector<std::pair<std::string, std::string>> members;
  pos = json_skip_ws(text, pos);
  if (pos < text.size() && text[pos] == '}') {
    ++pos;
    out += "{}";
    return true;
  }
  while (pos < text.size()) {
    pos = json_skip_ws(text, pos);
    if (pos >= text.size() || text[pos] != '"') {
      return false;
    }
    const auto key_end = json_find_string_end(text, pos);
    if (key_end == std::string::npos) {
      return false;
    }
    std::string key = json_unescape(text.substr(pos + 1, key_end - pos - 1));
    pos = json_skip_ws(text, key_end + 1);
    if (pos >= text.size() || text[pos] != ':') {
      return false;
    }
    ++pos;
    std::string value;
    if (!canonicalize_value(text, pos, value, depth + 1)) {
      return false;
    }
    members.emplace_back(std::move(key), std::move(value));
    pos = json_skip_ws(text, pos);
    if (pos < text.size() && text[pos] == ',') {
      ++pos;
      continue;
    }
    if (pos < text.size() && text[pos] == '}') {
      ++pos;
      break;
    }
    return false;
  }

  std::stable_sort(members.begin(), members.end(),
                   [](const auto &a, const auto &b) { return a.first < b.first; });
  out.push_back('{');
  for (std::size_t i = 0; i < members.size(); ++i) {
    if (i > 0) {
      out.push_back(',');
    }
    out += json_string(members[i].first);
    out.push_back(':');
    out += members[i].second;
  }
  out.push_back('}');
  return true;
}

bool canonicalize_array(const std::string &text, std::size_t &pos, std::string &out,
                        const std::size_t depth) {
  ++pos; // skip [
  out.push_back('[');
  pos = json_skip_ws(text, pos);
  if (pos < text.size() && text[pos] == ']') {
    ++pos;
    out.push_back(']');
    return true;
  }
  bool first = true;
  while (pos < text.size()) {
    if (!first) {
      out.push_back(',');
    }
    first = false;
    if (!canonicalize_value(text, pos, out, depth + 1)) {
      return false;
    }
    pos = json_skip_ws(text, pos);
    if (pos < text.size() && text[pos] == ',') {
      ++pos;
      continue;
    }
    if (pos < text.size() && text[pos] == ']') {
      ++pos;
      out.push_back(']');
      return true;
    }
    return false;
  }
  return false;
}

bool canonicalize_value(const std::string &text, std::size_t &pos, std::string &out,
                        const std::size_t depth) {
  if (depth > kMaxCanonicalDepth) {
    return false;
  }
  pos = json_skip_ws(text, pos);
  if (pos >= text.size()) {
    return false;
  }

  const char ch = text[pos];
  if (ch == '{') {
    return canonicalize_object(text, pos, out, depth);
  }
  if (ch == '[') {
    return canonicalize_array(text, pos, out, depth);
  }
  if (ch == '"') {
    const auto end = json_find_string_end(text, pos);
    if (end == std::string::npos) {
      return false;
    }
    out += json_string(json_unescape(text.substr(pos + 1, end - pos - 1)));
    pos = end + 1;
    return true;
  }
  for (const char *literal : {"true", "false", "null"}) {
    const std::string word(literal);
    if (text.compare(pos, word.size(), word) == 0) {
      out += word;
      pos += word.size();
      return true;
    }
  }

  const std::size_t start = pos;
  while (pos < text.size()) {
    const char c = text[pos];
    if (std::isdigit(static_cast<unsigned char>(c)) != 0 || c == '-' || c == '+' || c == '.' ||
        c == 'e' || c == 'E') {
      ++pos;
      continue;
    }
    break;
  }
  if (pos == start) {
    return false;
  }
  out.append(text, start, pos - start);
  return true;
}

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
    default:
      if (static_cast<unsigned char>(ch) < 0x20) {
        char buffer[8];
        std::snprintf(buffer, sizeof(buffer), "\\u%04x", static_cast<unsigned>(ch));
        escaped += buffer;
      } else {
        escaped.push_back(ch);
      }
      break;
    }
  }
  return escaped;
}

std::string json_string(const std::string &value) { return "\"" + json_escape(value) + "\""; }

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
        out.push_back('u');
        break;
      }
      i += 4;
      if (cp >= 0xD800 && cp <= 0xDBFF && i + 2 < raw.size() && raw[i + 1] == '\\' &&
          raw[i + 2] == 'u') {
        std::uint32_t low = 0;
        if (parse_hex4(raw, i + 3, low) && low >= 0xDC00 && low <= 0xDFFF) {
          cp = 0x10000 + ((cp - 0xD800) << 10U) + (low - 0xDC00);
          i += 6;
        }
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
  bool in_string = false;
  bool escaped = false;
  for (std::size_t i = open_pos; i < json.size(); ++i) {
    const char ch = json[i];
    if (in_string) {
      if (!escaped && ch == '"') {
        in_string = false;
      } else if (!escaped && ch == '\\') {
        escaped = true;
        continue;
      }
      escaped = false;
      continue;
    }
    if (ch == '"') {
      in_string = true;
      escaped = false;
      continue;
    }
    if (ch == open_ch) {
      ++depth;
    } else if (ch == close_ch) {
      if (depth == 0) {
        return std::string::npos;
      }
      --depth;
      if (depth == 0) {
        return i;
      }
    }
  }
  return std::string::npos;
}

std::string json_get_string(const std::string &json, const std::string &field) {
  const auto key_pos = json_find_key(json, field);
  if (key_pos == std::string::npos) {
    return "";
  }
  const auto colon = json.find(':', key_pos + field.size() + 2);
  if (colon == std::string::npos) {
    return "";
  }
  std::size_t pos = json_skip_ws(json, colon + 1);
  if (pos >= json.size() || json[pos] != '"') {
    return "";
  }
  const auto end = json_find_string_end(json, pos);
  if (end == std::string::npos || end <= pos) {
    return "";
  }
  return json_unescape(json.substr(pos + 1, end - pos - 1));
}

std::string json_get_number(const std::string &json, const std::string &field) {
  const auto key_pos = json_find_key(json, field);
  if (key_pos == std::string::npos) {
    return "";
  }
  const auto colon = json.find(':', key_pos + field.size() + 2);
  if (colon == std::string::npos) {
    return "";
  }
  std::size_t pos = json_skip_ws(json, colon + 1);
  if (pos >= json.size() || json[pos] == '"') {
    return "";
  }
  const std::size_t start = pos;
  while (pos < json.size()) {
    const char ch = json[pos];
    if (ch == ',' || ch == '}' || ch == ']' || std::isspace(static_cast<unsigned char>(ch)) != 0) {
      break;
    }
    ++pos;
  }
  if (pos <= start) {
    return "";
  }
  return json.substr(start, pos - start);
}

JsonMembers json_object_members(const std::string &object_json) {
  JsonMembers members;
  std::size_t pos = json_skip_ws(object_json, 0);
  if (pos >= object_json.size() || object_json[pos] != '{') {
    return members;
  }
  ++pos;

  while (pos < object_json.size()) {
    pos = json_skip_ws(object_json, pos);
    if (pos >= object_json.size() || object_json[pos] == '}') {
      break;
    }
    if (object_json[pos] == ',') {
      ++pos;
      continue;
    }
    if (object_json[pos] != '"') {
      break;
    }
    const auto key_end = json_find_string_end(object_json, pos);
    if (key_end == std::string::npos) {
      break;
    }
    std::string key = json_unescape(object_json.substr(pos + 1, key_end - pos - 1));
    pos = json_skip_ws(object_json, key_end + 1);
    if (pos >= object_json.size() || object_json[pos] != ':') {
      break;
    }
    pos = json_skip_ws(object_json, pos + 1);
    const auto value_end = find_value_end(object_json, pos);
    if (value_end == std::string::npos) {
      break;
    }
    members.emplace_back(std::move(key), object_json.substr(pos, value_end - pos + 1));
    pos = value_end + 1;
  }
  return members;
}

std::string json_member(const JsonMembers &members, const std::string &key) {
  for (const auto &[name, value] : members) {
    if (name == key) {
      return value;
    }
  }
  return "";
}

std::string json_value_as_string(const std::string &raw) {
  if (raw.size() < 2 || raw.front() != '"' || raw.back() != '"') {
    return "";
  }
  return json_unescape(raw.substr(1, raw.size() - 2));
}

std::vector<std::string> json_split_top_level_objects(const std::string &array_json) {
  std::vector<std::string> out;
  if (array_json.size() < 2 || array_json.front() != '[' || array_json.back() != ']') {
    return out;
  }

  bool in_string = false;
  bool escaped = false;
  std::size_t depth = 0;
  std::size_t current_start = std::string::npos;
  for (std::size_t i = 1; i + 1 < array_json.size(); ++i) {
    const char ch = array_json[i];
    if (in_string) {
      if (!escaped && ch == '"') {
        in_string = false;
      } else if (!escaped && ch == '\\') {
        escaped = true;
        continue;
      }
      escaped = false;
      continue;
    }
    if (ch == '"') {
      in_string = true;
      escaped = false;
      continue;
    }
    if (ch == '{') {
      if (depth == 0) {
        current_start = i;
      }
      ++depth;
      continue;
    }
    if (ch == '}') {
      if (depth == 0) {
        continue;
      }
      --depth;
      if (depth == 0 && current_start != std::string::npos) {
        out.push_back(array_json.substr(current_start, i - current_start + 1));
        current_start = std::string::npos;
      }
    }
  }
  return out;
}

Result<std::string> json_canonicalize(const std::string &json) {
  std::string out;
  out.reserve(json.size());
  std::size_t pos = 0;
  if (!canonicalize_value(json, pos, out, 0)) {
    return Result<std::string>::failure("invalid JSON near offset " + std::to_string(pos),
                                        ErrorKind::Invalid);
  }
  if (json_skip_ws(json, pos) != json.size()) {
    return Result<std::string>::failure("trailing data after JSON value", ErrorKind::Invalid);
  }
  return Result<std::string>::success(std::move(out));
}

} // namespace warden::common
