#include "warden/common/toml.hpp"

#include "warden/common/fs.hpp"

#include <algorithm>
#include <charconv>

namespace warden::common {

namespace {

/// Tracks whether a position sits inside a basic ("...") or literal ('...') string.
class QuoteState {
public:
  /// Feeds one character; returns true while the character is part of a string.
  bool feed(const char ch) {
    if (escaped_) {
      escaped_ = false;
      return true;
    }
    if (quote_ == '"' && ch == '\\') {
      escaped_ = true;
      return true;
    }
    if (quote_ != 0) {
      if (ch == quote_) {
        quote_ = 0;
      }
      return true;
    }
    if (ch == '"' || ch == '\'') {
      quote_ = ch;
      return true;
    }
    return false;
  }

  [[nodiscard]] bool open() const { return quote_ != 0; }

private:
  char quote_ = 0;
  bool escaped_ = false;
};

std::string without_comment(const std::string &line) {
  QuoteState quotes;
  for (std::size_t i = 0; i < line.size(); ++i) {
    if (!quotes.feed(line[i]) && line[i] == '#') {
      return line.substr(0, i);
    }
  }
  return line;
}

/// Net bracket depth of a value fragment, ignoring brackets inside strings.
int bracket_balance(const std::string &fragment) {
  QuoteState quotes;
  int depth = 0;
  for (const char ch : fragment) {
    if (quotes.feed(ch)) {
      continue;
    }
    depth += ch == '[' ? 1 : ch == ']' ? -1 : 0;
  }
  return depth;
}

std::vector<std::string> split_top_level(const std::string &body) {
  std::vector<std::string> parts;
  QuoteState quotes;
  std::string current;
  for (const char ch : body) {
    if (!quotes.feed(ch) && ch == ',') {
      parts.push_back(trim(current));
      current.clear();
      continue;
    }
    current.push_back(ch);
  }
  if (!trim(current).empty()) {
    parts.push_back(trim(current));
  }
  return parts;
}

std::string unescape_basic(const std::string &body) {
  std::string out;
  out.reserve(body.size());
  for (std::size_t i = 0; i < body.size(); ++i) {
    if (body[i] != '\\' || i + 1 >= body.size()) {
      out.push_back(body[i]);
      continue;
    }
    switch (const char next = body[++i]) {
    case 'n':
      out.push_back('\n');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'r':
      out.push_back('\r');
      break;
    default:
      out.push_back(next);
      break;
    }
  }
  return out;
}

std::string unquote(const std::string &raw) {
  const std::string value = trim(raw);
  if (value.size() < 2) {
    return value;
  }
  if (value.front() == '"' && value.back() == '"') {
    return unescape_basic(value.substr(1, value.size() - 2));
  }
  if (value.front() == '\'' && value.back() == '\'') {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

Result<TomlDocument> syntax_error(const std::string &what, const std::size_t line_number) {
  return Result<TomlDocument>::failure(what + " at line " + std::to_string(line_number),
                                       ErrorKind::Invalid);
}

} // namespace

std::optional<std::chrono::milliseconds> parse_duration(const std::string &text) {
  const std::string value = to_lower(trim(text));
  std::uint64_t amount = 0;
  const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), amount);
  if (ec != std::errc() || ptr == value.data()) {
    return std::nullopt;
  }

  const std::string unit = trim(std::string(ptr, value.data() + value.size()));
  if (unit.empty() || unit == "ms") {
    return std::chrono::milliseconds(amount);
  }
  if (unit == "s") {
    return std::chrono::seconds(amount);
  }
  if (unit == "m") {
    return std::chrono::minutes(amount);
  }
  if (unit == "h") {
    return std::chrono::hours(amount);
  }
  return std::nullopt;
}

bool TomlDocument::has(const std::string &key) const { return values.contains(key); }

std::string TomlDocument::get_string(const std::string &key, const std::string &fallback) const {
  const auto it = values.find(key);
  return it == values.end() ? fallback : unquote(it->second);
}

bool TomlDocument::get_bool(const std::string &key, const bool fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  const std::string normalized = to_lower(trim(it->second));
  if (normalized == "true" || normalized == "false") {
    return normalized == "true";
  }
  return fallback;
}

std::uint64_t TomlDocument::get_u64(const std::string &key, const std::uint64_t fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }

  // TOML allows underscores between digits: 262_144.
  std::string digits;
  for (const char ch : trim(it->second)) {
    if (ch != '_') {
      digits.push_back(ch);
    }
  }
  std::uint64_t parsed = 0;
  const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), parsed);
  if (ec != std::errc() || ptr != digits.data() + digits.size() || digits.empty()) {
    return fallback;
  }
  return parsed;
}

std::chrono::milliseconds TomlDocument::get_duration(const std::string &key,
                                                     const std::chrono::milliseconds fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  return parse_duration(unquote(it->second)).value_or(fallback);
}

std::vector<std::string>
TomlDocument::get_string_array(const std::string &key,
                               const std::vector<std::string> &fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  const std::string raw = trim(it->second);
  if (raw.size() < 2 || raw.front() != '[' || raw.back() != ']') {
    return fallback;
  }

  std::vector<std::string> out;
  for (const auto &element : split_top_level(raw.substr(1, raw.size() - 2))) {
    out.push_back(unquote(element));
  }
  return out;
}

Result<TomlDocument> parse_toml(const std::string &content) {
  TomlDocument document;
  std::string section;

  // An array value may continue over several lines until its brackets balance.
  std::string pending_key;
  std::string pending_value;
  std::size_t pending_line = 0;
  int pending_depth = 0;

  const auto commit = [&](const std::string &key, std::string value,
                          const std::size_t line_number) -> Status {
    const std::string full_key = section.empty() ? key : section + "." + key;
    if (!document.values.emplace(full_key, trim(value)).second) {
      return Status::error("Duplicate key '" + full_key + "' at line " +
                               std::to_string(line_number),
                           ErrorKind::Invalid);
    }
    return Status::success();
  };

  std::size_t line_number = 0;
  std::size_t start = 0;
  while (start <= content.size()) {
    const std::size_t end = std::min(content.find('\n', start), content.size());
    const std::string line = trim(without_comment(content.substr(start, end - start)));
    start = end + 1;
    ++line_number;

    if (pending_depth > 0) {
      pending_value += " " + line;
      pending_depth += bracket_balance(line);
      if (pending_depth <= 0) {
        if (auto stored = commit(pending_key, pending_value, pending_line); !stored.ok()) {
          return Result<TomlDocument>::failure(stored.details());
        }
      }
      continue;
    }
    if (line.empty()) {
      continue;
    }

    if (line.front() == '[') {
      if (line.back() != ']' || line.size() < 3) {
        return syntax_error("Invalid section header", line_number);
      }
      section = trim(line.substr(1, line.size() - 2));
      if (section.empty()) {
        return syntax_error("Invalid empty section", line_number);
      }
      continue;
    }

    const std::size_t equals = line.find('=');
    if (equals == std::string::npos) {
      return syntax_error("Invalid key/value", line_number);
    }
    const std::string key = unquote(line.substr(0, equals));
    const std::string value = trim(line.substr(equals + 1));
    if (key.empty()) {
      return syntax_error("Missing key", line_number);
    }

    QuoteState quotes;
    for (const char ch : value) {
      (void)quotes.feed(ch);
    }
    if (quotes.open()) {
      return syntax_error("Unterminated string", line_number);
    }

    const int depth = bracket_balance(value);
    if (depth > 0) {
      pending_key = key;
      pending_value = value;
      pending_line = line_number;
      pending_depth = depth;
      continue;
    }
    if (auto stored = commit(key, value, line_number); !stored.ok()) {
      return Result<TomlDocument>::failure(stored.details());
    }
  }

  if (pending_depth > 0) {
    return syntax_error("Unterminated array", pending_line);
  }
  return Result<TomlDocument>::success(std::move(document));
}

} // namespace warden::common
