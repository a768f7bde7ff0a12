#include "fsgate/common/toml.hpp"

#include "fsgate/common/fs.hpp"

#include <charconv>
#include <sstream>

namespace fsgate::common {

namespace {

bool is_unescaped_quote(const std::string &text, const std::size_t i) {
  return text[i] == '"' && (i == 0 || text[i - 1] != '\\');
}

std::string strip_comment(const std::string &line) {
  bool in_quotes = false;
  for (std::size_t i = 0; i < line.size(); ++i) {
    if (is_unescaped_quote(line, i)) {
      in_quotes = !in_quotes;
    } else if (!in_quotes && line[i] == '#') {
      return line.substr(0, i);
    }
  }
  return line;
}

std::vector<std::string> split_array_elements(const std::string &body) {
  std::vector<std::string> elements;
  std::string current;
  bool in_quotes = false;

  for (std::size_t i = 0; i < body.size(); ++i) {
    if (is_unescaped_quote(body, i)) {
      in_quotes = !in_quotes;
    } else if (!in_quotes && body[i] == ',') {
      elements.push_back(trim(current));
      current.clear();
      continue;
    }
    current.push_back(body[i]);
  }

  if (!trim(current).empty()) {
    elements.push_back(trim(current));
  }
  return elements;
}

std::string unquote(std::string value) {
  value = trim(value);
  if (value.size() < 2) {
    return value;
  }
  const char open = value.front();
  if ((open != '"' && open != '\'') || value.back() != open) {
    return value;
  }

  const std::string body = value.substr(1, value.size() - 2);
  if (open == '\'') {
    return body;
  }

  std::string out;
  out.reserve(body.size());
  bool escaped = false;
  for (const char ch : body) {
    if (!escaped && ch == '\\') {
      escaped = true;
      continue;
    }
    if (escaped) {
      switch (ch) {
      case 'n':
        out.push_back('\n');
        break;
      case 't':
        out.push_back('\t');
        break;
      default:
        out.push_back(ch);
        break;
      }
      escaped = false;
      continue;
    }
    out.push_back(ch);
  }
  return out;
}

} // namespace

bool TomlDocument::has(const std::string &key) const { return values.contains(key); }

std::string TomlDocument::get_string(const std::string &key, const std::string &fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  return unquote(it->second);
}

bool TomlDocument::get_bool(const std::string &key, const bool fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  const std::string normalized = to_lower(trim(it->second));
  if (normalized == "true") {
    return true;
  }
  if (normalized == "false") {
    return false;
  }
  return fallback;
}

std::uint64_t TomlDocument::get_u64(const std::string &key, const std::uint64_t fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }

  std::string normalized = trim(it->second);
  // TOML allows `10_485_760`.
  std::erase(normalized, '_');
  std::uint64_t parsed = 0;
  const auto *first = normalized.data();
  const auto *last = first + normalized.size();
  auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (ec != std::errc() || ptr != last) {
    return fallback;
  }
  return parsed;
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
  for (const auto &element : split_array_elements(raw.substr(1, raw.size() - 2))) {
    if (!element.empty()) {
      out.push_back(unquote(element));
    }
  }
  return out;
}

Result<TomlDocument> parse_toml(const std::string &content) {
  TomlDocument document;
  std::istringstream stream(content);
  std::string line;
  std::string section;
  std::size_t line_number = 0;

  while (std::getline(stream, line)) {
    ++line_number;
    const std::string clean = trim(strip_comment(line));
    if (clean.empty()) {
      continue;
    }

    if (clean.front() == '[' && clean.back() == ']') {
      section = trim(clean.substr(1, clean.size() - 2));
      if (section.empty()) {
        return Result<TomlDocument>::failure(
            ErrorCode::Config, "Invalid empty section at line " + std::to_string(line_number));
      }
      continue;
    }

    const std::size_t equals = clean.find('=');
    if (equals == std::string::npos) {
      return Result<TomlDocument>::failure(
          ErrorCode::Config, "Invalid key/value at line " + std::to_string(line_number));
    }

    const std::string key = trim(clean.substr(0, equals));
    if (key.empty()) {
      return Result<TomlDocument>::failure(ErrorCode::Config,
                                           "Missing key at line " + std::to_string(line_number));
    }

    const std::string full_key = section.empty() ? key : section + "." + key;
    document.values[full_key] = trim(clean.substr(equals + 1));
  }

  return Result<TomlDocument>::success(std::move(document));
}

std::string quote_toml_string(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size() + 2);
  escaped.push_back('"');
  for (const char ch : value) {
    if (ch == '"' || ch == '\\') {
      escaped.push_back('\\');
    }
    escaped.push_back(ch);
  }
  escaped.push_back('"');
  return escaped;
}

} // namespace fsgate::common
