#include "fsgate/common/fs.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iterator>
#include <regex>

namespace fsgate::common {

std::string trim(const std::string &input) {
  auto first = std::find_if_not(input.begin(), input.end(), [](unsigned char c) {
    return std::isspace(c) != 0;
  });
  auto last = std::find_if_not(input.rbegin(), input.rend(), [](unsigned char c) {
    return std::isspace(c) != 0;
  }).base();

  if (first >= last) {
    return "";
  }
  return std::string(first, last);
}

bool starts_with(const std::string &value, const std::string &prefix) {
  return value.rfind(prefix, 0) == 0;
}

std::string to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

Result<std::filesystem::path> home_dir() {
  if (const char *home = std::getenv("HOME"); home != nullptr && *home != '\0') {
    return Result<std::filesystem::path>::success(std::filesystem::path(home));
  }
  return Result<std::filesystem::path>::failure(ErrorCode::Config, "HOME is not set");
}

Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path) {
  std::error_code ec;
  std::filesystem::create_directories(path, ec);
  if (ec) {
    return Result<std::filesystem::path>::failure(
        ErrorCode::IoFailure, "Failed to create directory: " + path.string() + ": " + ec.message());
  }
  return Result<std::filesystem::path>::success(path);
}

std::string expand_home(std::string value) {
  if (value.empty() || value[0] != '~') {
    return value;
  }
  // `~user` forms are left alone.
  if (value.size() > 1 && value[1] != '/') {
    return value;
  }
  if (auto home = home_dir(); home.ok()) {
    value.replace(0, 1, home.value().string());
  }
  return value;
}

std::string expand_path(std::string value) {
  value = expand_home(std::move(value));
  if (value.find('$') == std::string::npos) {
    return value;
  }

  static const std::regex env_pattern(R"(\$\{?([A-Za-z_][A-Za-z0-9_]*)\}?)");
  std::smatch match;
  std::string expanded;
  std::string remaining = value;

  while (std::regex_search(remaining, match, env_pattern)) {
    expanded += match.prefix().str();
    const std::string var_name = match[1].str();
    if (const char *var = std::getenv(var_name.c_str()); var != nullptr) {
      expanded += var;
    }
    remaining = match.suffix().str();
  }

  expanded += remaining;
  return expanded;
}

bool is_subpath(const std::filesystem::path &candidate, const std::filesystem::path &parent) {
  if (parent.empty()) {
    return false;
  }

  auto c_it = candidate.begin();
  auto p_it = parent.begin();

  for (; p_it != parent.end(); ++p_it, ++c_it) {
    // A trailing separator shows up as an empty final element.
    if (p_it->empty() && std::next(p_it) == parent.end()) {
      break;
    }
    if (c_it == candidate.end() || *c_it != *p_it) {
      return false;
    }
  }

  return true;
}

std::optional<std::string> lowercase_extension(const std::filesystem::path &path) {
  const auto ext = path.extension().string();
  if (ext.size() < 2) {
    return std::nullopt;
  }
  return to_lower(ext.substr(1));
}

} // namespace fsgate::common
