#include "fsgate/platform/user_dirs.hpp"

#include "fsgate/common/fs.hpp"

#include <array>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <utility>

namespace fsgate::platform {

namespace {

struct CategorySpec {
  DirectoryCategory category;
  const char *xdg_key;
  const char *fallback_name;
};

constexpr std::array<CategorySpec, 3> CATEGORIES = {{
    {DirectoryCategory::Download, "XDG_DOWNLOAD_DIR", "Downloads"},
    {DirectoryCategory::Documents, "XDG_DOCUMENTS_DIR", "Documents"},
    {DirectoryCategory::Desktop, "XDG_DESKTOP_DIR", "Desktop"},
}};

std::string strip_shell_quotes(const std::string &raw) {
  std::string value = common::trim(raw);
  if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
    std::string out;
    out.reserve(value.size() - 2);
    bool escaped = false;
    for (std::size_t i = 1; i + 1 < value.size(); ++i) {
      const char ch = value[i];
      if (!escaped && ch == '\\') {
        escaped = true;
        continue;
      }
      out.push_back(ch);
      escaped = false;
    }
    return out;
  }
  if (value.size() >= 2 && value.front() == '\'' && value.back() == '\'') {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

std::filesystem::path user_dirs_file(const std::filesystem::path &home) {
  if (const char *xdg = std::getenv("XDG_CONFIG_HOME"); xdg != nullptr && *xdg == '/') {
    return std::filesystem::path(xdg) / "user-dirs.dirs";
  }
  return home / ".config" / "user-dirs.dirs";
}

std::string read_file_or_empty(const std::filesystem::path &path) {
  std::ifstream in(path);
  if (!in) {
    return "";
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

} // namespace

std::string_view category_name(const DirectoryCategory category) {
  switch (category) {
  case DirectoryCategory::Download:
    return "download";
  case DirectoryCategory::Documents:
    return "documents";
  case DirectoryCategory::Desktop:
    return "desktop";
  }
  return "unknown";
}

std::optional<std::filesystem::path> parse_user_dirs_entry(const std::string &content,
                                                           const std::string &key,
                                                           const std::filesystem::path &home) {
  std::istringstream stream(content);
  std::string line;
  std::optional<std::filesystem::path> found;

  while (std::getline(stream, line)) {
    std::string trimmed = common::trim(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }
    if (common::starts_with(trimmed, "export ")) {
      trimmed = common::trim(trimmed.substr(7));
    }

    const auto eq = trimmed.find('=');
    if (eq == std::string::npos || common::trim(trimmed.substr(0, eq)) != key) {
      continue;
    }

    std::string value = strip_shell_quotes(trimmed.substr(eq + 1));
    if (common::starts_with(value, "$HOME")) {
      value = home.string() + value.substr(5);
    }
    if (value.empty() || value.front() != '/') {
      continue;
    }
    while (value.size() > 1 && value.back() == '/') {
      value.pop_back();
    }
    // Later assignments win, as when the file is sourced.
    found = std::filesystem::path(value);
  }

  return found;
}

std::vector<KnownDirectory> XdgDirectoryProvider::lookup() const {
  const auto home = common::home_dir();
  if (!home.ok()) {
    return {};
  }

  const std::string content = read_file_or_empty(user_dirs_file(home.value()));
  std::vector<KnownDirectory> out;
  for (const auto &spec : CATEGORIES) {
    auto configured = parse_user_dirs_entry(content, spec.xdg_key, home.value());
    // xdg-user-dirs maps a disabled directory to $HOME itself.
    if (configured.has_value() && configured->lexically_normal() == home.value().lexically_normal()) {
      continue;
    }
    out.push_back({spec.category, configured.value_or(home.value() / spec.fallback_name)});
  }
  return out;
}

FixedDirectoryProvider::FixedDirectoryProvider(std::vector<KnownDirectory> directories)
    : directories_(std::move(directories)) {}

std::vector<KnownDirectory> FixedDirectoryProvider::lookup() const { return directories_; }

std::shared_ptr<IDirectoryProvider> create_directory_provider(const config::RootsConfig &roots) {
  if (!roots.any()) {
    return std::make_shared<XdgDirectoryProvider>();
  }

  std::vector<KnownDirectory> directories;
  if (roots.download.has_value()) {
    directories.push_back({DirectoryCategory::Download, *roots.download});
  }
  if (roots.documents.has_value()) {
    directories.push_back({DirectoryCategory::Documents, *roots.documents});
  }
  if (roots.desktop.has_value()) {
    directories.push_back({DirectoryCategory::Desktop, *roots.desktop});
  }
  return std::make_shared<FixedDirectoryProvider>(std::move(directories));
}

} // namespace fsgate::platform
