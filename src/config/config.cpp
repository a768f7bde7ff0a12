#include "fsgate/config/config.hpp"

#include "fsgate/common/fs.hpp"
#include "fsgate/common/toml.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>

namespace fsgate::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".fsgate";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return g_config_path_override;
  }
  if (const char *env = std::getenv("FSGATE_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::optional<std::string> optional_root(const common::TomlDocument &doc, const std::string &key) {
  if (!doc.has(key)) {
    return std::nullopt;
  }
  const std::string value = common::trim(doc.get_string(key));
  if (value.empty()) {
    return std::nullopt;
  }
  return common::expand_path(value);
}

bool is_known_backend(const std::string &part) {
  return part == "log" || part == "none" || part == "noop";
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    auto parent = override_path->parent_path();
    if (parent.empty()) {
      std::error_code ec;
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure(
            common::ErrorCode::Config, "unable to resolve current directory");
      }
    }
    return common::Result<std::filesystem::path>::success(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.status());
  }
  return common::Result<std::filesystem::path>::success(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec)) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto dir = config_dir();
  if (!dir.ok()) {
    return dir;
  }
  return common::Result<std::filesystem::path>::success(dir.value() / CONFIG_FILENAME);
}

bool config_exists() {
  const auto path = config_path();
  std::error_code ec;
  return path.ok() && std::filesystem::exists(path.value(), ec);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

std::optional<std::filesystem::path> config_path_override() {
  return resolved_config_path_override();
}

void apply_env_overrides(Config &config) {
  if (const char *backend = std::getenv("FSGATE_OBSERVABILITY"); backend != nullptr && *backend) {
    config.observability.backend = backend;
  }
  if (const char *locale = std::getenv("FSGATE_LOCALE"); locale != nullptr && *locale) {
    config.gateway.locale = locale;
  }
  if (const char *audit = std::getenv("FSGATE_AUDIT_PATH"); audit != nullptr && *audit) {
    config.audit.enabled = true;
    config.audit.path = common::expand_path(audit);
  }
}

common::Result<Config> parse_config(const std::string &toml_text) {
  const auto parsed = common::parse_toml(toml_text);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.status());
  }
  const auto &doc = parsed.value();

  Config config;
  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);
  config.gateway.locale = doc.get_string("gateway.locale", config.gateway.locale);

  config.roots.download = optional_root(doc, "roots.download");
  config.roots.documents = optional_root(doc, "roots.documents");
  config.roots.desktop = optional_root(doc, "roots.desktop");

  config.audit.enabled = doc.get_bool("audit.enabled", config.audit.enabled);
  config.audit.path = common::expand_path(doc.get_string("audit.path", config.audit.path));

  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  const auto path_result = config_path();
  if (!path_result.ok()) {
    return common::Result<Config>::failure(path_result.status());
  }

  const auto &path = path_result.value();
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    Config config;
    config.audit.path = common::expand_path(config.audit.path);
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  std::ifstream file(path);
  if (!file) {
    return common::Result<Config>::failure(common::ErrorCode::Config,
                                           "Unable to open config file: " + path.string());
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  auto config = parse_config(buffer.str());
  if (!config.ok()) {
    return common::Result<Config>::failure(common::ErrorCode::Config,
                                           path.string() + ": " + config.error());
  }

  apply_env_overrides(config.value());
  return config;
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  std::vector<std::string> warnings;

  const std::string locale = common::to_lower(common::trim(config.gateway.locale));
  if (locale != "en" && locale != "ru") {
    return common::Result<std::vector<std::string>>::failure(
        common::ErrorCode::Config, "Invalid gateway.locale: " + config.gateway.locale);
  }

  std::stringstream backends(common::to_lower(config.observability.backend));
  std::string part;
  while (std::getline(backends, part, ',')) {
    const std::string name = common::trim(part);
    if (!name.empty() && !is_known_backend(name)) {
      return common::Result<std::vector<std::string>>::failure(
          common::ErrorCode::Config, "Invalid observability.backend: " + name);
    }
  }

  if (config.audit.enabled && common::trim(config.audit.path).empty()) {
    return common::Result<std::vector<std::string>>::failure(
        common::ErrorCode::Config, "audit.path must be set when audit.enabled = true");
  }

  const auto check_root = [&warnings](const char *key, const std::optional<std::string> &root) {
    if (!root.has_value()) {
      return;
    }
    std::error_code ec;
    if (!std::filesystem::path(*root).is_absolute()) {
      warnings.push_back(std::string(key) + " is not absolute: " + *root);
    } else if (!std::filesystem::is_directory(*root, ec)) {
      warnings.push_back(std::string(key) + " does not exist: " + *root);
    }
  };
  check_root("roots.download", config.roots.download);
  check_root("roots.documents", config.roots.documents);
  check_root("roots.desktop", config.roots.desktop);

  return common::Result<std::vector<std::string>>::success(std::move(warnings));
}

} // namespace fsgate::config
