#pragma once

#include "fsgate/common/result.hpp"
#include "fsgate/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace fsgate::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
[[nodiscard]] bool config_exists();
void set_config_path_override(std::optional<std::filesystem::path> path);
[[nodiscard]] std::optional<std::filesystem::path> config_path_override();

/// Loads `config_path()`; a missing file yields defaults plus env overrides.
[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] common::Result<Config> parse_config(const std::string &toml_text);

/// Returns warnings on success; fails on values the gateway cannot run with.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

void apply_env_overrides(Config &config);

} // namespace fsgate::config
