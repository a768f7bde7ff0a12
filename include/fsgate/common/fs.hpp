#pragma once

#include "fsgate/common/result.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace fsgate::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);

/// Expands a leading `~` and `$VAR` / `${VAR}` references. Only for trusted input
/// such as configuration values.
[[nodiscard]] std::string expand_path(std::string value);

/// Expands a leading `~` or `~/` only. Used on caller-supplied paths.
[[nodiscard]] std::string expand_home(std::string value);

/// Segment-wise prefix test: `/a/b2` is not under `/a/b`.
[[nodiscard]] bool is_subpath(const std::filesystem::path &candidate,
                             const std::filesystem::path &parent);

/// Lowercased extension without the dot, or nullopt when the file name has none.
[[nodiscard]] std::optional<std::string> lowercase_extension(const std::filesystem::path &path);

} // namespace fsgate::common
