#pragma once

#include "fsgate/common/result.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace fsgate::io {

/// Filesystem primitives the gateway delegates to. Each call is a single attempt; a
/// failure carries the system diagnostic and is surfaced as-is.
class IFileSystem {
public:
  virtual ~IFileSystem() = default;

  [[nodiscard]] virtual common::Status write(const std::filesystem::path &path,
                                             std::string_view bytes) = 0;
  [[nodiscard]] virtual common::Result<std::string>
  read_to_string(const std::filesystem::path &path) = 0;
  [[nodiscard]] virtual common::Result<std::uint64_t>
  file_size(const std::filesystem::path &path) = 0;
  /// Strict: fails when any component does not exist.
  [[nodiscard]] virtual common::Result<std::filesystem::path>
  canonicalize(const std::filesystem::path &path) = 0;
  [[nodiscard]] virtual bool is_directory(const std::filesystem::path &path) = 0;
  /// Does not follow the final component; true for dangling links too.
  [[nodiscard]] virtual bool is_symlink(const std::filesystem::path &path) = 0;
};

/// Writes never follow a symlink in the final component.
class LocalFileSystem final : public IFileSystem {
public:
  [[nodiscard]] common::Status write(const std::filesystem::path &path,
                                     std::string_view bytes) override;
  [[nodiscard]] common::Result<std::string>
  read_to_string(const std::filesystem::path &path) override;
  [[nodiscard]] common::Result<std::uint64_t>
  file_size(const std::filesystem::path &path) override;
  [[nodiscard]] common::Result<std::filesystem::path>
  canonicalize(const std::filesystem::path &path) override;
  [[nodiscard]] bool is_directory(const std::filesystem::path &path) override;
  [[nodiscard]] bool is_symlink(const std::filesystem::path &path) override;
};

} // namespace fsgate::io
