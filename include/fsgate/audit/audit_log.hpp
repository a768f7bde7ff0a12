#pragma once

#include "fsgate/common/result.hpp"

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <sqlite3.h>
#include <string>
#include <vector>

namespace fsgate::audit {

struct AuditEntry {
  std::int64_t timestamp_ms = 0;
  std::string operation;
  std::string path;
  common::ErrorCode outcome = common::ErrorCode::None;
  std::string message;
  std::uint64_t bytes = 0;
  std::optional<std::string> sha256;
};

/// Append-only SQLite log of gateway decisions.
class AuditLog {
public:
  explicit AuditLog(std::filesystem::path db_path);
  ~AuditLog();

  AuditLog(const AuditLog &) = delete;
  AuditLog &operator=(const AuditLog &) = delete;

  [[nodiscard]] bool is_open() const { return db_ != nullptr; }
  [[nodiscard]] const std::filesystem::path &path() const { return db_path_; }

  [[nodiscard]] common::Status record(const AuditEntry &entry);
  /// Most recent first.
  [[nodiscard]] common::Result<std::vector<AuditEntry>> recent(std::size_t limit);

private:
  [[nodiscard]] common::Status init_schema();

  std::filesystem::path db_path_;
  sqlite3 *db_ = nullptr;
  std::mutex mutex_;
};

} // namespace fsgate::audit
