#include "fsgate/audit/audit_log.hpp"

#include <array>

namespace fsgate::audit {

namespace {

constexpr std::array<common::ErrorCode, 10> ALL_CODES = {
    common::ErrorCode::None,
    common::ErrorCode::RateLimitExceeded,
    common::ErrorCode::PayloadTooLarge,
    common::ErrorCode::MissingExtension,
    common::ErrorCode::DisallowedExtension,
    common::ErrorCode::PathNotAllowed,
    common::ErrorCode::IoFailure,
    common::ErrorCode::InvalidArgument,
    common::ErrorCode::Config,
    common::ErrorCode::Internal,
};

common::Status exec_sql(sqlite3 *db, const std::string &sql) {
  char *err = nullptr;
  const int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    const std::string message = err == nullptr ? "sqlite error" : err;
    if (err != nullptr) {
      sqlite3_free(err);
    }
    return common::Status::error(common::ErrorCode::IoFailure, message);
  }
  return common::Status::success();
}

common::ErrorCode code_from_name(const std::string &name) {
  for (const auto code : ALL_CODES) {
    if (common::error_code_name(code) == name) {
      return code;
    }
  }
  return common::ErrorCode::Internal;
}

std::string column_text(sqlite3_stmt *stmt, const int column) {
  const auto *text = reinterpret_cast<const char *>(sqlite3_column_text(stmt, column));
  return text == nullptr ? std::string() : std::string(text);
}

} // namespace

AuditLog::AuditLog(std::filesystem::path db_path) : db_path_(std::move(db_path)) {
  std::error_code ec;
  if (db_path_.has_parent_path()) {
    std::filesystem::create_directories(db_path_.parent_path(), ec);
  }
  if (sqlite3_open(db_path_.string().c_str(), &db_) != SQLITE_OK) {
    if (db_ != nullptr) {
      sqlite3_close(db_);
    }
    db_ = nullptr;
    return;
  }
  if (!init_schema().ok()) {
    sqlite3_close(db_);
    db_ = nullptr;
  }
}

AuditLog::~AuditLog() {
  if (db_ != nullptr) {
    sqlite3_close(db_);
  }
}

common::Status AuditLog::init_schema() {
  return exec_sql(db_, R"(
CREATE TABLE IF NOT EXISTS guard_decisions (
  id INTEGER PRIMARY KEY AUTOINCREMENT,
  timestamp_ms INTEGER NOT NULL,
  operation TEXT NOT NULL,
  path TEXT NOT NULL,
  outcome TEXT NOT NULL,
  message TEXT NOT NULL,
  bytes INTEGER NOT NULL DEFAULT 0,
  sha256 TEXT
);
CREATE INDEX IF NOT EXISTS idx_guard_decisions_ts ON guard_decisions(timestamp_ms);
)");
}

common::Status AuditLog::record(const AuditEntry &entry) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Status::error(common::ErrorCode::IoFailure, "audit db not initialized");
  }

  sqlite3_stmt *stmt = nullptr;
  const char *sql = "INSERT INTO guard_decisions(timestamp_ms, operation, path, outcome, message, "
                    "bytes, sha256) VALUES(?1, ?2, ?3, ?4, ?5, ?6, ?7)";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Status::error(common::ErrorCode::IoFailure, sqlite3_errmsg(db_));
  }

  const std::string outcome(common::error_code_name(entry.outcome));
  sqlite3_bind_int64(stmt, 1, entry.timestamp_ms);
  sqlite3_bind_text(stmt, 2, entry.operation.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 3, entry.path.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 4, outcome.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 5, entry.message.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int64(stmt, 6, static_cast<sqlite3_int64>(entry.bytes));
  if (entry.sha256.has_value()) {
    sqlite3_bind_text(stmt, 7, entry.sha256->c_str(), -1, SQLITE_TRANSIENT);
  } else {
    sqlite3_bind_null(stmt, 7);
  }

  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Status::error(common::ErrorCode::IoFailure, sqlite3_errmsg(db_));
  }
  return common::Status::success();
}

common::Result<std::vector<AuditEntry>> AuditLog::recent(const std::size_t limit) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<std::vector<AuditEntry>>::failure(common::ErrorCode::IoFailure,
                                                            "audit db not initialized");
  }

  sqlite3_stmt *stmt = nullptr;
  const char *sql = "SELECT timestamp_ms, operation, path, outcome, message, bytes, sha256 "
                    "FROM guard_decisions ORDER BY id DESC LIMIT ?1";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Result<std::vector<AuditEntry>>::failure(common::ErrorCode::IoFailure,
                                                            sqlite3_errmsg(db_));
  }
  sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(limit));

  std::vector<AuditEntry> out;
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
    AuditEntry entry;
    entry.timestamp_ms = sqlite3_column_int64(stmt, 0);
    entry.operation = column_text(stmt, 1);
    entry.path = column_text(stmt, 2);
    entry.outcome = code_from_name(column_text(stmt, 3));
    entry.message = column_text(stmt, 4);
    entry.bytes = static_cast<std::uint64_t>(sqlite3_column_int64(stmt, 5));
    if (sqlite3_column_type(stmt, 6) != SQLITE_NULL) {
      entry.sha256 = column_text(stmt, 6);
    }
    out.push_back(std::move(entry));
  }
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Result<std::vector<AuditEntry>>::failure(common::ErrorCode::IoFailure,
                                                            sqlite3_errmsg(db_));
  }
  return common::Result<std::vector<AuditEntry>>::success(std::move(out));
}

} // namespace fsgate::audit
