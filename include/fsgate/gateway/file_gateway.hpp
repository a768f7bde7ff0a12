#pragma once

#include "fsgate/audit/audit_log.hpp"
#include "fsgate/common/result.hpp"
#include "fsgate/gateway/messages.hpp"
#include "fsgate/gateway/operations.hpp"
#include "fsgate/io/filesystem.hpp"
#include "fsgate/security/path_guard.hpp"
#include "fsgate/security/rate_limiter.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fsgate::gateway {

struct GatewayOptions {
  std::uint64_t max_file_size = MAX_FILE_SIZE;
  Locale locale = Locale::En;
};

/// Guarded file access for an untrusted caller.
///
/// Writes run rate -> size -> extension -> containment -> write. Reads run
/// rate -> containment -> extension -> size (metadata) -> read, so nothing outside the
/// allowed roots is ever stat'ed. The first failing stage ends the call; later stages
/// and the I/O do not run.
///
/// Every decision is reported to the global observer and, when an audit log is
/// attached, recorded there. Thread-safe as long as the collaborators are.
class FileGateway {
public:
  FileGateway(std::shared_ptr<security::PathGuard> guard,
              std::shared_ptr<io::IFileSystem> filesystem,
              security::RateLimiter &limiter = security::RateLimiter::instance(),
              GatewayOptions options = {});

  void set_audit_log(std::shared_ptr<audit::AuditLog> audit_log);

  /// Returns `path` as given on success.
  [[nodiscard]] common::Result<std::string> write_text(const std::string &path,
                                                       const std::string &content);
  [[nodiscard]] common::Result<std::string>
  write_binary(const std::string &path, const std::vector<std::uint8_t> &content);
  [[nodiscard]] common::Result<std::string> read_text(const std::string &path);

  /// Existing allowed roots as absolute path strings. No guard chain; never fails.
  [[nodiscard]] std::vector<std::string> list_allowed_roots() const;

  [[nodiscard]] const MessageCatalog &messages() const { return messages_; }

private:
  using Clock = std::chrono::steady_clock;

  struct Decision {
    Stage stage = Stage::Done;
    common::Status status = common::Status::success();
    std::uint64_t bytes = 0;
    std::optional<std::string> sha256;
    std::filesystem::path target;
  };

  [[nodiscard]] common::Result<std::string> write_guarded(const OperationSpec &operation,
                                                          const std::string &path,
                                                          std::string_view bytes);

  [[nodiscard]] Decision check_rate(const OperationSpec &operation) const;
  [[nodiscard]] Decision check_size(std::uint64_t size) const;
  [[nodiscard]] Decision check_extension(const OperationSpec &operation,
                                         const std::string &path) const;
  [[nodiscard]] Decision check_containment(const OperationSpec &operation,
                                           const std::string &path) const;

  void report(const OperationSpec &operation, const std::string &path, const Decision &decision,
              Clock::time_point started) const;

  std::shared_ptr<security::PathGuard> guard_;
  std::shared_ptr<io::IFileSystem> filesystem_;
  security::RateLimiter &limiter_;
  GatewayOptions options_;
  MessageCatalog messages_;
  std::shared_ptr<audit::AuditLog> audit_log_;
};

} // namespace fsgate::gateway
