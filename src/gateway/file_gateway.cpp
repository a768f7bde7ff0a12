#include "fsgate/gateway/file_gateway.hpp"

#include "fsgate/common/digest.hpp"
#include "fsgate/common/fs.hpp"
#include "fsgate/observability/global.hpp"

namespace fsgate::gateway {

namespace {

std::int64_t unix_millis_now() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

} // namespace

FileGateway::FileGateway(std::shared_ptr<security::PathGuard> guard,
                         std::shared_ptr<io::IFileSystem> filesystem,
                         security::RateLimiter &limiter, GatewayOptions options)
    : guard_(std::move(guard)), filesystem_(std::move(filesystem)), limiter_(limiter),
      options_(options), messages_(options.locale) {}

void FileGateway::set_audit_log(std::shared_ptr<audit::AuditLog> audit_log) {
  audit_log_ = std::move(audit_log);
}

FileGateway::Decision FileGateway::check_rate(const OperationSpec &operation) const {
  Decision decision;
  decision.stage = Stage::Rate;
  const auto status = limiter_.check(std::string(operation.name));
  if (status.ok()) {
    return decision;
  }
  if (status.code() == common::ErrorCode::RateLimitExceeded) {
    observability::record_rate_limit_rejection(std::string(operation.name));
    decision.status = common::Status::error(status.code(), messages_.rate_limited());
  } else {
    observability::record_error("rate_limiter", status.error());
    decision.status = common::Status::error(status.code(), messages_.limiter_unavailable());
  }
  return decision;
}

FileGateway::Decision FileGateway::check_size(const std::uint64_t size) const {
  Decision decision;
  decision.stage = Stage::Size;
  decision.bytes = size;
  if (size > options_.max_file_size) {
    decision.status = common::Status::error(common::ErrorCode::PayloadTooLarge,
                                            messages_.payload_too_large(options_.max_file_size));
  }
  return decision;
}

FileGateway::Decision FileGateway::check_extension(const OperationSpec &operation,
                                                   const std::string &path) const {
  Decision decision;
  decision.stage = Stage::Extension;
  const auto ext = common::lowercase_extension(std::filesystem::path(path));
  if (!ext.has_value()) {
    decision.status =
        common::Status::error(common::ErrorCode::MissingExtension, messages_.missing_extension());
  } else if (!operation.allows_extension(*ext)) {
    decision.status = common::Status::error(common::ErrorCode::DisallowedExtension,
                                            messages_.disallowed_extension(operation));
  }
  return decision;
}

FileGateway::Decision FileGateway::check_containment(const OperationSpec &operation,
                                                     const std::string &path) const {
  Decision decision;
  decision.stage = Stage::Containment;
  if (!guard_) {
    decision.status = common::Status::error(common::ErrorCode::Internal, "path guard unavailable");
    return decision;
  }

  const auto resolved = guard_->resolve(path);
  if (resolved.ok()) {
    decision.target = resolved.value().target;
    return decision;
  }
  if (resolved.code() == common::ErrorCode::InvalidArgument) {
    decision.status = common::Status::error(common::ErrorCode::InvalidArgument,
                                            messages_.invalid_path(resolved.error()));
  } else {
    decision.status = common::Status::error(common::ErrorCode::PathNotAllowed,
                                            messages_.path_not_allowed(operation.mode));
  }
  return decision;
}

void FileGateway::report(const OperationSpec &operation, const std::string &path,
                         const Decision &decision, const Clock::time_point started) const {
  const std::string name(operation.name);
  const auto elapsed =
      std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started);
  observability::record_guard_decision(name, std::string(stage_name(decision.stage)),
                                       std::string(common::error_code_name(decision.status.code())),
                                       path, elapsed);
  if (decision.status.ok()) {
    observability::record_bytes_transferred(name, decision.bytes);
  }

  if (!audit_log_) {
    return;
  }
  audit::AuditEntry entry;
  entry.timestamp_ms = unix_millis_now();
  entry.operation = name;
  entry.path = path;
  entry.outcome = decision.status.code();
  entry.message = decision.status.error();
  entry.bytes = decision.bytes;
  entry.sha256 = decision.sha256;
  if (const auto recorded = audit_log_->record(entry); !recorded.ok()) {
    observability::record_error("audit", recorded.error());
  }
}

common::Result<std::string> FileGateway::write_guarded(const OperationSpec &operation,
                                                       const std::string &path,
                                                       const std::string_view bytes) {
  const auto started = Clock::now();
  const auto finish = [&](const Decision &decision) {
    report(operation, path, decision, started);
    if (!decision.status.ok()) {
      return common::Result<std::string>::failure(decision.status);
    }
    return common::Result<std::string>::success(path);
  };

  if (auto decision = check_rate(operation); !decision.status.ok()) {
    return finish(decision);
  }
  if (auto decision = check_size(bytes.size()); !decision.status.ok()) {
    return finish(decision);
  }
  if (auto decision = check_extension(operation, path); !decision.status.ok()) {
    return finish(decision);
  }
  const auto contained = check_containment(operation, path);
  if (!contained.status.ok()) {
    return finish(contained);
  }

  Decision decision;
  decision.stage = Stage::Io;
  decision.bytes = bytes.size();
  const auto written = filesystem_->write(contained.target, bytes);
  if (!written.ok()) {
    decision.status = common::Status::error(common::ErrorCode::IoFailure,
                                            messages_.io_failure(IoStep::Write, written.error()));
    return finish(decision);
  }

  decision.stage = Stage::Done;
  decision.sha256 = common::sha256_hex(bytes);
  return finish(decision);
}

common::Result<std::string> FileGateway::write_text(const std::string &path,
                                                    const std::string &content) {
  return write_guarded(write_text_operation(), path, content);
}

common::Result<std::string> FileGateway::write_binary(const std::string &path,
                                                      const std::vector<std::uint8_t> &content) {
  const std::string_view bytes(reinterpret_cast<const char *>(content.data()), content.size());
  return write_guarded(write_binary_operation(), path, bytes);
}

common::Result<std::string> FileGateway::read_text(const std::string &path) {
  const auto &operation = read_text_operation();
  const auto started = Clock::now();
  const auto fail = [&](const Decision &decision) {
    report(operation, path, decision, started);
    return common::Result<std::string>::failure(decision.status);
  };

  if (auto decision = check_rate(operation); !decision.status.ok()) {
    return fail(decision);
  }
  const auto contained = check_containment(operation, path);
  if (!contained.status.ok()) {
    return fail(contained);
  }
  if (auto decision = check_extension(operation, path); !decision.status.ok()) {
    return fail(decision);
  }

  const auto &target = contained.target;
  const auto size = filesystem_->file_size(target);
  if (!size.ok()) {
    Decision decision;
    decision.stage = Stage::Size;
    decision.status = common::Status::error(common::ErrorCode::IoFailure,
                                            messages_.io_failure(IoStep::Metadata, size.error()));
    return fail(decision);
  }
  if (auto decision = check_size(size.value()); !decision.status.ok()) {
    return fail(decision);
  }

  auto content = filesystem_->read_to_string(target);
  if (!content.ok()) {
    Decision decision;
    decision.stage = Stage::Io;
    decision.status = common::Status::error(common::ErrorCode::IoFailure,
                                            messages_.io_failure(IoStep::Read, content.error()));
    return fail(decision);
  }

  Decision decision;
  decision.stage = Stage::Done;
  decision.bytes = content.value().size();
  report(operation, path, decision, started);
  return content;
}

std::vector<std::string> FileGateway::list_allowed_roots() const {
  std::vector<std::string> out;
  if (!guard_) {
    return out;
  }
  for (const auto &root : guard_->existing_roots()) {
    out.push_back(root.path.string());
  }
  return out;
}

} // namespace fsgate::gateway
