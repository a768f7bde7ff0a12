#include "fsgate/gateway/factory.hpp"

#include "fsgate/platform/user_dirs.hpp"

namespace fsgate::gateway {

common::Result<std::shared_ptr<FileGateway>> create_gateway(const config::Config &config) {
  const auto locale = locale_from_string(config.gateway.locale);
  if (!locale.ok()) {
    return common::Result<std::shared_ptr<FileGateway>>::failure(locale.status());
  }

  auto filesystem = std::make_shared<io::LocalFileSystem>();
  auto guard = std::make_shared<security::PathGuard>(
      platform::create_directory_provider(config.roots), filesystem);

  GatewayOptions options;
  options.locale = locale.value();
  auto gateway = std::make_shared<FileGateway>(std::move(guard), std::move(filesystem),
                                               security::RateLimiter::instance(), options);

  if (config.audit.enabled) {
    auto audit_log = std::make_shared<audit::AuditLog>(config.audit.path);
    if (!audit_log->is_open()) {
      return common::Result<std::shared_ptr<FileGateway>>::failure(
          common::ErrorCode::Config, "Unable to open audit log: " + config.audit.path);
    }
    gateway->set_audit_log(std::move(audit_log));
  }

  return common::Result<std::shared_ptr<FileGateway>>::success(std::move(gateway));
}

} // namespace fsgate::gateway
