#pragma once

#include "fsgate/common/result.hpp"
#include "fsgate/config/schema.hpp"
#include "fsgate/gateway/file_gateway.hpp"

#include <memory>

namespace fsgate::gateway {

/// Wires a gateway for this process: local filesystem, directory lookup from
/// `config.roots`, the process-wide rate limiter, and the audit log when enabled.
[[nodiscard]] common::Result<std::shared_ptr<FileGateway>>
create_gateway(const config::Config &config);

} // namespace fsgate::gateway
