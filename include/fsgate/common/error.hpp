#pragma once

#include <string_view>

namespace fsgate::common {

enum class ErrorCode {
  None,
  RateLimitExceeded,
  PayloadTooLarge,
  MissingExtension,
  DisallowedExtension,
  PathNotAllowed,
  IoFailure,
  InvalidArgument,
  Config,
  Internal,
};

/// Stable snake_case identifier, used in logs and the audit table.
[[nodiscard]] std::string_view error_code_name(ErrorCode code);

/// True for failures the caller may retry unchanged after waiting.
[[nodiscard]] bool is_retryable(ErrorCode code);

} // namespace fsgate::common
