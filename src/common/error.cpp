#include "fsgate/common/error.hpp"

namespace fsgate::common {

std::string_view error_code_name(const ErrorCode code) {
  switch (code) {
  case ErrorCode::None:
    return "ok";
  case ErrorCode::RateLimitExceeded:
    return "rate_limit_exceeded";
  case ErrorCode::PayloadTooLarge:
    return "payload_too_large";
  case ErrorCode::MissingExtension:
    return "missing_extension";
  case ErrorCode::DisallowedExtension:
    return "disallowed_extension";
  case ErrorCode::PathNotAllowed:
    return "path_not_allowed";
  case ErrorCode::IoFailure:
    return "io_failure";
  case ErrorCode::InvalidArgument:
    return "invalid_argument";
  case ErrorCode::Config:
    return "config";
  case ErrorCode::Internal:
    return "internal";
  }
  return "unknown";
}

bool is_retryable(const ErrorCode code) { return code == ErrorCode::RateLimitExceeded; }

} // namespace fsgate::common
