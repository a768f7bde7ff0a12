#pragma once

#include "fsgate/common/result.hpp"
#include "fsgate/gateway/operations.hpp"

#include <cstdint>
#include <string>

namespace fsgate::gateway {

enum class Locale { En, Ru };

[[nodiscard]] common::Result<Locale> locale_from_string(const std::string &value);

/// Which primitive an I/O failure came from.
enum class IoStep { Write, Read, Metadata };

/// User-facing error texts. Every gateway failure message is produced here.
class MessageCatalog {
public:
  explicit MessageCatalog(Locale locale = Locale::En);

  [[nodiscard]] Locale locale() const { return locale_; }

  [[nodiscard]] std::string rate_limited() const;
  [[nodiscard]] std::string limiter_unavailable() const;
  [[nodiscard]] std::string payload_too_large(std::uint64_t max_bytes) const;
  [[nodiscard]] std::string missing_extension() const;
  [[nodiscard]] std::string disallowed_extension(const OperationSpec &operation) const;
  [[nodiscard]] std::string path_not_allowed(OperationMode mode) const;
  [[nodiscard]] std::string io_failure(IoStep step, const std::string &detail) const;
  [[nodiscard]] std::string invalid_path(const std::string &detail) const;

private:
  Locale locale_;
};

} // namespace fsgate::gateway
