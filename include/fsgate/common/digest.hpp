#pragma once

#include <string>
#include <string_view>

namespace fsgate::common {

/// Lowercase hex SHA-256 of `data`.
[[nodiscard]] std::string sha256_hex(std::string_view data);

} // namespace fsgate::common
