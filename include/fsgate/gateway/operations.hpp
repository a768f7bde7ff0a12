#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace fsgate::gateway {

constexpr std::uint64_t MAX_FILE_SIZE = 10ULL * 1024 * 1024;

enum class OperationMode { Write, Read };

/// Static parameters of one guarded operation. `name` is also the rate-limit key.
struct OperationSpec {
  std::string_view name;
  OperationMode mode = OperationMode::Write;
  std::vector<std::string> extensions;

  [[nodiscard]] bool allows_extension(const std::string &lowercase_ext) const;
};

[[nodiscard]] const OperationSpec &write_text_operation();
[[nodiscard]] const OperationSpec &write_binary_operation();
[[nodiscard]] const OperationSpec &read_text_operation();

/// Guard-chain stage that produced a decision.
enum class Stage { Rate, Size, Extension, Containment, Io, Done };

[[nodiscard]] std::string_view stage_name(Stage stage);

} // namespace fsgate::gateway
