#pragma once

#include <optional>
#include <string>

namespace fsgate::config {

struct ObservabilityConfig {
  std::string backend = "log";
};

struct GatewayConfig {
  std::string locale = "en";
};

/// Explicit allowed-root directories. Any value set here replaces the XDG lookup.
struct RootsConfig {
  std::optional<std::string> download;
  std::optional<std::string> documents;
  std::optional<std::string> desktop;

  [[nodiscard]] bool any() const {
    return download.has_value() || documents.has_value() || desktop.has_value();
  }
};

struct AuditConfig {
  bool enabled = false;
  std::string path = "~/.fsgate/audit.db";
};

struct Config {
  ObservabilityConfig observability;
  GatewayConfig gateway;
  RootsConfig roots;
  AuditConfig audit;
};

} // namespace fsgate::config
