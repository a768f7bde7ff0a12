#pragma once

#include "fsgate/gateway/file_gateway.hpp"
#include "fsgate/io/filesystem.hpp"
#include "fsgate/observability/observer.hpp"
#include "fsgate/platform/user_dirs.hpp"
#include "fsgate/security/rate_limiter.hpp"

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace fsgate::testing {

class TempDir {
public:
  TempDir();
  ~TempDir();

  TempDir(const TempDir &) = delete;
  TempDir &operator=(const TempDir &) = delete;

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }
  /// Creates `name` (and parents) under the temp dir and returns its absolute path.
  std::filesystem::path make_dir(const std::string &name) const;
  std::filesystem::path create_file(const std::string &name, const std::string &content) const;

private:
  std::filesystem::path path_;
};

struct EnvGuard {
  std::string key;
  std::optional<std::string> old_value;

  EnvGuard(std::string key_, std::optional<std::string> value);
  ~EnvGuard();

  EnvGuard(const EnvGuard &) = delete;
  EnvGuard &operator=(const EnvGuard &) = delete;
};

[[nodiscard]] std::string read_file(const std::filesystem::path &path);

/// Local filesystem with switchable failures and call counters.
class FakeFileSystem final : public io::IFileSystem {
public:
  [[nodiscard]] common::Status write(const std::filesystem::path &path,
                                     std::string_view bytes) override;
  [[nodiscard]] common::Result<std::string>
  read_to_string(const std::filesystem::path &path) override;
  [[nodiscard]] common::Result<std::uint64_t>
  file_size(const std::filesystem::path &path) override;
  [[nodiscard]] common::Result<std::filesystem::path>
  canonicalize(const std::filesystem::path &path) override;
  [[nodiscard]] bool is_directory(const std::filesystem::path &path) override;
  [[nodiscard]] bool is_symlink(const std::filesystem::path &path) override;

  std::optional<std::string> write_error;
  std::optional<std::string> read_error;
  std::optional<std::uint64_t> reported_size;
  std::size_t writes = 0;
  std::size_t reads = 0;
  std::size_t size_queries = 0;

private:
  io::LocalFileSystem local_;
};

/// Keeps every event for inspection.
class RecordingObserver final : public observability::IObserver {
public:
  void record_event(const observability::ObserverEvent &event) override;
  void record_metric(const observability::ObserverMetric &metric) override;
  [[nodiscard]] std::string_view name() const override { return "recording"; }

  [[nodiscard]] std::vector<observability::GuardDecisionEvent> decisions() const;
  [[nodiscard]] std::vector<observability::ErrorEvent> errors() const;
  [[nodiscard]] std::size_t metric_count() const;

private:
  mutable std::mutex mutex_;
  std::vector<observability::ObserverEvent> events_;
  std::size_t metrics_ = 0;
};

/// A gateway over `roots` with its own limiter and a fake filesystem.
struct GatewayFixture {
  explicit GatewayFixture(std::vector<platform::KnownDirectory> roots,
                          security::RateLimitOptions limits = {});

  std::shared_ptr<FakeFileSystem> filesystem;
  std::unique_ptr<security::RateLimiter> limiter;
  std::shared_ptr<security::PathGuard> guard;
  std::unique_ptr<gateway::FileGateway> gateway;
};

[[nodiscard]] std::vector<platform::KnownDirectory>
download_root(const std::filesystem::path &path);

} // namespace fsgate::testing
