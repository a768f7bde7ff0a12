#pragma once

#include "fsgate/common/result.hpp"
#include "fsgate/io/filesystem.hpp"
#include "fsgate/platform/user_dirs.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace fsgate::security {

/// How a candidate was resolved before the containment test.
enum class ResolutionBranch {
  /// The target exists and was canonicalized itself.
  ExistingTarget,
  /// The target does not exist yet; its parent directory was canonicalized instead.
  NewTarget,
};

struct ResolvedPath {
  std::filesystem::path canonical;
  ResolutionBranch branch = ResolutionBranch::ExistingTarget;
  /// The canonical allowed root containing `canonical`.
  std::filesystem::path root;
  /// Where I/O should go: `canonical` itself, or `canonical / <file name>` for a new target.
  std::filesystem::path target;
};

/// Containment check against the allowed roots. Both sides are canonicalized, so `..`
/// segments and symlinks cannot lead out of a root, and roots are compared segment by
/// segment. Roots are looked up afresh on every call.
class PathGuard {
public:
  PathGuard(std::shared_ptr<platform::IDirectoryProvider> directories,
            std::shared_ptr<io::IFileSystem> filesystem);

  [[nodiscard]] bool is_allowed(const std::string &path) const;
  [[nodiscard]] common::Result<ResolvedPath> resolve(const std::string &path) const;

  /// Allowed roots that currently exist, as returned by the lookup (not canonicalized).
  [[nodiscard]] std::vector<platform::KnownDirectory> existing_roots() const;

private:
  [[nodiscard]] common::Result<std::filesystem::path>
  canonicalize_candidate(const std::filesystem::path &candidate, ResolutionBranch &branch) const;

  std::shared_ptr<platform::IDirectoryProvider> directories_;
  std::shared_ptr<io::IFileSystem> filesystem_;
};

} // namespace fsgate::security
