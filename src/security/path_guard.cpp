#include "fsgate/security/path_guard.hpp"

#include "fsgate/common/fs.hpp"

namespace fsgate::security {

PathGuard::PathGuard(std::shared_ptr<platform::IDirectoryProvider> directories,
                     std::shared_ptr<io::IFileSystem> filesystem)
    : directories_(std::move(directories)), filesystem_(std::move(filesystem)) {}

common::Result<std::filesystem::path>
PathGuard::canonicalize_candidate(const std::filesystem::path &candidate,
                                  ResolutionBranch &branch) const {
  auto direct = filesystem_->canonicalize(candidate);
  if (direct.ok()) {
    branch = ResolutionBranch::ExistingTarget;
    return direct;
  }

  // canonical() fails on a dangling link; the parent fallback must not be used for it.
  if (filesystem_->is_symlink(candidate)) {
    return common::Result<std::filesystem::path>::failure(common::ErrorCode::PathNotAllowed,
                                                          candidate.string() +
                                                              " is a dangling symbolic link");
  }

  const auto parent = candidate.parent_path();
  if (parent.empty() || parent == candidate) {
    return common::Result<std::filesystem::path>::failure(common::ErrorCode::PathNotAllowed,
                                                          "path has no parent directory");
  }

  auto via_parent = filesystem_->canonicalize(parent);
  if (!via_parent.ok()) {
    return common::Result<std::filesystem::path>::failure(common::ErrorCode::PathNotAllowed,
                                                          via_parent.error());
  }
  branch = ResolutionBranch::NewTarget;
  return via_parent;
}

common::Result<ResolvedPath> PathGuard::resolve(const std::string &path) const {
  if (path.empty()) {
    return common::Result<ResolvedPath>::failure(common::ErrorCode::InvalidArgument,
                                                 "path is empty");
  }
  if (path.find('\0') != std::string::npos) {
    return common::Result<ResolvedPath>::failure(common::ErrorCode::InvalidArgument,
                                                 "path contains null byte");
  }
  if (!filesystem_ || !directories_) {
    return common::Result<ResolvedPath>::failure(common::ErrorCode::Internal,
                                                 "path guard is not configured");
  }

  ResolvedPath resolved;
  const std::filesystem::path candidate(common::expand_home(path));
  auto canonical = canonicalize_candidate(candidate, resolved.branch);
  if (!canonical.ok()) {
    return common::Result<ResolvedPath>::failure(canonical.status());
  }
  resolved.canonical = std::move(canonical.value());
  resolved.target = resolved.branch == ResolutionBranch::NewTarget
                        ? resolved.canonical / candidate.filename()
                        : resolved.canonical;

  for (const auto &root : directories_->lookup()) {
    if (!root.path.is_absolute()) {
      continue;
    }
    const auto canonical_root = filesystem_->canonicalize(root.path);
    if (!canonical_root.ok()) {
      continue;
    }
    if (common::is_subpath(resolved.canonical, canonical_root.value())) {
      resolved.root = canonical_root.value();
      return common::Result<ResolvedPath>::success(std::move(resolved));
    }
  }

  return common::Result<ResolvedPath>::failure(common::ErrorCode::PathNotAllowed,
                                               resolved.canonical.string() +
                                                   " is outside every allowed root");
}

bool PathGuard::is_allowed(const std::string &path) const { return resolve(path).ok(); }

std::vector<platform::KnownDirectory> PathGuard::existing_roots() const {
  std::vector<platform::KnownDirectory> out;
  if (!filesystem_ || !directories_) {
    return out;
  }
  for (auto &root : directories_->lookup()) {
    if (root.path.is_absolute() && filesystem_->is_directory(root.path)) {
      out.push_back(std::move(root));
    }
  }
  return out;
}

} // namespace fsgate::security
