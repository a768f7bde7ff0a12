#pragma once

#include "fsgate/config/schema.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fsgate::platform {

enum class DirectoryCategory { Download, Documents, Desktop };

[[nodiscard]] std::string_view category_name(DirectoryCategory category);

struct KnownDirectory {
  DirectoryCategory category = DirectoryCategory::Download;
  std::filesystem::path path;
};

/// Well-known directory lookup. Returns 0..3 absolute directories; a category the
/// platform does not define is simply missing from the result.
class IDirectoryProvider {
public:
  virtual ~IDirectoryProvider() = default;

  [[nodiscard]] virtual std::vector<KnownDirectory> lookup() const = 0;
};

/// freedesktop.org user directories: `$XDG_CONFIG_HOME/user-dirs.dirs`
/// (XDG_DOWNLOAD_DIR, XDG_DOCUMENTS_DIR, XDG_DESKTOP_DIR), falling back to
/// `$HOME/Downloads`, `$HOME/Documents` and `$HOME/Desktop`. Read on every call.
class XdgDirectoryProvider final : public IDirectoryProvider {
public:
  [[nodiscard]] std::vector<KnownDirectory> lookup() const override;
};

/// Fixed directories, e.g. from the `[roots]` config section.
class FixedDirectoryProvider final : public IDirectoryProvider {
public:
  explicit FixedDirectoryProvider(std::vector<KnownDirectory> directories);

  [[nodiscard]] std::vector<KnownDirectory> lookup() const override;

private:
  std::vector<KnownDirectory> directories_;
};

/// Parses the shell-style body of a user-dirs.dirs file for one key. `$HOME` is
/// expanded; relative results are rejected.
[[nodiscard]] std::optional<std::filesystem::path>
parse_user_dirs_entry(const std::string &content, const std::string &key,
                      const std::filesystem::path &home);

[[nodiscard]] std::shared_ptr<IDirectoryProvider>
create_directory_provider(const config::RootsConfig &roots);

} // namespace fsgate::platform
