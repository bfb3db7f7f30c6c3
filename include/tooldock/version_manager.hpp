#ifndef TOOLDOCK_VERSION_MANAGER_HPP
#define TOOLDOCK_VERSION_MANAGER_HPP

#include "tooldock/archive.hpp"
#include "tooldock/config.hpp"
#include "tooldock/http.hpp"
#include "tooldock/layout.hpp"
#include "tooldock/platform.hpp"
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace tooldock {

// Owns the lifecycle of installed tooling versions under
// <installation dir>/versions and keeps the active version pointer in the
// settings consistent with what is on disk.
//
// The settings lock is only held while reading the root or touching the
// pointer. Operations that read or change version directories (list,
// download, remove, activate, validate) are serialized by the manager's own
// staging mutex, so settings stay readable during a long download while a
// half-staged version is never listed.
class VersionManager {
public:
  VersionManager(Config &config, Fetcher &fetcher, Extractor &extractor,
                 FolderOpener &opener, HostPlatform platform = hostPlatform());

  // Empty when no installation directory is set or the folder is missing.
  // Waits for an in-flight download, remove or activation to settle.
  std::vector<std::string>
  listDownloadedVersions(const std::string &versionFolder);

  // Resets <folder>/<version>, fetches the platform archive, extracts it and
  // checks for the marker executable. On an extraction or integrity failure
  // the version directory is removed before the error is thrown.
  void downloadVersion(const std::string &version,
                       const std::string &versionFolder,
                       const std::string &url);

  // Missing directories are fine. Clears the active pointer when it names
  // the removed version.
  void removeVersion(const std::string &version,
                     const std::string &versionFolder);

  void goToVersionFolder(const std::string &versionFolder);

  // False if no active version is set, or if its directory vanished (in
  // which case the pointer is cleared).
  bool ensureActiveVersionStillExists();

  void saveActiveVersionChange(const std::string &versionFolder,
                               const std::string &version);
  std::optional<std::string> activeVersion() const;
  std::optional<std::string> activeVersionFolder() const;

private:
  VersionLayout resolveLayout(const std::string &action) const;

  Config &config_;
  Fetcher &fetcher_;
  Extractor &extractor_;
  FolderOpener &opener_;
  HostPlatform platform_;

  std::mutex stagingMutex_;
};

} // namespace tooldock

#endif // TOOLDOCK_VERSION_MANAGER_HPP
