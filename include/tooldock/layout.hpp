#ifndef TOOLDOCK_LAYOUT_HPP
#define TOOLDOCK_LAYOUT_HPP

#include "tooldock/platform.hpp"
#include <filesystem>
#include <optional>
#include <string>

namespace tooldock {

// On-disk convention for installed tooling:
//
//   <root>/versions/<folder>/<version>/        one installed version
//   <root>/versions/<folder>/<archive name>    archive while it downloads
//
// Pure path arithmetic, nothing here touches the disk.
class VersionLayout {
public:
  explicit VersionLayout(std::filesystem::path installRoot);

  // Throws ConfigurationError("no installation directory set") when the
  // root is unset or empty.
  static VersionLayout resolve(const std::optional<std::string> &installRoot);

  std::filesystem::path versionsDir() const;
  std::filesystem::path folderDir(const std::string &versionFolder) const;
  std::filesystem::path versionDir(const std::string &versionFolder,
                                   const std::string &version) const;
  std::filesystem::path archivePath(const std::string &versionFolder,
                                    const ReleaseAsset &asset) const;
  std::filesystem::path markerPath(const std::string &versionFolder,
                                   const std::string &version,
                                   const ReleaseAsset &asset) const;

private:
  std::filesystem::path root_;
};

// Rejects names that would resolve outside <root>/versions/<folder>/:
// empty, "." / "..", or anything with a path separator. `what` names the
// argument in the InstallationError message.
void requireSafeSegment(const std::string &name, const std::string &what);

} // namespace tooldock

#endif // TOOLDOCK_LAYOUT_HPP
