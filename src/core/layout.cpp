#include "tooldock/layout.hpp"
#include "tooldock/errors.hpp"
#include <utility>

namespace tooldock {

VersionLayout::VersionLayout(std::filesystem::path installRoot)
    : root_(std::move(installRoot)) {}

VersionLayout
VersionLayout::resolve(const std::optional<std::string> &installRoot) {
  if (!installRoot || installRoot->empty()) {
    throw ConfigurationError("no installation directory set");
  }
  return VersionLayout(std::filesystem::path(*installRoot));
}

std::filesystem::path VersionLayout::versionsDir() const {
  return root_ / "versions";
}

std::filesystem::path
VersionLayout::folderDir(const std::string &versionFolder) const {
  return versionsDir() / versionFolder;
}

std::filesystem::path
VersionLayout::versionDir(const std::string &versionFolder,
                          const std::string &version) const {
  return folderDir(versionFolder) / version;
}

std::filesystem::path
VersionLayout::archivePath(const std::string &versionFolder,
                           const ReleaseAsset &asset) const {
  return folderDir(versionFolder) / asset.archiveName;
}

std::filesystem::path
VersionLayout::markerPath(const std::string &versionFolder,
                          const std::string &version,
                          const ReleaseAsset &asset) const {
  return versionDir(versionFolder, version) / asset.markerName;
}

void requireSafeSegment(const std::string &name, const std::string &what) {
  if (name.empty()) {
    throw InstallationError(what + " must not be empty");
  }
  if (name == "." || name == ".." ||
      name.find_first_of("/\\") != std::string::npos) {
    throw InstallationError("Invalid " + what + " '" + name +
                            "', it must be a plain directory name");
  }
}

} // namespace tooldock
