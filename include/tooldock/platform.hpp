#ifndef TOOLDOCK_PLATFORM_HPP
#define TOOLDOCK_PLATFORM_HPP

#include "tooldock/archive.hpp"
#include <filesystem>
#include <string>

namespace tooldock {

enum class HostPlatform {
  Windows,
  Unix,
  Unknown
};

constexpr HostPlatform hostPlatform() {
#if defined(_WIN32)
  return HostPlatform::Windows;
#elif defined(__unix__) || defined(__APPLE__)
  return HostPlatform::Unix;
#else
  return HostPlatform::Unknown;
#endif
}

const char *hostPlatformLabel(HostPlatform platform);

// What a release looks like on a given platform.
struct ReleaseAsset {
  std::string archiveName; // e.g. "v1.2.0.tar.gz"
  ArchiveKind kind;
  std::string markerName; // executable proving a complete extraction
};

// Throws InstallationError for HostPlatform::Unknown.
ReleaseAsset releaseAssetFor(HostPlatform platform, const std::string &version);

class FolderOpener {
public:
  virtual ~FolderOpener() = default;
  virtual void open(const std::filesystem::path &dir) = 0;
};

// Hands the folder to the desktop's file manager.
class DesktopFolderOpener : public FolderOpener {
public:
  void open(const std::filesystem::path &dir) override;
};

} // namespace tooldock

#endif // TOOLDOCK_PLATFORM_HPP
