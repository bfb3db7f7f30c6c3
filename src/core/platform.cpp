#include "tooldock/platform.hpp"
#include "tooldock/errors.hpp"
#include "tooldock/logger.hpp"
#include <cstdlib>

namespace tooldock {

const char *hostPlatformLabel(HostPlatform platform) {
  switch (platform) {
  case HostPlatform::Windows:
    return "windows";
  case HostPlatform::Unix:
    return "unix";
  default:
    return "unknown";
  }
}

ReleaseAsset releaseAssetFor(HostPlatform platform,
                             const std::string &version) {
  switch (platform) {
  case HostPlatform::Windows:
    return {version + archiveExtension(ArchiveKind::Zip), ArchiveKind::Zip,
            "extractor.exe"};
  case HostPlatform::Unix:
    return {version + archiveExtension(ArchiveKind::TarGz),
            ArchiveKind::TarGz, "extractor"};
  default:
    throw InstallationError("Unknown operating system, unable to download and "
                            "extract correct release");
  }
}

namespace {

std::string shellQuote(const std::string &arg) {
#if defined(_WIN32)
  return "\"" + arg + "\"";
#else
  std::string out = "'";
  for (char c : arg) {
    if (c == '\'')
      out += "'\\''";
    else
      out += c;
  }
  out += "'";
  return out;
#endif
}

} // namespace

void DesktopFolderOpener::open(const std::filesystem::path &dir) {
#if defined(_WIN32)
  // explorer.exe exits with 1 even when it succeeds; only a failed spawn counts
  const std::string cmd = "explorer " + shellQuote(dir.string());
  LOG_INFO("Opening folder: " + cmd);
  if (std::system(cmd.c_str()) == -1) {
    throw IOError("Unable to launch explorer for '" + dir.string() + "'");
  }
#else
#if defined(__APPLE__)
  const std::string cmd = "open " + shellQuote(dir.string());
#else
  const std::string cmd =
      "xdg-open " + shellQuote(dir.string()) + " >/dev/null 2>&1";
#endif
  LOG_INFO("Opening folder: " + cmd);
  int ret = std::system(cmd.c_str());
  if (ret != 0) {
    throw IOError("Unable to open '" + dir.string() +
                  "' in the file manager (exit status " + std::to_string(ret) +
                  ")");
  }
#endif
}

} // namespace tooldock
