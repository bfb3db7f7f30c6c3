#include "tooldock/version_manager.hpp"
#include "tooldock/errors.hpp"
#include "tooldock/file_util.hpp"
#include "tooldock/logger.hpp"
#include <filesystem>

namespace tooldock {

namespace {

VersionLayout layoutFor(const std::optional<std::string> &root,
                        const std::string &action) {
  try {
    return VersionLayout::resolve(root);
  } catch (const ConfigurationError &e) {
    throw InstallationError("Cannot " + action, e);
  }
}

bool isSet(const std::optional<std::string> &value) {
  return value.has_value() && !value->empty();
}

} // namespace

VersionManager::VersionManager(Config &config, Fetcher &fetcher,
                               Extractor &extractor, FolderOpener &opener,
                               HostPlatform platform)
    : config_(config), fetcher_(fetcher), extractor_(extractor),
      opener_(opener), platform_(platform) {}

VersionLayout VersionManager::resolveLayout(const std::string &action) const {
  return layoutFor(config_.installationDir(), action);
}

std::vector<std::string>
VersionManager::listDownloadedVersions(const std::string &versionFolder) {
  auto root = config_.installationDir();
  if (!isSet(root)) {
    return {};
  }

  // A version being staged is not listed until its download settles
  std::lock_guard<std::mutex> staging(stagingMutex_);

  std::filesystem::path expectedPath =
      VersionLayout(*root).folderDir(versionFolder);
  std::error_code ec;
  if (!std::filesystem::is_directory(expectedPath, ec)) {
    LOG_INFO("Folder '" + expectedPath.string() +
             "' not found, returning empty version list");
    return {};
  }

  try {
    return FileUtil::listSubdirectories(expectedPath);
  } catch (const Error &e) {
    throw InstallationError("Unable to read versions folder", e);
  }
}

void VersionManager::downloadVersion(const std::string &version,
                                     const std::string &versionFolder,
                                     const std::string &url) {
  requireSafeSegment(versionFolder, "version folder");
  requireSafeSegment(version, "version");
  VersionLayout layout = resolveLayout("download version");
  const ReleaseAsset asset = releaseAssetFor(platform_, version);

  std::lock_guard<std::mutex> staging(stagingMutex_);

  const std::filesystem::path destDir =
      layout.versionDir(versionFolder, version);
  LOG_INFO("Downloading version '" + version + "' to '" + destDir.string() +
           "'");

  // Always start from an empty directory so a retry never builds on top of
  // a previous partial attempt.
  try {
    FileUtil::deleteDir(destDir);
  } catch (const Error &e) {
    throw InstallationError("Unable to delete destination folder for download",
                            e);
  }
  try {
    FileUtil::createDir(destDir);
  } catch (const Error &e) {
    throw InstallationError("Unable to create destination folder for download",
                            e);
  }

  const std::filesystem::path archivePath =
      layout.archivePath(versionFolder, asset);
  try {
    fetcher_.fetch(url, archivePath);
  } catch (const std::exception &e) {
    LOG_ERROR("Download of '" + url + "' failed: " + e.what());
    throw InstallationError("Unable to download version", e);
  }

  try {
    extractor_.extract(asset.kind, archivePath, destDir);
  } catch (const std::exception &e) {
    LOG_ERROR("Extraction of " + archivePath.string() + " failed: " + e.what());
    try {
      FileUtil::deleteDir(destDir);
      FileUtil::deleteFile(archivePath);
    } catch (const Error &cleanup) {
      LOG_ERROR("Could not clean up after failed extraction: " +
                std::string(cleanup.what()));
    }
    throw InstallationError("Unable to extract downloaded version", e);
  }

  const std::filesystem::path markerPath =
      layout.markerPath(versionFolder, version, asset);
  std::error_code ec;
  if (!std::filesystem::exists(markerPath, ec)) {
    LOG_ERROR("Version did not extract properly, " + markerPath.string() +
              " is missing!");
    try {
      FileUtil::deleteDir(destDir);
    } catch (const Error &e) {
      throw InstallationError("Unable to delete bad version folder", e);
    }
    throw InstallationError(
        "Version did not extract properly, critical files are missing. An "
        "antivirus may have deleted the files!");
  }

  LOG_INFO("Version '" + version + "' installed into " + destDir.string());
}

void VersionManager::removeVersion(const std::string &version,
                                   const std::string &versionFolder) {
  requireSafeSegment(versionFolder, "version folder");
  requireSafeSegment(version, "version");
  VersionLayout layout = resolveLayout("remove version");

  std::lock_guard<std::mutex> staging(stagingMutex_);

  LOG_INFO("Deleting version '" + version + "' from '" + versionFolder + "'");
  try {
    FileUtil::deleteDir(layout.versionDir(versionFolder, version));
  } catch (const Error &e) {
    throw InstallationError("Unable to delete version directory", e);
  }

  try {
    if (config_.clearActiveVersionIf(versionFolder, version)) {
      LOG_INFO("Removed version was active, cleared the active version");
    }
  } catch (const Error &e) {
    throw InstallationError("Unable to clear active version from config", e);
  }
}

void VersionManager::goToVersionFolder(const std::string &versionFolder) {
  requireSafeSegment(versionFolder, "version folder");
  VersionLayout layout = resolveLayout("open version folder");

  const std::filesystem::path folderPath = layout.folderDir(versionFolder);
  try {
    FileUtil::createDir(folderPath);
  } catch (const Error &e) {
    throw InstallationError("Unable to create version folder '" +
                                folderPath.string() + "' in order to open it",
                            e);
  }

  try {
    opener_.open(folderPath);
  } catch (const std::exception &e) {
    throw InstallationError("Unable to open folder in OS", e);
  }
}

bool VersionManager::ensureActiveVersionStillExists() {
  std::lock_guard<std::mutex> staging(stagingMutex_);

  const Settings settings = config_.snapshot();
  VersionLayout layout = layoutFor(settings.installationDir,
                                   "check if active version still exists");

  const auto &folder = settings.activeVersionFolder;
  const auto &version = settings.activeVersion;
  LOG_INFO("Checking if active version still exists " +
           folder.value_or("<unset>") + ":" + version.value_or("<unset>"));

  if (!isSet(folder) || !isSet(version)) {
    return false;
  }

  const std::filesystem::path versionDir = layout.versionDir(*folder, *version);
  std::error_code ec;
  const bool versionExists = std::filesystem::exists(versionDir, ec);
  if (ec) {
    throw InstallationError(
        "Unable to check if active version still exists",
        std::filesystem::filesystem_error(ec.message(), versionDir, ec));
  }

  if (!versionExists) {
    LOG_WARN("Active version directory " + versionDir.string() +
             " is gone, clearing the active version");
    try {
      config_.clearActiveVersionIf(*folder, *version);
    } catch (const Error &e) {
      throw InstallationError("Unable to clear active version from config", e);
    }
  }
  return versionExists;
}

void VersionManager::saveActiveVersionChange(const std::string &versionFolder,
                                             const std::string &version) {
  requireSafeSegment(versionFolder, "version folder");
  requireSafeSegment(version, "version");

  std::lock_guard<std::mutex> staging(stagingMutex_);
  LOG_INFO("Activating version '" + version + "' from '" + versionFolder +
           "'");
  config_.setActiveVersion(versionFolder, version);
}

std::optional<std::string> VersionManager::activeVersion() const {
  return config_.read([](const Settings &s) { return s.activeVersion; });
}

std::optional<std::string> VersionManager::activeVersionFolder() const {
  return config_.read([](const Settings &s) { return s.activeVersionFolder; });
}

} // namespace tooldock
