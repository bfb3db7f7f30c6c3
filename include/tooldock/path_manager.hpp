#ifndef TOOLDOCK_PATH_MANAGER_HPP
#define TOOLDOCK_PATH_MANAGER_HPP

#include <filesystem>
#include <string>

namespace tooldock {

// Where tooldock keeps its own state. The installation directory for
// tooling versions is a setting and lives elsewhere (see VersionLayout).
class PathManager {
public:
    static PathManager& instance();

    // Initializes paths based on optional root override.
    // If rootOverride is empty, it checks TOOLDOCK_CONFIG_DIR, then XDG defaults.
    void init(const std::string& rootOverride = "");

    std::filesystem::path configDir() const { return configDir_; }
    std::filesystem::path settingsFile() const { return configDir_ / "settings.json"; }
    std::filesystem::path logs() const { return logsDir_; }

    // Returns the path to the current session's log file
    std::filesystem::path currentLog() const { return currentLogPath_; }

    // Older releases kept extracted game data under <config>/data
    std::filesystem::path legacyDataDir() const { return configDir_ / "data"; }
    bool hasOldDataDirectory() const;
    void deleteOldDataDirectory() const;

private:
    PathManager() = default;

    std::filesystem::path configDir_;
    std::filesystem::path logsDir_;
    std::filesystem::path currentLogPath_;

    static std::filesystem::path resolveRoot(const std::string& override);
};

} // namespace tooldock

#endif // TOOLDOCK_PATH_MANAGER_HPP
