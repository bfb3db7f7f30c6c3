#ifndef TOOLDOCK_CONFIG_HPP
#define TOOLDOCK_CONFIG_HPP

#include "tooldock/version.hpp"
#include <filesystem>
#include <map>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>

namespace tooldock {

// avx and openGL are recorded by the launcher's hardware check, tooldock
// only carries them through load and save.
struct Requirements {
  std::optional<bool> avx;
  std::optional<bool> openGL;
  std::optional<bool> bypassRequirements;
};

// Which tooling version a game was last installed with. Written only when
// the installer reports success.
struct GameRecord {
  bool isInstalled = false;
  std::string version;
  std::string versionFolder;
};

struct Settings {
  std::string version = TOOLDOCK_SETTINGS_SCHEMA;
  std::optional<std::string> installationDir;
  std::optional<std::string> activeVersion;
  std::optional<std::string> activeVersionFolder;
  std::optional<std::string> locale;
  Requirements requirements;
  std::map<std::string, GameRecord> games;
};

void to_json(nlohmann::json &j, const Settings &s);
// Throws ConfigurationError on a field of the wrong type.
void from_json(const nlohmann::json &j, Settings &s);

// Persisted launcher settings. Every access goes through one recursive
// mutex; a mutation is written to disk before mutate() returns and is rolled
// back in memory if the write fails.
class Config {
public:
  static Config &instance();

  Config() = default;

  void load(const std::filesystem::path &configPath);
  // Throws ConfigurationError. No-op while no path is set.
  void save();

  std::filesystem::path path() const;
  Settings snapshot() const;

  template <typename Fn> auto read(Fn &&fn) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return fn(static_cast<const Settings &>(settings_));
  }

  template <typename Fn> auto mutate(Fn &&fn) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    Settings backup = settings_;
    try {
      if constexpr (std::is_void_v<decltype(fn(settings_))>) {
        fn(settings_);
        save();
      } else {
        auto result = fn(settings_);
        save();
        return result;
      }
    } catch (...) {
      settings_ = std::move(backup);
      throw;
    }
  }

  // Installation directory
  std::optional<std::string> installationDir() const;
  // Returns a user facing message instead of changing anything when the
  // directory can't be used.
  std::optional<std::string> setInstallDirectory(const std::string &newDir);

  // Active tooling version
  void setActiveVersion(const std::string &versionFolder,
                        const std::string &version);
  void clearActiveVersion();
  // Clears the pointer only if it still names (versionFolder, version).
  bool clearActiveVersionIf(const std::string &versionFolder,
                            const std::string &version);

  // Per-game install records
  void updateInstalledGameVersion(const std::string &game, bool installed);
  bool isGameInstalled(const std::string &game);
  std::string gameInstallVersion(const std::string &game) const;
  std::string gameInstallVersionFolder(const std::string &game) const;

  // Misc
  void setLocale(const std::string &locale);
  void setBypassRequirements(bool bypass);
  void resetToDefaults();

  // Forbidden
  Config(const Config &) = delete;
  Config &operator=(const Config &) = delete;

private:
  std::filesystem::path configPath_;
  Settings settings_;

  mutable std::recursive_mutex mutex_;
};

} // namespace tooldock

#endif // TOOLDOCK_CONFIG_HPP
