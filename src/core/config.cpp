#include "tooldock/config.hpp"
#include "tooldock/errors.hpp"
#include "tooldock/file_util.hpp"
#include "tooldock/logger.hpp"
#include <fstream>

namespace tooldock {

using json = nlohmann::json;

namespace {

json optionalToJson(const std::optional<std::string> &value) {
  return value ? json(*value) : json(nullptr);
}

json optionalToJson(const std::optional<bool> &value) {
  return value ? json(*value) : json(nullptr);
}

template <typename T>
std::optional<T> optionalField(const json &j, const char *key) {
  if (!j.contains(key) || j[key].is_null())
    return std::nullopt;
  try {
    return j[key].get<T>();
  } catch (const json::exception &e) {
    throw ConfigurationError("Invalid value for '" + std::string(key) + "'",
                             e);
  }
}

void requireGameName(const std::string &game) {
  if (game.empty()) {
    throw ConfigurationError("Game name must not be empty");
  }
}

} // namespace

void to_json(json &j, const Settings &s) {
  j = json{{"version", s.version},
           {"installationDir", optionalToJson(s.installationDir)},
           {"activeVersion", optionalToJson(s.activeVersion)},
           {"activeVersionFolder", optionalToJson(s.activeVersionFolder)},
           {"locale", optionalToJson(s.locale)},
           {"requirements",
            {{"avx", optionalToJson(s.requirements.avx)},
             {"openGL", optionalToJson(s.requirements.openGL)},
             {"bypassRequirements",
              optionalToJson(s.requirements.bypassRequirements)}}}};

  j["games"] = json::object();
  for (const auto &[name, game] : s.games) {
    j["games"][name] = {
        {"isInstalled", game.isInstalled},
        {"version", game.version.empty() ? json(nullptr) : json(game.version)},
        {"versionFolder", game.versionFolder.empty()
                              ? json(nullptr)
                              : json(game.versionFolder)}};
  }
}

void from_json(const json &j, Settings &s) {
  if (!j.is_object()) {
    throw ConfigurationError("Settings root must be a JSON object");
  }

  s = Settings{};
  s.version =
      optionalField<std::string>(j, "version").value_or(TOOLDOCK_SETTINGS_SCHEMA);
  s.installationDir = optionalField<std::string>(j, "installationDir");
  s.activeVersion = optionalField<std::string>(j, "activeVersion");
  s.activeVersionFolder = optionalField<std::string>(j, "activeVersionFolder");
  s.locale = optionalField<std::string>(j, "locale");

  if (j.contains("requirements") && j["requirements"].is_object()) {
    auto &r = j["requirements"];
    s.requirements.avx = optionalField<bool>(r, "avx");
    s.requirements.openGL = optionalField<bool>(r, "openGL");
    s.requirements.bypassRequirements =
        optionalField<bool>(r, "bypassRequirements");
  }

  if (j.contains("games") && j["games"].is_object()) {
    for (auto &[name, g] : j["games"].items()) {
      if (!g.is_object()) {
        throw ConfigurationError("Invalid entry for game '" + name + "'");
      }
      GameRecord record;
      record.isInstalled = optionalField<bool>(g, "isInstalled").value_or(false);
      record.version = optionalField<std::string>(g, "version").value_or("");
      record.versionFolder =
          optionalField<std::string>(g, "versionFolder").value_or("");
      s.games[name] = record;
    }
  }
}

Config &Config::instance() {
  static Config instance;
  return instance;
}

void Config::load(const std::filesystem::path &path) {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  configPath_ = path;
  settings_ = Settings{};

  std::error_code statusError;
  const bool present = std::filesystem::exists(path, statusError);
  if (statusError) {
    throw ConfigurationError(
        "Unable to access settings file",
        std::filesystem::filesystem_error(statusError.message(), path, statusError));
  }
  if (!present) {
    LOG_WARN("Settings file not found at " + path.string() +
             ". Using defaults.");
    save();
    return;
  }

  try {
    std::ifstream file(path);
    if (!file) {
      throw ConfigurationError("Unable to open settings file '" +
                               path.string() + "'");
    }
    json j = json::parse(file);
    settings_ = j.get<Settings>();
    LOG_INFO("Settings loaded from " + path.string());
    return;
  } catch (const json::exception &e) {
    LOG_ERROR("Failed to parse settings file: " + std::string(e.what()));
  } catch (const ConfigurationError &e) {
    LOG_ERROR("Failed to load settings file: " + std::string(e.what()));
  }

  // Keep the unreadable file around for the user, start over from defaults
  std::filesystem::path backup = path;
  backup += ".bak";
  std::error_code ec;
  std::filesystem::rename(path, backup, ec);
  if (ec) {
    LOG_WARN("Unable to back up unreadable settings to " + backup.string() +
             ": " + ec.message());
  } else {
    LOG_WARN("Unreadable settings moved to " + backup.string());
  }
  settings_ = Settings{};
  save();
}

void Config::save() {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  if (configPath_.empty())
    return;

  try {
    if (configPath_.has_parent_path()) {
      FileUtil::createDir(configPath_.parent_path());
    }
  } catch (const Error &e) {
    throw ConfigurationError("Unable to create settings directory", e);
  }

  json j = settings_;

  std::filesystem::path tmpPath = configPath_;
  tmpPath += ".tmp";
  {
    std::ofstream file(tmpPath, std::ios::out | std::ios::trunc);
    file << j.dump(2);
    file.flush();
    if (!file) {
      throw ConfigurationError("Unable to write settings file '" +
                               tmpPath.string() + "'");
    }
  }

  std::error_code ec;
  std::filesystem::rename(tmpPath, configPath_, ec);
  if (ec) {
    std::filesystem::remove(tmpPath, ec);
    throw ConfigurationError("Unable to replace settings file '" +
                             configPath_.string() + "'");
  }
  LOG_DEBUG("Settings saved to " + configPath_.string());
}

std::filesystem::path Config::path() const {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  return configPath_;
}

Settings Config::snapshot() const {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  return settings_;
}

std::optional<std::string> Config::installationDir() const {
  return read([](const Settings &s) { return s.installationDir; });
}

std::optional<std::string>
Config::setInstallDirectory(const std::string &newDir) {
  if (newDir.empty()) {
    return std::string("No installation directory provided");
  }

  std::filesystem::path dir =
      std::filesystem::absolute(newDir).lexically_normal();
  if (auto problem = FileUtil::probeWritable(dir)) {
    LOG_WARN("Rejected installation directory: " + *problem);
    return problem;
  }

  mutate([&](Settings &s) { s.installationDir = dir.string(); });
  LOG_INFO("Installation directory set to " + dir.string());
  return std::nullopt;
}

void Config::setActiveVersion(const std::string &versionFolder,
                              const std::string &version) {
  mutate([&](Settings &s) {
    s.activeVersionFolder = versionFolder;
    s.activeVersion = version;
  });
}

void Config::clearActiveVersion() {
  mutate([](Settings &s) {
    s.activeVersionFolder.reset();
    s.activeVersion.reset();
  });
}

bool Config::clearActiveVersionIf(const std::string &versionFolder,
                                  const std::string &version) {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  if (settings_.activeVersionFolder != versionFolder ||
      settings_.activeVersion != version) {
    return false;
  }
  clearActiveVersion();
  return true;
}

void Config::updateInstalledGameVersion(const std::string &game,
                                        bool installed) {
  requireGameName(game);
  mutate([&](Settings &s) {
    GameRecord &record = s.games[game];
    record.isInstalled = installed;
    if (installed) {
      record.version = s.activeVersion.value_or("");
      record.versionFolder = s.activeVersionFolder.value_or("");
    } else {
      record.version.clear();
      record.versionFolder.clear();
    }
  });
}

bool Config::isGameInstalled(const std::string &game) {
  requireGameName(game);
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  auto it = settings_.games.find(game);
  if (it == settings_.games.end() || !it->second.isInstalled) {
    return false;
  }

  if (it->second.version.empty() || it->second.versionFolder.empty()) {
    LOG_WARN("Game '" + game +
             "' is marked installed without a tooling version, resetting");
    updateInstalledGameVersion(game, false);
    return false;
  }
  return true;
}

std::string Config::gameInstallVersion(const std::string &game) const {
  requireGameName(game);
  return read([&](const Settings &s) {
    auto it = s.games.find(game);
    return it == s.games.end() ? std::string() : it->second.version;
  });
}

std::string Config::gameInstallVersionFolder(const std::string &game) const {
  requireGameName(game);
  return read([&](const Settings &s) {
    auto it = s.games.find(game);
    return it == s.games.end() ? std::string() : it->second.versionFolder;
  });
}

void Config::setLocale(const std::string &locale) {
  mutate([&](Settings &s) { s.locale = locale; });
}

void Config::setBypassRequirements(bool bypass) {
  mutate([&](Settings &s) { s.requirements.bypassRequirements = bypass; });
}

void Config::resetToDefaults() {
  mutate([](Settings &s) { s = Settings{}; });
  LOG_INFO("Settings reset to defaults");
}

} // namespace tooldock
