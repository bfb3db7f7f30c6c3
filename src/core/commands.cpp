#include "tooldock/commands.hpp"
#include "tooldock/errors.hpp"
#include "tooldock/logger.hpp"
#include "tooldock/task_runner.hpp"

namespace tooldock {

using json = nlohmann::json;

namespace {

const json &argument(const json &args, const char *name) {
  if (!args.is_object() || !args.contains(name) || args[name].is_null()) {
    throw ConfigurationError("Missing argument '" + std::string(name) + "'");
  }
  return args[name];
}

std::string stringArg(const json &args, const char *name) {
  const json &value = argument(args, name);
  if (!value.is_string()) {
    throw ConfigurationError("Argument '" + std::string(name) +
                             "' must be a string");
  }
  return value.get<std::string>();
}

bool boolArg(const json &args, const char *name) {
  const json &value = argument(args, name);
  if (!value.is_boolean()) {
    throw ConfigurationError("Argument '" + std::string(name) +
                             "' must be a boolean");
  }
  return value.get<bool>();
}

json optionalJson(const std::optional<std::string> &value) {
  return value ? json(*value) : json(nullptr);
}

json errorJson(ErrorKind kind, const std::string &message) {
  return json{{"error", {{"kind", errorKindLabel(kind)}, {"message", message}}}};
}

} // namespace

CommandDispatcher::CommandDispatcher(Config &config, VersionManager &versions,
                                     PathManager &paths)
    : config_(config), versions_(versions), paths_(paths) {
  registerHandlers();
}

void CommandDispatcher::registerHandlers() {
  // Tooling versions
  handlers_["list_downloaded_versions"] = [this](const json &args) {
    return json(versions_.listDownloadedVersions(
        stringArg(args, "versionFolder")));
  };
  handlers_["download_version"] = [this](const json &args) {
    versions_.downloadVersion(stringArg(args, "version"),
                              stringArg(args, "versionFolder"),
                              stringArg(args, "url"));
    return json(nullptr);
  };
  handlers_["remove_version"] = [this](const json &args) {
    versions_.removeVersion(stringArg(args, "version"),
                            stringArg(args, "versionFolder"));
    return json(nullptr);
  };
  handlers_["go_to_version_folder"] = [this](const json &args) {
    versions_.goToVersionFolder(stringArg(args, "versionFolder"));
    return json(nullptr);
  };
  handlers_["ensure_active_version_still_exists"] = [this](const json &) {
    return json(versions_.ensureActiveVersionStillExists());
  };
  handlers_["save_active_version_change"] = [this](const json &args) {
    versions_.saveActiveVersionChange(stringArg(args, "versionFolder"),
                                      stringArg(args, "newActiveVersion"));
    return json(nullptr);
  };
  handlers_["get_active_tooling_version"] = [this](const json &) {
    return optionalJson(versions_.activeVersion());
  };
  handlers_["get_active_tooling_version_folder"] = [this](const json &) {
    return optionalJson(versions_.activeVersionFolder());
  };

  // Settings
  handlers_["get_install_directory"] = [this](const json &) {
    return optionalJson(config_.installationDir());
  };
  handlers_["set_install_directory"] = [this](const json &args) {
    return optionalJson(config_.setInstallDirectory(stringArg(args, "newDir")));
  };
  handlers_["reset_to_defaults"] = [this](const json &) {
    config_.resetToDefaults();
    return json(nullptr);
  };
  handlers_["get_locale"] = [this](const json &) {
    return optionalJson(
        config_.read([](const Settings &s) { return s.locale; }));
  };
  handlers_["set_locale"] = [this](const json &args) {
    config_.setLocale(stringArg(args, "locale"));
    return json(nullptr);
  };
  handlers_["get_bypass_requirements"] = [this](const json &) {
    return json(config_.read([](const Settings &s) {
      return s.requirements.bypassRequirements.value_or(false);
    }));
  };
  handlers_["set_bypass_requirements"] = [this](const json &args) {
    config_.setBypassRequirements(boolArg(args, "bypass"));
    return json(nullptr);
  };
  handlers_["has_old_data_directory"] = [this](const json &) {
    return json(paths_.hasOldDataDirectory());
  };
  handlers_["delete_old_data_directory"] = [this](const json &) {
    paths_.deleteOldDataDirectory();
    return json(nullptr);
  };

  // Games
  handlers_["finalize_installation"] = [this](const json &args) {
    const std::string game = stringArg(args, "gameName");
    config_.updateInstalledGameVersion(game, true);
    LOG_INFO("gameInstalled: " + game);
    return json(nullptr);
  };
  handlers_["is_game_installed"] = [this](const json &args) {
    return json(config_.isGameInstalled(stringArg(args, "gameName")));
  };
  handlers_["get_installed_version"] = [this](const json &args) {
    return json(config_.gameInstallVersion(stringArg(args, "gameName")));
  };
  handlers_["get_installed_version_folder"] = [this](const json &args) {
    return json(config_.gameInstallVersionFolder(stringArg(args, "gameName")));
  };
}

json CommandDispatcher::invoke(const std::string &command, const json &args) {
  auto it = handlers_.find(command);
  if (it == handlers_.end()) {
    LOG_WARN("Unknown command '" + command + "'");
    return errorJson(ErrorKind::Configuration,
                     "Unknown command '" + command + "'");
  }

  LOG_DEBUG("Invoking " + command + " " + args.dump());
  try {
    return json{{"result", it->second(args)}};
  } catch (const Error &e) {
    LOG_ERROR("Error invoking " + command + ": (" + errorKindLabel(e.kind()) +
              ") " + e.what());
    return errorJson(e.kind(), e.what());
  } catch (const std::exception &e) {
    LOG_ERROR("Error invoking " + command + ": " + e.what());
    return errorJson(ErrorKind::IO, e.what());
  }
}

std::future<json> CommandDispatcher::dispatch(const std::string &command,
                                              json args) {
  return TaskRunner::instance().async(
      [this, command, args = std::move(args)]() {
        return invoke(command, args);
      });
}

std::vector<std::string> CommandDispatcher::commands() const {
  std::vector<std::string> names;
  names.reserve(handlers_.size());
  for (const auto &[name, handler] : handlers_) {
    names.push_back(name);
  }
  return names;
}

} // namespace tooldock
