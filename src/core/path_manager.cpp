#include "tooldock/path_manager.hpp"
#include "tooldock/errors.hpp"
#include "tooldock/file_util.hpp"
#include "tooldock/logger.hpp"
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace tooldock {

PathManager& PathManager::instance() {
    static PathManager instance;
    return instance;
}

void PathManager::init(const std::string& rootOverride) {
    configDir_ = resolveRoot(rootOverride);
    logsDir_ = configDir_ / "logs";

    FileUtil::createDir(configDir_);
    FileUtil::createDir(logsDir_);

    // Generate path for current session log
    auto now = std::chrono::system_clock::now();
    auto in_time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&in_time_t, &tm);
    std::stringstream ss;
    ss << "tooldock_" << std::put_time(&tm, "%Y%m%d_%H%M%S") << ".log";
    currentLogPath_ = logsDir_ / ss.str();
}

namespace {

std::filesystem::path absoluteOrThrow(const std::filesystem::path& p) {
    std::error_code ec;
    std::filesystem::path abs = std::filesystem::absolute(p, ec);
    if (ec) {
        throw IOError("Unable to resolve config directory '" + p.string() + "'",
                      std::filesystem::filesystem_error(ec.message(), p, ec));
    }
    return abs;
}

} // namespace

std::filesystem::path PathManager::resolveRoot(const std::string& override) {
    if (!override.empty()) return absoluteOrThrow(override);

    const char* envPath = std::getenv("TOOLDOCK_CONFIG_DIR");
    if (envPath && strlen(envPath) > 0) return absoluteOrThrow(envPath);

    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfigHome && strlen(xdgConfigHome) > 0) {
        return absoluteOrThrow(xdgConfigHome) / "tooldock";
    }

    const char* home = std::getenv("HOME");
    if (!home) home = "/tmp";
    return std::filesystem::path(home) / ".config" / "tooldock";
}

bool PathManager::hasOldDataDirectory() const {
    std::error_code ec;
    return std::filesystem::exists(legacyDataDir() / "iso_data", ec);
}

void PathManager::deleteOldDataDirectory() const {
    LOG_INFO("Deleting legacy data directory " + legacyDataDir().string());
    FileUtil::deleteDir(legacyDataDir());
}

} // namespace tooldock
