#include "tooldock/file_util.hpp"
#include "tooldock/errors.hpp"
#include "tooldock/logger.hpp"
#include <fstream>
#include <system_error>

namespace tooldock {

void FileUtil::deleteDir(const std::filesystem::path& dir) {
    try {
        if (!std::filesystem::exists(dir)) return;
        auto removed = std::filesystem::remove_all(dir);
        LOG_DEBUG("Removed " + std::to_string(removed) + " entries under " + dir.string());
    } catch (const std::filesystem::filesystem_error& e) {
        throw IOError("Unable to delete directory '" + dir.string() + "'", e);
    }
}

void FileUtil::createDir(const std::filesystem::path& dir) {
    try {
        std::filesystem::create_directories(dir);
    } catch (const std::filesystem::filesystem_error& e) {
        throw IOError("Unable to create directory '" + dir.string() + "'", e);
    }
    if (!std::filesystem::is_directory(dir)) {
        throw IOError("Unable to create directory '" + dir.string() + "', a file is in the way");
    }
}

void FileUtil::deleteFile(const std::filesystem::path& file) {
    std::error_code ec;
    std::filesystem::remove(file, ec);
    if (ec) {
        throw IOError("Unable to delete file '" + file.string() + "'",
                      std::filesystem::filesystem_error(ec.message(), file, ec));
    }
}

std::vector<std::string> FileUtil::listSubdirectories(const std::filesystem::path& dir) {
    std::vector<std::string> names;
    try {
        for (const auto& entry : std::filesystem::directory_iterator(dir)) {
            std::error_code ec;
            if (!entry.is_directory(ec) || ec) continue;

            std::string name;
            try {
                name = entry.path().filename().string();
            } catch (const std::system_error&) {
                // not representable in the narrow encoding
                name.clear();
            }
            names.push_back(name);
        }
    } catch (const std::filesystem::filesystem_error& e) {
        throw IOError("Unable to read directory '" + dir.string() + "'", e);
    }
    return names;
}

std::optional<std::string> FileUtil::probeWritable(const std::filesystem::path& dir) {
    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec)) {
        return "'" + dir.string() + "' is not an existing directory";
    }

    std::filesystem::path probe = dir / ".tooldock-write-probe";
    {
        std::ofstream ofs(probe, std::ios::out | std::ios::trunc);
        if (!ofs) {
            return "Can't write to '" + dir.string() + "', pick a directory you have write access to";
        }
        ofs << "probe";
    }
    std::filesystem::remove(probe, ec);
    if (ec) {
        LOG_WARN("Left write probe behind at " + probe.string() + ": " + ec.message());
    }
    return std::nullopt;
}

} // namespace tooldock
