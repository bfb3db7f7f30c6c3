#ifndef TOOLDOCK_FILE_UTIL_HPP
#define TOOLDOCK_FILE_UTIL_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace tooldock {

// Thin wrappers over std::filesystem that raise IOError with the offending
// path in the message.
class FileUtil {
public:
    // Removes the directory tree. A missing directory is not an error.
    static void deleteDir(const std::filesystem::path& dir);

    // Creates the directory and any missing parents. Existing is fine.
    static void createDir(const std::filesystem::path& dir);

    static void deleteFile(const std::filesystem::path& file);

    // Names of the immediate subdirectories. Regular files are skipped and
    // names that can't be decoded come back as "".
    static std::vector<std::string> listSubdirectories(const std::filesystem::path& dir);

    // Writes and removes a probe file. Returns a message on failure.
    static std::optional<std::string> probeWritable(const std::filesystem::path& dir);
};

} // namespace tooldock

#endif // TOOLDOCK_FILE_UTIL_HPP
