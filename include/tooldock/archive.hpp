#ifndef TOOLDOCK_ARCHIVE_HPP
#define TOOLDOCK_ARCHIVE_HPP

#include <filesystem>
#include <string>

namespace tooldock {

enum class ArchiveKind {
    Zip,
    TarGz
};

const char* archiveKindLabel(ArchiveKind kind);

// File extension including the dot, e.g. ".tar.gz".
std::string archiveExtension(ArchiveKind kind);

class Extractor {
public:
    virtual ~Extractor() = default;

    // Unpacks src into dest (created if needed) and deletes src on success.
    virtual void extract(ArchiveKind kind, const std::filesystem::path& src,
                         const std::filesystem::path& dest) = 0;
};

// libarchive backed extractor for both supported container formats.
class ArchiveExtractor : public Extractor {
public:
    void extract(ArchiveKind kind, const std::filesystem::path& src,
                 const std::filesystem::path& dest) override;
};

} // namespace tooldock

#endif // TOOLDOCK_ARCHIVE_HPP
