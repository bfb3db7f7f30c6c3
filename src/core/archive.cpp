#include "tooldock/archive.hpp"
#include "tooldock/errors.hpp"
#include "tooldock/file_util.hpp"
#include "tooldock/logger.hpp"
#include <archive.h>
#include <archive_entry.h>
#include <memory>

namespace tooldock {

const char* archiveKindLabel(ArchiveKind kind) {
    switch (kind) {
        case ArchiveKind::Zip:   return "zip";
        case ArchiveKind::TarGz: return "tar.gz";
        default:                 return "unknown";
    }
}

std::string archiveExtension(ArchiveKind kind) {
    return std::string(".") + archiveKindLabel(kind);
}

namespace {

struct ReadDeleter {
    void operator()(struct archive* a) const { archive_read_free(a); }
};
struct WriteDeleter {
    void operator()(struct archive* a) const { archive_write_free(a); }
};

using ArchiveReader = std::unique_ptr<struct archive, ReadDeleter>;
using ArchiveWriter = std::unique_ptr<struct archive, WriteDeleter>;

std::string errorString(struct archive* a) {
    const char* msg = archive_error_string(a);
    return msg ? msg : "unknown libarchive error";
}

int copyData(struct archive* ar, struct archive* aw) {
    int r;
    const void* buff;
    size_t size;
    la_int64_t offset;

    for (;;) {
        r = archive_read_data_block(ar, &buff, &size, &offset);
        if (r == ARCHIVE_EOF) return ARCHIVE_OK;
        if (r < ARCHIVE_OK) return r;
        r = archive_write_data_block(aw, buff, size, offset);
        if (r < ARCHIVE_OK) return r;
    }
}

// Strips leading separators. Returns "" for entries that would land outside
// the destination.
std::string sanitizeEntryPath(const std::string& raw) {
    std::string relPath = raw;
    while (!relPath.empty() && (relPath[0] == '/' || relPath[0] == '\\')) {
        relPath = relPath.substr(1);
    }
    for (const auto& part : std::filesystem::path(relPath)) {
        if (part == "..") return "";
    }
    return relPath;
}

} // namespace

void ArchiveExtractor::extract(ArchiveKind kind, const std::filesystem::path& src,
                               const std::filesystem::path& dest) {
    const std::string archivePath = src.string();
    LOG_INFO("Extracting " + std::string(archiveKindLabel(kind)) + " archive " + archivePath +
             " into " + dest.string());

    ArchiveReader a(archive_read_new());
    ArchiveWriter ext(archive_write_disk_new());
    if (!a || !ext) {
        throw IOError("Unable to allocate libarchive handles for '" + archivePath + "'");
    }

    switch (kind) {
        case ArchiveKind::Zip:
            archive_read_support_format_zip(a.get());
            break;
        case ArchiveKind::TarGz:
            archive_read_support_format_tar(a.get());
            archive_read_support_filter_gzip(a.get());
            break;
    }

    int flags = ARCHIVE_EXTRACT_TIME;
    flags |= ARCHIVE_EXTRACT_PERM;
    flags |= ARCHIVE_EXTRACT_SECURE_NODOTDOT;
    flags |= ARCHIVE_EXTRACT_SECURE_SYMLINKS;
    archive_write_disk_set_options(ext.get(), flags);
    archive_write_disk_set_standard_lookup(ext.get());

    if (archive_read_open_filename(a.get(), archivePath.c_str(), 10240) != ARCHIVE_OK) {
        throw IOError("Could not open archive '" + archivePath + "': " + errorString(a.get()));
    }

    FileUtil::createDir(dest);

    size_t entries = 0;
    struct archive_entry* entry;
    for (;;) {
        int r = archive_read_next_header(a.get(), &entry);
        if (r == ARCHIVE_EOF) break;
        if (r < ARCHIVE_OK) {
            LOG_WARN("Archive header warning: " + errorString(a.get()));
        }
        if (r < ARCHIVE_WARN) {
            throw IOError("Corrupt archive '" + archivePath + "': " + errorString(a.get()));
        }

        const char* currentFile = archive_entry_pathname(entry);
        std::string relPath = sanitizeEntryPath(currentFile ? currentFile : "");
        if (relPath.empty()) {
            LOG_WARN("Skipping unsafe archive entry: " + std::string(currentFile ? currentFile : "<null>"));
            continue;
        }

        std::filesystem::path fullPath = dest / relPath;
        archive_entry_set_pathname(entry, fullPath.string().c_str());

        // tar hardlink targets are archive relative too
        if (const char* linkTarget = archive_entry_hardlink(entry)) {
            std::string relLink = sanitizeEntryPath(linkTarget);
            if (relLink.empty()) {
                LOG_WARN("Skipping hardlink with unsafe target: " + relPath + " -> " + linkTarget);
                continue;
            }
            archive_entry_set_hardlink(entry, (dest / relLink).string().c_str());
        }

        r = archive_write_header(ext.get(), entry);
        if (r < ARCHIVE_WARN) {
            throw IOError("Unable to write '" + relPath + "' from '" + archivePath +
                          "': " + errorString(ext.get()));
        }
        if (r < ARCHIVE_OK) {
            LOG_WARN("Archive write header warning: " + errorString(ext.get()));
        }
        // zip entries written with a data descriptor report no size up front
        if (archive_entry_size(entry) > 0 || !archive_entry_size_is_set(entry)) {
            r = copyData(a.get(), ext.get());
            if (r < ARCHIVE_WARN) {
                throw IOError("Unable to extract '" + relPath + "' from '" + archivePath +
                              "': " + errorString(ext.get()));
            }
        }

        r = archive_write_finish_entry(ext.get());
        if (r < ARCHIVE_WARN) {
            throw IOError("Unable to finish '" + relPath + "': " + errorString(ext.get()));
        }
        ++entries;
    }

    archive_read_close(a.get());
    if (archive_write_close(ext.get()) != ARCHIVE_OK) {
        throw IOError("Unable to finalize extraction into '" + dest.string() + "': " +
                      errorString(ext.get()));
    }

    LOG_INFO("Extracted " + std::to_string(entries) + " entries, removing " + archivePath);
    FileUtil::deleteFile(src);
}

} // namespace tooldock
