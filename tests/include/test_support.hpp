#pragma once

#include "tooldock/archive.hpp"
#include "tooldock/config.hpp"
#include "tooldock/http.hpp"
#include "tooldock/platform.hpp"
#include <archive.h>
#include <archive_entry.h>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <random>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace testsupport {

namespace fs = std::filesystem;

// Unique scratch directory, removed with everything in it on destruction.
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        std::mt19937_64 gen(rd());
        path_ = fs::temp_directory_path() / ("tooldock-test-" + std::to_string(gen()));
        fs::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const fs::path& path() const { return path_; }
    fs::path operator/(const std::string& child) const { return path_ / child; }

private:
    fs::path path_;
};

inline void writeFile(const fs::path& p, const std::string& content) {
    fs::create_directories(p.parent_path());
    std::ofstream ofs(p, std::ios::binary | std::ios::trunc);
    ofs << content;
}

inline std::string readFile(const fs::path& p) {
    std::ifstream ifs(p, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
}

struct ArchiveEntry {
    std::string name;
    std::string content;
    int mode = 0644;
    std::string hardlink; // tar only, names an earlier entry
};

// Writes a real archive with libarchive so the extractor has something
// genuine to chew on.
inline void writeArchive(const fs::path& dest, tooldock::ArchiveKind kind,
                         const std::vector<ArchiveEntry>& entries) {
    struct archive* a = archive_write_new();
    if (kind == tooldock::ArchiveKind::Zip) {
        archive_write_set_format_zip(a);
    } else {
        archive_write_set_format_pax_restricted(a);
        archive_write_add_filter_gzip(a);
    }
    if (archive_write_open_filename(a, dest.string().c_str()) != ARCHIVE_OK) {
        std::string msg = archive_error_string(a) ? archive_error_string(a) : "open failed";
        archive_write_free(a);
        throw std::runtime_error("fixture archive: " + msg);
    }

    for (const auto& e : entries) {
        struct archive_entry* entry = archive_entry_new();
        archive_entry_set_pathname(entry, e.name.c_str());
        archive_entry_set_filetype(entry, AE_IFREG);
        archive_entry_set_perm(entry, e.mode);
        if (!e.hardlink.empty()) {
            archive_entry_set_hardlink(entry, e.hardlink.c_str());
            archive_entry_set_size(entry, 0);
            archive_write_header(a, entry);
        } else {
            archive_entry_set_size(entry, static_cast<la_int64_t>(e.content.size()));
            archive_write_header(a, entry);
            archive_write_data(a, e.content.data(), e.content.size());
        }
        archive_entry_free(entry);
    }

    archive_write_close(a);
    archive_write_free(a);
}

// Treats the "url" as a local file path and copies it into place.
class CopyFetcher : public tooldock::Fetcher {
public:
    void fetch(const std::string& url, const fs::path& dest) override {
        ++calls;
        fs::copy_file(url, dest, fs::copy_options::overwrite_existing);
    }
    int calls = 0;
};

// Writes placeholder bytes, or fails like a dropped connection.
class FakeFetcher : public tooldock::Fetcher {
public:
    void fetch(const std::string& url, const fs::path& dest) override {
        urls.push_back(url);
        destinations.push_back(dest);
        if (onFetch) onFetch(url, dest);
        if (fail) throw std::runtime_error("cURL request failed: Couldn't connect to server");
        writeFile(dest, "archive bytes");
    }

    bool fail = false;
    std::function<void(const std::string&, const fs::path&)> onFetch;
    std::vector<std::string> urls;
    std::vector<fs::path> destinations;
};

// Lays out a fixed set of files instead of unpacking anything.
class FakeExtractor : public tooldock::Extractor {
public:
    void extract(tooldock::ArchiveKind kind, const fs::path& src, const fs::path& dest) override {
        kinds.push_back(kind);
        fs::create_directories(dest);
        for (const auto& f : files) {
            writeFile(dest / f, "payload");
        }
        if (fail) throw std::runtime_error("Corrupt archive: truncated gzip stream");
        fs::remove(src);
    }

    std::vector<std::string> files{"extractor", "extractor.exe", "data/goal_src.txt"};
    bool fail = false;
    std::vector<tooldock::ArchiveKind> kinds;
};

class RecordingOpener : public tooldock::FolderOpener {
public:
    void open(const fs::path& dir) override {
        opened.push_back(dir);
        if (fail) throw std::runtime_error("xdg-open: no method available for opening");
    }

    bool fail = false;
    std::vector<fs::path> opened;
};

// Config persisted inside a temp dir with the installation root already set.
inline void pointConfigAt(tooldock::Config& config, const TempDir& tmp, bool withRoot = true) {
    config.load(tmp / "config/settings.json");
    if (withRoot) {
        fs::create_directories(tmp / "install");
        config.mutate([&](tooldock::Settings& s) { s.installationDir = (tmp / "install").string(); });
    }
}

} // namespace testsupport
