#include <catch2/catch.hpp>
#include "test_support.hpp"
#include "tooldock/errors.hpp"
#include "tooldock/version_manager.hpp"
#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <future>
#include <thread>

using tooldock::Config;
using tooldock::ErrorKind;
using tooldock::HostPlatform;
using tooldock::VersionManager;
using testsupport::TempDir;
namespace fs = std::filesystem;

namespace {

struct Fixture {
    TempDir tmp;
    Config config;
    testsupport::FakeFetcher fetcher;
    testsupport::FakeExtractor extractor;
    testsupport::RecordingOpener opener;

    explicit Fixture(bool withRoot = true) { testsupport::pointConfigAt(config, tmp, withRoot); }

    VersionManager manager(HostPlatform platform = HostPlatform::Unix) {
        return VersionManager(config, fetcher, extractor, opener, platform);
    }

    fs::path versions() const { return tmp / "install/versions"; }
};

} // namespace

TEST_CASE("without an installation directory", "[versions]") {
    Fixture f(false);
    auto vm = f.manager();

    REQUIRE(vm.listDownloadedVersions("official").empty());

    auto requireConfigCause = [](auto&& op) {
        try {
            op();
            FAIL("expected InstallationError");
        } catch (const tooldock::InstallationError& e) {
            REQUIRE(e.involves(ErrorKind::Configuration));
        }
    };
    requireConfigCause([&] { vm.downloadVersion("v1", "official", "https://example.com/v1"); });
    requireConfigCause([&] { vm.removeVersion("v1", "official"); });
    requireConfigCause([&] { vm.goToVersionFolder("official"); });
    requireConfigCause([&] { vm.ensureActiveVersionStillExists(); });
    REQUIRE(f.fetcher.urls.empty());
    REQUIRE(f.opener.opened.empty());
}

TEST_CASE("listDownloadedVersions", "[versions]") {
    Fixture f;
    auto vm = f.manager();

    SECTION("missing folder is empty") {
        REQUIRE(vm.listDownloadedVersions("official").empty());
    }

    SECTION("only directories are listed") {
        fs::create_directories(f.versions() / "official/v0.1.31");
        fs::create_directories(f.versions() / "official/v0.1.32");
        testsupport::writeFile(f.versions() / "official/v0.1.33.tar.gz", "partial");

        auto names = vm.listDownloadedVersions("official");
        std::sort(names.begin(), names.end());
        REQUIRE(names == std::vector<std::string>{"v0.1.31", "v0.1.32"});
        REQUIRE(vm.listDownloadedVersions("unofficial").empty());
    }
}

TEST_CASE("downloadVersion installs a version", "[versions]") {
    Fixture f;
    auto vm = f.manager(HostPlatform::Unix);

    vm.downloadVersion("v1.2.0", "official", "https://example.com/v1.2.0.tar.gz");

    REQUIRE(f.fetcher.urls == std::vector<std::string>{"https://example.com/v1.2.0.tar.gz"});
    REQUIRE(f.fetcher.destinations.front() == f.versions() / "official/v1.2.0.tar.gz");
    REQUIRE(f.extractor.kinds == std::vector<tooldock::ArchiveKind>{tooldock::ArchiveKind::TarGz});
    REQUIRE(fs::exists(f.versions() / "official/v1.2.0/extractor"));
    REQUIRE_FALSE(fs::exists(f.versions() / "official/v1.2.0.tar.gz"));
    REQUIRE(vm.listDownloadedVersions("official") == std::vector<std::string>{"v1.2.0"});
}

TEST_CASE("downloading again starts from a clean directory", "[versions]") {
    Fixture f;
    auto vm = f.manager();
    testsupport::writeFile(f.versions() / "official/v1/stale.txt", "left over");

    vm.downloadVersion("v1", "official", "https://example.com/v1");
    vm.downloadVersion("v1", "official", "https://example.com/v1");

    REQUIRE_FALSE(fs::exists(f.versions() / "official/v1/stale.txt"));
    REQUIRE(fs::exists(f.versions() / "official/v1/extractor"));
    REQUIRE(f.fetcher.urls.size() == 2);
}

TEST_CASE("missing marker removes the version", "[versions]") {
    Fixture f;
    f.extractor.files = {"data/goal_src.txt"};
    auto vm = f.manager();

    REQUIRE_THROWS_WITH(vm.downloadVersion("v1", "official", "https://example.com/v1"),
                        Catch::Contains("antivirus"));
    REQUIRE_FALSE(fs::exists(f.versions() / "official/v1"));
}

TEST_CASE("marker is per platform", "[versions]") {
    Fixture f;
    f.extractor.files = {"extractor.exe"};

    SECTION("windows accepts extractor.exe from a zip") {
        auto vm = f.manager(HostPlatform::Windows);
        REQUIRE_NOTHROW(vm.downloadVersion("v1", "official", "https://example.com/v1.zip"));
        REQUIRE(f.fetcher.destinations.back() == f.versions() / "official/v1.zip");
        REQUIRE(f.extractor.kinds.back() == tooldock::ArchiveKind::Zip);
    }

    SECTION("unix still wants extractor") {
        auto vm = f.manager(HostPlatform::Unix);
        REQUIRE_THROWS_AS(vm.downloadVersion("v1", "official", "https://example.com/v1"),
                          tooldock::InstallationError);
        REQUIRE_FALSE(fs::exists(f.versions() / "official/v1"));
    }
}

TEST_CASE("failed fetch leaves an empty version directory", "[versions]") {
    Fixture f;
    f.fetcher.fail = true;
    auto vm = f.manager();

    try {
        vm.downloadVersion("v1", "official", "https://example.com/v1");
        FAIL("expected InstallationError");
    } catch (const tooldock::InstallationError& e) {
        REQUIRE(e.context() == "Unable to download version");
        REQUIRE(std::string(e.what()).find("Couldn't connect") != std::string::npos);
    }
    REQUIRE(fs::is_directory(f.versions() / "official/v1"));
    REQUIRE(fs::is_empty(f.versions() / "official/v1"));
    REQUIRE(f.extractor.kinds.empty());
}

TEST_CASE("failed extraction removes the directory and archive", "[versions]") {
    Fixture f;
    f.extractor.fail = true;
    auto vm = f.manager();

    REQUIRE_THROWS_WITH(vm.downloadVersion("v1", "official", "https://example.com/v1"),
                        Catch::Contains("Unable to extract downloaded version"));
    REQUIRE_FALSE(fs::exists(f.versions() / "official/v1"));
    REQUIRE_FALSE(fs::exists(f.versions() / "official/v1.tar.gz"));
}

TEST_CASE("unknown platform refuses before touching disk", "[versions]") {
    Fixture f;
    testsupport::writeFile(f.versions() / "official/v1/extractor", "old install");
    auto vm = f.manager(HostPlatform::Unknown);

    REQUIRE_THROWS_WITH(vm.downloadVersion("v1", "official", "https://example.com/v1"),
                        Catch::Contains("Unknown operating system"));
    REQUIRE(fs::exists(f.versions() / "official/v1/extractor"));
    REQUIRE(f.fetcher.urls.empty());
}

TEST_CASE("invalid names are rejected", "[versions]") {
    Fixture f;
    auto vm = f.manager();

    REQUIRE_THROWS_AS(vm.downloadVersion("", "official", "https://example.com/v1"),
                      tooldock::InstallationError);
    REQUIRE_THROWS_AS(vm.downloadVersion("v1", "", "https://example.com/v1"),
                      tooldock::InstallationError);
    REQUIRE_THROWS_AS(vm.removeVersion("..", "official"), tooldock::InstallationError);
    REQUIRE_THROWS_AS(vm.goToVersionFolder("../.."), tooldock::InstallationError);
    REQUIRE(f.fetcher.urls.empty());
    REQUIRE_FALSE(fs::exists(f.versions()));
}

TEST_CASE("removeVersion", "[versions]") {
    Fixture f;
    auto vm = f.manager();
    fs::create_directories(f.versions() / "official/v1");
    fs::create_directories(f.versions() / "official/v2");

    SECTION("missing version is fine") {
        REQUIRE_NOTHROW(vm.removeVersion("v9", "official"));
    }

    SECTION("active version clears the pointer") {
        vm.saveActiveVersionChange("official", "v1");
        vm.removeVersion("v1", "official");
        REQUIRE_FALSE(fs::exists(f.versions() / "official/v1"));
        REQUIRE_FALSE(vm.activeVersion().has_value());
        REQUIRE_FALSE(vm.activeVersionFolder().has_value());
    }

    SECTION("other version keeps the pointer") {
        vm.saveActiveVersionChange("official", "v2");
        vm.removeVersion("v1", "official");
        REQUIRE(vm.activeVersion() == std::optional<std::string>("v2"));
        REQUIRE(fs::exists(f.versions() / "official/v2"));
    }

    SECTION("same version in another folder keeps the pointer") {
        vm.saveActiveVersionChange("unofficial", "v1");
        vm.removeVersion("v1", "official");
        REQUIRE(vm.activeVersion() == std::optional<std::string>("v1"));
    }
}

TEST_CASE("goToVersionFolder", "[versions]") {
    Fixture f;
    auto vm = f.manager();

    SECTION("creates then opens the folder") {
        vm.goToVersionFolder("official");
        REQUIRE(fs::is_directory(f.versions() / "official"));
        REQUIRE(f.opener.opened == std::vector<fs::path>{f.versions() / "official"});
    }

    SECTION("opener failure is an installation error") {
        f.opener.fail = true;
        REQUIRE_THROWS_WITH(vm.goToVersionFolder("official"),
                            Catch::Contains("Unable to open folder in OS"));
        REQUIRE(fs::is_directory(f.versions() / "official"));
    }
}

TEST_CASE("ensureActiveVersionStillExists", "[versions]") {
    Fixture f;
    auto vm = f.manager();

    SECTION("nothing active") {
        REQUIRE_FALSE(vm.ensureActiveVersionStillExists());
    }

    SECTION("active and present") {
        fs::create_directories(f.versions() / "official/v1");
        vm.saveActiveVersionChange("official", "v1");
        REQUIRE(vm.ensureActiveVersionStillExists());
        REQUIRE(vm.activeVersion() == std::optional<std::string>("v1"));
    }

    SECTION("active but deleted behind our back") {
        vm.saveActiveVersionChange("official", "v1");
        REQUIRE_FALSE(vm.ensureActiveVersionStillExists());
        REQUIRE_FALSE(vm.activeVersion().has_value());

        Config reloaded;
        reloaded.load(f.config.path());
        REQUIRE_FALSE(reloaded.snapshot().activeVersion.has_value());
        REQUIRE_FALSE(reloaded.snapshot().activeVersionFolder.has_value());
    }

    SECTION("empty strings count as unset") {
        f.config.mutate([](tooldock::Settings& s) {
            s.activeVersion = "";
            s.activeVersionFolder = "official";
        });
        REQUIRE_FALSE(vm.ensureActiveVersionStillExists());
    }
}

TEST_CASE("install, activate, delete, revalidate", "[versions][integration]") {
    TempDir tmp;
    Config config;
    testsupport::pointConfigAt(config, tmp);
    testsupport::CopyFetcher fetcher;
    tooldock::ArchiveExtractor extractor;
    testsupport::RecordingOpener opener;
    VersionManager vm(config, fetcher, extractor, opener, HostPlatform::Unix);

    fs::path release = tmp / "release.tar.gz";
    testsupport::writeArchive(release, tooldock::ArchiveKind::TarGz,
                              {{"extractor", "#!/bin/sh\n", 0755}, {"goalc", "bin", 0755}});

    vm.downloadVersion("v1.2.0", "jak1", release.string());
    fs::path installed = tmp / "install/versions/jak1/v1.2.0";
    REQUIRE(fs::exists(installed / "extractor"));
    REQUIRE(fs::exists(installed / "goalc"));
    REQUIRE(fetcher.calls == 1);

    vm.saveActiveVersionChange("jak1", "v1.2.0");
    REQUIRE(vm.ensureActiveVersionStillExists());

    fs::remove_all(installed);
    REQUIRE_FALSE(vm.ensureActiveVersionStillExists());
    REQUIRE_FALSE(vm.activeVersion().has_value());
    REQUIRE(fs::exists(release));
}

TEST_CASE("settings stay readable during a long download", "[versions][concurrency]") {
    Fixture f;
    auto vm = f.manager();

    std::mutex m;
    std::condition_variable cv;
    bool fetching = false;
    bool release = false;
    f.fetcher.onFetch = [&](const std::string&, const fs::path&) {
        std::unique_lock<std::mutex> lock(m);
        fetching = true;
        cv.notify_all();
        cv.wait(lock, [&] { return release; });
    };

    auto download = std::async(std::launch::async, [&] {
        vm.downloadVersion("v1", "official", "https://example.com/v1");
    });
    {
        std::unique_lock<std::mutex> lock(m);
        cv.wait(lock, [&] { return fetching; });
    }

    // Settings reads don't wait for the download
    REQUIRE(f.config.installationDir().has_value());
    REQUIRE_FALSE(vm.activeVersion().has_value());

    // A remove of the same version waits for the download to finish
    auto remove = std::async(std::launch::async, [&] { vm.removeVersion("v1", "official"); });
    REQUIRE(remove.wait_for(std::chrono::milliseconds(100)) == std::future_status::timeout);

    {
        std::lock_guard<std::mutex> lock(m);
        release = true;
    }
    cv.notify_all();

    download.get();
    remove.get();
    REQUIRE_FALSE(fs::exists(f.versions() / "official/v1"));
}

TEST_CASE("a version being staged is not listed", "[versions][concurrency]") {
    Fixture f;
    f.extractor.fail = true;
    auto vm = f.manager();

    std::mutex m;
    std::condition_variable cv;
    bool fetching = false;
    bool release = false;
    f.fetcher.onFetch = [&](const std::string&, const fs::path&) {
        std::unique_lock<std::mutex> lock(m);
        fetching = true;
        cv.notify_all();
        cv.wait(lock, [&] { return release; });
    };

    auto download = std::async(std::launch::async, [&] {
        vm.downloadVersion("v1", "official", "https://example.com/v1");
    });
    {
        std::unique_lock<std::mutex> lock(m);
        cv.wait(lock, [&] { return fetching; });
    }
    // the empty version directory already exists on disk at this point
    REQUIRE(fs::is_directory(f.versions() / "official/v1"));

    auto listed = std::async(std::launch::async, [&] { return vm.listDownloadedVersions("official"); });
    REQUIRE(listed.wait_for(std::chrono::milliseconds(100)) == std::future_status::timeout);

    {
        std::lock_guard<std::mutex> lock(m);
        release = true;
    }
    cv.notify_all();

    REQUIRE_THROWS_AS(download.get(), tooldock::InstallationError);
    REQUIRE(listed.get().empty());
    REQUIRE_FALSE(vm.activeVersion().has_value());
}
