#include <catch2/catch_test_macros.hpp>

#include "install/ArchiveInstaller.hpp"
#include "utils/ScratchDirectory.hpp"
#include "../utils/archive_builder.hpp"
#include "../utils/local_downloader.hpp"

using namespace install;
using test_utils::ArchiveMember;
using updater::ErrorKind;
using updater::InstallError;
namespace fs = std::filesystem;

namespace {

const std::string kModUrl = "https://example.com/mymod.zip";

config::Mod makeMod(const std::string& url) {
    config::Mod mod;
    mod.sourceUrl = url;
    return mod;
}

}  // namespace

TEST_CASE("ArchiveInstaller destinations", "[installer]") {
    test_utils::LocalFileDownloader downloader;
    ArchiveInstaller installer(config::ContentSettings{}, downloader);
    const fs::path root = fs::path("/games/userdata");

    config::Mod mod = makeMod(kModUrl);
    REQUIRE(installer.destinationFor(mod, root) == root / "mods");

    mod.installSubpath = ".";
    REQUIRE(installer.destinationFor(mod, root) == root / "mods");

    mod.contentType = config::ContentType::Tileset;
    REQUIRE(installer.destinationFor(mod, root) == root / "gfx");

    mod.contentType = config::ContentType::Soundpack;
    REQUIRE(installer.destinationFor(mod, root) == root / "sound");

    mod.installSubpath = "custom/place";
    REQUIRE(installer.destinationFor(mod, root) == root / "custom/place");
}

TEST_CASE("ArchiveInstaller installs packages", "[installer]") {
    utils::ScratchDirectory scratch("test-installer");
    REQUIRE(scratch.valid());
    const fs::path installRoot = scratch / "userdata";
    const fs::path archivePath = scratch / "mymod.zip";

    REQUIRE(test_utils::writeZip(archivePath, {
                                                  ArchiveMember::dir("mymod-abc123/"),
                                                  ArchiveMember::file("mymod-abc123/modinfo.json", "{}"),
                                                  ArchiveMember::file("mymod-abc123/data/items.json", "[1]"),
                                              }));

    test_utils::LocalFileDownloader downloader;
    downloader.serve(kModUrl, archivePath);
    ArchiveInstaller installer(config::ContentSettings{}, downloader);

    SECTION("Wrapper folder is stripped and the package lands under mods") {
        InstallError error;
        REQUIRE(installer.install(makeMod(kModUrl), installRoot, error));
        REQUIRE(test_utils::readFile(installRoot / "mods" / "mymod-abc123" / "data" / "items.json") == "[1]");
        REQUIRE(fs::exists(installRoot / "mods" / "mymod-abc123" / "modinfo.json"));
        REQUIRE_FALSE(fs::exists(installRoot / "mods" / "mymod-abc123" / "mymod-abc123"));
    }

    SECTION("Preserved layout copies the wrapper contents verbatim") {
        config::Mod mod = makeMod(kModUrl);
        mod.preserveOriginalLayout = true;
        mod.installSubpath = "plain";
        InstallError error;
        REQUIRE(installer.install(mod, installRoot, error));
        REQUIRE(test_utils::readFile(installRoot / "plain" / "data" / "items.json") == "[1]");
        REQUIRE(fs::exists(installRoot / "plain" / "modinfo.json"));
    }

    SECTION("Reinstalling overwrites member by member") {
        InstallError error;
        REQUIRE(installer.install(makeMod(kModUrl), installRoot, error));

        const fs::path items = installRoot / "mods" / "mymod-abc123" / "data" / "items.json";
        const fs::path extra = installRoot / "mods" / "mymod-abc123" / "local-notes.txt";
        REQUIRE(test_utils::writeFile(items, "edited"));
        REQUIRE(test_utils::writeFile(extra, "mine"));

        REQUIRE(installer.install(makeMod(kModUrl), installRoot, error));
        REQUIRE(test_utils::readFile(items) == "[1]");
        REQUIRE(test_utils::readFile(extra) == "mine");
    }

    SECTION("Content subpath selects the package root") {
        config::Mod mod = makeMod(kModUrl);
        mod.contentSubpath = "data";
        mod.installSubpath = "only-data";
        InstallError error;
        REQUIRE(installer.install(mod, installRoot, error));
        REQUIRE(test_utils::readFile(installRoot / "only-data" / "items.json") == "[1]");
        REQUIRE_FALSE(fs::exists(installRoot / "only-data" / "modinfo.json"));
    }

    SECTION("Missing subpath reports ContentNotFound and writes nothing") {
        config::Mod mod = makeMod(kModUrl);
        mod.contentSubpath = "nope";
        InstallError error;
        REQUIRE_FALSE(installer.install(mod, installRoot, error));
        REQUIRE(error.kind == ErrorKind::ContentNotFound);
        REQUIRE_FALSE(fs::exists(installRoot / "mods"));
    }

    SECTION("Failed download reports DownloadError") {
        InstallError error;
        REQUIRE_FALSE(installer.install(makeMod("https://example.com/missing.zip"), installRoot, error));
        REQUIRE(error.kind == ErrorKind::DownloadError);
    }

    SECTION("Empty source URL is refused") {
        InstallError error;
        REQUIRE_FALSE(installer.install(makeMod("  "), installRoot, error));
        REQUIRE(error.kind == ErrorKind::DownloadError);
        REQUIRE(downloader.requested().empty());
    }

    SECTION("Corrupt download reports ArchiveError") {
        const fs::path garbage = scratch / "garbage.zip";
        REQUIRE(test_utils::writeFile(garbage, "this is not a zip file"));
        downloader.serve("https://example.com/garbage.zip", garbage);
        InstallError error;
        REQUIRE_FALSE(installer.install(makeMod("https://example.com/garbage.zip"), installRoot, error));
        REQUIRE(error.kind == ErrorKind::ArchiveError);
    }

    SECTION("Tar.gz sources are read by extension") {
        const fs::path tarPath = scratch / "sounds.tar.gz";
        REQUIRE(test_utils::writeTarGz(tarPath, {
                                                    ArchiveMember::file("pack-1.0/modinfo.json", "{}"),
                                                    ArchiveMember::file("pack-1.0/sfx/boom.ogg", "BOOM"),
                                                }));
        downloader.serve("https://example.com/pack-1.0.tar.gz", tarPath);

        config::Mod mod = makeMod("https://example.com/pack-1.0.tar.gz");
        mod.contentType = config::ContentType::Soundpack;
        InstallError error;
        REQUIRE(installer.install(mod, installRoot, error));
        REQUIRE(test_utils::readFile(installRoot / "sound" / "pack-1.0" / "sfx" / "boom.ogg") == "BOOM");
    }

    SECTION("Whole archive install strips only the wrapper") {
        InstallError error;
        REQUIRE(installer.installArchive(kModUrl, scratch / "game", error));
        REQUIRE(test_utils::readFile(scratch / "game" / "data" / "items.json") == "[1]");
    }
}

TEST_CASE("ArchiveInstaller batch install", "[installer]") {
    utils::ScratchDirectory scratch("test-batch");
    REQUIRE(scratch.valid());
    const fs::path installRoot = scratch / "userdata";

    const fs::path first = scratch / "first.zip";
    const fs::path third = scratch / "third.zip";
    REQUIRE(test_utils::writeZip(first, {ArchiveMember::file("first-main/modinfo.json", "{}")}));
    REQUIRE(test_utils::writeZip(third, {ArchiveMember::file("third-main/modinfo.json", "{}")}));

    test_utils::LocalFileDownloader downloader;
    downloader.serve("https://github.com/u/first/archive/refs/heads/master.zip", first);
    downloader.serve("https://example.com/third.zip", third);
    ArchiveInstaller installer(config::ContentSettings{}, downloader);

    std::vector<config::Mod> mods{makeMod("https://github.com/u/first"), makeMod("https://github.com/u/second"),
                                  makeMod("https://example.com/third.zip")};

    std::vector<size_t> seen;
    auto summary = installer.installAll(mods, installRoot, [&](size_t index, size_t total, const config::Mod&) {
        REQUIRE(total == 3);
        seen.push_back(index);
    });

    REQUIRE(seen == std::vector<size_t>{0, 1, 2});
    REQUIRE(summary.successCount == 2);
    REQUIRE(summary.failures.size() == 1);
    REQUIRE(summary.failures[0].name == "u/second");
    REQUIRE_FALSE(summary.allSucceeded());
    REQUIRE(fs::exists(installRoot / "mods" / "first-main" / "modinfo.json"));
    REQUIRE(fs::exists(installRoot / "mods" / "third-main" / "modinfo.json"));
}

TEST_CASE("ArchiveInstaller batch reports each failure kind", "[installer]") {
    utils::ScratchDirectory scratch("test-batch-failures");
    REQUIRE(scratch.valid());
    const fs::path installRoot = scratch / "userdata";

    // A plain file where the blocked package's folder would go
    REQUIRE(test_utils::writeFile(installRoot / "blocked", "not a directory"));

    const fs::path good = scratch / "good.zip";
    const fs::path broken = scratch / "broken.tar.gz";
    REQUIRE(test_utils::writeZip(good, {ArchiveMember::file("good-main/modinfo.json", "{}")}));
    REQUIRE(test_utils::writeTarGzWithLongNameSize(broken, std::uint64_t{1} << 60));

    test_utils::LocalFileDownloader downloader;
    downloader.serve("https://example.com/broken.tar.gz", broken);
    downloader.serve("https://example.com/blocked.zip", good);
    downloader.serve("https://example.com/good.zip", good);
    ArchiveInstaller installer(config::ContentSettings{}, downloader);

    config::Mod blocked = makeMod("https://example.com/blocked.zip");
    blocked.installSubpath = "blocked/inside";

    std::vector<config::Mod> mods{makeMod("https://example.com/broken.tar.gz"), blocked,
                                  makeMod("https://example.com/good.zip")};
    auto summary = installer.installAll(mods, installRoot);

    REQUIRE(summary.successCount == 1);
    REQUIRE(summary.failures.size() == 2);
    REQUIRE(summary.failures[0].name == "https://example.com/broken.tar.gz");
    REQUIRE(summary.failures[0].message == "Downloaded file is not a valid archive");
    REQUIRE(summary.failures[1].name == "https://example.com/blocked.zip");
    REQUIRE(summary.failures[1].message == "Could not write package files");
    REQUIRE(fs::exists(installRoot / "mods" / "good-main" / "modinfo.json"));
}

TEST_CASE("ArchiveInstaller reports write failures", "[installer]") {
    utils::ScratchDirectory scratch("test-installer-write");
    REQUIRE(scratch.valid());
    const fs::path installRoot = scratch / "userdata";
    REQUIRE(test_utils::writeFile(installRoot / "mods", "not a directory"));

    const fs::path archivePath = scratch / "mymod.zip";
    REQUIRE(test_utils::writeZip(archivePath, {ArchiveMember::file("mymod-abc123/modinfo.json", "{}")}));

    test_utils::LocalFileDownloader downloader;
    downloader.serve(kModUrl, archivePath);
    ArchiveInstaller installer(config::ContentSettings{}, downloader);

    InstallError error;
    REQUIRE_FALSE(installer.install(makeMod(kModUrl), installRoot, error));
    REQUIRE(error.kind == ErrorKind::WriteError);
    REQUIRE(test_utils::readFile(installRoot / "mods") == "not a directory");
}
