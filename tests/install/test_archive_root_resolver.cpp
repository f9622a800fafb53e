#include <catch2/catch_test_macros.hpp>

#include "install/ArchiveRootResolver.hpp"

using namespace install;
using updater::ErrorKind;
using updater::InstallError;

TEST_CASE("ArchiveRootResolver wrapper detection", "[resolver]") {

    SECTION("Single shared top-level folder is a wrapper") {
        std::vector<std::string> members{"mymod-abc123/", "mymod-abc123/modinfo.json",
                                         "mymod-abc123/data/items.json"};
        REQUIRE(ArchiveRootResolver::wrapperPrefix(members) == "mymod-abc123/");
    }

    SECTION("Several top-level folders mean no wrapper") {
        std::vector<std::string> members{"a/file.txt", "b/file.txt"};
        REQUIRE(ArchiveRootResolver::wrapperPrefix(members).empty());
    }

    SECTION("Bare top-level files do not break wrapping") {
        std::vector<std::string> members{"README.md", "pack/modinfo.json"};
        REQUIRE(ArchiveRootResolver::wrapperPrefix(members) == "pack/");
    }

    SECTION("Flat archive has no wrapper") {
        std::vector<std::string> members{"modinfo.json", "items.json"};
        REQUIRE(ArchiveRootResolver::wrapperPrefix(members).empty());
    }

    SECTION("Loose top-level files can be made to block wrapping") {
        std::vector<std::string> members{"mod_manager.py", "run.sh", "mod_manager/", "mod_manager/app.py"};
        REQUIRE(ArchiveRootResolver::wrapperPrefix(members) == "mod_manager/");
        REQUIRE(ArchiveRootResolver::wrapperPrefix(members, true).empty());

        std::vector<std::string> wrapped{"release-1.1/", "release-1.1/run.sh", "release-1.1/lib/a.so"};
        REQUIRE(ArchiveRootResolver::wrapperPrefix(wrapped, true) == "release-1.1/");
    }
}

TEST_CASE("ArchiveRootResolver keeps a flat release whole", "[resolver]") {
    std::vector<std::string> members{"mod_manager.py", "run.sh", "mod_manager/", "mod_manager/app.py",
                                     "mod_manager/updater.py"};
    ResolveRequest request;
    request.looseFilesBlockWrapper = true;

    ResolvedRoot resolved;
    InstallError error;
    REQUIRE(ArchiveRootResolver::resolve(members, request, resolved, error));
    REQUIRE(resolved.rootPrefix.empty());
    REQUIRE(ArchiveRootResolver::relativePath("mod_manager.py", resolved.rootPrefix) == "mod_manager.py");
    REQUIRE(ArchiveRootResolver::relativePath("run.sh", resolved.rootPrefix) == "run.sh");
    REQUIRE(ArchiveRootResolver::relativePath("mod_manager/app.py", resolved.rootPrefix) == "mod_manager/app.py");
}

TEST_CASE("ArchiveRootResolver relative paths", "[resolver]") {
    REQUIRE(ArchiveRootResolver::relativePath("wrap/data/a.json", "wrap/") == "data/a.json");
    REQUIRE(ArchiveRootResolver::relativePath("wrap/data/", "wrap/") == "data");
    REQUIRE(ArchiveRootResolver::relativePath("a.json", "") == "a.json");

    SECTION("Prefix itself and outside members are skipped") {
        REQUIRE_FALSE(ArchiveRootResolver::relativePath("wrap/", "wrap/").has_value());
        REQUIRE_FALSE(ArchiveRootResolver::relativePath("other/a.json", "wrap/").has_value());
    }

    SECTION("Paths escaping the destination are refused") {
        REQUIRE_FALSE(ArchiveRootResolver::relativePath("wrap/../../etc/passwd", "wrap/").has_value());
        REQUIRE_FALSE(ArchiveRootResolver::relativePath("/etc/passwd", "").has_value());
    }
}

TEST_CASE("ArchiveRootResolver resolve", "[resolver]") {
    const std::vector<std::string> wrapped{"mymod-abc123/", "mymod-abc123/modinfo.json",
                                           "mymod-abc123/data/items.json"};
    ResolvedRoot resolved;
    InstallError error;

    SECTION("Verbatim layout strips only the wrapper") {
        ResolveRequest request;
        REQUIRE(ArchiveRootResolver::resolve(wrapped, request, resolved, error));
        REQUIRE(resolved.rootPrefix == "mymod-abc123/");
        REQUIRE(resolved.packages.size() == 1);
        REQUIRE(resolved.packages[0].prefix == "mymod-abc123/");
        REQUIRE(resolved.packages[0].folderName.empty());
    }

    SECTION("Auto-detect with marker at the wrapper root names the package after the wrapper") {
        ResolveRequest request;
        request.autoDetect = true;
        REQUIRE(ArchiveRootResolver::resolve(wrapped, request, resolved, error));
        REQUIRE(resolved.packages.size() == 1);
        REQUIRE(resolved.packages[0].prefix == "mymod-abc123/");
        REQUIRE(resolved.packages[0].folderName == "mymod-abc123");
    }

    SECTION("Auto-detect finds several nested packages") {
        std::vector<std::string> members{"repo-main/README.md", "repo-main/mods/alpha/modinfo.json",
                                         "repo-main/mods/alpha/a.json", "repo-main/mods/beta/modinfo.json",
                                         "repo-main/mods/beta/b.json"};
        ResolveRequest request;
        request.autoDetect = true;
        REQUIRE(ArchiveRootResolver::resolve(members, request, resolved, error));
        REQUIRE(resolved.packages.size() == 2);
        REQUIRE(resolved.packages[0].prefix == "repo-main/mods/alpha/");
        REQUIRE(resolved.packages[0].folderName == "alpha");
        REQUIRE(resolved.packages[1].prefix == "repo-main/mods/beta/");
        REQUIRE(resolved.packages[1].folderName == "beta");
    }

    SECTION("Marker at an unwrapped root uses the fallback name") {
        std::vector<std::string> members{"modinfo.json", "items.json"};
        ResolveRequest request;
        request.autoDetect = true;
        request.fallbackFolderName = "flatmod";
        REQUIRE(ArchiveRootResolver::resolve(members, request, resolved, error));
        REQUIRE(resolved.packages.size() == 1);
        REQUIRE(resolved.packages[0].prefix.empty());
        REQUIRE(resolved.packages[0].folderName == "flatmod");
    }

    SECTION("Subpath is appended to the wrapper and disables auto-detect") {
        std::vector<std::string> members{"repo-main/extras/x.json", "repo-main/data/modinfo.json",
                                         "repo-main/data/items.json"};
        ResolveRequest request;
        request.autoDetect = true;
        request.contentSubpath = "/data/";
        REQUIRE(ArchiveRootResolver::resolve(members, request, resolved, error));
        REQUIRE(resolved.rootPrefix == "repo-main/data/");
        REQUIRE(resolved.packages.size() == 1);
        REQUIRE(resolved.packages[0].folderName.empty());
    }

    SECTION("Missing subpath is ContentNotFound") {
        ResolveRequest request;
        request.contentSubpath = "nothing";
        REQUIRE_FALSE(ArchiveRootResolver::resolve(wrapped, request, resolved, error));
        REQUIRE(error.kind == ErrorKind::ContentNotFound);
        REQUIRE(error.message == "Subfolder 'nothing' not found in archive");
    }

    SECTION("Escaping subpath is refused") {
        ResolveRequest request;
        request.contentSubpath = "../outside";
        REQUIRE_FALSE(ArchiveRootResolver::resolve(wrapped, request, resolved, error));
        REQUIRE(error.kind == ErrorKind::ContentNotFound);
    }

    SECTION("Empty archive is ContentNotFound") {
        ResolveRequest request;
        REQUIRE_FALSE(ArchiveRootResolver::resolve({}, request, resolved, error));
        REQUIRE(error.kind == ErrorKind::ContentNotFound);
        REQUIRE(error.message == "No files found in archive");
    }

    SECTION("Auto-detect without any marker is ContentNotFound") {
        std::vector<std::string> members{"pack/readme.txt", "pack/data/items.json"};
        ResolveRequest request;
        request.autoDetect = true;
        REQUIRE_FALSE(ArchiveRootResolver::resolve(members, request, resolved, error));
        REQUIRE(error.kind == ErrorKind::ContentNotFound);
        REQUIRE(error.message == "No modinfo.json found in archive");
    }
}
