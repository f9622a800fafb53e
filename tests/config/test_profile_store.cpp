#include <catch2/catch_test_macros.hpp>

#include "config/ProfileStore.hpp"
#include "utils/ScratchDirectory.hpp"
#include "../utils/archive_builder.hpp"

#include <nlohmann/json.hpp>

#include <fstream>

using namespace config;
namespace fs = std::filesystem;

TEST_CASE("ProfileStore without a file", "[profiles]") {
    utils::ScratchDirectory scratch("test-profiles");
    REQUIRE(scratch.valid());
    ProfileStore store(scratch / "cfg" / "mod_profiles.json", scratch.path(), "userdata");

    std::string error;
    REQUIRE(store.load(error) == LoadStatus::NotFound);
    REQUIRE(store.names() == std::vector<std::string>{"default"});
    REQUIRE(store.current().name == "default");
    REQUIRE(store.current().installRoot == (fs::absolute(scratch.path()) / "userdata").lexically_normal());
    REQUIRE(store.current().mods.empty());
}

TEST_CASE("ProfileStore migrates stored shapes", "[profiles]") {
    utils::ScratchDirectory scratch("test-profiles-migrate");
    REQUIRE(scratch.valid());
    const fs::path storePath = scratch / "cfg" / "mod_profiles.json";
    const fs::path base = fs::absolute(scratch.path()).lexically_normal();

    REQUIRE(test_utils::writeFile(storePath, R"({
        "profiles": {
            "legacy": [
                {"url": "https://github.com/u/a", "subdir": "data", "keep_structure": true},
                {"url": ""}
            ],
            "modern": {
                "mods": [{"url": "https://example.com/t.zip", "install_type": "tileset", "preserve_layout": true}],
                "mod_install_dir": "/abs/elsewhere"
            },
            "broken": 42
        },
        "current_profile": "modern"
    })"));

    ProfileStore store(storePath, scratch.path(), "userdata");
    std::string error;
    REQUIRE(store.load(error) == LoadStatus::Loaded);
    REQUIRE(store.names() == std::vector<std::string>{"legacy", "modern"});
    REQUIRE(store.current().name == "modern");

    SECTION("Legacy list with legacy keys") {
        const Profile* legacy = store.find("legacy");
        REQUIRE(legacy != nullptr);
        REQUIRE(legacy->mods.size() == 1);
        REQUIRE(legacy->mods[0].contentSubpath == "data");
        REQUIRE_FALSE(legacy->mods[0].preserveOriginalLayout);
        REQUIRE(legacy->installRoot == base / "userdata");
    }

    SECTION("Record shape") {
        const Profile& modern = store.current();
        REQUIRE(modern.mods.size() == 1);
        REQUIRE(modern.mods[0].contentType == ContentType::Tileset);
        REQUIRE(modern.mods[0].preserveOriginalLayout);
        REQUIRE(modern.installRoot == fs::path("/abs/elsewhere"));
    }

    SECTION("Save writes the record shape with relative roots") {
        store.switchTo("legacy");
        REQUIRE(store.save(error));

        std::ifstream file(storePath);
        auto root = nlohmann::json::parse(file);
        REQUIRE(root["current_profile"] == "legacy");
        REQUIRE(root["profiles"]["legacy"]["mod_install_dir"] == "userdata");
        REQUIRE(root["profiles"]["legacy"]["mods"][0]["mod_subdir"] == "data");
        REQUIRE(root["profiles"]["legacy"]["mods"][0]["preserve_layout"] == false);
        REQUIRE(root["profiles"]["modern"]["mod_install_dir"] == "/abs/elsewhere");

        ProfileStore reloaded(storePath, scratch.path(), "userdata");
        REQUIRE(reloaded.load(error) == LoadStatus::Loaded);
        REQUIRE(reloaded.current().name == "legacy");
        REQUIRE(reloaded.current().mods[0].contentSubpath == "data");
    }
}

TEST_CASE("ProfileStore editing", "[profiles]") {
    utils::ScratchDirectory scratch("test-profiles-edit");
    REQUIRE(scratch.valid());
    ProfileStore store(scratch / "mod_profiles.json", scratch.path(), "userdata");
    std::string error;
    REQUIRE(store.load(error) == LoadStatus::NotFound);

    SECTION("Create switches to the new profile and refuses duplicates") {
        REQUIRE(store.createProfile("modded"));
        REQUIRE(store.current().name == "modded");
        REQUIRE_FALSE(store.createProfile("modded"));
        REQUIRE_FALSE(store.createProfile(""));
        REQUIRE(store.size() == 2);
    }

    SECTION("Rename follows the current profile") {
        REQUIRE(store.renameProfile("default", "main"));
        REQUIRE(store.current().name == "main");
        REQUIRE_FALSE(store.renameProfile("missing", "x"));
        REQUIRE(store.createProfile("other"));
        REQUIRE_FALSE(store.renameProfile("other", "main"));
    }

    SECTION("The last profile cannot be removed") {
        REQUIRE_FALSE(store.removeProfile("default"));
        REQUIRE(store.createProfile("second"));
        REQUIRE(store.removeProfile("second"));
        REQUIRE(store.current().name == "default");
    }

    SECTION("Switching to an unknown profile fails") {
        REQUIRE_FALSE(store.switchTo("ghost"));
        REQUIRE(store.current().name == "default");
    }

    SECTION("Mods and install root belong to the current profile") {
        Mod mod;
        mod.sourceUrl = "https://example.com/pack.zip";
        store.setMods({mod});
        store.setInstallRoot("custom");
        REQUIRE(store.current().mods.size() == 1);
        REQUIRE(store.current().installRoot == (fs::absolute(scratch.path()) / "custom").lexically_normal());
        REQUIRE(store.makeRelative(store.current().installRoot) == "custom");
    }
}

TEST_CASE("ProfileStore rejects unreadable files", "[profiles]") {
    utils::ScratchDirectory scratch("test-profiles-bad");
    REQUIRE(scratch.valid());
    REQUIRE(test_utils::writeFile(scratch / "mod_profiles.json", "{ not json"));

    ProfileStore store(scratch / "mod_profiles.json", scratch.path(), "userdata");
    std::string error;
    REQUIRE(store.load(error) == LoadStatus::Invalid);
    REQUIRE_FALSE(error.empty());
    REQUIRE(store.current().name == "default");
}
