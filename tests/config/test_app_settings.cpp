#include <catch2/catch_test_macros.hpp>

#include "config/AppSettings.hpp"
#include "config/ModManagerConfig.hpp"
#include "utils/ScratchDirectory.hpp"
#include "../utils/archive_builder.hpp"

#include <nlohmann/json.hpp>

#include <fstream>

using namespace config;

TEST_CASE("AppSettings parsing", "[config]") {

    SECTION("Defaults") {
        AppSettings settings;
        REQUIRE(settings.update.preserved_dirs == std::vector<std::string>{"cfg", "mods"});
        REQUIRE(settings.paths.version_file == "version.json");
        REQUIRE(settings.content.marker_file == "modinfo.json");
        REQUIRE(settings.network.download_timeout_ms == 0);
    }

    SECTION("Tables override only the keys they name") {
        AppSettings settings;
        std::string error;
        REQUIRE(AppSettings::parse(R"(
[logging]
level = 5
file = "logs/modkeep.log"

[network]
timeout_ms = 5000

[update]
preserved_dirs = ["cfg", "save"]
fallback_version = "0.9.0"

[content]
mod_dir = "data/mods"

[game]
default_install_dir = "cbn"
)",
                                   settings, error));
        REQUIRE(settings.logging.level == 5);
        REQUIRE(settings.logging.file == "logs/modkeep.log");
        REQUIRE(settings.logging.backup_count == 3);
        REQUIRE(settings.network.timeout_ms == 5000);
        REQUIRE(settings.network.connect_timeout_ms == 10000);
        REQUIRE(settings.update.preserved_dirs == std::vector<std::string>{"cfg", "save"});
        REQUIRE(settings.update.preserved_files == std::vector<std::string>{"mod_debug.log"});
        REQUIRE(settings.update.fallback_version == "0.9.0");
        REQUIRE(settings.content.mod_dir == "data/mods");
        REQUIRE(settings.content.tileset_dir == "gfx");
        REQUIRE(settings.game.default_install_dir == "cbn");
    }

    SECTION("Out-of-range log level is ignored") {
        AppSettings settings;
        std::string error;
        REQUIRE(AppSettings::parse("[logging]\nlevel = 42\n", settings, error));
        REQUIRE(settings.logging.level == 4);
    }

    SECTION("Malformed TOML keeps the defaults") {
        AppSettings settings;
        settings.logging.file = "untouched.log";
        std::string error;
        REQUIRE_FALSE(AppSettings::parse("[logging\nlevel = ", settings, error));
        REQUIRE_FALSE(error.empty());
        REQUIRE(settings.logging.file == "untouched.log");
    }

    SECTION("Missing file is not an error") {
        AppSettings settings;
        std::string error;
        REQUIRE(AppSettings::load("/nonexistent/modkeep.toml", settings, error));
        REQUIRE(error.empty());
    }
}

TEST_CASE("ModManagerConfig record", "[config]") {
    utils::ScratchDirectory scratch("test-config");
    REQUIRE(scratch.valid());
    const std::string path = (scratch / "cfg" / "mod_manager_config.json").string();

    ModManagerConfig cfg;
    std::string error;

    SECTION("Missing, invalid and valid files") {
        REQUIRE(ModManagerConfig::load(path, cfg, error) == LoadStatus::NotFound);

        REQUIRE(test_utils::writeFile(path, "[1, 2"));
        REQUIRE(ModManagerConfig::load(path, cfg, error) == LoadStatus::Invalid);
        REQUIRE_FALSE(error.empty());

        REQUIRE(test_utils::writeFile(path, R"({"mod_install_dir":"userdata","update_url":null})"));
        REQUIRE(ModManagerConfig::load(path, cfg, error) == LoadStatus::Loaded);
        REQUIRE(cfg.modInstallDir == "userdata");
        REQUIRE(cfg.updateUrl.empty());
    }

    SECTION("Save keeps keys it does not own") {
        REQUIRE(test_utils::writeFile(path, R"({"theme":"dark","backup_dir":"old"})"));
        cfg.backupDir = "backups";
        cfg.updateUrl = "https://api.github.com/repos/o/r/releases/latest";
        REQUIRE(cfg.save(path, error));

        std::ifstream file(path);
        auto root = nlohmann::json::parse(file);
        REQUIRE(root["theme"] == "dark");
        REQUIRE(root["backup_dir"] == "backups");
        REQUIRE(root["update_url"] == "https://api.github.com/repos/o/r/releases/latest");
    }
}
