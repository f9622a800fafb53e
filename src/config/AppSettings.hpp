#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace config
{

struct LoggingSettings
{
    int level = 4; // plog::info
    bool append = false;
    std::string file = "mod_debug.log";
    std::size_t max_file_size = 10 * 1024 * 1024;
    std::size_t backup_count = 3;
};

struct NetworkSettings
{
    int connect_timeout_ms = 10000;
    int timeout_ms = 30000;
    int download_timeout_ms = 0; // no overall limit, archives can be large
    std::string user_agent = "modkeep-updater";
};

struct PathSettings
{
    std::string config_file = "cfg/mod_manager_config.json";
    std::string profiles_file = "cfg/mod_profiles.json";
    std::string version_file = "version.json";
    std::string default_install_dir = "userdata";
};

struct UpdateSettings
{
    std::vector<std::string> preserved_dirs{ "cfg", "mods" };
    std::vector<std::string> preserved_files{ "mod_debug.log" };
    std::string fallback_version;
};

struct ContentSettings
{
    std::string mod_dir = "mods";
    std::string tileset_dir = "gfx";
    std::string soundpack_dir = "sound";
    std::string marker_file = "modinfo.json";
};

// Releases of the separately installed game build
struct GameSettings
{
    std::string releases_url = "https://api.github.com/repos/cataclysmbnteam/Cataclysm-BN/releases";
    std::string experimental_url = "https://api.github.com/repos/cataclysmbnteam/Cataclysm-BN/releases/tags/experimental";
    std::string default_install_dir = "game"; // when game_install_dir is not configured
};

// Immutable settings value, built once at start-up and handed to each
// component that needs it.
struct AppSettings
{
    LoggingSettings logging;
    NetworkSettings network;
    PathSettings paths;
    UpdateSettings update;
    ContentSettings content;
    GameSettings game;

    static constexpr const char* kDefaultFile = "cfg/modkeep.toml";

    // Missing file leaves the defaults in place and succeeds.
    // A malformed file leaves the defaults in place and fails with outError set.
    static bool load(const std::string& path, AppSettings& outSettings, std::string& outError);

    static bool parse(const std::string& tomlContent, AppSettings& outSettings, std::string& outError);
};

} // namespace config
