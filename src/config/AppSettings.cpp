#include "AppSettings.hpp"

#include <plog/Log.h>
#include <toml++/toml.h>

#include <filesystem>

namespace config
{

namespace
{

void readStringList(const toml::node_view<const toml::node>& node, std::vector<std::string>& out)
{
    const toml::array* arr = node.as_array();
    if (!arr)
        return;

    std::vector<std::string> values;
    for (const auto& element : *arr)
    {
        if (auto value = element.value<std::string>())
            values.push_back(*value);
    }
    out = std::move(values);
}

template <typename T>
void readValue(const toml::node_view<const toml::node>& node, T& out)
{
    if (auto value = node.value<T>())
        out = *value;
}

void applyTable(const toml::table& root, AppSettings& s)
{
    if (auto logging = root["logging"].as_table())
    {
        const toml::table& t = *logging;
        if (auto level = t["level"].value<int64_t>())
        {
            int level_int = static_cast<int>(*level);
            if (level_int >= 0 && level_int <= 6)
                s.logging.level = level_int;
            else
                PLOG_WARNING << "Ignoring out-of-range logging level " << level_int;
        }
        readValue(t["append"], s.logging.append);
        readValue(t["file"], s.logging.file);
        if (auto size = t["max_file_size"].value<int64_t>(); size && *size > 0)
            s.logging.max_file_size = static_cast<std::size_t>(*size);
        if (auto count = t["backup_count"].value<int64_t>(); count && *count >= 0)
            s.logging.backup_count = static_cast<std::size_t>(*count);
    }

    if (auto network = root["network"].as_table())
    {
        const toml::table& t = *network;
        readValue(t["connect_timeout_ms"], s.network.connect_timeout_ms);
        readValue(t["timeout_ms"], s.network.timeout_ms);
        readValue(t["download_timeout_ms"], s.network.download_timeout_ms);
        readValue(t["user_agent"], s.network.user_agent);
    }

    if (auto paths = root["paths"].as_table())
    {
        const toml::table& t = *paths;
        readValue(t["config_file"], s.paths.config_file);
        readValue(t["profiles_file"], s.paths.profiles_file);
        readValue(t["version_file"], s.paths.version_file);
        readValue(t["default_install_dir"], s.paths.default_install_dir);
    }

    if (auto update = root["update"].as_table())
    {
        const toml::table& t = *update;
        readStringList(t["preserved_dirs"], s.update.preserved_dirs);
        readStringList(t["preserved_files"], s.update.preserved_files);
        readValue(t["fallback_version"], s.update.fallback_version);
    }

    if (auto content = root["content"].as_table())
    {
        const toml::table& t = *content;
        readValue(t["mod_dir"], s.content.mod_dir);
        readValue(t["tileset_dir"], s.content.tileset_dir);
        readValue(t["soundpack_dir"], s.content.soundpack_dir);
        readValue(t["marker_file"], s.content.marker_file);
    }

    if (auto game = root["game"].as_table())
    {
        const toml::table& t = *game;
        readValue(t["releases_url"], s.game.releases_url);
        readValue(t["experimental_url"], s.game.experimental_url);
        readValue(t["default_install_dir"], s.game.default_install_dir);
    }
}

} // namespace

bool AppSettings::load(const std::string& path, AppSettings& outSettings, std::string& outError)
{
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec))
    {
        PLOG_DEBUG << "No settings file at " << path << ", using defaults";
        return true;
    }

    try
    {
        toml::table root = toml::parse_file(path);
        AppSettings parsed;
        applyTable(root, parsed);
        outSettings = std::move(parsed);
        PLOG_DEBUG << "Settings loaded from " << path;
        return true;
    }
    catch (const toml::parse_error& e)
    {
        outError = "Failed to parse " + path + ": " + std::string(e.description());
        return false;
    }
}

bool AppSettings::parse(const std::string& tomlContent, AppSettings& outSettings, std::string& outError)
{
    try
    {
        toml::table root = toml::parse(tomlContent);
        AppSettings parsed;
        applyTable(root, parsed);
        outSettings = std::move(parsed);
        return true;
    }
    catch (const toml::parse_error& e)
    {
        outError = "Failed to parse settings: " + std::string(e.description());
        return false;
    }
}

} // namespace config
