#include "ModManagerConfig.hpp"

#include <nlohmann/json.hpp>
#include <plog/Log.h>

#include <filesystem>
#include <fstream>
#include <sstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace config
{

namespace
{

std::string stringField(const json& object, const char* key)
{
    auto it = object.find(key);
    if (it == object.end() || !it->is_string())
        return {};
    return it->get<std::string>();
}

} // namespace

LoadStatus ModManagerConfig::parse(const std::string& jsonContent, ModManagerConfig& outConfig, std::string& outError)
{
    try
    {
        json root = json::parse(jsonContent);
        if (!root.is_object())
        {
            outError = "Config root is not a JSON object";
            return LoadStatus::Invalid;
        }

        ModManagerConfig parsed;
        parsed.modInstallDir = stringField(root, "mod_install_dir");
        parsed.gameInstallDir = stringField(root, "game_install_dir");
        parsed.backupDir = stringField(root, "backup_dir");
        parsed.updateUrl = stringField(root, "update_url");
        outConfig = std::move(parsed);
        return LoadStatus::Loaded;
    }
    catch (const json::exception& e)
    {
        outError = std::string("JSON parse error: ") + e.what();
        return LoadStatus::Invalid;
    }
}

LoadStatus ModManagerConfig::load(const std::string& path, ModManagerConfig& outConfig, std::string& outError)
{
    std::error_code ec;
    if (!fs::is_regular_file(path, ec))
    {
        PLOG_DEBUG << "Config file not found: " << path;
        return LoadStatus::NotFound;
    }

    std::ifstream file(path);
    if (!file.is_open())
    {
        outError = "Failed to open config file: " + path;
        PLOG_ERROR << outError;
        return LoadStatus::Invalid;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    LoadStatus status = parse(buffer.str(), outConfig, outError);
    if (status == LoadStatus::Invalid)
    {
        outError = path + ": " + outError;
        PLOG_ERROR << "Error loading config: " << outError;
    }
    else
    {
        PLOG_INFO << "Config loaded from " << path;
    }
    return status;
}

bool ModManagerConfig::save(const std::string& path, std::string& outError) const
{
    try
    {
        json root = json::object();
        std::error_code ec;
        if (fs::is_regular_file(path, ec))
        {
            std::ifstream existing(path);
            json previous = json::parse(existing, nullptr, false);
            if (previous.is_object())
                root = std::move(previous);
        }

        root["mod_install_dir"] = modInstallDir;
        root["game_install_dir"] = gameInstallDir;
        root["backup_dir"] = backupDir;
        root["update_url"] = updateUrl;

        fs::path target(path);
        if (target.has_parent_path())
            fs::create_directories(target.parent_path());

        std::ofstream file(path, std::ios::trunc);
        if (!file.is_open())
        {
            outError = "Failed to open config file for writing: " + path;
            PLOG_ERROR << outError;
            return false;
        }
        file << root.dump(2);
        if (file.fail())
        {
            outError = "Failed to write config file: " + path;
            PLOG_ERROR << outError;
            return false;
        }

        PLOG_INFO << "Config saved to " << path;
        return true;
    }
    catch (const fs::filesystem_error& e)
    {
        outError = std::string("Filesystem error: ") + e.what();
        PLOG_ERROR << outError;
        return false;
    }
}

} // namespace config
