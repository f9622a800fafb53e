#pragma once

#include <string>

namespace config
{

enum class LoadStatus
{
    Loaded,
    NotFound,
    Invalid
};

// Persisted path hints and the self-update endpoint (cfg/mod_manager_config.json)
struct ModManagerConfig
{
    std::string modInstallDir;
    std::string gameInstallDir;
    std::string backupDir;
    std::string updateUrl;

    static LoadStatus load(const std::string& path, ModManagerConfig& outConfig, std::string& outError);
    static LoadStatus parse(const std::string& jsonContent, ModManagerConfig& outConfig, std::string& outError);

    // Rewrites only the keys this record owns; unknown keys already in the file survive
    bool save(const std::string& path, std::string& outError) const;
};

} // namespace config
