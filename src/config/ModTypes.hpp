#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace config
{

// Decides the default destination folder under the install root
enum class ContentType
{
    Mod,
    Tileset,
    Soundpack
};

// One content package a user wants installed
struct Mod
{
    std::string sourceUrl;      // archive location, never empty once persisted
    std::string contentSubpath; // path inside the archive to treat as the package root
    std::string installSubpath; // path under the install root; empty or "." means the content-type folder
    bool preserveOriginalLayout = false; // false: auto-detect package roots by marker file
    ContentType contentType = ContentType::Mod;
};

struct Profile
{
    std::string name;
    std::filesystem::path installRoot; // absolute once loaded
    std::vector<Mod> mods;
};

const char* contentTypeToString(ContentType type);
ContentType contentTypeFromString(const std::string& value);

} // namespace config
