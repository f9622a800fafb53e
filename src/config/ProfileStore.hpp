#pragma once

#include "ModManagerConfig.hpp"
#include "ModTypes.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace config
{

// Named install profiles persisted in cfg/mod_profiles.json.
// Exactly one profile is current at any time once load() has run.
class ProfileStore
{
public:
    ProfileStore(std::filesystem::path storePath, std::filesystem::path baseDir, std::string defaultInstallDir);

    // Reads the store and migrates every older profile shape. A missing file
    // yields a single "default" profile and NotFound.
    LoadStatus load(std::string& outError);
    bool save(std::string& outError) const;

    // New profile becomes current; false if the name is taken or empty
    bool createProfile(const std::string& name);
    bool renameProfile(const std::string& oldName, const std::string& newName);
    // Refuses to remove the last profile
    bool removeProfile(const std::string& name);
    bool switchTo(const std::string& name);

    const Profile& current() const;
    Profile& current();
    const Profile* find(const std::string& name) const;
    std::vector<std::string> names() const;
    size_t size() const { return profiles_.size(); }

    void setMods(std::vector<Mod> mods);
    void setInstallRoot(const std::filesystem::path& root);

    // Relative to the base directory when the path lives inside it
    std::string makeRelative(const std::filesystem::path& path) const;
    std::filesystem::path resolve(const std::string& stored) const;

private:
    Profile* findMutable(const std::string& name);
    void ensureDefault();

    std::filesystem::path storePath_;
    std::filesystem::path baseDir_;
    std::string defaultInstallDir_;
    std::vector<Profile> profiles_;
    std::string current_;
};

} // namespace config
