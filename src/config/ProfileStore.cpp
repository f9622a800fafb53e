#include "ProfileStore.hpp"

#include <nlohmann/json.hpp>
#include <plog/Log.h>

#include <algorithm>
#include <fstream>
#include <variant>

using json = nlohmann::ordered_json;
namespace fs = std::filesystem;

namespace config
{

namespace
{

// Shapes a profile entry has had on disk over time
struct LegacyModList // "name": [ {mod}, ... ]
{
    json mods;
};

struct ProfileRecord // "name": { "mods": [...], "mod_install_dir": "..." }
{
    json mods;
    std::string installDir;
};

using StoredProfile = std::variant<LegacyModList, ProfileRecord>;

bool readStoredProfile(const json& entry, StoredProfile& out)
{
    if (entry.is_array())
    {
        out = LegacyModList{ entry };
        return true;
    }
    if (entry.is_object())
    {
        ProfileRecord record;
        record.mods = entry.value("mods", json::array());
        auto dir = entry.find("mod_install_dir");
        if (dir != entry.end() && dir->is_string())
            record.installDir = dir->get<std::string>();
        out = std::move(record);
        return true;
    }
    return false;
}

std::string stringField(const json& object, const char* key)
{
    auto it = object.find(key);
    if (it == object.end() || !it->is_string())
        return {};
    return it->get<std::string>();
}

bool readMod(const json& entry, Mod& out)
{
    if (!entry.is_object())
        return false;

    Mod mod;
    mod.sourceUrl = stringField(entry, "url");
    if (mod.sourceUrl.empty())
        return false;

    mod.contentSubpath = stringField(entry, "mod_subdir");
    if (mod.contentSubpath.empty())
        mod.contentSubpath = stringField(entry, "subdir");
    mod.installSubpath = stringField(entry, "install_subdir");

    // keep_structure=true used to mean "auto-detect package folders"
    if (auto layout = entry.find("preserve_layout"); layout != entry.end() && layout->is_boolean())
        mod.preserveOriginalLayout = layout->get<bool>();
    else if (auto keep = entry.find("keep_structure"); keep != entry.end() && keep->is_boolean())
        mod.preserveOriginalLayout = !keep->get<bool>();

    mod.contentType = contentTypeFromString(stringField(entry, "install_type"));
    out = std::move(mod);
    return true;
}

json writeMod(const Mod& mod)
{
    json entry = json::object();
    entry["url"] = mod.sourceUrl;
    entry["mod_subdir"] = mod.contentSubpath;
    entry["install_subdir"] = mod.installSubpath;
    entry["preserve_layout"] = mod.preserveOriginalLayout;
    entry["install_type"] = contentTypeToString(mod.contentType);
    return entry;
}

std::vector<Mod> readMods(const std::string& profileName, const json& mods)
{
    std::vector<Mod> out;
    if (!mods.is_array())
        return out;

    for (const auto& entry : mods)
    {
        Mod mod;
        if (readMod(entry, mod))
            out.push_back(std::move(mod));
        else
            PLOG_WARNING << "Dropping mod entry without a URL from profile '" << profileName << "'";
    }
    return out;
}

} // namespace

ProfileStore::ProfileStore(fs::path storePath, fs::path baseDir, std::string defaultInstallDir)
    : storePath_(std::move(storePath))
    , baseDir_(fs::absolute(baseDir).lexically_normal())
    , defaultInstallDir_(std::move(defaultInstallDir))
{
}

LoadStatus ProfileStore::load(std::string& outError)
{
    profiles_.clear();
    current_.clear();

    std::error_code ec;
    if (!fs::is_regular_file(storePath_, ec))
    {
        PLOG_INFO << "No profile store at " << storePath_.string() << ", starting with a default profile";
        ensureDefault();
        return LoadStatus::NotFound;
    }

    try
    {
        std::ifstream file(storePath_);
        json root = json::parse(file);

        const json profiles = root.value("profiles", json::object());
        if (profiles.is_object())
        {
            for (const auto& [name, entry] : profiles.items())
            {
                StoredProfile stored;
                if (!readStoredProfile(entry, stored))
                {
                    PLOG_WARNING << "Skipping profile '" << name << "' with unrecognised shape";
                    continue;
                }

                // Single migration point: everything below sees only Profile
                Profile profile;
                profile.name = name;
                if (const auto* legacy = std::get_if<LegacyModList>(&stored))
                {
                    profile.mods = readMods(name, legacy->mods);
                    profile.installRoot = resolve(defaultInstallDir_);
                    PLOG_INFO << "Migrated list-shaped profile '" << name << "'";
                }
                else
                {
                    const auto& record = std::get<ProfileRecord>(stored);
                    profile.mods = readMods(name, record.mods);
                    profile.installRoot = resolve(record.installDir);
                }
                profiles_.push_back(std::move(profile));
            }
        }

        std::string current = stringField(root, "current_profile");
        if (findMutable(current))
            current_ = current;

        ensureDefault();
        PLOG_INFO << "Profiles loaded. Current profile: " << current_;
        return LoadStatus::Loaded;
    }
    catch (const json::exception& e)
    {
        outError = "Failed to read profiles from " + storePath_.string() + ": " + e.what();
        PLOG_ERROR << outError;
        profiles_.clear();
        ensureDefault();
        return LoadStatus::Invalid;
    }
}

bool ProfileStore::save(std::string& outError) const
{
    json profiles = json::object();
    for (const auto& profile : profiles_)
    {
        json mods = json::array();
        for (const auto& mod : profile.mods)
            mods.push_back(writeMod(mod));

        json record = json::object();
        record["mods"] = std::move(mods);
        record["mod_install_dir"] = makeRelative(profile.installRoot);
        profiles[profile.name] = std::move(record);
    }

    json root = json::object();
    root["profiles"] = std::move(profiles);
    root["current_profile"] = current_;

    std::error_code ec;
    if (storePath_.has_parent_path())
    {
        fs::create_directories(storePath_.parent_path(), ec);
        if (ec)
        {
            outError = "Failed to create " + storePath_.parent_path().string() + ": " + ec.message();
            PLOG_ERROR << outError;
            return false;
        }
    }

    std::ofstream file(storePath_, std::ios::trunc);
    if (!file.is_open())
    {
        outError = "Failed to open " + storePath_.string() + " for writing";
        PLOG_ERROR << outError;
        return false;
    }
    file << root.dump(2);
    if (file.fail())
    {
        outError = "Failed to write " + storePath_.string();
        PLOG_ERROR << outError;
        return false;
    }

    PLOG_INFO << "Profiles saved successfully.";
    return true;
}

bool ProfileStore::createProfile(const std::string& name)
{
    if (name.empty() || findMutable(name))
        return false;

    Profile profile;
    profile.name = name;
    profile.installRoot = resolve(defaultInstallDir_);
    profiles_.push_back(std::move(profile));
    current_ = name;
    return true;
}

bool ProfileStore::renameProfile(const std::string& oldName, const std::string& newName)
{
    if (newName.empty() || findMutable(newName))
        return false;

    Profile* profile = findMutable(oldName);
    if (!profile)
        return false;

    profile->name = newName;
    if (current_ == oldName)
        current_ = newName;
    return true;
}

bool ProfileStore::removeProfile(const std::string& name)
{
    if (profiles_.size() <= 1)
        return false;

    auto it = std::find_if(profiles_.begin(), profiles_.end(), [&](const Profile& p) { return p.name == name; });
    if (it == profiles_.end())
        return false;

    profiles_.erase(it);
    if (current_ == name)
        current_ = profiles_.front().name;
    return true;
}

bool ProfileStore::switchTo(const std::string& name)
{
    if (!findMutable(name))
        return false;
    current_ = name;
    return true;
}

const Profile& ProfileStore::current() const
{
    return *std::find_if(profiles_.begin(), profiles_.end(), [&](const Profile& p) { return p.name == current_; });
}

Profile& ProfileStore::current() { return *findMutable(current_); }

const Profile* ProfileStore::find(const std::string& name) const
{
    auto it = std::find_if(profiles_.begin(), profiles_.end(), [&](const Profile& p) { return p.name == name; });
    return it == profiles_.end() ? nullptr : &*it;
}

std::vector<std::string> ProfileStore::names() const
{
    std::vector<std::string> out;
    out.reserve(profiles_.size());
    for (const auto& profile : profiles_)
        out.push_back(profile.name);
    return out;
}

void ProfileStore::setMods(std::vector<Mod> mods) { current().mods = std::move(mods); }

void ProfileStore::setInstallRoot(const fs::path& root) { current().installRoot = resolve(root.string()); }

std::string ProfileStore::makeRelative(const fs::path& path) const
{
    if (path.empty() || !path.is_absolute())
        return path.generic_string();

    fs::path relative = path.lexically_normal().lexically_relative(baseDir_);
    if (relative.empty() || *relative.begin() == "..")
        return path.generic_string();
    return relative.generic_string();
}

fs::path ProfileStore::resolve(const std::string& stored) const
{
    const std::string& value = stored.empty() ? defaultInstallDir_ : stored;
    fs::path path(value);
    if (path.is_absolute())
        return path.lexically_normal();
    return (baseDir_ / path).lexically_normal();
}

Profile* ProfileStore::findMutable(const std::string& name)
{
    auto it = std::find_if(profiles_.begin(), profiles_.end(), [&](const Profile& p) { return p.name == name; });
    return it == profiles_.end() ? nullptr : &*it;
}

void ProfileStore::ensureDefault()
{
    if (profiles_.empty())
        createProfile("default");
    if (current_.empty())
        current_ = profiles_.front().name;
}

} // namespace config
