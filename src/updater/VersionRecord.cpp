#include "VersionRecord.hpp"

#include <nlohmann/json.hpp>
#include <plog/Log.h>

#include <fstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace updater
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

VersionRecord::VersionRecord(fs::path path)
    : path_(std::move(path))
{
}

config::LoadStatus VersionRecord::load(std::string& outError)
{
    std::error_code ec;
    if (!fs::is_regular_file(path_, ec))
    {
        PLOG_DEBUG << "Version record not found: " << path_.string();
        return config::LoadStatus::NotFound;
    }

    std::ifstream file(path_);
    if (!file.is_open())
    {
        outError = "Failed to open version record: " + path_.string();
        PLOG_ERROR << outError;
        return config::LoadStatus::Invalid;
    }

    try
    {
        json root = json::parse(file);
        if (!root.is_object())
        {
            outError = path_.string() + ": version record is not a JSON object";
            PLOG_ERROR << outError;
            return config::LoadStatus::Invalid;
        }

        programVersion_ = stringField(root, "program_version");
        if (programVersion_.empty())
            programVersion_ = stringField(root, "version");
        gameVersion_ = stringField(root, "game_version");
        legacyUpdateUrl_ = stringField(root, "update_url");
        return config::LoadStatus::Loaded;
    }
    catch (const json::exception& e)
    {
        outError = path_.string() + ": JSON parse error: " + e.what();
        PLOG_ERROR << outError;
        return config::LoadStatus::Invalid;
    }
}

bool VersionRecord::save(std::string& outError) const
{
    try
    {
        json root = json::object();
        std::error_code ec;
        if (fs::is_regular_file(path_, ec))
        {
            std::ifstream existing(path_);
            json previous = json::parse(existing, nullptr, false);
            if (previous.is_object())
                root = std::move(previous);
        }

        if (!programVersion_.empty())
            root["program_version"] = programVersion_;
        if (!gameVersion_.empty())
            root["game_version"] = gameVersion_;

        if (path_.has_parent_path())
            fs::create_directories(path_.parent_path());

        std::ofstream file(path_, std::ios::trunc);
        if (!file.is_open())
        {
            outError = "Failed to open version record for writing: " + path_.string();
            PLOG_ERROR << outError;
            return false;
        }
        file << root.dump(2);
        if (file.fail())
        {
            outError = "Failed to write version record: " + path_.string();
            PLOG_ERROR << outError;
            return false;
        }
        return true;
    }
    catch (const fs::filesystem_error& e)
    {
        outError = std::string("Filesystem error: ") + e.what();
        PLOG_ERROR << outError;
        return false;
    }
}

std::string VersionRecord::currentProgramVersion(const fs::path& path, const std::string& fallback)
{
    VersionRecord record(path);
    std::string error;
    if (record.load(error) == config::LoadStatus::Loaded && !record.programVersion().empty())
        return record.programVersion();
    return fallback;
}

bool VersionRecord::writeProgramVersion(const fs::path& path, const std::string& version, std::string& outError)
{
    VersionRecord record(path);
    if (record.load(outError) == config::LoadStatus::Invalid)
        PLOG_WARNING << "Rewriting unreadable version record " << path.string();
    record.setProgramVersion(version);
    if (!record.save(outError))
        return false;
    PLOG_INFO << "Recorded program_version " << version << " in " << path.string();
    return true;
}

bool VersionRecord::writeGameVersion(const fs::path& path, const std::string& version, std::string& outError)
{
    VersionRecord record(path);
    if (record.load(outError) == config::LoadStatus::Invalid)
        PLOG_WARNING << "Rewriting unreadable version record " << path.string();
    record.setGameVersion(version);
    if (!record.save(outError))
        return false;
    PLOG_INFO << "Recorded game_version " << version << " in " << path.string();
    return true;
}

} // namespace updater
