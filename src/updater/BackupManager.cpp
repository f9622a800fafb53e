#include "BackupManager.hpp"

#include "utils/FileUtils.hpp"

#include <plog/Log.h>

#include <picosha2.h>

#include <fstream>
#include <iterator>

namespace fs = std::filesystem;

namespace updater
{

BackupManager::BackupManager(fs::path installationRoot, fs::path backupDir)
    : installationRoot_(std::move(installationRoot))
    , backupDir_(std::move(backupDir))
{
}

bool BackupManager::createBackup(const PreservationSet& preserved, std::string& outError)
{
    entries_.clear();
    try
    {
        fs::create_directories(backupDir_);

        for (const auto& name : preserved)
        {
            fs::path sourcePath = installationRoot_ / name;
            std::error_code ec;
            if (!fs::exists(fs::symlink_status(sourcePath, ec)))
            {
                PLOG_DEBUG << "Preserved entry not present: " << name;
                continue;
            }

            if (!utils::FileUtils::CopyTreeFollowingLinks(sourcePath, backupDir_ / name, outError))
            {
                outError = "backup " + sourcePath.string() + ": " + outError;
                PLOG_ERROR << outError;
                return false;
            }

            entries_.push_back(name);
            PLOG_DEBUG << "Backed up: " << name;
        }

        PLOG_INFO << "Backup created successfully: " << backupDir_.string() << " (" << entries_.size()
                  << " entries)";
        return true;
    }
    catch (const fs::filesystem_error& e)
    {
        outError = std::string("Filesystem error: ") + e.what();
        PLOG_ERROR << outError;
        return false;
    }
}

bool BackupManager::restoreFromBackup(std::string& outError)
{
    PLOG_INFO << "Restoring from backup: " << backupDir_.string();

    std::string failures;
    for (const auto& name : entries_)
    {
        fs::path source = backupDir_ / name;
        std::error_code ec;
        if (!fs::exists(fs::symlink_status(source, ec)))
        {
            // CopyTreeFollowingLinks skipped it: the original was a dangling link
            continue;
        }

        std::string error;
        if (!utils::FileUtils::ReplaceWithCopy(source, installationRoot_ / name, error))
        {
            PLOG_ERROR << "restore " << name << ": " << error;
            failures += (failures.empty() ? "" : "; ") + name + ": " + error;
            continue;
        }
        PLOG_DEBUG << "Restored: " << name;
    }

    if (!failures.empty())
    {
        outError = "Restore incomplete: " + failures;
        return false;
    }

    PLOG_INFO << "Restore completed successfully";
    return true;
}

bool BackupManager::fileSha256(const fs::path& filePath, std::string& outHex, std::string& outError)
{
    std::ifstream file(filePath, std::ios::binary);
    if (!file.is_open())
    {
        outError = "Failed to open file for hashing: " + filePath.string();
        return false;
    }

    std::vector<unsigned char> hash(picosha2::k_digest_size);
    picosha2::hash256(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>(), hash.begin(),
                      hash.end());
    outHex = picosha2::bytes_to_hex_string(hash.begin(), hash.end());
    return true;
}

bool BackupManager::computeDigests(const fs::path& root, const std::vector<std::string>& entries,
                                   DigestMap& outDigests, std::string& outError)
{
    outDigests.clear();
    try
    {
        for (const auto& name : entries)
        {
            fs::path entryPath = root / name;
            if (fs::is_regular_file(entryPath))
            {
                std::string hex;
                if (!fileSha256(entryPath, hex, outError))
                    return false;
                outDigests[fs::path(name).generic_string()] = hex;
                continue;
            }
            if (!fs::is_directory(entryPath))
                continue;

            for (const auto& item :
                 fs::recursive_directory_iterator(entryPath, fs::directory_options::follow_directory_symlink))
            {
                std::error_code ec;
                if (!item.is_regular_file(ec))
                    continue;

                std::string hex;
                if (!fileSha256(item.path(), hex, outError))
                    return false;
                outDigests[item.path().lexically_relative(root).generic_string()] = hex;
            }
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

} // namespace updater
