#pragma once

#include "PreservationSet.hpp"

#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace updater
{

// Snapshot of the preserved top-level entries of an installation root,
// kept in a backup directory outside of it.
class BackupManager
{
public:
    // relative file path (generic form) -> SHA-256 hex
    using DigestMap = std::map<std::string, std::string>;

    BackupManager(std::filesystem::path installationRoot, std::filesystem::path backupDir);

    // Copies every preserved entry that exists under the root, following
    // symlinks and skipping the ones that do not resolve
    bool createBackup(const PreservationSet& preserved, std::string& outError);

    // Puts every backed-up entry back, replacing whatever sits under the same
    // name. Keeps going after a failed entry; outError lists all failures.
    bool restoreFromBackup(std::string& outError);

    bool hasBackup() const { return !entries_.empty(); }
    const std::vector<std::string>& backedUpEntries() const { return entries_; }
    const std::filesystem::path& getBackupDir() const { return backupDir_; }

    static bool computeDigests(const std::filesystem::path& root, const std::vector<std::string>& entries,
                               DigestMap& outDigests, std::string& outError);

    static bool fileSha256(const std::filesystem::path& filePath, std::string& outHex, std::string& outError);

private:
    std::filesystem::path installationRoot_;
    std::filesystem::path backupDir_;
    std::vector<std::string> entries_;
};

} // namespace updater
