#include "PreserveReplaceOrchestrator.hpp"
#include "VersionRecord.hpp"

#include "archive/ArchiveReader.hpp"
#include "install/ArchiveRootResolver.hpp"
#include "utils/FileUtils.hpp"
#include "utils/ScratchDirectory.hpp"

#include <plog/Log.h>

namespace fs = std::filesystem;

namespace updater
{

namespace
{

// Clears the busy flag on every exit path
class BusyGuard
{
public:
    explicit BusyGuard(std::atomic<bool>& flag)
        : flag_(flag)
    {
    }
    ~BusyGuard() { flag_ = false; }

    BusyGuard(const BusyGuard&) = delete;
    BusyGuard& operator=(const BusyGuard&) = delete;

private:
    std::atomic<bool>& flag_;
};

} // namespace

PreserveReplaceOrchestrator::PreserveReplaceOrchestrator(IPackageDownloader& downloader)
    : downloader_(downloader)
{
}

void PreserveReplaceOrchestrator::enter(UpdateState state)
{
    state_ = state;
    PLOG_INFO << "Self-update: " << updateStateToString(state);
    if (stateCallback_)
        stateCallback_(state);
}

void PreserveReplaceOrchestrator::enterQuietly(UpdateState state)
{
    try
    {
        enter(state);
    }
    catch (const std::exception& e)
    {
        PLOG_WARNING << "State callback failed on " << updateStateToString(state) << ": " << e.what();
    }
}

bool PreserveReplaceOrchestrator::replace(const ReplaceRequest& request, UpdateError& outError)
{
    bool expected = false;
    if (!busy_.compare_exchange_strong(expected, true))
    {
        outError = { ErrorKind::Busy, "An update is already in progress",
                     "replace: refused, state " + std::string(updateStateToString(state_.load())) };
        PLOG_WARNING << outError.technicalInfo;
        return false;
    }
    BusyGuard guard(busy_);
    warnings_.clear();

    std::error_code ec;
    if (!fs::is_directory(request.installationRoot, ec))
    {
        outError = { ErrorKind::WriteError, "Installation folder not found. No files were changed.",
                     "replace: not a directory: " + request.installationRoot.string() };
        PLOG_ERROR << outError.technicalInfo;
        enterQuietly(UpdateState::Failed);
        return false;
    }

    utils::ScratchDirectory scratch("update");
    if (!scratch.valid())
    {
        outError = { ErrorKind::WriteError, "Could not create a temporary directory. No files were changed.",
                     scratch.error() };
        enterQuietly(UpdateState::Failed);
        return false;
    }

    BackupManager backup(request.installationRoot, scratch / "backup");
    Progress progress;
    bool succeeded = false;

    try
    {
        succeeded = runSteps(request, scratch, backup, progress, outError);
    }
    catch (const std::exception& e)
    {
        succeeded = false;
        outError = { ErrorKind::WriteError, std::string("Unexpected error while ") + updateStateToString(state_.load()),
                     e.what() };
        PLOG_ERROR << "replace: exception in " << updateStateToString(state_.load()) << ": " << e.what();
    }

    if (succeeded)
    {
        enterQuietly(UpdateState::Done);
        PLOG_INFO << "Self-update to " << request.targetVersion << " completed in "
                  << request.installationRoot.string();
        return true;
    }

    const UpdateState failedIn = state_.load();

    if (!progress.purgeStarted)
    {
        // Nothing under the root has been touched yet
        outError.message += ". No files were changed.";
        PLOG_ERROR << "Self-update aborted during " << updateStateToString(failedIn) << ": "
                   << outError.technicalInfo;
        enterQuietly(UpdateState::Failed);
        return false;
    }

    if (outError.kind == ErrorKind::PartialUpdateRestoreAttempted)
    {
        // Restoring itself failed; the message already points at the kept backup
        enterQuietly(UpdateState::Failed);
        return false;
    }

    if (!progress.restoreAttempted)
    {
        PLOG_ERROR << "Self-update failed during " << updateStateToString(failedIn) << " (" << outError.technicalInfo
                   << "), restoring preserved entries";
        enterQuietly(UpdateState::Restoring);

        UpdateError restoreError;
        if (!restore(backup, scratch, restoreError))
        {
            restoreError.technicalInfo = outError.technicalInfo + "; " + restoreError.technicalInfo;
            outError = restoreError;
            enterQuietly(UpdateState::Failed);
            return false;
        }
    }

    UpdateError partial(ErrorKind::PartialUpdateRestoreAttempted,
                        std::string("Update failed while ") + updateStateToString(failedIn) + ": " + outError.message +
                            ". Your preserved files were restored but program files may be incomplete. "
                            "Download and unpack the release manually.",
                        outError.technicalInfo);
    partial.recoveryPath = outError.recoveryPath;
    outError = partial;
    enterQuietly(UpdateState::Failed);
    return false;
}

bool PreserveReplaceOrchestrator::runSteps(const ReplaceRequest& request, utils::ScratchDirectory& scratch,
                                           BackupManager& backup, Progress& progress, UpdateError& outError)
{
    const fs::path& root = request.installationRoot;

    enter(UpdateState::Downloading);
    archive::ArchiveFormat format = archive::formatFromName(request.downloadUrl);
    fs::path archivePath = scratch / (std::string("release") + archive::formatExtension(format));

    std::string error;
    if (!downloader_.download(request.downloadUrl, archivePath, downloadProgress_, error))
    {
        outError = { ErrorKind::DownloadError, "Download failed: " + error,
                     "Downloading: " + request.downloadUrl + " -> " + archivePath.string() };
        return false;
    }

    enter(UpdateState::Extracting);
    fs::path extracted = scratch / "extracted";
    if (!extractPayload(archivePath, extracted, outError))
        return false;

    BackupManager::DigestMap digestsBefore;

    enter(UpdateState::BackingUp);
    if (!backup.createBackup(request.preservationSet, error))
    {
        outError = { ErrorKind::WriteError, "Could not back up preserved files",
                     "BackingUp: " + backup.getBackupDir().string() + ": " + error };
        return false;
    }
    if (!BackupManager::computeDigests(root, backup.backedUpEntries(), digestsBefore, error))
        PLOG_WARNING << "Preserved files could not be hashed, skipping integrity check: " << error;

    enter(UpdateState::Purging);
    progress.purgeStarted = true;
    purge(root);

    enter(UpdateState::Installing);
    if (!installPayload(extracted, request, outError))
        return false;

    enter(UpdateState::Restoring);
    progress.restoreAttempted = true;
    if (!restore(backup, scratch, outError))
        return false;

    enter(UpdateState::Verifying);
    verify(request, backup, digestsBefore);
    return true;
}

bool PreserveReplaceOrchestrator::extractPayload(const fs::path& archivePath, const fs::path& extracted,
                                                 UpdateError& outError)
{
    std::string error;
    auto reader = archive::openArchive(archivePath, archive::formatFromName(archivePath.string()), error);
    if (!reader)
    {
        outError = { ErrorKind::ArchiveError, "Release file is not a valid archive", "Extracting: " + error };
        return false;
    }

    // Only a release whose every member sits under one folder is wrapped
    install::ResolveRequest request;
    request.looseFilesBlockWrapper = true;

    install::ResolvedRoot resolved;
    if (!install::ArchiveRootResolver::resolve(reader->memberNames(), request, resolved, outError))
    {
        outError.message = "Release archive is empty";
        outError.technicalInfo = "Extracting: " + outError.technicalInfo;
        return false;
    }

    archive::EntryTargets targets = [&](const archive::ArchiveEntry& entry)
    {
        std::vector<fs::path> dests;
        if (auto relative = install::ArchiveRootResolver::relativePath(entry.name, resolved.rootPrefix))
            dests.push_back(extracted / fs::path(*relative));
        else if (!utils::FileUtils::IsContainedRelativePath(entry.name))
            PLOG_WARNING << "Skipping unsafe archive member: " << entry.name;
        return dests;
    };

    archive::ExtractError extractError;
    if (!reader->extract(targets, extractError))
    {
        if (extractError.writeFailure)
            outError = { ErrorKind::WriteError, "Could not unpack the release", "Extracting: " + extractError.message };
        else
            outError = { ErrorKind::ArchiveError, "Release archive is corrupt", "Extracting: " + extractError.message };
        return false;
    }

    PLOG_INFO << "Release unpacked into " << extracted.string()
              << (resolved.rootPrefix.empty() ? "" : " (stripped " + resolved.rootPrefix + ")");
    return true;
}

void PreserveReplaceOrchestrator::purge(const fs::path& root)
{
    std::vector<fs::path> entries;
    std::error_code ec;
    for (fs::directory_iterator it(root, ec), end; !ec && it != end; it.increment(ec))
        entries.push_back(it->path());
    if (ec)
        PLOG_WARNING << "Purging: listing " << root.string() << " stopped early: " << ec.message();

    size_t removed = 0;
    for (const auto& entry : entries)
    {
        std::string error;
        if (!utils::FileUtils::RemoveEntry(entry, error))
        {
            // Continue; Installing overwrites and Restoring replaces what is left
            PLOG_WARNING << "Purging: " << error;
            continue;
        }
        ++removed;
    }
    PLOG_INFO << "Purged " << removed << " of " << entries.size() << " entries from " << root.string();
}

bool PreserveReplaceOrchestrator::installPayload(const fs::path& extracted, const ReplaceRequest& request,
                                                 UpdateError& outError)
{
    std::error_code ec;
    if (!fs::exists(extracted, ec))
        return true; // payload consisted only of empty wrapper folders

    fs::directory_iterator it(extracted, ec);
    if (ec)
    {
        outError = { ErrorKind::WriteError, "Could not read the unpacked release",
                     "Installing: " + extracted.string() + ": " + ec.message() };
        return false;
    }

    for (const auto& entry : it)
    {
        std::string name = entry.path().filename().string();
        if (request.preservationSet.count(name) != 0)
        {
            PLOG_INFO << "Installing: keeping existing '" << name << "', release copy skipped";
            continue;
        }

        std::string error;
        fs::path dest = request.installationRoot / name;
        if (!utils::FileUtils::ReplaceWithCopy(entry.path(), dest, error))
        {
            outError = { ErrorKind::WriteError, "Could not install program files", "Installing: " + error };
            return false;
        }
        PLOG_DEBUG << "Installed: " << name;
    }
    return true;
}

bool PreserveReplaceOrchestrator::restore(BackupManager& backup, utils::ScratchDirectory& scratch,
                                          UpdateError& outError)
{
    std::string error;
    if (backup.restoreFromBackup(error))
        return true;

    // The backup is now the only copy of the preserved data
    scratch.release();
    outError = { ErrorKind::PartialUpdateRestoreAttempted,
                 "Update failed and preserved files could not all be restored. A copy is kept in " +
                     backup.getBackupDir().string() + "; copy it back into the program folder manually.",
                 "Restoring: " + error };
    outError.recoveryPath = backup.getBackupDir().string();
    PLOG_FATAL << outError.technicalInfo << " (backup kept at " << outError.recoveryPath << ")";
    return false;
}

void PreserveReplaceOrchestrator::verify(const ReplaceRequest& request, const BackupManager& backup,
                                         const BackupManager::DigestMap& digestsBefore)
{
    if (!request.targetVersion.empty())
    {
        VersionRecord record(request.installationRoot / request.versionFile);
        std::string error;
        if (record.load(error) == config::LoadStatus::Invalid)
            PLOG_WARNING << "Verifying: " << error;
        if (record.programVersion() != request.targetVersion)
        {
            std::string found = record.programVersion().empty() ? "(none)" : record.programVersion();
            warnings_.push_back("Installed version record says " + found + ", expected " + request.targetVersion);
            PLOG_WARNING << "Verifying: " << warnings_.back();
        }
    }

    if (digestsBefore.empty())
        return;

    BackupManager::DigestMap digestsAfter;
    std::string error;
    if (!BackupManager::computeDigests(request.installationRoot, backup.backedUpEntries(), digestsAfter, error))
    {
        warnings_.push_back("Could not re-hash preserved files: " + error);
        PLOG_WARNING << "Verifying: " << warnings_.back();
        return;
    }

    for (const auto& [path, digest] : digestsBefore)
    {
        auto it = digestsAfter.find(path);
        if (it == digestsAfter.end())
            warnings_.push_back("Preserved file missing after update: " + path);
        else if (it->second != digest)
            warnings_.push_back("Preserved file changed during update: " + path);
        else
            continue;
        PLOG_WARNING << "Verifying: " << warnings_.back();
    }
}

} // namespace updater
