#pragma once

#include "BackupManager.hpp"
#include "PackageDownloader.hpp"
#include "PreservationSet.hpp"
#include "UpdateTypes.hpp"

#include <atomic>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace utils
{
class ScratchDirectory;
}

namespace updater
{

struct ReplaceRequest
{
    std::string downloadUrl;
    PreservationSet preservationSet;
    std::filesystem::path installationRoot;
    std::string targetVersion; // compared against the version record at Verifying
    std::string versionFile = "version.json";
};

using StateCallback = std::function<void(UpdateState)>;

// Replaces everything under an installation root with a release payload
// while keeping the preserved entries:
// Downloading -> Extracting -> BackingUp -> Purging -> Installing -> Restoring -> Verifying -> Done.
// A failure before Purging leaves the root untouched. A failure from Purging
// on triggers a best-effort restore and reports PartialUpdateRestoreAttempted.
class PreserveReplaceOrchestrator
{
public:
    explicit PreserveReplaceOrchestrator(IPackageDownloader& downloader);

    PreserveReplaceOrchestrator(const PreserveReplaceOrchestrator&) = delete;
    PreserveReplaceOrchestrator& operator=(const PreserveReplaceOrchestrator&) = delete;

    // Refuses with ErrorKind::Busy while another replace is running
    bool replace(const ReplaceRequest& request, UpdateError& outError);

    UpdateState state() const { return state_.load(); }
    bool isBusy() const { return busy_.load(); }

    // Called on entering each state, on the replacing thread
    void setStateCallback(StateCallback callback) { stateCallback_ = std::move(callback); }
    void setDownloadProgress(PackageProgressCallback callback) { downloadProgress_ = std::move(callback); }

    // Verification findings of the last replace (version mismatch, changed preserved files)
    const std::vector<std::string>& lastWarnings() const { return warnings_; }

private:
    struct Progress
    {
        bool purgeStarted = false;
        bool restoreAttempted = false;
    };

    bool runSteps(const ReplaceRequest& request, utils::ScratchDirectory& scratch, BackupManager& backup,
                  Progress& progress, UpdateError& outError);

    bool extractPayload(const std::filesystem::path& archivePath, const std::filesystem::path& extracted,
                        UpdateError& outError);
    void purge(const std::filesystem::path& root);
    bool installPayload(const std::filesystem::path& extracted, const ReplaceRequest& request, UpdateError& outError);
    bool restore(BackupManager& backup, utils::ScratchDirectory& scratch, UpdateError& outError);
    void verify(const ReplaceRequest& request, const BackupManager& backup,
                const BackupManager::DigestMap& digestsBefore);

    void enter(UpdateState state);
    void enterQuietly(UpdateState state);

    IPackageDownloader& downloader_;
    StateCallback stateCallback_;
    PackageProgressCallback downloadProgress_;
    std::atomic<UpdateState> state_{ UpdateState::Idle };
    std::atomic<bool> busy_{ false };
    std::vector<std::string> warnings_;
};

} // namespace updater
