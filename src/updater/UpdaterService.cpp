#include "UpdaterService.hpp"
#include "UpdateDecisionService.hpp"
#include "VersionRecord.hpp"

#include "config/ModManagerConfig.hpp"
#include "utils/ErrorReporter.hpp"

#include <plog/Log.h>

#include <mutex>

namespace fs = std::filesystem;

namespace updater
{

struct UpdaterService::Impl
{
    config::AppSettings settings;
    fs::path root;
    std::string fallbackVersion;

    UpdateDecisionService decision;
    PreserveReplaceOrchestrator orchestrator;

    mutable std::mutex infoMutex;
    UpdateAvailability availability;
    bool checked = false;
    UpdateError lastError;
    std::vector<std::string> warnings;

    Impl(config::AppSettings s, fs::path r, utils::http::GetFunction httpGet, IPackageDownloader& downloader,
         std::string fallback)
        : settings(std::move(s))
        , root(std::move(r))
        , fallbackVersion(std::move(fallback))
        , decision(std::move(httpGet))
        , orchestrator(downloader)
    {
    }

    fs::path versionFile() const { return root / settings.paths.version_file; }

    config::ModManagerConfig loadConfig() const
    {
        config::ModManagerConfig cfg;
        std::string error;
        if (config::ModManagerConfig::load((root / settings.paths.config_file).string(), cfg, error) ==
            config::LoadStatus::Invalid)
        {
            utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                                "Config file is unreadable, using defaults", error);
        }
        return cfg;
    }

    void fail(const UpdateError& error)
    {
        std::lock_guard<std::mutex> lock(infoMutex);
        lastError = error;
    }
};

UpdaterService::UpdaterService(config::AppSettings settings, fs::path installationRoot,
                               utils::http::GetFunction httpGet, IPackageDownloader& downloader,
                               std::string fallbackVersion)
    : impl_(std::make_unique<Impl>(std::move(settings), std::move(installationRoot), std::move(httpGet), downloader,
                                   std::move(fallbackVersion)))
{
}

UpdaterService::~UpdaterService() = default;

std::string UpdaterService::currentVersion() const
{
    std::string fallback = impl_->settings.update.fallback_version.empty() ? impl_->fallbackVersion
                                                                           : impl_->settings.update.fallback_version;
    return VersionRecord::currentProgramVersion(impl_->versionFile(), fallback);
}

std::string UpdaterService::updateUrl() const
{
    config::ModManagerConfig cfg = impl_->loadConfig();
    if (!cfg.updateUrl.empty())
        return cfg.updateUrl;

    VersionRecord record(impl_->versionFile());
    std::string error;
    if (record.load(error) != config::LoadStatus::Loaded)
        return {};
    return record.legacyUpdateUrl();
}

PreservationSet UpdaterService::preservationSet() const
{
    return computePreservationSet(impl_->settings.update, impl_->loadConfig(), impl_->root);
}

bool UpdaterService::checkForUpdates(UpdateAvailability& outAvailability, CheckError& outError)
{
    std::string current = currentVersion();
    std::string url = updateUrl();
    PLOG_INFO << "Update check for " << impl_->root.string() << " (current version: " << current << ")";

    if (!impl_->decision.check(url, current, outAvailability, outError))
    {
        impl_->fail(outError);
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Network, outError.message, outError.technicalInfo);
        return false;
    }

    std::lock_guard<std::mutex> lock(impl_->infoMutex);
    impl_->availability = outAvailability;
    impl_->checked = true;
    return true;
}

bool UpdaterService::applyUpdate(UpdateError& outError, PackageProgressCallback progressCallback)
{
    UpdateAvailability availability;
    {
        std::lock_guard<std::mutex> lock(impl_->infoMutex);
        availability = impl_->availability;
        if (!impl_->checked || !availability.updateAvailable())
        {
            outError = { ErrorKind::None, "No update available, run a check first", "applyUpdate: no pending update" };
            PLOG_WARNING << outError.technicalInfo;
            return false;
        }
    }

    ReplaceRequest request;
    request.downloadUrl = availability.release.downloadUrl;
    request.preservationSet = preservationSet();
    request.installationRoot = impl_->root;
    request.targetVersion = availability.release.tagVersion;
    request.versionFile = impl_->settings.paths.version_file;

    std::string preserved;
    for (const auto& name : request.preservationSet)
        preserved += (preserved.empty() ? "" : ", ") + name;
    PLOG_INFO << "Applying update " << request.targetVersion << ", preserving: " << preserved;

    // The record is not preserved; carry game_version over the replace
    VersionRecord before(impl_->versionFile());
    std::string recordError;
    if (before.load(recordError) == config::LoadStatus::Invalid)
        PLOG_WARNING << "Version record unreadable before update: " << recordError;

    impl_->orchestrator.setDownloadProgress(std::move(progressCallback));
    if (!impl_->orchestrator.replace(request, outError))
    {
        impl_->fail(outError);
        if (outError.kind == ErrorKind::Busy)
            return false;
        auto severity = outError.kind == ErrorKind::PartialUpdateRestoreAttempted ? utils::ErrorSeverity::Fatal
                                                                                   : utils::ErrorSeverity::Error;
        utils::ErrorReporter::Report(utils::ErrorCategory::Update, severity, outError.message,
                                     outError.technicalInfo);
        return false;
    }

    VersionRecord after(impl_->versionFile());
    std::string error;
    if (after.load(error) == config::LoadStatus::Invalid)
        PLOG_WARNING << "Replacing unreadable version record shipped with the release: " << error;
    after.setProgramVersion(request.targetVersion);
    if (after.gameVersion().empty())
        after.setGameVersion(before.gameVersion());
    if (!after.save(error))
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Update,
                                            "Update installed but the version record could not be written", error);
    }

    std::lock_guard<std::mutex> lock(impl_->infoMutex);
    impl_->warnings = impl_->orchestrator.lastWarnings();
    impl_->availability.status = AvailabilityStatus::UpToDate;
    impl_->availability.currentVersion = request.targetVersion;
    return true;
}

void UpdaterService::setStateCallback(StateCallback callback)
{
    impl_->orchestrator.setStateCallback(std::move(callback));
}

UpdateState UpdaterService::getState() const { return impl_->orchestrator.state(); }

UpdateAvailability UpdaterService::getAvailability() const
{
    std::lock_guard<std::mutex> lock(impl_->infoMutex);
    return impl_->availability;
}

UpdateError UpdaterService::getLastError() const
{
    std::lock_guard<std::mutex> lock(impl_->infoMutex);
    return impl_->lastError;
}

bool UpdaterService::isUpdateAvailable() const
{
    std::lock_guard<std::mutex> lock(impl_->infoMutex);
    return impl_->checked && impl_->availability.updateAvailable();
}

std::vector<std::string> UpdaterService::getVerificationWarnings() const
{
    std::lock_guard<std::mutex> lock(impl_->infoMutex);
    return impl_->warnings;
}

} // namespace updater
