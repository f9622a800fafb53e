#pragma once

#include "PackageDownloader.hpp"
#include "PreservationSet.hpp"
#include "PreserveReplaceOrchestrator.hpp"
#include "UpdateTypes.hpp"
#include "config/AppSettings.hpp"
#include "utils/HttpCommon.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace updater
{

// Self-update of one installation root: release check, preservation set,
// preserve/replace and the version record rewrite
class UpdaterService
{
public:
    UpdaterService(config::AppSettings settings, std::filesystem::path installationRoot,
                   utils::http::GetFunction httpGet, IPackageDownloader& downloader, std::string fallbackVersion);
    ~UpdaterService();

    // Disable copy
    UpdaterService(const UpdaterService&) = delete;
    UpdaterService& operator=(const UpdaterService&) = delete;

    // program_version of the version record, else the fallback
    std::string currentVersion() const;

    // update_url of the config record, else the legacy key of the version record
    std::string updateUrl() const;

    PreservationSet preservationSet() const;

    bool checkForUpdates(UpdateAvailability& outAvailability, CheckError& outError);

    // Requires a previous check that found an update
    bool applyUpdate(UpdateError& outError, PackageProgressCallback progressCallback = nullptr);

    void setStateCallback(StateCallback callback);

    // State queries (thread-safe)
    UpdateState getState() const;
    UpdateAvailability getAvailability() const;
    UpdateError getLastError() const;
    bool isUpdateAvailable() const;
    std::vector<std::string> getVerificationWarnings() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace updater
