#include "UpdateDecisionService.hpp"
#include "Version.hpp"

#include <plog/Log.h>

namespace updater
{

UpdateDecisionService::UpdateDecisionService(utils::http::GetFunction httpGet)
    : httpGet_(std::move(httpGet))
{
}

utils::http::GetFunction UpdateDecisionService::defaultHttpGet(const utils::http::SessionConfig& session)
{
    return [session](const std::string& url)
    {
        return utils::http::get(url, { { "Accept", "application/vnd.github+json" } }, session);
    };
}

bool UpdateDecisionService::fetch(const std::string& url, utils::http::HttpResponse& outResponse,
                                  CheckError& outError)
{
    if (!httpGet_)
    {
        outError = { ErrorKind::DownloadError, "No HTTP client configured", "check: " + url };
        return false;
    }

    outResponse = httpGet_(url);
    if (!outResponse.error.empty())
    {
        outError = { ErrorKind::DownloadError, "Could not reach the update server",
                     "check: GET " + url + ": " + outResponse.error };
        PLOG_ERROR << outError.technicalInfo;
        return false;
    }
    return true;
}

bool UpdateDecisionService::fetchLatest(const std::string& updateUrl, ReleaseRecord& outRelease, bool& outFound,
                                        CheckError& outError)
{
    outFound = false;

    utils::http::HttpResponse response;
    if (!fetch(updateUrl, response, outError))
        return false;

    std::string parseError;
    if (response.status_code == 200)
    {
        if (!ReleaseParser::parseRelease(response.text, outRelease, parseError))
        {
            outError = { ErrorKind::DownloadError, "Update server sent unreadable release data", parseError };
            return false;
        }
        outFound = true;
        return true;
    }

    const std::string latestSuffix = "/releases/latest";
    size_t latest = updateUrl.rfind(latestSuffix);
    if (response.status_code != 404 || latest == std::string::npos)
    {
        outError = { ErrorKind::DownloadError, "Update check returned status " + std::to_string(response.status_code),
                     "check: GET " + updateUrl };
        PLOG_ERROR << outError.message << " (" << updateUrl << ")";
        return false;
    }

    // No "latest" release (only pre-releases published): take the newest of all
    std::string listUrl = updateUrl.substr(0, latest) + "/releases" + updateUrl.substr(latest + latestSuffix.size());
    PLOG_INFO << "No latest release at " << updateUrl << ", falling back to " << listUrl;

    if (!fetch(listUrl, response, outError))
        return false;
    if (response.status_code != 200)
    {
        outError = { ErrorKind::DownloadError, "Update check returned status " + std::to_string(response.status_code),
                     "check: GET " + listUrl };
        PLOG_ERROR << outError.message << " (" << listUrl << ")";
        return false;
    }

    std::vector<ReleaseRecord> releases;
    if (!ReleaseParser::parseReleaseList(response.text, releases, parseError))
    {
        outError = { ErrorKind::DownloadError, "Update server sent unreadable release data", parseError };
        return false;
    }
    if (releases.empty())
        return true;

    outRelease = releases.front();
    outFound = true;
    return true;
}

bool UpdateDecisionService::check(const std::string& updateUrl, const std::string& currentVersion,
                                  UpdateAvailability& outAvailability, CheckError& outError)
{
    outAvailability = UpdateAvailability{};
    outAvailability.currentVersion = currentVersion;

    if (updateUrl.empty())
    {
        PLOG_INFO << "No update URL configured, skipping update check";
        outAvailability.status = AvailabilityStatus::NotConfigured;
        return true;
    }

    PLOG_INFO << "Checking for updates: " << updateUrl;

    ReleaseRecord release;
    bool found = false;
    if (!fetchLatest(updateUrl, release, found, outError))
        return false;

    if (!found)
    {
        PLOG_INFO << "No releases published at " << updateUrl;
        outAvailability.status = AvailabilityStatus::NoReleaseFound;
        return true;
    }

    if (!ReleaseParser::toMetadata(release, outAvailability.release, outError))
        return false;

    const std::string& latest = outAvailability.release.tagVersion;
    if (Version::isNewer(currentVersion, latest))
    {
        outAvailability.status = AvailabilityStatus::UpdateAvailable;
        PLOG_INFO << "New version available: " << latest << " (current: " << currentVersion << ")";
        PLOG_INFO << "Download URL: " << outAvailability.release.downloadUrl;
    }
    else
    {
        outAvailability.status = AvailabilityStatus::UpToDate;
        PLOG_INFO << "Current version " << currentVersion << " is up to date (latest: " << latest << ")";
    }
    return true;
}

} // namespace updater
