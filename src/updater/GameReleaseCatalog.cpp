#include "GameReleaseCatalog.hpp"
#include "VersionRecord.hpp"

#include "install/ArchiveInstaller.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <cctype>

namespace updater
{

namespace
{

std::string lower(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool endsWith(const std::string& value, const std::string& suffix)
{
    return value.size() >= suffix.size() && value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

GamePlatform GamePlatform::current()
{
#ifdef _WIN32
    return { ".zip", "windows" };
#else
    return { ".tar.gz", "linux" };
#endif
}

GameReleaseCatalog::GameReleaseCatalog(utils::http::GetFunction httpGet, std::string releasesUrl,
                                       std::string experimentalUrl)
    : httpGet_(std::move(httpGet))
    , releasesUrl_(std::move(releasesUrl))
    , experimentalUrl_(std::move(experimentalUrl))
{
}

std::vector<GameRelease> GameReleaseCatalog::filterReleases(const std::vector<ReleaseRecord>& releases,
                                                            bool experimental, const GamePlatform& platform)
{
    std::vector<GameRelease> filtered;
    for (const auto& release : releases)
    {
        for (const auto& asset : release.assets)
        {
            std::string name = lower(asset.name);
            if (!endsWith(name, platform.extension) || name.find(platform.keyword) == std::string::npos ||
                name.find("tiles") == std::string::npos)
                continue;

            bool isExperimental = name.find("experimental") != std::string::npos;
            if (isExperimental != experimental)
                continue;

            GameRelease entry;
            entry.name = release.title.empty() ? release.tagName : release.title;
            entry.description = release.body.empty() ? "No changelog available." : release.body;
            entry.asset = asset;
            filtered.push_back(std::move(entry));
            break;
        }

        if (filtered.size() == kMaxEntries)
            break;
    }
    return filtered;
}

bool GameReleaseCatalog::fetch(bool experimental, std::vector<GameRelease>& outReleases, CheckError& outError) const
{
    const std::string& url = experimental ? experimentalUrl_ : releasesUrl_;
    PLOG_INFO << "Fetching game releases: " << url;

    utils::http::HttpResponse response = httpGet_(url);
    if (!response.ok())
    {
        std::string detail = response.error.empty() ? "status " + std::to_string(response.status_code) : response.error;
        outError = { ErrorKind::DownloadError, "Failed to fetch releases", "games: GET " + url + ": " + detail };
        PLOG_ERROR << outError.technicalInfo;
        return false;
    }

    std::vector<ReleaseRecord> releases;
    std::string parseError;
    bool parsed = false;
    if (experimental)
    {
        // The experimental endpoint describes a single release
        ReleaseRecord release;
        parsed = ReleaseParser::parseRelease(response.text, release, parseError);
        if (parsed)
            releases.push_back(std::move(release));
    }
    else
    {
        parsed = ReleaseParser::parseReleaseList(response.text, releases, parseError);
    }
    if (!parsed)
    {
        outError = { ErrorKind::DownloadError, "Release server sent unreadable data", parseError };
        return false;
    }

    outReleases = filterReleases(releases, experimental, GamePlatform::current());
    PLOG_INFO << "Found " << outReleases.size() << " installable game builds";
    return true;
}

bool installGameRelease(install::ArchiveInstaller& installer, const GameRelease& release,
                        const std::filesystem::path& gameDir, const std::filesystem::path& versionFile,
                        InstallError& outError)
{
    PLOG_INFO << "Installing game build " << release.name << " (" << release.asset.name << ")";
    if (!installer.installArchive(release.asset.downloadUrl, gameDir, outError))
        return false;

    std::string error;
    if (!VersionRecord::writeGameVersion(versionFile, release.name, error))
    {
        outError = { ErrorKind::WriteError, "Game installed but its version could not be recorded", error };
        return false;
    }
    return true;
}

} // namespace updater
