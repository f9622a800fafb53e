#include "ReleaseParser.hpp"
#include "Version.hpp"

#include <nlohmann/json.hpp>
#include <plog/Log.h>

#include <algorithm>
#include <cctype>

using json = nlohmann::json;

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

// GitHub sends null for unset strings
std::string stringField(const json& object, const char* key)
{
    auto it = object.find(key);
    if (it == object.end() || !it->is_string())
        return {};
    return it->get<std::string>();
}

ReleaseRecord fromJson(const json& releaseJson)
{
    ReleaseRecord release;
    release.tagName = stringField(releaseJson, "tag_name");
    release.title = stringField(releaseJson, "name");
    release.body = stringField(releaseJson, "body");
    release.zipballUrl = stringField(releaseJson, "zipball_url");
    release.tarballUrl = stringField(releaseJson, "tarball_url");
    release.prerelease = releaseJson.value("prerelease", false);

    if (releaseJson.contains("assets") && releaseJson["assets"].is_array())
    {
        for (const auto& assetJson : releaseJson["assets"])
        {
            ReleaseAsset asset;
            asset.name = stringField(assetJson, "name");
            asset.downloadUrl = stringField(assetJson, "browser_download_url");

            if (asset.downloadUrl.empty())
            {
                PLOG_WARNING << "Skipping release asset without download URL: " << asset.name;
                continue;
            }
            release.assets.push_back(std::move(asset));
        }
    }
    return release;
}

} // namespace

bool ReleaseParser::parseRelease(const std::string& jsonContent, ReleaseRecord& outRelease, std::string& outError)
{
    try
    {
        json releaseJson = json::parse(jsonContent);
        if (!releaseJson.is_object())
        {
            outError = "Release metadata is not a JSON object";
            return false;
        }
        outRelease = fromJson(releaseJson);
        return true;
    }
    catch (const json::exception& e)
    {
        outError = std::string("JSON parse error: ") + e.what();
        PLOG_ERROR << outError;
        return false;
    }
}

bool ReleaseParser::parseReleaseList(const std::string& jsonContent, std::vector<ReleaseRecord>& outReleases,
                                     std::string& outError)
{
    try
    {
        json listJson = json::parse(jsonContent);
        if (!listJson.is_array())
        {
            outError = "Release list is not a JSON array";
            return false;
        }

        outReleases.clear();
        for (const auto& releaseJson : listJson)
        {
            if (releaseJson.is_object())
                outReleases.push_back(fromJson(releaseJson));
        }
        return true;
    }
    catch (const json::exception& e)
    {
        outError = std::string("JSON parse error: ") + e.what();
        PLOG_ERROR << outError;
        return false;
    }
}

std::string ReleaseParser::resolveVersion(const ReleaseRecord& release)
{
    std::string tag = release.tagName;
    if (!tag.empty() && (tag[0] == 'v' || tag[0] == 'V'))
        tag.erase(0, 1);

    bool placeholder = std::none_of(tag.begin(), tag.end(), [](unsigned char c) { return std::isdigit(c); });
    if (!placeholder)
        return tag;

    std::string fromTitle = Version::extractDotted(release.title);
    if (!fromTitle.empty())
        PLOG_INFO << "Release tag '" << release.tagName << "' carries no version, using " << fromTitle
                  << " from the title";
    return fromTitle;
}

std::string ReleaseParser::preferredDownloadUrl(const ReleaseRecord& release)
{
    for (const auto& asset : release.assets)
    {
        std::string name = lower(asset.name);
        if (name.size() >= 4 && name.compare(name.size() - 4, 4, ".zip") == 0)
            return asset.downloadUrl;
    }
    if (!release.zipballUrl.empty())
        return release.zipballUrl;
    return release.tarballUrl;
}

bool ReleaseParser::isExperimental(const ReleaseRecord& release)
{
    return release.prerelease || lower(release.title).find("experimental") != std::string::npos ||
           lower(release.tagName).find("experimental") != std::string::npos;
}

bool ReleaseParser::toMetadata(const ReleaseRecord& release, ReleaseMetadata& outMetadata, CheckError& outError)
{
    std::string version = resolveVersion(release);
    if (version.empty())
    {
        outError = { ErrorKind::VersionUnresolvable, "Could not determine the release version",
                     "tag '" + release.tagName + "', title '" + release.title + "'" };
        PLOG_ERROR << "Release check: " << outError.message << " (" << outError.technicalInfo << ")";
        return false;
    }

    outMetadata.tagVersion = version;
    outMetadata.title = release.title;
    outMetadata.releaseNotes = release.body;
    outMetadata.downloadUrl = preferredDownloadUrl(release);
    outMetadata.isExperimental = isExperimental(release);
    return true;
}

} // namespace updater
