#pragma once

#include "UpdateTypes.hpp"

#include <string>
#include <vector>

namespace updater
{

struct ReleaseAsset
{
    std::string name;
    std::string downloadUrl;
};

// Fields of one releases-API entry that the updater reads
struct ReleaseRecord
{
    std::string tagName;
    std::string title;
    std::string body;
    std::string zipballUrl;
    std::string tarballUrl;
    bool prerelease = false;
    std::vector<ReleaseAsset> assets;
};

// Parser for GitHub-style release JSON
class ReleaseParser
{
public:
    // Single release object
    static bool parseRelease(const std::string& jsonContent, ReleaseRecord& outRelease, std::string& outError);

    // Array of release objects, newest first as the API returns them
    static bool parseReleaseList(const std::string& jsonContent, std::vector<ReleaseRecord>& outReleases,
                                 std::string& outError);

    // Tag without its leading 'v'; when the tag is a placeholder (empty or no
    // digit) the first dotted number of the title. Empty when neither works.
    static std::string resolveVersion(const ReleaseRecord& release);

    // First ".zip" asset, then the zip snapshot, then the tarball snapshot
    static std::string preferredDownloadUrl(const ReleaseRecord& release);

    static bool isExperimental(const ReleaseRecord& release);

    static bool toMetadata(const ReleaseRecord& release, ReleaseMetadata& outMetadata, CheckError& outError);
};

} // namespace updater
