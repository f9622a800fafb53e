#pragma once

#include "ReleaseParser.hpp"
#include "UpdateTypes.hpp"
#include "utils/HttpCommon.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace install
{
class ArchiveInstaller;
}

namespace updater
{

// Which release asset fits this machine
struct GamePlatform
{
    std::string extension; // ".zip" or ".tar.gz"
    std::string keyword; // "windows" or "linux"

    static GamePlatform current();
};

struct GameRelease
{
    std::string name; // release title, recorded as game_version once installed
    std::string description;
    ReleaseAsset asset;
};

// Installable builds of the game, newest first
class GameReleaseCatalog
{
public:
    static constexpr size_t kMaxEntries = 10;

    GameReleaseCatalog(utils::http::GetFunction httpGet, std::string releasesUrl, std::string experimentalUrl);

    bool fetch(bool experimental, std::vector<GameRelease>& outReleases, CheckError& outError) const;

    // Per release the first tiles asset for the platform. Experimental assets
    // only when asked for, and then nothing else.
    static std::vector<GameRelease> filterReleases(const std::vector<ReleaseRecord>& releases, bool experimental,
                                                   const GamePlatform& platform);

private:
    utils::http::GetFunction httpGet_;
    std::string releasesUrl_;
    std::string experimentalUrl_;
};

// Unpacks the build into gameDir (wrapper folder stripped) and records its
// name as game_version in the version record
bool installGameRelease(install::ArchiveInstaller& installer, const GameRelease& release,
                        const std::filesystem::path& gameDir, const std::filesystem::path& versionFile,
                        InstallError& outError);

} // namespace updater
