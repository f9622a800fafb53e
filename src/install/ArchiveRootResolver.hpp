#pragma once

#include "updater/UpdateTypes.hpp"

#include <optional>
#include <string>
#include <vector>

namespace install
{

struct ResolveRequest
{
    std::string contentSubpath; // optional package root inside the archive
    bool autoDetect = false; // look for marker files below the root
    std::string markerFile = "modinfo.json";
    std::string fallbackFolderName; // name for a package whose marker sits at the archive root
    bool looseFilesBlockWrapper = false; // a bare top-level file means there is no wrapper folder
};

// One installable package inside an archive
struct PackageRoot
{
    std::string prefix; // member prefix to strip, ends with '/' unless empty
    std::string folderName; // destination folder; empty means install directly into the base
};

struct ResolvedRoot
{
    std::string rootPrefix;
    std::vector<PackageRoot> packages; // several when auto-detect finds several markers
};

// Turns a flat member list into the prefix(es) to strip before writing
class ArchiveRootResolver
{
public:
    // "name/" when every nested member shares one first segment, else "".
    // With looseFilesBlockWrapper set, any bare top-level file also gives "".
    static std::string wrapperPrefix(const std::vector<std::string>& members, bool looseFilesBlockWrapper = false);

    static bool resolve(const std::vector<std::string>& members, const ResolveRequest& request,
                        ResolvedRoot& outResolved, updater::InstallError& outError);

    // Member path with the prefix stripped. nullopt for members outside the
    // prefix, for the prefix itself and for paths that would leave the
    // destination (absolute or containing "..").
    static std::optional<std::string> relativePath(const std::string& member, const std::string& prefix);
};

} // namespace install
