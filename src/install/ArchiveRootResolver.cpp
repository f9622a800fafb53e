#include "ArchiveRootResolver.hpp"

#include "utils/FileUtils.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <set>

namespace install
{

namespace
{

std::string trimSlashes(const std::string& value)
{
    size_t first = value.find_first_not_of("/\\");
    if (first == std::string::npos)
        return {};
    size_t last = value.find_last_not_of("/\\");
    return value.substr(first, last - first + 1);
}

std::string lastSegment(const std::string& path)
{
    std::string trimmed = trimSlashes(path);
    size_t slash = trimmed.rfind('/');
    return slash == std::string::npos ? trimmed : trimmed.substr(slash + 1);
}

} // namespace

std::string ArchiveRootResolver::wrapperPrefix(const std::vector<std::string>& members, bool looseFilesBlockWrapper)
{
    std::set<std::string> topLevel;
    for (const auto& member : members)
    {
        size_t slash = member.find('/');
        if (slash == std::string::npos && looseFilesBlockWrapper && !member.empty())
            return {};
        // Otherwise bare top-level files say nothing about wrapping
        if (slash == std::string::npos || slash == 0)
            continue;
        topLevel.insert(member.substr(0, slash));
        if (topLevel.size() > 1)
            return {};
    }

    if (topLevel.size() == 1)
        return *topLevel.begin() + "/";
    return {};
}

std::optional<std::string> ArchiveRootResolver::relativePath(const std::string& member, const std::string& prefix)
{
    if (member.size() <= prefix.size() || member.compare(0, prefix.size(), prefix) != 0)
        return std::nullopt;

    std::string relative = member.substr(prefix.size());
    while (!relative.empty() && relative.back() == '/')
        relative.pop_back();
    if (relative.empty())
        return std::nullopt;

    if (!utils::FileUtils::IsContainedRelativePath(relative))
        return std::nullopt;
    return relative;
}

bool ArchiveRootResolver::resolve(const std::vector<std::string>& members, const ResolveRequest& request,
                                  ResolvedRoot& outResolved, updater::InstallError& outError)
{
    using updater::ErrorKind;

    outResolved = ResolvedRoot{};
    std::string prefix = wrapperPrefix(members, request.looseFilesBlockWrapper);
    if (!prefix.empty())
        PLOG_DEBUG << "Archive wrapper folder: " << prefix;

    std::string subpath = trimSlashes(request.contentSubpath);
    std::replace(subpath.begin(), subpath.end(), '\\', '/');
    if (!subpath.empty())
    {
        if (!utils::FileUtils::IsContainedRelativePath(subpath))
        {
            outError = { ErrorKind::ContentNotFound, "Invalid subfolder '" + request.contentSubpath + "'",
                         "resolve: subpath leaves the archive root" };
            return false;
        }
        prefix += subpath + "/";
    }

    bool anyMember = std::any_of(members.begin(), members.end(),
                                 [&](const std::string& m) { return relativePath(m, prefix).has_value(); });
    if (!anyMember)
    {
        std::string message = subpath.empty() ? "No files found in archive"
                                              : "Subfolder '" + subpath + "' not found in archive";
        outError = { ErrorKind::ContentNotFound, message, "resolve: no member under prefix '" + prefix + "'" };
        PLOG_WARNING << outError.technicalInfo;
        return false;
    }

    outResolved.rootPrefix = prefix;

    if (!request.autoDetect || !subpath.empty())
    {
        outResolved.packages.push_back({ prefix, "" });
        return true;
    }

    std::set<std::string> seen;
    for (const auto& member : members)
    {
        if (!member.empty() && member.back() == '/')
            continue;
        auto relative = relativePath(member, prefix);
        if (!relative || lastSegment(*relative) != request.markerFile)
            continue;

        size_t slash = relative->rfind('/');
        std::string dir = slash == std::string::npos ? std::string() : relative->substr(0, slash);

        PackageRoot package;
        package.prefix = dir.empty() ? prefix : prefix + dir + "/";
        if (!dir.empty())
            package.folderName = lastSegment(dir);
        else if (!prefix.empty())
            package.folderName = lastSegment(prefix);
        else
            package.folderName = request.fallbackFolderName;

        if (seen.insert(package.prefix).second)
        {
            PLOG_DEBUG << "Detected package root '" << package.prefix << "' -> " << package.folderName;
            outResolved.packages.push_back(std::move(package));
        }
    }

    if (outResolved.packages.empty())
    {
        outError = { ErrorKind::ContentNotFound, "No " + request.markerFile + " found in archive",
                     "resolve: auto-detect found no marker under '" + prefix + "'" };
        PLOG_WARNING << outError.technicalInfo;
        return false;
    }
    return true;
}

} // namespace install
