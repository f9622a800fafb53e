#pragma once

#include <filesystem>
#include <string>

namespace utils
{

class FileUtils
{
public:
    // Copies a file or directory tree, following symlinks. Links that do not
    // resolve are skipped with a warning instead of failing the copy.
    // Existing destination files are overwritten.
    static bool CopyTreeFollowingLinks(const std::filesystem::path& source, const std::filesystem::path& dest,
                                       std::string& outError);

    // Copies an entry as it is (symlinks stay symlinks) after removing
    // whatever already sits at dest.
    static bool ReplaceWithCopy(const std::filesystem::path& source, const std::filesystem::path& dest,
                                std::string& outError);

    // Removes a file, symlink or directory tree; a missing path is not an error
    static bool RemoveEntry(const std::filesystem::path& path, std::string& outError);

    // True when the relative path has no root and no ".." segment
    static bool IsContainedRelativePath(const std::filesystem::path& relative);
};

} // namespace utils
