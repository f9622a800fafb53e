#include "FileUtils.hpp"

#include <plog/Log.h>

namespace fs = std::filesystem;

namespace utils
{

namespace
{

bool copyResolved(const fs::path& source, const fs::path& dest, std::string& outError)
{
    std::error_code ec;
    fs::file_status status = fs::status(source, ec);
    if (ec || !fs::exists(status))
    {
        PLOG_WARNING << "Skipping unresolvable symlink: " << source.string();
        return true;
    }

    if (fs::is_directory(status))
    {
        fs::create_directories(dest, ec);
        if (ec)
        {
            outError = "Failed to create directory " + dest.string() + ": " + ec.message();
            return false;
        }

        fs::directory_iterator it(source, ec);
        if (ec)
        {
            outError = "Failed to list " + source.string() + ": " + ec.message();
            return false;
        }
        for (const auto& entry : it)
        {
            if (!copyResolved(entry.path(), dest / entry.path().filename(), outError))
                return false;
        }
        return true;
    }

    if (!fs::is_regular_file(status))
    {
        PLOG_WARNING << "Skipping special file: " << source.string();
        return true;
    }

    fs::copy_file(source, dest, fs::copy_options::overwrite_existing, ec);
    if (ec)
    {
        outError = "Failed to copy " + source.string() + " to " + dest.string() + ": " + ec.message();
        return false;
    }
    return true;
}

} // namespace

bool FileUtils::CopyTreeFollowingLinks(const fs::path& source, const fs::path& dest, std::string& outError)
{
    return copyResolved(source, dest, outError);
}

bool FileUtils::ReplaceWithCopy(const fs::path& source, const fs::path& dest, std::string& outError)
{
    if (!RemoveEntry(dest, outError))
        return false;

    std::error_code ec;
    fs::copy(source, dest, fs::copy_options::recursive | fs::copy_options::copy_symlinks, ec);
    if (ec)
    {
        outError = "Failed to copy " + source.string() + " to " + dest.string() + ": " + ec.message();
        return false;
    }
    return true;
}

bool FileUtils::RemoveEntry(const fs::path& path, std::string& outError)
{
    std::error_code ec;
    fs::file_status status = fs::symlink_status(path, ec);
    if (ec || !fs::exists(status))
        return true;

    fs::remove_all(path, ec);
    if (ec)
    {
        outError = "Failed to remove " + path.string() + ": " + ec.message();
        return false;
    }
    return true;
}

bool FileUtils::IsContainedRelativePath(const fs::path& relative)
{
    if (relative.empty() || relative.has_root_path())
        return false;

    for (const auto& part : relative)
    {
        if (part == "..")
            return false;
    }
    return true;
}

} // namespace utils
