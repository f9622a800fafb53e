#include "ArchiveReader.hpp"
#include "TarGzArchiveReader.hpp"
#include "ZipArchiveReader.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <cctype>

namespace fs = std::filesystem;

namespace archive
{

namespace
{

bool endsWith(const std::string& value, const std::string& suffix)
{
    return value.size() >= suffix.size() && value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

std::vector<std::string> ArchiveReader::memberNames() const
{
    std::vector<std::string> names;
    names.reserve(entries().size());
    for (const auto& entry : entries())
        names.push_back(entry.name);
    return names;
}

ArchiveFormat formatFromName(const std::string& name)
{
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    // Ignore any query string on URLs
    if (auto query = lowered.find('?'); query != std::string::npos)
        lowered.erase(query);

    if (endsWith(lowered, ".tar.gz") || endsWith(lowered, ".tgz") || lowered.find("/tarball/") != std::string::npos)
        return ArchiveFormat::TarGz;
    return ArchiveFormat::Zip;
}

const char* formatExtension(ArchiveFormat format)
{
    return format == ArchiveFormat::TarGz ? ".tar.gz" : ".zip";
}

std::unique_ptr<ArchiveReader> openArchive(const fs::path& path, ArchiveFormat format, std::string& outError)
{
    std::error_code ec;
    if (!fs::is_regular_file(path, ec))
    {
        outError = "Archive does not exist: " + path.string();
        PLOG_ERROR << outError;
        return nullptr;
    }

    if (format == ArchiveFormat::TarGz)
        return TarGzArchiveReader::open(path, outError);
    return ZipArchiveReader::open(path, outError);
}

namespace detail
{

bool prepareParent(const fs::path& dest, ExtractError& outError)
{
    std::error_code ec;
    fs::create_directories(dest.parent_path(), ec);
    if (ec)
    {
        outError.writeFailure = true;
        outError.message = "Failed to create directory " + dest.parent_path().string() + ": " + ec.message();
        return false;
    }
    return true;
}

bool fanOut(const std::vector<fs::path>& dests, ExtractError& outError)
{
    for (size_t i = 1; i < dests.size(); ++i)
    {
        if (!prepareParent(dests[i], outError))
            return false;

        std::error_code ec;
        fs::copy_file(dests.front(), dests[i], fs::copy_options::overwrite_existing, ec);
        if (ec)
        {
            outError.writeFailure = true;
            outError.message = "Failed to write " + dests[i].string() + ": " + ec.message();
            return false;
        }
    }
    return true;
}

bool createDirectories(const std::vector<fs::path>& dests, ExtractError& outError)
{
    for (const auto& dest : dests)
    {
        std::error_code ec;
        fs::create_directories(dest, ec);
        if (ec)
        {
            outError.writeFailure = true;
            outError.message = "Failed to create directory " + dest.string() + ": " + ec.message();
            return false;
        }
    }
    return true;
}

} // namespace detail

} // namespace archive
