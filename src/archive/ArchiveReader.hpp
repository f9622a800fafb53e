#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace archive
{

enum class ArchiveFormat
{
    Zip,
    TarGz
};

struct ArchiveEntry
{
    std::string name; // member path with '/' separators, directories keep their trailing '/'
    bool isDirectory = false;
    std::uint64_t size = 0;
};

struct ExtractError
{
    bool writeFailure = false; // true: destination filesystem, false: archive data
    std::string message;
};

// Destinations for one member; an empty list skips the member
using EntryTargets = std::function<std::vector<std::filesystem::path>(const ArchiveEntry&)>;

class ArchiveReader
{
public:
    virtual ~ArchiveReader() = default;

    virtual ArchiveFormat format() const = 0;

    // Members in archive order
    virtual const std::vector<ArchiveEntry>& entries() const = 0;

    // Streams each selected member to its destinations. Parent directories
    // are created; directory members are created explicitly. Existing files
    // are overwritten.
    virtual bool extract(const EntryTargets& targets, ExtractError& outError) = 0;

    std::vector<std::string> memberNames() const;
};

// ".tar.gz", ".tgz" or a "/tarball/" URL select TarGz, everything else Zip
ArchiveFormat formatFromName(const std::string& name);

const char* formatExtension(ArchiveFormat format);

std::unique_ptr<ArchiveReader> openArchive(const std::filesystem::path& path, ArchiveFormat format,
                                           std::string& outError);

namespace detail
{
// Shared by the readers: creates parents, then copies the first written
// file to any further destinations.
bool prepareParent(const std::filesystem::path& dest, ExtractError& outError);
bool fanOut(const std::vector<std::filesystem::path>& dests, ExtractError& outError);
bool createDirectories(const std::vector<std::filesystem::path>& dests, ExtractError& outError);
} // namespace detail

} // namespace archive
