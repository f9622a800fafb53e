#include "TarGzArchiveReader.hpp"

#include <plog/Log.h>
#include <zlib.h>

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstring>
#include <fstream>

namespace fs = std::filesystem;

namespace archive
{

namespace
{

// Tar Format Constants (POSIX ustar)
constexpr size_t TAR_BLOCK_SIZE = 512;
constexpr size_t COPY_CHUNK = 64 * 1024;
// Upper bound for GNU long-name and pax records, which are read into memory
constexpr std::uint64_t MAX_META_RECORD_SIZE = 1024 * 1024;

struct TarHeader
{
    char name[100];
    char mode[8];
    char uid[8];
    char gid[8];
    char size[12];
    char mtime[12];
    char checksum[8];
    char typeflag;
    char linkname[100];
    char magic[6];
    char version[2];
    char uname[32];
    char gname[32];
    char devmajor[8];
    char devminor[8];
    char prefix[155];
    char padding[12];
};
static_assert(sizeof(TarHeader) == TAR_BLOCK_SIZE, "TarHeader must be 512 bytes");

constexpr char TAR_REGTYPE = '0';
constexpr char TAR_AREGTYPE = '\0';
constexpr char TAR_CONTTYPE = '7';
constexpr char TAR_DIRTYPE = '5';
constexpr char TAR_GNU_LONGNAME = 'L';
constexpr char TAR_GNU_LONGLINK = 'K';
constexpr char TAR_PAX_HEADER = 'x';
constexpr char TAR_PAX_GLOBAL = 'g';

std::string fieldString(const char* field, size_t length)
{
    size_t n = 0;
    while (n < length && field[n] != '\0')
        ++n;
    return std::string(field, n);
}

// Parse octal value from tar header field, or GNU base-256 when the high bit is set
bool parseNumber(const char* field, size_t length, std::uint64_t& out)
{
    const auto* bytes = reinterpret_cast<const unsigned char*>(field);
    if (bytes[0] & 0x80)
    {
        std::uint64_t value = bytes[0] & 0x7F;
        for (size_t i = 1; i < length; ++i)
            value = (value << 8) | bytes[i];
        out = value;
        return true;
    }

    std::uint64_t value = 0;
    size_t i = 0;
    while (i < length && (field[i] == ' ' || field[i] == '\0'))
        ++i;
    for (; i < length && field[i] >= '0' && field[i] <= '7'; ++i)
        value = (value << 3) | static_cast<std::uint64_t>(field[i] - '0');
    for (; i < length; ++i)
    {
        if (field[i] != ' ' && field[i] != '\0')
            return false;
    }
    out = value;
    return true;
}

bool checksumMatches(const TarHeader& header)
{
    std::uint64_t stored = 0;
    if (!parseNumber(header.checksum, sizeof(header.checksum), stored))
        return false;

    const auto* bytes = reinterpret_cast<const unsigned char*>(&header);
    std::uint64_t sum = 0;
    for (size_t i = 0; i < TAR_BLOCK_SIZE; ++i)
    {
        bool inChecksum = i >= offsetof(TarHeader, checksum) && i < offsetof(TarHeader, checksum) + 8;
        sum += inChecksum ? static_cast<unsigned char>(' ') : bytes[i];
    }
    return sum == stored;
}

bool isZeroBlock(const TarHeader& header)
{
    const auto* bytes = reinterpret_cast<const unsigned char*>(&header);
    for (size_t i = 0; i < TAR_BLOCK_SIZE; ++i)
    {
        if (bytes[i] != 0)
            return false;
    }
    return true;
}

std::uint64_t paddedSize(std::uint64_t size)
{
    return (size + TAR_BLOCK_SIZE - 1) / TAR_BLOCK_SIZE * TAR_BLOCK_SIZE;
}

// "<len> path=<value>\n" records
std::string paxPath(const std::string& records)
{
    std::string path;
    size_t pos = 0;
    while (pos < records.size())
    {
        size_t space = records.find(' ', pos);
        if (space == std::string::npos)
            break;
        size_t length = 0;
        try
        {
            length = std::stoul(records.substr(pos, space - pos));
        }
        catch (const std::exception&)
        {
            break;
        }
        if (length == 0 || pos + length > records.size())
            break;

        std::string record = records.substr(space + 1, length - (space - pos) - 2);
        if (record.rfind("path=", 0) == 0)
            path = record.substr(5);
        pos += length;
    }
    return path;
}

class GzStream
{
public:
    explicit GzStream(const fs::path& path)
        : file_(gzopen(path.string().c_str(), "rb"))
    {
        if (file_)
            gzbuffer(file_, 128 * 1024);
    }

    ~GzStream()
    {
        if (file_)
            gzclose(file_);
    }

    GzStream(const GzStream&) = delete;
    GzStream& operator=(const GzStream&) = delete;

    bool isOpen() const { return file_ != nullptr; }

    // Bytes read; -1 on a stream error
    long long read(void* buffer, size_t length)
    {
        int n = gzread(file_, buffer, static_cast<unsigned>(length));
        return n;
    }

    bool readExact(void* buffer, size_t length)
    {
        return read(buffer, length) == static_cast<long long>(length);
    }

    bool skip(std::uint64_t length)
    {
        std::array<char, COPY_CHUNK> chunk{};
        while (length > 0)
        {
            size_t want = static_cast<size_t>(std::min<std::uint64_t>(length, chunk.size()));
            if (!readExact(chunk.data(), want))
                return false;
            length -= want;
        }
        return true;
    }

    std::string error()
    {
        int errnum = Z_OK;
        const char* message = gzerror(file_, &errnum);
        if (errnum == Z_OK)
            return "unexpected end of archive";
        return message ? message : "unknown zlib error";
    }

private:
    gzFile file_;
};

} // namespace

TarGzArchiveReader::TarGzArchiveReader(fs::path path)
    : path_(std::move(path))
{
}

std::unique_ptr<ArchiveReader> TarGzArchiveReader::open(const fs::path& path, std::string& outError)
{
    std::unique_ptr<TarGzArchiveReader> reader(new TarGzArchiveReader(path));

    ExtractError error;
    if (!reader->walk(&reader->entries_, nullptr, error))
    {
        outError = "Failed to read tar.gz archive " + path.string() + ": " + error.message;
        PLOG_ERROR << outError;
        return nullptr;
    }

    PLOG_INFO << "Opened tar.gz archive " << path.string() << " with " << reader->entries_.size() << " members";
    return reader;
}

bool TarGzArchiveReader::extract(const EntryTargets& targets, ExtractError& outError)
{
    return walk(nullptr, &targets, outError);
}

bool TarGzArchiveReader::walk(std::vector<ArchiveEntry>* list, const EntryTargets* targets,
                              ExtractError& outError) const
{
    GzStream stream(path_);
    if (!stream.isOpen())
    {
        outError.message = "Failed to open " + path_.string();
        return false;
    }

    std::string pendingName; // from a GNU long-name or pax record
    int zeroBlocks = 0;

    while (true)
    {
        TarHeader header{};
        long long got = stream.read(&header, sizeof(header));
        if (got == 0)
            break; // clean end without the trailing zero blocks
        if (got != static_cast<long long>(sizeof(header)))
        {
            outError.message = got < 0 ? stream.error() : "truncated tar header";
            return false;
        }

        if (isZeroBlock(header))
        {
            if (++zeroBlocks == 2)
                break;
            continue;
        }
        zeroBlocks = 0;

        if (!checksumMatches(header))
        {
            outError.message = "tar header checksum mismatch (not a tar.gz archive?)";
            return false;
        }

        std::uint64_t size = 0;
        if (!parseNumber(header.size, sizeof(header.size), size))
        {
            outError.message = "invalid size field in tar header";
            return false;
        }

        const char type = header.typeflag;

        if (type == TAR_GNU_LONGNAME || type == TAR_PAX_HEADER)
        {
            if (size > MAX_META_RECORD_SIZE)
            {
                outError.message = "oversized " + std::string(type == TAR_PAX_HEADER ? "pax" : "long-name") +
                                   " record (" + std::to_string(size) + " bytes)";
                return false;
            }
            std::string data(static_cast<size_t>(size), '\0');
            if (!stream.readExact(data.data(), data.size()) || !stream.skip(paddedSize(size) - size))
            {
                outError.message = stream.error();
                return false;
            }
            if (type == TAR_GNU_LONGNAME)
                pendingName = fieldString(data.data(), data.size());
            else if (std::string path = paxPath(data); !path.empty())
                pendingName = path;
            continue;
        }

        std::string name = pendingName;
        pendingName.clear();
        if (name.empty())
        {
            name = fieldString(header.name, sizeof(header.name));
            std::string prefix = fieldString(header.prefix, sizeof(header.prefix));
            if (std::memcmp(header.magic, "ustar", 5) == 0 && !prefix.empty())
                name = prefix + "/" + name;
        }
        if (name.rfind("./", 0) == 0)
            name.erase(0, 2);

        const bool isFile = type == TAR_REGTYPE || type == TAR_AREGTYPE || type == TAR_CONTTYPE;
        const bool isDir = type == TAR_DIRTYPE;

        if ((!isFile && !isDir) || name.empty())
        {
            if (type != TAR_PAX_GLOBAL && type != TAR_GNU_LONGLINK && !name.empty())
                PLOG_DEBUG << "Skipping tar member '" << name << "' of type '" << type << "'";
            if (!stream.skip(paddedSize(size)))
            {
                outError.message = stream.error();
                return false;
            }
            continue;
        }

        ArchiveEntry entry;
        entry.name = name;
        entry.isDirectory = isDir;
        if (isDir && entry.name.back() != '/')
            entry.name += '/';
        entry.size = isDir ? 0 : size;

        if (list)
            list->push_back(entry);

        std::vector<fs::path> dests;
        if (targets)
            dests = (*targets)(entry);

        if (dests.empty() || isDir)
        {
            if (isDir && !dests.empty() && !detail::createDirectories(dests, outError))
                return false;
            if (!stream.skip(paddedSize(size)))
            {
                outError.message = stream.error();
                return false;
            }
            continue;
        }

        if (!detail::prepareParent(dests.front(), outError))
            return false;

        std::ofstream output(dests.front(), std::ios::binary | std::ios::trunc);
        if (!output.is_open())
        {
            outError.writeFailure = true;
            outError.message = "Failed to create file: " + dests.front().string();
            return false;
        }

        std::array<char, COPY_CHUNK> chunk{};
        std::uint64_t remaining = size;
        while (remaining > 0)
        {
            size_t want = static_cast<size_t>(std::min<std::uint64_t>(remaining, chunk.size()));
            if (!stream.readExact(chunk.data(), want))
            {
                outError.message = "Failed to read '" + entry.name + "': " + stream.error();
                return false;
            }
            output.write(chunk.data(), static_cast<std::streamsize>(want));
            if (!output)
            {
                outError.writeFailure = true;
                outError.message = "Failed to write " + dests.front().string();
                return false;
            }
            remaining -= want;
        }
        output.close();

        if (!stream.skip(paddedSize(size) - size))
        {
            outError.message = stream.error();
            return false;
        }

        if (!detail::fanOut(dests, outError))
            return false;
    }

    return true;
}

} // namespace archive
