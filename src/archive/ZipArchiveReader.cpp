#include "ZipArchiveReader.hpp"

#include <plog/Log.h>

#define MINIZ_NO_ZLIB_APIS
#define MINIZ_NO_ARCHIVE_WRITING_APIS
#include <miniz.h>

#include <algorithm>

namespace fs = std::filesystem;

namespace archive
{

struct ZipArchiveReader::Impl
{
    mz_zip_archive zip{};
    bool opened = false;

    ~Impl()
    {
        if (opened)
            mz_zip_reader_end(&zip);
    }

    std::string lastError()
    {
        return mz_zip_get_error_string(mz_zip_get_last_error(&zip));
    }

    bool lastErrorIsWrite()
    {
        mz_zip_error err = mz_zip_peek_last_error(&zip);
        return err == MZ_ZIP_FILE_OPEN_FAILED || err == MZ_ZIP_FILE_WRITE_FAILED || err == MZ_ZIP_FILE_CLOSE_FAILED;
    }
};

ZipArchiveReader::ZipArchiveReader()
    : impl_(std::make_unique<Impl>())
{
}

ZipArchiveReader::~ZipArchiveReader() = default;

std::unique_ptr<ArchiveReader> ZipArchiveReader::open(const fs::path& path, std::string& outError)
{
    std::unique_ptr<ZipArchiveReader> reader(new ZipArchiveReader());
    Impl& impl = *reader->impl_;

    if (!mz_zip_reader_init_file(&impl.zip, path.string().c_str(), 0))
    {
        outError = "Failed to open ZIP archive " + path.string() + ": " + impl.lastError();
        PLOG_ERROR << outError;
        return nullptr;
    }
    impl.opened = true;

    mz_uint fileCount = mz_zip_reader_get_num_files(&impl.zip);
    reader->entries_.reserve(fileCount);

    for (mz_uint i = 0; i < fileCount; ++i)
    {
        mz_zip_archive_file_stat fileStat{};
        if (!mz_zip_reader_file_stat(&impl.zip, i, &fileStat))
        {
            outError = "Failed to read file stat from ZIP " + path.string() + ": " + impl.lastError();
            PLOG_ERROR << outError;
            return nullptr;
        }

        ArchiveEntry entry;
        entry.name = fileStat.m_filename;
        std::replace(entry.name.begin(), entry.name.end(), '\\', '/');
        entry.isDirectory = fileStat.m_is_directory != 0;
        entry.size = fileStat.m_uncomp_size;
        reader->entries_.push_back(std::move(entry));
    }

    PLOG_INFO << "Opened ZIP archive " << path.string() << " with " << fileCount << " members";
    return reader;
}

bool ZipArchiveReader::extract(const EntryTargets& targets, ExtractError& outError)
{
    for (mz_uint i = 0; i < entries_.size(); ++i)
    {
        const ArchiveEntry& entry = entries_[i];
        std::vector<fs::path> dests = targets(entry);
        if (dests.empty())
            continue;

        if (entry.isDirectory)
        {
            if (!detail::createDirectories(dests, outError))
                return false;
            continue;
        }

        if (!detail::prepareParent(dests.front(), outError))
            return false;

        // miniz inflates straight into the file in chunks
        if (!mz_zip_reader_extract_to_file(&impl_->zip, i, dests.front().string().c_str(), 0))
        {
            outError.writeFailure = impl_->lastErrorIsWrite();
            outError.message = "Failed to extract '" + entry.name + "' to " + dests.front().string() + ": " +
                               impl_->lastError();
            PLOG_ERROR << outError.message;
            return false;
        }

        if (!detail::fanOut(dests, outError))
        {
            PLOG_ERROR << outError.message;
            return false;
        }
    }
    return true;
}

} // namespace archive
