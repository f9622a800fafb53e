#pragma once

#include "ArchiveReader.hpp"

namespace archive
{

// Gzip-compressed tar (ustar, GNU long names, pax path records) through zlib.
// Only regular files and directories are listed; links and device nodes
// are skipped.
class TarGzArchiveReader : public ArchiveReader
{
public:
    ~TarGzArchiveReader() override = default;

    static std::unique_ptr<ArchiveReader> open(const std::filesystem::path& path, std::string& outError);

    ArchiveFormat format() const override { return ArchiveFormat::TarGz; }
    const std::vector<ArchiveEntry>& entries() const override { return entries_; }
    bool extract(const EntryTargets& targets, ExtractError& outError) override;

private:
    explicit TarGzArchiveReader(std::filesystem::path path);

    // One sequential pass over the stream; lists members, extracts them, or both
    bool walk(std::vector<ArchiveEntry>* list, const EntryTargets* targets, ExtractError& outError) const;

    std::filesystem::path path_;
    std::vector<ArchiveEntry> entries_;
};

} // namespace archive
