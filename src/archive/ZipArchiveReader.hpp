#pragma once

#include "ArchiveReader.hpp"

namespace archive
{

// ZIP reading through miniz
class ZipArchiveReader : public ArchiveReader
{
public:
    ~ZipArchiveReader() override;

    static std::unique_ptr<ArchiveReader> open(const std::filesystem::path& path, std::string& outError);

    ArchiveFormat format() const override { return ArchiveFormat::Zip; }
    const std::vector<ArchiveEntry>& entries() const override { return entries_; }
    bool extract(const EntryTargets& targets, ExtractError& outError) override;

private:
    ZipArchiveReader();

    struct Impl;
    std::unique_ptr<Impl> impl_;
    std::vector<ArchiveEntry> entries_;
};

} // namespace archive
