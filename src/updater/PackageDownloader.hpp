#pragma once

#include "UpdateTypes.hpp"
#include "utils/HttpCommon.hpp"

#include <filesystem>
#include <functional>
#include <string>

namespace updater
{

using PackageProgressCallback = std::function<void(const DownloadProgress&)>;

// Fetches one archive to a local file
class IPackageDownloader
{
public:
    virtual ~IPackageDownloader() = default;

    virtual bool download(const std::string& url, const std::filesystem::path& destPath,
                          const PackageProgressCallback& progressCallback, std::string& outError) = 0;
};

// HTTP downloader streaming through cpr in bounded chunks
class PackageDownloader : public IPackageDownloader
{
public:
    explicit PackageDownloader(utils::http::SessionConfig session);

    bool download(const std::string& url, const std::filesystem::path& destPath,
                  const PackageProgressCallback& progressCallback, std::string& outError) override;

    static std::string formatSpeed(double bytesPerSecond);

private:
    utils::http::SessionConfig session_;
};

} // namespace updater
