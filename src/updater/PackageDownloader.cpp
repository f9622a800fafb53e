#include "PackageDownloader.hpp"

#include <plog/Log.h>

#include <chrono>

namespace updater
{

PackageDownloader::PackageDownloader(utils::http::SessionConfig session)
    : session_(std::move(session))
{
}

std::string PackageDownloader::formatSpeed(double bytesPerSecond)
{
    if (bytesPerSecond < 1024)
        return std::to_string(static_cast<int>(bytesPerSecond)) + " B/s";
    if (bytesPerSecond < 1024 * 1024)
        return std::to_string(static_cast<int>(bytesPerSecond / 1024)) + " KB/s";
    return std::to_string(static_cast<int>(bytesPerSecond / (1024 * 1024))) + " MB/s";
}

bool PackageDownloader::download(const std::string& url, const std::filesystem::path& destPath,
                                 const PackageProgressCallback& progressCallback, std::string& outError)
{
    PLOG_INFO << "Starting download: " << url;

    auto startTime = std::chrono::steady_clock::now();
    std::uint64_t lastBytes = 0;
    auto lastProgressTime = startTime;
    std::uint64_t received = 0;

    utils::http::TransferProgress onProgress = [&](std::uint64_t downloadNow, std::uint64_t downloadTotal)
    {
        received = downloadNow;
        if (!progressCallback)
            return;

        auto now = std::chrono::steady_clock::now();
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - lastProgressTime).count();
        if (elapsed < 100)
            return;

        double bytesPerSecond = (downloadNow - lastBytes) * 1000.0 / elapsed;

        DownloadProgress progress;
        progress.bytesDownloaded = static_cast<size_t>(downloadNow);
        progress.totalBytes = static_cast<size_t>(downloadTotal);
        progress.percentage =
            downloadTotal > 0 ? (static_cast<float>(downloadNow) / static_cast<float>(downloadTotal)) * 100.0f : 0.0f;
        progress.speed = formatSpeed(bytesPerSecond);
        progressCallback(progress);

        lastBytes = downloadNow;
        lastProgressTime = now;
    };

    auto response = utils::http::download(url, destPath, session_, onProgress);

    if (!response.error.empty())
    {
        outError = "Network error: " + response.error;
        PLOG_ERROR << "Download of " << url << " failed: " << response.error;
        return false;
    }
    if (!response.ok())
    {
        outError = "HTTP error " + std::to_string(response.status_code);
        PLOG_ERROR << "Download of " << url << " failed with status: " << response.status_code;
        return false;
    }

    auto seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - startTime).count();
    PLOG_INFO << "Download completed: " << destPath.string() << " (" << received << " bytes, "
              << formatSpeed(seconds > 0 ? received / seconds : 0.0) << ")";
    return true;
}

} // namespace updater
