#pragma once

#include "updater/PackageDownloader.hpp"

#include <filesystem>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace test_utils {

// Serves "downloads" from local files registered per URL
class LocalFileDownloader : public updater::IPackageDownloader {
public:
    void serve(const std::string& url, const std::filesystem::path& file) { files_[url] = file; }
    void failOn(const std::string& url) { failing_.insert(url); }

    bool download(const std::string& url, const std::filesystem::path& destPath,
                  const updater::PackageProgressCallback& progressCallback, std::string& outError) override {
        requested_.push_back(url);

        auto it = files_.find(url);
        if (failing_.count(url) != 0 || it == files_.end()) {
            outError = "HTTP 404 for " + url;
            return false;
        }

        std::error_code ec;
        std::filesystem::copy_file(it->second, destPath, std::filesystem::copy_options::overwrite_existing, ec);
        if (ec) {
            outError = ec.message();
            return false;
        }

        if (progressCallback) {
            updater::DownloadProgress progress;
            progress.bytesDownloaded = static_cast<size_t>(std::filesystem::file_size(destPath, ec));
            progress.totalBytes = progress.bytesDownloaded;
            progress.percentage = 100.0f;
            progressCallback(progress);
        }
        return true;
    }

    const std::vector<std::string>& requested() const { return requested_; }

private:
    std::map<std::string, std::filesystem::path> files_;
    std::set<std::string> failing_;
    std::vector<std::string> requested_;
};

}  // namespace test_utils
