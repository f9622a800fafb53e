#pragma once

#include "ArchiveRootResolver.hpp"
#include "config/AppSettings.hpp"
#include "config/ModTypes.hpp"
#include "updater/PackageDownloader.hpp"
#include "updater/UpdateTypes.hpp"
#include "utils/ScratchDirectory.hpp"

#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace install
{

// index (0-based), total, mod about to be installed
using BatchProgressCallback = std::function<void(size_t, size_t, const config::Mod&)>;

// Downloads content archives and writes the resolved package files under an
// install root. Re-running an install overwrites member by member; files left
// over from a differently shaped earlier archive are not removed.
class ArchiveInstaller
{
public:
    ArchiveInstaller(config::ContentSettings content, updater::IPackageDownloader& downloader);

    bool install(const config::Mod& mod, const std::filesystem::path& installRoot, updater::InstallError& outError);

    // Sequential; a failing package is recorded and the batch carries on
    updater::BatchInstallSummary installAll(const std::vector<config::Mod>& mods,
                                            const std::filesystem::path& installRoot,
                                            const BatchProgressCallback& progress = nullptr);

    // Whole archive minus its wrapper folder into destination, no marker detection
    bool installArchive(const std::string& url, const std::filesystem::path& destination,
                        updater::InstallError& outError);

    // installRoot/installSubpath, or the content-type folder when unset or "."
    std::filesystem::path destinationFor(const config::Mod& mod, const std::filesystem::path& installRoot) const;

    void setDownloadProgress(updater::PackageProgressCallback callback) { downloadProgress_ = std::move(callback); }

private:
    bool installFromUrl(const std::string& url, const ResolveRequest& request, const std::filesystem::path& destBase,
                        updater::InstallError& outError);
    bool downloadAndExtract(const std::string& url, const ResolveRequest& request,
                            const std::filesystem::path& destBase, utils::ScratchDirectory& scratch,
                            updater::InstallError& outError);

    config::ContentSettings content_;
    updater::IPackageDownloader& downloader_;
    updater::PackageProgressCallback downloadProgress_;
};

// Folder name used when a package marker sits at the archive root
std::string packageNameFromUrl(const std::string& url);

} // namespace install
