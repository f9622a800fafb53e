#include "ArchiveInstaller.hpp"
#include "ModSource.hpp"

#include "archive/ArchiveReader.hpp"
#include "utils/FileUtils.hpp"
#include "utils/ScratchDirectory.hpp"

#include <plog/Log.h>

namespace fs = std::filesystem;

namespace install
{

using updater::ErrorKind;
using updater::InstallError;

std::string packageNameFromUrl(const std::string& url)
{
    std::string name = displayName(url);
    if (name != url)
        return name.substr(name.find('/') + 1);

    std::string path = url.substr(0, url.find('?'));
    while (!path.empty() && path.back() == '/')
        path.pop_back();
    std::string file = path.substr(path.rfind('/') + 1);

    for (const char* ext : { ".tar.gz", ".tgz", ".zip" })
    {
        std::string suffix(ext);
        if (file.size() > suffix.size() && file.compare(file.size() - suffix.size(), suffix.size(), suffix) == 0)
        {
            file.erase(file.size() - suffix.size());
            break;
        }
    }
    return file.empty() ? "package" : file;
}

ArchiveInstaller::ArchiveInstaller(config::ContentSettings content, updater::IPackageDownloader& downloader)
    : content_(std::move(content))
    , downloader_(downloader)
{
}

fs::path ArchiveInstaller::destinationFor(const config::Mod& mod, const fs::path& installRoot) const
{
    if (mod.installSubpath.empty() || mod.installSubpath == ".")
    {
        switch (mod.contentType)
        {
        case config::ContentType::Tileset:
            return installRoot / content_.tileset_dir;
        case config::ContentType::Soundpack:
            return installRoot / content_.soundpack_dir;
        case config::ContentType::Mod:
            break;
        }
        return installRoot / content_.mod_dir;
    }

    fs::path subpath(mod.installSubpath);
    if (subpath.is_absolute())
        return subpath;
    return installRoot / subpath;
}

bool ArchiveInstaller::install(const config::Mod& mod, const fs::path& installRoot, InstallError& outError)
{
    std::string url = normalizeSourceUrl(mod.sourceUrl);
    if (url.empty())
    {
        outError = { ErrorKind::DownloadError, "Mod has no source URL", "install: empty sourceUrl" };
        PLOG_ERROR << outError.technicalInfo;
        return false;
    }

    ResolveRequest request;
    request.contentSubpath = mod.contentSubpath;
    request.autoDetect = !mod.preserveOriginalLayout;
    request.markerFile = content_.marker_file;
    request.fallbackFolderName = packageNameFromUrl(url);

    fs::path destBase = destinationFor(mod, installRoot);
    PLOG_INFO << "Installing " << displayName(url) << " into " << destBase.string();
    return installFromUrl(url, request, destBase, outError);
}

bool ArchiveInstaller::installArchive(const std::string& url, const fs::path& destination, InstallError& outError)
{
    PLOG_INFO << "Installing archive " << url << " into " << destination.string();
    return installFromUrl(url, ResolveRequest{}, destination, outError);
}

updater::BatchInstallSummary ArchiveInstaller::installAll(const std::vector<config::Mod>& mods,
                                                          const fs::path& installRoot,
                                                          const BatchProgressCallback& progress)
{
    updater::BatchInstallSummary summary;
    for (size_t i = 0; i < mods.size(); ++i)
    {
        const config::Mod& mod = mods[i];
        if (progress)
            progress(i, mods.size(), mod);

        InstallError error;
        if (install(mod, installRoot, error))
        {
            ++summary.successCount;
            continue;
        }

        std::string name = displayName(normalizeSourceUrl(mod.sourceUrl));
        PLOG_WARNING << "Batch install: " << name << " failed (" << updater::errorKindToString(error.kind)
                     << "): " << error.message;
        summary.failures.push_back({ name.empty() ? "(unnamed)" : name, error.message });
    }

    PLOG_INFO << "Batch install finished: " << summary.successCount << " succeeded, " << summary.failures.size()
              << " failed";
    return summary;
}

bool ArchiveInstaller::installFromUrl(const std::string& url, const ResolveRequest& request, const fs::path& destBase,
                                      InstallError& outError)
{
    utils::ScratchDirectory scratch("install");
    if (!scratch.valid())
    {
        outError = { ErrorKind::WriteError, "Could not create a temporary directory", scratch.error() };
        PLOG_ERROR << "install: " << scratch.error();
        return false;
    }

    try
    {
        return downloadAndExtract(url, request, destBase, scratch, outError);
    }
    catch (const fs::filesystem_error& e)
    {
        outError = { ErrorKind::WriteError, "Could not write package files", e.what() };
    }
    catch (const std::exception& e)
    {
        outError = { ErrorKind::ArchiveError, "Archive could not be processed", e.what() };
    }
    PLOG_ERROR << "install: exception while installing " << url << ": " << outError.technicalInfo;
    return false;
}

bool ArchiveInstaller::downloadAndExtract(const std::string& url, const ResolveRequest& request,
                                          const fs::path& destBase, utils::ScratchDirectory& scratch,
                                          InstallError& outError)
{
    archive::ArchiveFormat format = archive::formatFromName(url);
    fs::path archivePath = scratch / (std::string("package") + archive::formatExtension(format));

    std::string error;
    if (!downloader_.download(url, archivePath, downloadProgress_, error))
    {
        outError = { ErrorKind::DownloadError, "Download failed: " + error, "install: download " + url };
        return false;
    }

    auto reader = archive::openArchive(archivePath, format, error);
    if (!reader)
    {
        outError = { ErrorKind::ArchiveError, "Downloaded file is not a valid archive", error };
        return false;
    }

    ResolvedRoot resolved;
    if (!ArchiveRootResolver::resolve(reader->memberNames(), request, resolved, outError))
        return false;

    size_t filesWritten = 0;
    archive::EntryTargets targets = [&](const archive::ArchiveEntry& entry)
    {
        std::vector<fs::path> dests;
        for (const auto& package : resolved.packages)
        {
            auto relative = ArchiveRootResolver::relativePath(entry.name, package.prefix);
            if (!relative)
                continue;
            fs::path base = package.folderName.empty() ? destBase : destBase / package.folderName;
            dests.push_back(base / fs::path(*relative));
        }

        if (dests.empty() && !utils::FileUtils::IsContainedRelativePath(entry.name))
            PLOG_WARNING << "Skipping unsafe archive member: " << entry.name;
        else if (!dests.empty() && !entry.isDirectory)
            ++filesWritten;
        return dests;
    };

    archive::ExtractError extractError;
    if (!reader->extract(targets, extractError))
    {
        if (extractError.writeFailure)
            outError = { ErrorKind::WriteError, "Could not write package files", extractError.message };
        else
            outError = { ErrorKind::ArchiveError, "Archive is corrupt", extractError.message };
        PLOG_ERROR << "install: extract into " << destBase.string() << ": " << extractError.message;
        return false;
    }

    PLOG_INFO << "Installed " << filesWritten << " files from " << url << " into " << destBase.string();
    return true;
}

} // namespace install
