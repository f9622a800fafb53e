#include "PreservationSet.hpp"

#include <plog/Log.h>

namespace fs = std::filesystem;

namespace updater
{

std::string topLevelSegmentInside(const fs::path& target, const fs::path& root)
{
    std::error_code ec;
    fs::path base = fs::weakly_canonical(root, ec);
    if (ec)
        base = fs::absolute(root, ec).lexically_normal();

    fs::path candidate = target.is_absolute() ? target : base / target;
    fs::path resolved = fs::weakly_canonical(candidate, ec);
    if (ec)
        resolved = candidate.lexically_normal();

    fs::path relative = resolved.lexically_relative(base);
    if (relative.empty())
        return {};

    std::string first = relative.begin()->string();
    if (first.empty() || first == "." || first == "..")
        return {};
    return first;
}

PreservationSet computePreservationSet(const config::UpdateSettings& settings,
                                       const config::ModManagerConfig& config,
                                       const fs::path& installationRoot)
{
    PreservationSet preserved;
    for (const auto& dir : settings.preserved_dirs)
        preserved.insert(dir);
    for (const auto& file : settings.preserved_files)
        preserved.insert(file);

    for (const std::string* configured : { &config.modInstallDir, &config.gameInstallDir, &config.backupDir })
    {
        if (configured->empty())
            continue;

        std::error_code ec;
        fs::path target = fs::path(*configured).is_absolute() ? fs::path(*configured)
                                                              : installationRoot / *configured;
        if (!fs::exists(target, ec))
            continue;

        std::string segment = topLevelSegmentInside(target, installationRoot);
        if (!segment.empty() && preserved.insert(segment).second)
            PLOG_INFO << "Preserving '" << segment << "' (configured path " << *configured << ")";
    }
    return preserved;
}

} // namespace updater
