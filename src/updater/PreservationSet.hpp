#pragma once

#include "config/AppSettings.hpp"
#include "config/ModManagerConfig.hpp"

#include <filesystem>
#include <set>
#include <string>

namespace updater
{

using PreservationSet = std::set<std::string>;

// Top-level names under installationRoot that a self-update must keep:
// the configured base dirs and files, plus the first segment of every config
// path (mod, game and backup dirs) that resolves inside the root.
PreservationSet computePreservationSet(const config::UpdateSettings& settings,
                                       const config::ModManagerConfig& config,
                                       const std::filesystem::path& installationRoot);

// First path segment of target below root, empty when target is not inside it
std::string topLevelSegmentInside(const std::filesystem::path& target, const std::filesystem::path& root);

} // namespace updater
