#pragma once

#include "config/ModManagerConfig.hpp"

#include <filesystem>
#include <string>

namespace updater
{

// version.json beside the program: the tool's own version and the version of
// the separately installed game build. Keys this type does not own are kept.
class VersionRecord
{
public:
    explicit VersionRecord(std::filesystem::path path);

    // A legacy "version" key is read as program_version
    config::LoadStatus load(std::string& outError);
    bool save(std::string& outError) const;

    const std::string& programVersion() const { return programVersion_; }
    const std::string& gameVersion() const { return gameVersion_; }
    // Older records stored the self-update endpoint here
    const std::string& legacyUpdateUrl() const { return legacyUpdateUrl_; }

    void setProgramVersion(const std::string& version) { programVersion_ = version; }
    void setGameVersion(const std::string& version) { gameVersion_ = version; }

    const std::filesystem::path& path() const { return path_; }

    // program_version from the record, else the compiled-in version
    static std::string currentProgramVersion(const std::filesystem::path& path, const std::string& fallback);

    // Reads, sets one key and writes back in one step
    static bool writeProgramVersion(const std::filesystem::path& path, const std::string& version,
                                    std::string& outError);
    static bool writeGameVersion(const std::filesystem::path& path, const std::string& version,
                                 std::string& outError);

private:
    std::filesystem::path path_;
    std::string programVersion_;
    std::string gameVersion_;
    std::string legacyUpdateUrl_;
};

} // namespace updater
