#pragma once

#include <filesystem>
#include <string>

namespace utils
{

// Fresh private directory under the system temp path, removed with
// everything in it when the object goes out of scope.
class ScratchDirectory
{
public:
    explicit ScratchDirectory(const std::string& tag);
    ~ScratchDirectory();

    ScratchDirectory(const ScratchDirectory&) = delete;
    ScratchDirectory& operator=(const ScratchDirectory&) = delete;

    // False when the directory could not be created; error() has the reason
    bool valid() const { return !path_.empty(); }
    const std::string& error() const { return error_; }

    const std::filesystem::path& path() const { return path_; }
    std::filesystem::path operator/(const std::filesystem::path& child) const { return path_ / child; }

    // Keep the directory on disk after destruction
    void release() { released_ = true; }

private:
    std::filesystem::path path_;
    std::string error_;
    bool released_ = false;
};

} // namespace utils
