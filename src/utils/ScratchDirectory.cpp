#include "ScratchDirectory.hpp"

#include <plog/Log.h>

#include <random>
#include <sstream>

namespace fs = std::filesystem;

namespace utils
{

ScratchDirectory::ScratchDirectory(const std::string& tag)
{
    std::error_code ec;
    fs::path base = fs::temp_directory_path(ec);
    if (ec)
    {
        error_ = "No temporary directory available: " + ec.message();
        PLOG_ERROR << error_;
        return;
    }

    std::random_device rd;
    std::mt19937_64 gen(rd());

    for (int attempt = 0; attempt < 16; ++attempt)
    {
        std::ostringstream name;
        name << "modkeep-" << tag << "-" << std::hex << gen();
        fs::path candidate = base / name.str();

        // create_directory reports false when the name is already taken
        if (fs::create_directory(candidate, ec))
        {
            path_ = candidate;
            PLOG_DEBUG << "Scratch directory created: " << path_.string();
            return;
        }
        if (ec)
        {
            error_ = "Failed to create scratch directory " + candidate.string() + ": " + ec.message();
            PLOG_ERROR << error_;
            return;
        }
    }

    error_ = "Failed to find a free scratch directory name under " + base.string();
    PLOG_ERROR << error_;
}

ScratchDirectory::~ScratchDirectory()
{
    if (path_.empty())
        return;

    if (released_)
    {
        PLOG_WARNING << "Scratch directory kept on disk: " << path_.string();
        return;
    }

    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec)
    {
        PLOG_WARNING << "Failed to remove scratch directory " << path_.string() << ": " << ec.message();
    }
    else
    {
        PLOG_DEBUG << "Scratch directory removed: " << path_.string();
    }
}

} // namespace utils
