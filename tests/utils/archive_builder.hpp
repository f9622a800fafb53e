#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace test_utils {

// One member of an archive built for a test
struct ArchiveMember {
    enum class Kind { File, Directory, Symlink };

    std::string name;     // directories end with '/'
    std::string content;  // file data, or the link target for Symlink
    Kind kind = Kind::File;

    static ArchiveMember file(std::string name, std::string content) {
        return {std::move(name), std::move(content), Kind::File};
    }
    static ArchiveMember dir(std::string name) { return {std::move(name), "", Kind::Directory}; }
    static ArchiveMember symlink(std::string name, std::string target) {
        return {std::move(name), std::move(target), Kind::Symlink};
    }
};

// ZIP through miniz's writer. Symlink members are not supported.
bool writeZip(const std::filesystem::path& path, const std::vector<ArchiveMember>& members);

// ustar inside a gzip stream through zlib. Names longer than 100 bytes get a
// GNU long-name record.
bool writeTarGz(const std::filesystem::path& path, const std::vector<ArchiveMember>& members);

// A tar.gz whose first record is a GNU long-name header declaring
// declaredSize bytes of name data
bool writeTarGzWithLongNameSize(const std::filesystem::path& path, std::uint64_t declaredSize);

// Whole file as a string, empty when it cannot be read
std::string readFile(const std::filesystem::path& path);
bool writeFile(const std::filesystem::path& path, const std::string& content);

}  // namespace test_utils
