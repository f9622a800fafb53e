#include "archive_builder.hpp"

#include <zlib.h>

#include <algorithm>
#include <array>
#include <cstdio>
#include <cstring>

namespace test_utils {

namespace {

constexpr size_t kBlock = 512;

void putString(std::array<char, kBlock>& block, size_t offset, size_t length, const std::string& value) {
    std::memcpy(block.data() + offset, value.data(), std::min(length, value.size()));
}

void putOctal(std::array<char, kBlock>& block, size_t offset, size_t length, unsigned long long value) {
    // length - 1 digits followed by NUL
    std::snprintf(block.data() + offset, length, "%0*llo", static_cast<int>(length - 1), value);
}

void writeChecksum(std::array<char, kBlock>& block) {
    std::memset(block.data() + 148, ' ', 8);
    unsigned long long sum = 0;
    for (char c : block) {
        sum += static_cast<unsigned char>(c);
    }
    std::snprintf(block.data() + 148, 8, "%06llo", sum);
    block[155] = ' ';
}

std::array<char, kBlock> makeHeader(const std::string& name, char type, size_t size, const std::string& link) {
    std::array<char, kBlock> block{};
    putString(block, 0, 100, name);
    putOctal(block, 100, 8, type == '5' ? 0755 : 0644);
    putOctal(block, 108, 8, 0);
    putOctal(block, 116, 8, 0);
    putOctal(block, 124, 12, size);
    putOctal(block, 136, 12, 0);
    block[156] = type;
    putString(block, 157, 100, link);
    putString(block, 257, 6, "ustar");
    putString(block, 263, 2, "00");

    writeChecksum(block);
    return block;
}

bool writeData(gzFile gz, const std::string& data) {
    if (!data.empty() && gzwrite(gz, data.data(), static_cast<unsigned>(data.size())) != static_cast<int>(data.size())) {
        return false;
    }
    size_t padding = (kBlock - data.size() % kBlock) % kBlock;
    std::array<char, kBlock> zeros{};
    return padding == 0 || gzwrite(gz, zeros.data(), static_cast<unsigned>(padding)) == static_cast<int>(padding);
}

bool writeHeader(gzFile gz, const std::array<char, kBlock>& header) {
    return gzwrite(gz, header.data(), kBlock) == static_cast<int>(kBlock);
}

}  // namespace

bool writeTarGz(const std::filesystem::path& path, const std::vector<ArchiveMember>& members) {
    gzFile gz = gzopen(path.string().c_str(), "wb");
    if (!gz) {
        return false;
    }

    bool ok = true;
    for (const auto& member : members) {
        char type = '0';
        std::string data = member.content;
        std::string link;
        if (member.kind == ArchiveMember::Kind::Directory) {
            type = '5';
            data.clear();
        } else if (member.kind == ArchiveMember::Kind::Symlink) {
            type = '2';
            link = member.content;
            data.clear();
        }

        if (member.name.size() > 100) {
            std::string longName = member.name + '\0';
            ok = writeHeader(gz, makeHeader("././@LongLink", 'L', longName.size(), "")) && writeData(gz, longName);
            if (!ok) {
                break;
            }
        }

        ok = writeHeader(gz, makeHeader(member.name.substr(0, 100), type, data.size(), link)) && writeData(gz, data);
        if (!ok) {
            break;
        }
    }

    if (ok) {
        std::array<char, kBlock> zeros{};
        ok = writeHeader(gz, zeros) && writeHeader(gz, zeros);
    }
    return gzclose(gz) == Z_OK && ok;
}

bool writeTarGzWithLongNameSize(const std::filesystem::path& path, std::uint64_t declaredSize) {
    std::array<char, kBlock> header = makeHeader("././@LongLink", 'L', 0, "");
    // GNU base-256: high bit set, big-endian value in the remaining bytes
    std::memset(header.data() + 124, 0, 12);
    header[124] = static_cast<char>(0x80);
    for (size_t i = 0; i < 8; ++i) {
        header[135 - i] = static_cast<char>((declaredSize >> (8 * i)) & 0xFF);
    }
    writeChecksum(header);

    gzFile gz = gzopen(path.string().c_str(), "wb");
    if (!gz) {
        return false;
    }
    bool ok = writeHeader(gz, header) && writeData(gz, "member-name");
    return gzclose(gz) == Z_OK && ok;
}

}  // namespace test_utils
