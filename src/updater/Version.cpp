#include "Version.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <charconv>
#include <regex>
#include <sstream>

namespace updater
{

Version::Version()
    : segments_{ 0 }
{
}

Version::Version(const std::string& versionString)
    : segments_{ 0 }
{
    if (!parseString(versionString))
    {
        // Keep default 0 if parsing fails
        segments_ = { 0 };
    }
}

std::string Version::toString() const
{
    std::ostringstream oss;
    for (size_t i = 0; i < segments_.size(); ++i)
    {
        if (i > 0)
            oss << ".";
        oss << segments_[i];
    }
    return oss.str();
}

std::strong_ordering Version::operator<=>(const Version& other) const
{
    const size_t length = std::max(segments_.size(), other.segments_.size());
    for (size_t i = 0; i < length; ++i)
    {
        unsigned long long lhs = i < segments_.size() ? segments_[i] : 0;
        unsigned long long rhs = i < other.segments_.size() ? other.segments_[i] : 0;
        if (auto cmp = lhs <=> rhs; cmp != 0)
            return cmp;
    }
    return std::strong_ordering::equal;
}

bool Version::operator==(const Version& other) const { return (*this <=> other) == 0; }

bool Version::tryParse(const std::string& versionString, Version& outVersion)
{
    return outVersion.parseString(versionString);
}

bool Version::parseString(const std::string& versionString)
{
    // Supported: "1", "1.2", "1.2.3.4", each optionally prefixed with 'v' or 'V'
    std::string cleaned = versionString;
    if (!cleaned.empty() && (cleaned[0] == 'v' || cleaned[0] == 'V'))
    {
        cleaned = cleaned.substr(1);
    }
    if (cleaned.empty())
        return false;

    std::vector<unsigned long long> parsed;
    size_t start = 0;
    while (true)
    {
        size_t dot = cleaned.find('.', start);
        size_t end = dot == std::string::npos ? cleaned.size() : dot;
        if (end == start)
            return false; // empty segment

        const char* first = cleaned.data() + start;
        const char* last = cleaned.data() + end;
        if (!std::all_of(first, last, [](char c) { return c >= '0' && c <= '9'; }))
            return false;

        unsigned long long value = 0;
        auto [ptr, ec] = std::from_chars(first, last, value);
        if (ec != std::errc() || ptr != last)
            return false; // overflow

        parsed.push_back(value);
        if (dot == std::string::npos)
            break;
        start = dot + 1;
    }

    segments_ = std::move(parsed);
    return true;
}

bool Version::isNewer(const std::string& current, const std::string& candidate)
{
    if (candidate.empty())
        return false;

    Version currentVersion;
    Version candidateVersion;
    if (tryParse(current, currentVersion) && tryParse(candidate, candidateVersion))
        return candidateVersion > currentVersion;

    // Non-numeric tag on either side: any difference is offered as an update
    bool differs = current != candidate;
    PLOG_DEBUG << "Non-numeric version comparison '" << current << "' vs '" << candidate
               << "', treating as " << (differs ? "newer" : "same");
    return differs;
}

std::string Version::extractDotted(const std::string& text)
{
    static const std::regex dottedRegex(R"((\d+(?:\.\d+)+))");
    std::smatch match;
    if (std::regex_search(text, match, dottedRegex))
        return match[1].str();
    return {};
}

} // namespace updater
