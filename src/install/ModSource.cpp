#include "ModSource.hpp"

#include <regex>

namespace install
{

namespace
{

std::string trimUrl(const std::string& url)
{
    size_t first = url.find_first_not_of(" \t\r\n");
    if (first == std::string::npos)
        return {};
    size_t last = url.find_last_not_of(" \t\r\n/");
    if (last == std::string::npos || last < first)
        return {};
    return url.substr(first, last - first + 1);
}

} // namespace

std::string normalizeSourceUrl(const std::string& url)
{
    static const std::regex bareRepo(R"(^(https?://github\.com/[^/\s]+/[^/\s]+?)(\.git)?$)",
                                     std::regex::icase);

    std::string trimmed = trimUrl(url);
    std::smatch match;
    if (std::regex_match(trimmed, match, bareRepo))
        return match[1].str() + "/archive/refs/heads/master.zip";
    return trimmed;
}

std::string displayName(const std::string& url)
{
    static const std::regex githubRepo(R"(^https?://(?:www\.)?github\.com/([^/\s]+)/([^/\s]+))", std::regex::icase);

    std::smatch match;
    if (std::regex_search(url, match, githubRepo))
    {
        std::string repo = match[2].str();
        if (repo.size() > 4 && repo.compare(repo.size() - 4, 4, ".git") == 0)
            repo.erase(repo.size() - 4);
        return match[1].str() + "/" + repo;
    }
    return url;
}

} // namespace install
