#pragma once

#include <string>

namespace install
{

// Bare "https://github.com/<user>/<repo>" becomes the master branch zip;
// trailing slashes are dropped. Other URLs pass through.
std::string normalizeSourceUrl(const std::string& url);

// "<user>/<repo>" for GitHub URLs, the URL itself otherwise
std::string displayName(const std::string& url);

} // namespace install
