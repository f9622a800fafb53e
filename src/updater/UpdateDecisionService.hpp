#pragma once

#include "ReleaseParser.hpp"
#include "UpdateTypes.hpp"
#include "utils/HttpCommon.hpp"

#include <string>

namespace updater
{

// Decides whether the release behind an update URL should be offered
class UpdateDecisionService
{
public:
    explicit UpdateDecisionService(utils::http::GetFunction httpGet);

    // GET with the GitHub JSON accept header and the given session settings
    static utils::http::GetFunction defaultHttpGet(const utils::http::SessionConfig& session);

    // Empty updateUrl reports NotConfigured and succeeds
    bool check(const std::string& updateUrl, const std::string& currentVersion, UpdateAvailability& outAvailability,
               CheckError& outError);

    // Latest release; a 404 on ".../releases/latest" falls back to the newest
    // entry of ".../releases". outFound is false when that list is empty.
    bool fetchLatest(const std::string& updateUrl, ReleaseRecord& outRelease, bool& outFound, CheckError& outError);

private:
    bool fetch(const std::string& url, utils::http::HttpResponse& outResponse, CheckError& outError);

    utils::http::GetFunction httpGet_;
};

} // namespace updater
