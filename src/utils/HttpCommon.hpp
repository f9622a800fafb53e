#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace utils::http
{

struct Header
{
    std::string name;
    std::string value;
};

struct SessionConfig
{
    int connect_timeout_ms = 10000;
    int timeout_ms = 30000; // 0 disables the overall timeout
    std::string user_agent = "modkeep";
    std::atomic<bool>* cancel_flag = nullptr;
};

struct HttpResponse
{
    int status_code = 0;
    std::string text;
    std::string error; // non-empty on network/transport errors

    bool ok() const { return error.empty() && status_code >= 200 && status_code < 300; }
};

// bytesNow, bytesTotal (0 when the server sends no length)
using TransferProgress = std::function<void(std::uint64_t, std::uint64_t)>;

using GetFunction = std::function<HttpResponse(const std::string& url)>;

// Simple GET helper
HttpResponse get(const std::string& url, const std::vector<Header>& headers, const SessionConfig& cfg);

// Streams the response body into destPath; the body is never held in memory.
// On any failure the partial file is removed.
HttpResponse download(const std::string& url, const std::filesystem::path& destPath, const SessionConfig& cfg,
                      const TransferProgress& progress = nullptr);

} // namespace utils::http
