#include "HttpCommon.hpp"

#include <cpr/cpr.h>
#include <plog/Log.h>

#include <fstream>

namespace
{

struct ProgressContext
{
    std::atomic<bool>* cancel_flag = nullptr;
    const utils::http::TransferProgress* progress = nullptr;
};

inline void apply_common(cpr::Session& s, const utils::http::SessionConfig& cfg)
{
    s.SetConnectTimeout(cpr::ConnectTimeout{ cfg.connect_timeout_ms });
    s.SetTimeout(cpr::Timeout{ cfg.timeout_ms });
    s.SetUserAgent(cpr::UserAgent{ cfg.user_agent });
    s.SetRedirect(cpr::Redirect{ true });
}

inline void apply_progress(cpr::Session& s, ProgressContext& ctx)
{
    if (!ctx.cancel_flag && !(ctx.progress && *ctx.progress))
        return;

    s.SetProgressCallback(cpr::ProgressCallback(
        [](cpr::cpr_pf_arg_t downloadTotal, cpr::cpr_pf_arg_t downloadNow, cpr::cpr_pf_arg_t, cpr::cpr_pf_arg_t,
           intptr_t userdata) -> bool
        {
            auto* c = reinterpret_cast<ProgressContext*>(userdata);
            if (c->cancel_flag && c->cancel_flag->load())
                return false;
            if (c->progress && *c->progress && downloadNow > 0)
            {
                (*c->progress)(static_cast<std::uint64_t>(downloadNow),
                               downloadTotal > 0 ? static_cast<std::uint64_t>(downloadTotal) : 0);
            }
            return true;
        },
        reinterpret_cast<intptr_t>(&ctx)));
}

inline cpr::Header make_header(const std::vector<utils::http::Header>& headers)
{
    cpr::Header h;
    for (auto& kv : headers)
        h.emplace(kv.name, kv.value);
    return h;
}

} // namespace

namespace utils::http
{

HttpResponse get(const std::string& url, const std::vector<Header>& headers, const SessionConfig& cfg)
{
    cpr::Session s;
    s.SetUrl(cpr::Url{ url });
    s.SetHeader(make_header(headers));
    apply_common(s, cfg);
    ProgressContext ctx{ cfg.cancel_flag, nullptr };
    apply_progress(s, ctx);
    auto r = s.Get();
    HttpResponse hr;
    if (r.error)
    {
        hr.error = r.error.message;
        return hr;
    }
    hr.status_code = static_cast<int>(r.status_code);
    hr.text = std::move(r.text);
    return hr;
}

HttpResponse download(const std::string& url, const std::filesystem::path& destPath, const SessionConfig& cfg,
                      const TransferProgress& progress)
{
    HttpResponse hr;
    {
        std::ofstream output(destPath, std::ios::binary | std::ios::trunc);
        if (!output.is_open())
        {
            hr.error = "Failed to create output file: " + destPath.string();
            return hr;
        }

        cpr::Session s;
        s.SetUrl(cpr::Url{ url });
        apply_common(s, cfg);
        ProgressContext ctx{ cfg.cancel_flag, &progress };
        apply_progress(s, ctx);

        cpr::Response r = s.Download(output);
        output.close();

        if (r.error)
        {
            hr.error = r.error.message;
        }
        else if (output.fail())
        {
            hr.error = "Failed to write downloaded data to " + destPath.string();
        }
        hr.status_code = static_cast<int>(r.status_code);
    }

    if (!hr.ok())
    {
        std::error_code ec;
        std::filesystem::remove(destPath, ec);
    }
    return hr;
}

} // namespace utils::http
