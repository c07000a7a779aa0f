#include "CprHttpClient.hpp"

#include <cpr/cpr.h>

#include <cctype>
#include <charconv>

namespace
{

inline void apply_common(cpr::Session& s, const net::RequestConfig& cfg)
{
    s.SetConnectTimeout(cpr::ConnectTimeout{ cfg.connect_timeout_ms });
    s.SetTimeout(cpr::Timeout{ cfg.timeout_ms });
    s.SetRedirect(cpr::Redirect{ true });

    cpr::Header h;
    for (auto& kv : cfg.headers)
    {
        h.emplace(kv.name, kv.value);
    }
    s.SetHeader(std::move(h));
}

inline bool starts_with_nocase(std::string_view s, std::string_view prefix)
{
    if (s.size() < prefix.size())
        return false;
    for (size_t i = 0; i < prefix.size(); ++i)
    {
        char a = static_cast<char>(std::tolower(static_cast<unsigned char>(s[i])));
        char b = static_cast<char>(std::tolower(static_cast<unsigned char>(prefix[i])));
        if (a != b)
            return false;
    }
    return true;
}

inline std::string_view trim(std::string_view s)
{
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())))
        s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))
        s.remove_suffix(1);
    return s;
}

// Status of the response currently being received. A redirect chain produces
// several responses; every status line replaces the previous one.
struct ResponseStatus
{
    int status_code = 0;

    // True when line starts a new response
    bool consume(std::string_view line)
    {
        if (!starts_with_nocase(line, "HTTP/"))
        {
            return false;
        }

        status_code = 0;
        auto space = line.find(' ');
        if (space != std::string_view::npos)
        {
            auto code = trim(line.substr(space + 1));
            std::from_chars(code.data(), code.data() + code.size(), status_code);
        }
        return true;
    }

    bool success() const { return status_code >= 200 && status_code < 300; }
};

} // namespace

namespace net
{

HttpResponse CprHttpClient::get(const std::string& url, const RequestConfig& cfg)
{
    cpr::Session s;
    s.SetUrl(cpr::Url{ url });
    apply_common(s, cfg);
    auto r = s.Get();
    HttpResponse hr;
    if (r.error)
    {
        hr.error = r.error.message;
        return hr;
    }
    hr.status_code = static_cast<int>(r.status_code);
    hr.text = std::move(r.text);
    hr.bytes_received = hr.text.size();
    return hr;
}

HttpResponse CprHttpClient::download(const std::string& url, const RequestConfig& cfg, const ChunkSink& sink)
{
    cpr::Session s;
    s.SetUrl(cpr::Url{ url });
    apply_common(s, cfg);

    ResponseStatus head;
    int64_t total = -1;
    HttpResponse hr;

    s.SetHeaderCallback(cpr::HeaderCallback{ [&](std::string_view line, intptr_t) -> bool
                                             {
                                                 if (head.consume(line))
                                                 {
                                                     total = -1;
                                                 }
                                                 return true;
                                             } });

    // libcurl reports 0 while the length is unknown
    s.SetProgressCallback(cpr::ProgressCallback{
        [&total](cpr::cpr_pf_arg_t downloadTotal, cpr::cpr_pf_arg_t, cpr::cpr_pf_arg_t, cpr::cpr_pf_arg_t,
                 intptr_t) -> bool
        {
            if (downloadTotal > 0)
            {
                total = static_cast<int64_t>(downloadTotal);
            }
            return true;
        } });

    auto r = s.Download(cpr::WriteCallback{ [&](std::string_view data, intptr_t) -> bool
                                            {
                                                if (!head.success())
                                                {
                                                    return true; // error page, drop it
                                                }
                                                hr.bytes_received += data.size();
                                                return !sink || sink(data, total);
                                            } });

    hr.status_code = static_cast<int>(r.status_code);
    hr.content_length = head.success() ? total : -1;
    if (r.error)
    {
        hr.error = r.error.message;
    }
    return hr;
}

} // namespace net
