#pragma once

#include "HttpClient.hpp"

namespace net
{

// IHttpClient on top of cpr/libcurl
class CprHttpClient : public IHttpClient
{
public:
    HttpResponse get(const std::string& url, const RequestConfig& cfg) override;
    HttpResponse download(const std::string& url, const RequestConfig& cfg, const ChunkSink& sink) override;
};

} // namespace net
