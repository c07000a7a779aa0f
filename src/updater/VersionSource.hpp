#pragma once

#include "UpdateTypes.hpp"
#include "UpdaterConfig.hpp"

#include <memory>
#include <string>

namespace net
{
class IHttpClient;
}

namespace updater
{

// Where the latest published version identifier comes from
class IVersionSource
{
public:
    virtual ~IVersionSource() = default;

    // Fetch the latest version token, trimmed but otherwise verbatim
    // (e.g. "v1.3.0"). Errors: Network, NotFound, Server.
    virtual bool fetchLatest(std::string& outVersion, UpdateError& outError) = 0;
};

// Reads a plain-text VERSION file from a static, unauthenticated URL.
// No release API is involved, so there is no rate limit to run into.
class HttpVersionSource : public IVersionSource
{
public:
    static constexpr int kTimeoutMs = 10000;

    HttpVersionSource(std::shared_ptr<net::IHttpClient> http, const UpdaterConfig& config);

    bool fetchLatest(std::string& outVersion, UpdateError& outError) override;

    const std::string& url() const { return url_; }

private:
    std::shared_ptr<net::IHttpClient> http_;
    std::string url_;
    std::string userAgent_;
};

} // namespace updater
