#include "VersionSource.hpp"
#include "../net/HttpClient.hpp"
#include "../utils/StringUtils.hpp"

#include <plog/Log.h>

namespace updater
{

HttpVersionSource::HttpVersionSource(std::shared_ptr<net::IHttpClient> http, const UpdaterConfig& config)
    : http_(std::move(http))
    , url_(config.versionUrl())
    , userAgent_(config.userAgent)
{
}

bool HttpVersionSource::fetchLatest(std::string& outVersion, UpdateError& outError)
{
    PLOG_INFO << "Checking for updates: " << url_;

    net::RequestConfig cfg;
    cfg.connect_timeout_ms = kTimeoutMs;
    cfg.timeout_ms = kTimeoutMs;
    cfg.headers.push_back({ "User-Agent", userAgent_ });

    net::HttpResponse response = http_->get(url_, cfg);

    if (!response.error.empty())
    {
        outError = UpdateError(UpdateErrorKind::Network, "Failed to check version", response.error);
        PLOG_ERROR << outError.describe();
        return false;
    }

    if (response.status_code == 404)
    {
        outError = UpdateError(UpdateErrorKind::NotFound, "Version file not found", url_, 404);
        PLOG_ERROR << outError.describe();
        return false;
    }

    if (response.status_code != 200)
    {
        outError = UpdateError(UpdateErrorKind::Server,
                               "Failed to fetch version: HTTP " + std::to_string(response.status_code), url_,
                               response.status_code);
        PLOG_ERROR << outError.describe();
        return false;
    }

    outVersion = utils::Trim(response.text);
    PLOG_INFO << "Latest published version: '" << outVersion << "'";
    return true;
}

} // namespace updater
