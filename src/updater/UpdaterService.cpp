#include "UpdaterService.hpp"
#include "ArtifactDownloader.hpp"
#include "SelfReplaceOrchestrator.hpp"
#include "UpdateInfoBuilder.hpp"
#include "VersionSource.hpp"
#include "../net/CprHttpClient.hpp"
#include "../platform/HostPlatform.hpp"

#include <plog/Log.h>

#include <mutex>

namespace updater
{

struct UpdaterService::Impl
{
    UpdaterConfig config;
    std::shared_ptr<IVersionSource> versionSource;
    std::shared_ptr<net::IHttpClient> http;
    std::shared_ptr<platform::IHostPlatform> platform;
    Clock clock;

    ArtifactDownloader downloader;
    SelfReplaceOrchestrator orchestrator;

    // Check cache; decision and checkedAt always change together
    struct CheckCache
    {
        std::optional<UpdateDecision> decision;
        std::chrono::steady_clock::time_point checkedAt{};
    };

    mutable std::mutex cacheMutex;
    CheckCache cache;

    Impl(UpdaterConfig cfg, std::shared_ptr<IVersionSource> source, std::shared_ptr<net::IHttpClient> client,
         std::shared_ptr<platform::IHostPlatform> host, Clock clk)
        : config(std::move(cfg))
        , versionSource(std::move(source))
        , http(std::move(client))
        , platform(std::move(host))
        , clock(clk ? std::move(clk) : Clock([] { return std::chrono::steady_clock::now(); }))
        , downloader(http, config)
        , orchestrator(*platform, config)
    {
    }
};

UpdaterService::UpdaterService(UpdaterConfig config, std::shared_ptr<IVersionSource> versionSource,
                               std::shared_ptr<net::IHttpClient> http,
                               std::shared_ptr<platform::IHostPlatform> platform, Clock clock)
    : impl_(std::make_unique<Impl>(std::move(config), std::move(versionSource), std::move(http),
                                   std::move(platform), std::move(clock)))
{
    PLOG_INFO << "UpdaterService initialized for " << impl_->config.owner << "/" << impl_->config.repo
              << " (current version: " << impl_->config.currentVersion << ", platform: " << impl_->platform->name()
              << ")";
}

UpdaterService::~UpdaterService() = default;

std::unique_ptr<UpdaterService> UpdaterService::Create(const UpdaterConfig& config)
{
    auto http = std::make_shared<net::CprHttpClient>();
    auto source = std::make_shared<HttpVersionSource>(http, config);
    std::shared_ptr<platform::IHostPlatform> host = platform::CreateHostPlatform();
    return std::make_unique<UpdaterService>(config, std::move(source), std::move(http), std::move(host));
}

bool UpdaterService::checkForUpdates(bool force, UpdateDecision& outDecision, UpdateError& outError)
{
    // Held across the fetch so concurrent checks cannot interleave their
    // read-then-write of the cache
    std::lock_guard<std::mutex> lock(impl_->cacheMutex);

    auto now = impl_->clock();
    auto& cache = impl_->cache;
    if (!force && cache.decision && now - cache.checkedAt < impl_->config.checkInterval)
    {
        PLOG_DEBUG << "Using cached update decision";
        outDecision = *cache.decision;
        return true;
    }

    std::string latest;
    if (!impl_->versionSource->fetchLatest(latest, outError))
    {
        PLOG_WARNING << "Update check failed (" << UpdateErrorKindToString(outError.kind) << ")";
        return false;
    }

    UpdateDecision decision = BuildUpdateDecision(impl_->config, latest);
    cache.decision = decision;
    cache.checkedAt = now;

    if (decision.available)
    {
        PLOG_INFO << "Update available: " << decision.latestVersion << " (current: " << decision.currentVersion
                  << ")";
    }
    else
    {
        PLOG_INFO << "Current version " << decision.currentVersion << " is up to date (latest: "
                  << decision.latestVersion << ")";
    }

    outDecision = std::move(decision);
    return true;
}

std::optional<UpdateDecision> UpdaterService::cachedDecision() const
{
    std::lock_guard<std::mutex> lock(impl_->cacheMutex);
    return impl_->cache.decision;
}

bool UpdaterService::downloadUpdate(const std::string& downloadUrl, const DownloadProgressCallback& onProgress,
                                    std::string& outArchivePath, UpdateError& outError)
{
    return impl_->downloader.download(downloadUrl, onProgress, outArchivePath, outError);
}

bool UpdaterService::prepareInstall(const std::string& archivePath, std::string& outScriptPath,
                                    UpdateError& outError)
{
    return impl_->orchestrator.prepareInstall(archivePath, outScriptPath, outError);
}

bool UpdaterService::launchInstall(const std::string& scriptPath, UpdateError& outError)
{
    return impl_->orchestrator.launchInstall(scriptPath, outError);
}

bool UpdaterService::openReleasePage(const std::string& url, UpdateError& outError)
{
    if (url.empty())
    {
        outError = UpdateError(UpdateErrorKind::NotFound, "No release page URL");
        return false;
    }

    PLOG_INFO << "Opening release page " << url;
    if (!impl_->platform->openUrl(url))
    {
        outError = UpdateError(UpdateErrorKind::IO, "Failed to open release page", url);
        PLOG_ERROR << outError.describe();
        return false;
    }
    return true;
}

const std::string& UpdaterService::currentVersion() const { return impl_->config.currentVersion; }

const UpdaterConfig& UpdaterService::config() const { return impl_->config; }

InstallState UpdaterService::installState() const { return impl_->orchestrator.state(); }

} // namespace updater
