#pragma once

#include "UpdateTypes.hpp"
#include "UpdaterConfig.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace net
{
class IHttpClient;
}

namespace platform
{
class IHostPlatform;
}

namespace updater
{

class IVersionSource;

// Entry point for the embedding application: owns the check cache and wires
// the pipeline stages together. Construct one and pass it to whoever needs it.
//
// Every call blocks on the calling thread. checkForUpdates may be called from
// several threads; the cache is guarded by a mutex.
class UpdaterService
{
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    UpdaterService(UpdaterConfig config, std::shared_ptr<IVersionSource> versionSource,
                   std::shared_ptr<net::IHttpClient> http, std::shared_ptr<platform::IHostPlatform> platform,
                   Clock clock = {});
    ~UpdaterService();

    UpdaterService(const UpdaterService&) = delete;
    UpdaterService& operator=(const UpdaterService&) = delete;

    // Production wiring: cpr transport, VERSION file source, host platform
    static std::unique_ptr<UpdaterService> Create(const UpdaterConfig& config);

    // Cached decision when younger than the check interval and not forced,
    // otherwise a fresh fetch. On failure the cache is left as it was.
    bool checkForUpdates(bool force, UpdateDecision& outDecision, UpdateError& outError);

    // Last successful decision regardless of age
    std::optional<UpdateDecision> cachedDecision() const;

    bool downloadUpdate(const std::string& downloadUrl, const DownloadProgressCallback& onProgress,
                        std::string& outArchivePath, UpdateError& outError);

    // Extract, locate the new executable and write the replacement script
    bool prepareInstall(const std::string& archivePath, std::string& outScriptPath, UpdateError& outError);

    // Start the replacement script detached; exit the application afterwards
    bool launchInstall(const std::string& scriptPath, UpdateError& outError);

    bool openReleasePage(const std::string& url, UpdateError& outError);

    const std::string& currentVersion() const;
    const UpdaterConfig& config() const;
    InstallState installState() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace updater
