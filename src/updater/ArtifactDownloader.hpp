#pragma once

#include "UpdateTypes.hpp"
#include "UpdaterConfig.hpp"

#include <cstddef>
#include <memory>
#include <string>

namespace net
{
class IHttpClient;
}

namespace updater
{

// Streams a release artifact into the temp directory
class ArtifactDownloader
{
public:
    static constexpr int kTimeoutMs = 5 * 60 * 1000;
    static constexpr size_t kChunkSize = 32 * 1024;

    ArtifactDownloader(std::shared_ptr<net::IHttpClient> http, const UpdaterConfig& config);

    // Download url to <temp>/<prefix>-update-<file name>, calling onProgress
    // (may be empty) after every chunk written. Errors: Network before any byte
    // arrived, Server for a non-200 status, IO for mid-stream or disk failures.
    // On IO errors the partial file is left in place.
    bool download(const std::string& url, const DownloadProgressCallback& onProgress, std::string& outPath,
                  UpdateError& outError);

    // Last path segment of a URL without query or fragment ("artifact" if empty)
    static std::string FileNameFromUrl(const std::string& url);

    static std::string FormatSpeed(double bytesPerSecond);

private:
    std::shared_ptr<net::IHttpClient> http_;
    UpdaterConfig config_;
};

} // namespace updater
