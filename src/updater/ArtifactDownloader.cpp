#include "ArtifactDownloader.hpp"
#include "../net/HttpClient.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;

namespace updater
{

ArtifactDownloader::ArtifactDownloader(std::shared_ptr<net::IHttpClient> http, const UpdaterConfig& config)
    : http_(std::move(http))
    , config_(config)
{
}

std::string ArtifactDownloader::FileNameFromUrl(const std::string& url)
{
    std::string path = url.substr(0, url.find_first_of("?#"));
    while (!path.empty() && path.back() == '/')
    {
        path.pop_back();
    }

    size_t slash = path.rfind('/');
    std::string name = slash == std::string::npos ? path : path.substr(slash + 1);

    // "https:" with nothing after it is not a file name
    if (name.empty() || name.find(':') != std::string::npos || name == "." || name == "..")
    {
        return "artifact";
    }
    return name;
}

std::string ArtifactDownloader::FormatSpeed(double bytesPerSecond)
{
    if (bytesPerSecond < 1024)
        return std::to_string(static_cast<int>(bytesPerSecond)) + " B/s";
    if (bytesPerSecond < 1024 * 1024)
        return std::to_string(static_cast<int>(bytesPerSecond / 1024)) + " KB/s";
    return std::to_string(static_cast<int>(bytesPerSecond / (1024 * 1024))) + " MB/s";
}

bool ArtifactDownloader::download(const std::string& url, const DownloadProgressCallback& onProgress,
                                  std::string& outPath, UpdateError& outError)
{
    fs::path destPath = config_.artifactPath(FileNameFromUrl(url));
    PLOG_INFO << "Starting download: " << url << " -> " << destPath.string();

    std::ofstream outputFile(destPath, std::ios::binary | std::ios::trunc);
    if (!outputFile.is_open())
    {
        outError = UpdateError(UpdateErrorKind::IO, "Failed to create temp file", destPath.string());
        PLOG_ERROR << outError.describe();
        return false;
    }

    std::vector<char> buffer;
    buffer.reserve(kChunkSize);
    int64_t downloaded = 0;
    int64_t total = kUnknownSize;
    bool writeFailed = false;
    auto startTime = std::chrono::steady_clock::now();

    auto flush = [&]() -> bool
    {
        if (buffer.empty())
        {
            return true;
        }

        outputFile.write(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        if (!outputFile)
        {
            writeFailed = true;
            return false;
        }
        downloaded += static_cast<int64_t>(buffer.size());
        buffer.clear();

        if (onProgress)
        {
            auto elapsedMs = std::chrono::duration_cast<std::chrono::milliseconds>(
                                 std::chrono::steady_clock::now() - startTime)
                                 .count();

            DownloadProgress progress;
            progress.bytesDownloaded = downloaded;
            progress.totalBytes = total;
            progress.percentage =
                total > 0 ? (static_cast<float>(downloaded) / static_cast<float>(total)) * 100.0f : -1.0f;
            progress.speed = FormatSpeed(elapsedMs > 0 ? downloaded * 1000.0 / elapsedMs : 0.0);
            onProgress(progress);
        }
        return true;
    };

    net::RequestConfig cfg;
    cfg.connect_timeout_ms = kTimeoutMs;
    cfg.timeout_ms = kTimeoutMs;
    cfg.headers.push_back({ "User-Agent", config_.userAgent });

    net::HttpResponse response = http_->download(
        url, cfg,
        [&](std::string_view chunk, int64_t contentLength) -> bool
        {
            if (contentLength >= 0)
            {
                total = contentLength;
            }
            while (!chunk.empty())
            {
                size_t n = std::min(kChunkSize - buffer.size(), chunk.size());
                buffer.insert(buffer.end(), chunk.data(), chunk.data() + n);
                chunk.remove_prefix(n);
                if (buffer.size() == kChunkSize && !flush())
                {
                    return false;
                }
            }
            return true;
        });

    if (writeFailed)
    {
        outError = UpdateError(UpdateErrorKind::IO, "Failed to write downloaded data", destPath.string());
        PLOG_ERROR << outError.describe();
        return false;
    }

    if (!response.error.empty())
    {
        if (response.bytes_received > 0)
        {
            // Keep what arrived so the failure can be inspected
            if (!flush())
            {
                PLOG_WARNING << "Could not write buffered data to " << destPath.string();
            }
            outError = UpdateError(UpdateErrorKind::IO, "Download interrupted after " +
                                                            std::to_string(response.bytes_received) + " bytes",
                                   response.error);
        }
        else
        {
            outputFile.close();
            std::error_code ec;
            fs::remove(destPath, ec);
            outError = UpdateError(UpdateErrorKind::Network, "Download failed", response.error);
        }
        PLOG_ERROR << outError.describe();
        return false;
    }

    if (response.status_code != 200)
    {
        outputFile.close();
        std::error_code ec;
        fs::remove(destPath, ec);
        outError = UpdateError(UpdateErrorKind::Server, "Download error: HTTP " + std::to_string(response.status_code),
                               url, response.status_code);
        PLOG_ERROR << outError.describe();
        return false;
    }

    if (response.content_length >= 0)
    {
        total = response.content_length;
    }
    if (!flush())
    {
        outError = UpdateError(UpdateErrorKind::IO, "Failed to write downloaded data", destPath.string());
        PLOG_ERROR << outError.describe();
        return false;
    }

    outputFile.close();
    if (outputFile.fail())
    {
        outError = UpdateError(UpdateErrorKind::IO, "Failed to finalize downloaded file", destPath.string());
        PLOG_ERROR << outError.describe();
        return false;
    }

    PLOG_INFO << "Download completed: " << destPath.string() << " (" << downloaded << " bytes)";
    outPath = destPath.string();
    return true;
}

} // namespace updater
