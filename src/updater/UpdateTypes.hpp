#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <utility>

namespace updater
{

// Size value used when the server did not tell us
constexpr int64_t kUnknownSize = -1;

// Install attempt state machine (only up to Launched is observable in-process)
enum class InstallState
{
    Idle, // Nothing prepared
    Extracting, // Unpacking the artifact into the scratch directory
    LocatingExecutable, // Searching the extracted tree for the new binary
    ScriptGenerated, // Replacement script written to disk
    Launched, // Script started detached, caller should exit now
    Failed // Attempt aborted, scratch state left for diagnosis
};

enum class UpdateErrorKind
{
    None,
    Network, // Transport or timeout failure, retry later
    NotFound, // Version file missing or no executable inside the artifact
    Server, // Non-success HTTP status, errorCode holds it
    CorruptArchive, // Artifact is not a readable archive
    IO // Local filesystem failure
};

// Result of comparing the running version with the published one
struct UpdateDecision
{
    bool available = false;
    std::string currentVersion; // As configured, e.g. "1.2.0"
    std::string latestVersion; // Always "v"-prefixed, e.g. "v1.3.0"
    std::string releaseNotesUrl;
    std::string downloadUrl; // Direct artifact URL
    std::string releaseUrl; // Release page for display only
    std::string assetName; // e.g. "FKey-v1.3.0-portable.zip"
    int64_t assetSize = kUnknownSize;
};

// Download progress information
struct DownloadProgress
{
    int64_t bytesDownloaded = 0; // Bytes written to disk so far
    int64_t totalBytes = kUnknownSize; // kUnknownSize when Content-Length is absent
    float percentage = -1.0f; // 0-100, negative when indeterminate
    std::string speed; // Human-readable speed (e.g., "2 MB/s")

    bool isIndeterminate() const { return totalBytes < 0; }
};

using DownloadProgressCallback = std::function<void(const DownloadProgress&)>;

// Error information for failed update stages
struct UpdateError
{
    UpdateErrorKind kind = UpdateErrorKind::None;
    std::string message; // Human-readable error message
    std::string technicalInfo; // Underlying cause for logging
    int errorCode = 0; // HTTP status for Server errors

    UpdateError() = default;

    UpdateError(UpdateErrorKind k, std::string msg, std::string tech = {}, int code = 0)
        : kind(k)
        , message(std::move(msg))
        , technicalInfo(std::move(tech))
        , errorCode(code)
    {
    }

    bool isError() const { return kind != UpdateErrorKind::None; }

    // "message (technicalInfo)" or just the message
    std::string describe() const;
};

const char* UpdateErrorKindToString(UpdateErrorKind kind);

// Paths baked into a replacement script
struct ReplacementPaths
{
    std::filesystem::path currentExecutable;
    std::filesystem::path newExecutable;
    std::filesystem::path archivePath;
    std::filesystem::path scratchDirectory;
};

} // namespace updater
