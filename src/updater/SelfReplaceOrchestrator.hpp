#pragma once

#include "UpdateTypes.hpp"
#include "UpdaterConfig.hpp"

#include <atomic>
#include <filesystem>
#include <string>

namespace platform
{
class IHostPlatform;
}

namespace updater
{

// Phase one of the self-replacement: unpack the artifact, find the new binary
// and hand a generated script to a detached process. Phase two (waiting for
// this process to exit, swapping the binary, restarting, cleaning up) runs in
// that script and reports nothing back.
class SelfReplaceOrchestrator
{
public:
    SelfReplaceOrchestrator(const platform::IHostPlatform& platform, const UpdaterConfig& config);

    // Extract archivePath into the scratch directory, locate the new executable
    // and write the replacement script. Errors: IO, CorruptArchive, NotFound.
    bool prepareInstall(const std::string& archivePath, std::string& outScriptPath, UpdateError& outError);

    // Start the script detached. The caller is expected to exit right after.
    bool launchInstall(const std::string& scriptPath, UpdateError& outError);

    // First native executable under root in sorted depth-first order, empty if none
    std::filesystem::path findExecutable(const std::filesystem::path& root) const;

    InstallState state() const { return state_.load(); }

private:
    bool fail(UpdateError error, UpdateError& outError);

    const platform::IHostPlatform& platform_;
    UpdaterConfig config_;
    std::atomic<InstallState> state_{ InstallState::Idle };
};

} // namespace updater
