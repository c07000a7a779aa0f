#include "SelfReplaceOrchestrator.hpp"
#include "../platform/HostPlatform.hpp"
#include "../utils/ArchiveExtractor.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <fstream>
#include <vector>

namespace fs = std::filesystem;

namespace updater
{

namespace
{

// Directory entries of dir, sorted so the walk is deterministic
std::vector<fs::path> sortedEntries(const fs::path& dir, std::error_code& ec)
{
    std::vector<fs::path> entries;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec))
    {
        entries.push_back(it->path());
    }
    std::sort(entries.begin(), entries.end());
    return entries;
}

} // namespace

SelfReplaceOrchestrator::SelfReplaceOrchestrator(const platform::IHostPlatform& platform, const UpdaterConfig& config)
    : platform_(platform)
    , config_(config)
{
}

bool SelfReplaceOrchestrator::fail(UpdateError error, UpdateError& outError)
{
    PLOG_ERROR << "Install failed: " << error.describe();
    outError = std::move(error);
    state_ = InstallState::Failed;
    return false;
}

fs::path SelfReplaceOrchestrator::findExecutable(const fs::path& root) const
{
    std::error_code ec;
    std::vector<fs::path> entries = sortedEntries(root, ec);
    if (ec)
    {
        PLOG_WARNING << "Cannot list " << root.string() << ": " << ec.message();
        return {};
    }

    for (const auto& entry : entries)
    {
        if (platform_.isNativeExecutable(entry))
        {
            return entry;
        }
    }

    for (const auto& entry : entries)
    {
        if (fs::is_directory(fs::symlink_status(entry, ec)))
        {
            fs::path found = findExecutable(entry);
            if (!found.empty())
            {
                return found;
            }
        }
    }
    return {};
}

bool SelfReplaceOrchestrator::prepareInstall(const std::string& archivePath, std::string& outScriptPath,
                                             UpdateError& outError)
{
    fs::path currentExe = platform_.currentExecutablePath();
    if (currentExe.empty())
    {
        return fail(UpdateError(UpdateErrorKind::IO, "Failed to get executable path"), outError);
    }

    std::error_code ec;
    fs::path absArchive = fs::absolute(archivePath, ec);
    if (ec)
    {
        return fail(UpdateError(UpdateErrorKind::IO, "Invalid archive path " + archivePath, ec.message()), outError);
    }

    // Start from an empty scratch directory; leftovers of an earlier attempt go
    state_ = InstallState::Extracting;
    fs::path scratchDir = config_.scratchDirectory();
    fs::remove_all(scratchDir, ec);
    if (ec)
    {
        return fail(UpdateError(UpdateErrorKind::IO, "Failed to clear " + scratchDir.string(), ec.message()),
                    outError);
    }
    fs::create_directories(scratchDir, ec);
    if (ec)
    {
        return fail(UpdateError(UpdateErrorKind::IO, "Failed to create " + scratchDir.string(), ec.message()),
                    outError);
    }

    UpdateError extractError;
    if (!utils::ArchiveExtractor::Extract(absArchive.string(), scratchDir.string(), extractError))
    {
        extractError.message = "Failed to extract update: " + extractError.message;
        return fail(std::move(extractError), outError);
    }

    state_ = InstallState::LocatingExecutable;
    fs::path newExe = findExecutable(scratchDir);
    if (newExe.empty())
    {
        return fail(UpdateError(UpdateErrorKind::NotFound, "No executable found in update package",
                                absArchive.string()),
                    outError);
    }
    PLOG_INFO << "New executable: " << newExe.string();

    ReplacementPaths paths;
    paths.currentExecutable = currentExe;
    paths.newExecutable = newExe;
    paths.archivePath = absArchive;
    paths.scratchDirectory = scratchDir;

    std::string scriptContent = platform_.generateReplacementScript(paths, config_.productName);
    fs::path scriptPath = fs::absolute(config_.tempRoot() / platform_.scriptFileName(config_.tempPrefix), ec);
    if (ec)
    {
        return fail(UpdateError(UpdateErrorKind::IO, "Cannot resolve script path", ec.message()), outError);
    }

    std::ofstream scriptFile(scriptPath, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!scriptFile.is_open())
    {
        return fail(UpdateError(UpdateErrorKind::IO, "Failed to create updater script", scriptPath.string()),
                    outError);
    }
    scriptFile << scriptContent;
    scriptFile.close();
    if (scriptFile.fail())
    {
        return fail(UpdateError(UpdateErrorKind::IO, "Failed to write updater script", scriptPath.string()),
                    outError);
    }

    fs::permissions(scriptPath, fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec |
                                    fs::perms::others_read | fs::perms::others_exec,
                    fs::perm_options::replace, ec);
    if (ec)
    {
        PLOG_WARNING << "Could not mark " << scriptPath.string() << " executable: " << ec.message();
    }

    PLOG_INFO << "Updater script written to " << scriptPath.string() << " (" << scriptContent.size() << " bytes, "
              << platform_.name() << ")";

    state_ = InstallState::ScriptGenerated;
    outScriptPath = scriptPath.string();
    return true;
}

bool SelfReplaceOrchestrator::launchInstall(const std::string& scriptPath, UpdateError& outError)
{
    std::error_code ec;
    if (!fs::is_regular_file(scriptPath, ec))
    {
        return fail(UpdateError(UpdateErrorKind::IO, "Updater script not found", scriptPath), outError);
    }

    PLOG_INFO << "Launching updater script " << scriptPath;
    if (!platform_.launchScript(scriptPath))
    {
        return fail(UpdateError(UpdateErrorKind::IO, "Failed to launch updater script", scriptPath), outError);
    }

    state_ = InstallState::Launched;
    PLOG_INFO << "Updater script launched, application should exit now";
    return true;
}

} // namespace updater
