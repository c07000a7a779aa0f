#include "Application.hpp"
#include "../updater/UpdaterService.hpp"

#include <plog/Log.h>

#include <cstring>
#include <iostream>

#ifndef FKEY_UPDATER_VERSION
#define FKEY_UPDATER_VERSION "0.0.0"
#endif

using updater::UpdateDecision;
using updater::UpdateError;
using updater::UpdateErrorKind;

Application::Application(int argc, char** argv)
{
    parsed_ = ParseCommandLine(argc, argv, cmd_, parse_error_);
}

Application::~Application() = default;

std::string Application::Usage()
{
    return "Usage: fkey-updater [--config <file>] <command>\n"
           "\n"
           "Commands:\n"
           "  check [--force]     Check whether a newer release is published\n"
           "  download [<url>]    Download the latest (or given) release artifact\n"
           "  install <archive>   Unpack an artifact and hand over to the replacement script\n"
           "  update              check, download and install in one go\n"
           "  release-page        Open the latest release page in the browser\n"
           "  version             Print the current version\n"
           "\n"
           "install and update replace the running executable (this binary when run\n"
           "standalone) with the executable from the release archive, then restart it.\n";
}

bool Application::ParseCommandLine(int argc, const char* const* argv, CommandLine& out, std::string& outError)
{
    CommandLine result;
    bool haveCommand = false;

    for (int i = 1; i < argc; ++i)
    {
        const char* arg = argv[i];

        if (std::strcmp(arg, "--config") == 0)
        {
            if (i + 1 >= argc)
            {
                outError = "--config needs a file name";
                return false;
            }
            result.configPath = argv[++i];
            result.configRequired = true;
        }
        else if (std::strcmp(arg, "--force") == 0)
        {
            result.force = true;
        }
        else if (std::strcmp(arg, "-h") == 0 || std::strcmp(arg, "--help") == 0)
        {
            result.command = Command::Help;
            haveCommand = true;
        }
        else if (!haveCommand)
        {
            if (std::strcmp(arg, "check") == 0)
                result.command = Command::Check;
            else if (std::strcmp(arg, "download") == 0)
                result.command = Command::Download;
            else if (std::strcmp(arg, "install") == 0)
                result.command = Command::Install;
            else if (std::strcmp(arg, "update") == 0)
                result.command = Command::Update;
            else if (std::strcmp(arg, "release-page") == 0)
                result.command = Command::ReleasePage;
            else if (std::strcmp(arg, "version") == 0)
                result.command = Command::Version;
            else
            {
                outError = std::string("unknown command '") + arg + "'";
                return false;
            }
            haveCommand = true;
        }
        else if (result.argument.empty() &&
                 (result.command == Command::Download || result.command == Command::Install))
        {
            result.argument = arg;
        }
        else
        {
            outError = std::string("unexpected argument '") + arg + "'";
            return false;
        }
    }

    if (result.command == Command::Install && result.argument.empty())
    {
        outError = "install needs the path of a downloaded archive";
        return false;
    }

    out = std::move(result);
    return true;
}

int Application::ExitCodeFor(UpdateErrorKind kind)
{
    switch (kind)
    {
    case UpdateErrorKind::None:
        return kExitOk;
    case UpdateErrorKind::Network:
        return kExitNetwork;
    case UpdateErrorKind::NotFound:
        return kExitNotFound;
    case UpdateErrorKind::Server:
        return kExitServer;
    case UpdateErrorKind::CorruptArchive:
        return kExitCorruptArchive;
    case UpdateErrorKind::IO:
        return kExitIO;
    }
    return kExitIO;
}

bool Application::initialize()
{
    std::string error;
    if (!config::LoadAppConfig(cmd_.configPath, cmd_.configRequired, config_, error))
    {
        std::cerr << "Configuration error: " << error << "\n";
        return false;
    }

    if (config_.updater.currentVersion.empty())
    {
        config_.updater.currentVersion = FKEY_UPDATER_VERSION;
    }

    if (!config_.updater.validate(error))
    {
        std::cerr << "Configuration error: " << error << "\n";
        return false;
    }

    if (!utils::LogManager::Initialize(config_.log, error))
    {
        std::cerr << error << "\n";
        return false;
    }

    PLOG_INFO << "fkey-updater " << FKEY_UPDATER_VERSION << " using " << cmd_.configPath;
    service_ = updater::UpdaterService::Create(config_.updater);
    return true;
}

int Application::run()
{
    if (!parsed_)
    {
        std::cerr << "fkey-updater: " << parse_error_ << "\n\n" << Usage();
        return kExitUsage;
    }

    switch (cmd_.command)
    {
    case Command::Help:
        std::cout << Usage();
        return kExitOk;
    case Command::Version:
        std::cout << FKEY_UPDATER_VERSION << "\n";
        return kExitOk;
    default:
        break;
    }

    if (!initialize())
    {
        return kExitConfig;
    }

    switch (cmd_.command)
    {
    case Command::Check:
        return runCheck();
    case Command::Download:
        return runDownload();
    case Command::Install:
        return runInstall();
    case Command::Update:
        return runUpdate();
    case Command::ReleasePage:
        return runReleasePage();
    default:
        return kExitUsage;
    }
}

int Application::report(const UpdateError& error, const char* stage)
{
    // Each stage and kind gets its own wording; recovery differs per kind
    std::cerr << stage << " failed (" << updater::UpdateErrorKindToString(error.kind) << "): " << error.describe()
              << "\n";
    if (error.kind == UpdateErrorKind::Network)
    {
        std::cerr << "Check your connection and try again later.\n";
    }
    return ExitCodeFor(error.kind);
}

int Application::runCheck()
{
    UpdateDecision decision;
    UpdateError error;
    if (!service_->checkForUpdates(cmd_.force, decision, error))
    {
        return report(error, "Update check");
    }

    if (decision.available)
    {
        std::cout << "Update available: " << decision.currentVersion << " -> " << decision.latestVersion << "\n"
                  << "  asset:    " << decision.assetName << "\n"
                  << "  download: " << decision.downloadUrl << "\n"
                  << "  release:  " << decision.releaseUrl << "\n";
    }
    else
    {
        std::cout << "Up to date (" << decision.currentVersion << ", latest " << decision.latestVersion << ")\n";
    }
    return kExitOk;
}

bool Application::downloadLatest(const UpdateDecision& decision, std::string& outArchive, UpdateError& outError)
{
    std::cout << "Downloading " << decision.assetName << "...\n";
    bool ok = service_->downloadUpdate(
        decision.downloadUrl,
        [](const updater::DownloadProgress& p)
        {
            if (p.isIndeterminate())
                std::cout << "\r  " << p.bytesDownloaded << " bytes (" << p.speed << ")" << std::flush;
            else
                std::cout << "\r  " << static_cast<int>(p.percentage) << "% of " << p.totalBytes << " bytes ("
                          << p.speed << ")" << std::flush;
        },
        outArchive, outError);
    std::cout << "\n";
    return ok;
}

int Application::runDownload()
{
    UpdateDecision decision;
    UpdateError error;

    if (cmd_.argument.empty())
    {
        if (!service_->checkForUpdates(cmd_.force, decision, error))
        {
            return report(error, "Update check");
        }
    }
    else
    {
        decision.downloadUrl = cmd_.argument;
        decision.assetName = cmd_.argument;
    }

    std::string archive;
    if (!downloadLatest(decision, archive, error))
    {
        return report(error, "Download");
    }
    std::cout << "Saved to " << archive << "\n";
    return kExitOk;
}

int Application::runInstall()
{
    UpdateError error;
    std::string script;
    if (!service_->prepareInstall(cmd_.argument, script, error))
    {
        return report(error, "Install");
    }
    if (!service_->launchInstall(script, error))
    {
        return report(error, "Install");
    }
    std::cout << "Updater started; exiting so the executable can be replaced.\n";
    return kExitOk;
}

int Application::runUpdate()
{
    UpdateDecision decision;
    UpdateError error;
    if (!service_->checkForUpdates(cmd_.force, decision, error))
    {
        return report(error, "Update check");
    }
    if (!decision.available)
    {
        std::cout << "Already up to date (" << decision.currentVersion << ")\n";
        return kExitOk;
    }

    std::string archive;
    if (!downloadLatest(decision, archive, error))
    {
        return report(error, "Download");
    }

    cmd_.argument = archive;
    return runInstall();
}

int Application::runReleasePage()
{
    UpdateDecision decision;
    UpdateError error;
    if (!service_->checkForUpdates(cmd_.force, decision, error))
    {
        return report(error, "Update check");
    }
    if (!service_->openReleasePage(decision.releaseUrl, error))
    {
        return report(error, "Opening release page");
    }
    return kExitOk;
}
