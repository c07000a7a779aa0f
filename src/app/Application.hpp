#pragma once

#include "../config/AppConfig.hpp"
#include "../updater/UpdateTypes.hpp"

#include <memory>
#include <string>

namespace updater
{
class UpdaterService;
}

// Command-line front end that embeds the updater the way a desktop app would
class Application
{
public:
    enum class Command
    {
        Help,
        Version,
        Check,
        Download,
        Install,
        Update,
        ReleasePage
    };

    struct CommandLine
    {
        std::string configPath = "fkey-updater.toml";
        bool configRequired = false; // true when --config was given
        Command command = Command::Help;
        bool force = false;
        std::string argument; // URL for download, archive for install
    };

    enum ExitCode
    {
        kExitOk = 0,
        kExitUsage = 1,
        kExitConfig = 2,
        kExitNetwork = 3,
        kExitNotFound = 4,
        kExitServer = 5,
        kExitCorruptArchive = 6,
        kExitIO = 7
    };

    Application(int argc, char** argv);
    ~Application();

    int run();

    static bool ParseCommandLine(int argc, const char* const* argv, CommandLine& out, std::string& outError);
    static int ExitCodeFor(updater::UpdateErrorKind kind);
    static std::string Usage();

private:
    bool initialize();
    int report(const updater::UpdateError& error, const char* stage);

    int runCheck();
    int runDownload();
    int runInstall();
    int runUpdate();
    int runReleasePage();

    bool downloadLatest(const updater::UpdateDecision& decision, std::string& outArchive,
                        updater::UpdateError& outError);

    std::string parse_error_;
    bool parsed_ = false;
    CommandLine cmd_;
    config::AppConfig config_;
    std::unique_ptr<updater::UpdaterService> service_;
};
