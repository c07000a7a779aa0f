#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace utils
{

// Cross-platform utilities for process management
class ProcessUtils
{
public:
    struct LaunchOptions
    {
        // Process runs independently, is never waited on and survives our exit
        bool detached = true;
        // Windows only: give the child its own console window
        bool newConsole = false;
        // Empty keeps the caller's working directory
        std::filesystem::path workingDirectory;
    };

    // Get the absolute path to the current executable (empty on failure)
    static std::filesystem::path GetExecutablePath();

    // Launch a process. A program without a directory part is looked up in PATH.
    // Returns false when the process could not be started.
    static bool LaunchProcess(const std::filesystem::path& program, const std::vector<std::string>& args,
                              const LaunchOptions& options);
};

} // namespace utils
