#pragma once

#include "../updater/UpdateTypes.hpp"

#include <filesystem>
#include <memory>
#include <string>

namespace platform
{

// Everything in the update flow that depends on the operating system.
// One variant per OS family, chosen once by CreateHostPlatform().
class IHostPlatform
{
public:
    virtual ~IHostPlatform() = default;

    virtual const char* name() const = 0;

    // Absolute path of the running binary, empty on failure
    virtual std::filesystem::path currentExecutablePath() const = 0;

    // Whether an extracted file is the kind of binary this OS runs
    virtual bool isNativeExecutable(const std::filesystem::path& path) const = 0;

    // "<prefix>-updater.bat" / "<prefix>-updater.sh"
    virtual std::string scriptFileName(const std::string& prefix) const = 0;

    // Self-deleting script that swaps paths.currentExecutable for
    // paths.newExecutable once the running process has let go of it
    virtual std::string generateReplacementScript(const updater::ReplacementPaths& paths,
                                                  const std::string& productName) const = 0;

    // Start a generated script detached; never waits for it
    virtual bool launchScript(const std::filesystem::path& scriptPath) const = 0;

    // Hand a URL to the desktop's default handler
    virtual bool openUrl(const std::string& url) const = 0;

    // Seconds waited before the first delete attempt
    static constexpr int kInitialDelaySeconds = 2;
    // Delete attempts (one per second) before the script gives up and pauses
    static constexpr int kMaxDeleteAttempts = 30;
};

class WindowsPlatform : public IHostPlatform
{
public:
    const char* name() const override { return "windows"; }
    std::filesystem::path currentExecutablePath() const override;
    bool isNativeExecutable(const std::filesystem::path& path) const override;
    std::string scriptFileName(const std::string& prefix) const override;
    std::string generateReplacementScript(const updater::ReplacementPaths& paths,
                                          const std::string& productName) const override;
    bool launchScript(const std::filesystem::path& scriptPath) const override;
    bool openUrl(const std::string& url) const override;
};

// Linux and macOS. They differ only in the command that opens URLs.
class PosixPlatform : public IHostPlatform
{
public:
    PosixPlatform(std::string name, std::string openCommand);

    const char* name() const override { return name_.c_str(); }
    std::filesystem::path currentExecutablePath() const override;
    bool isNativeExecutable(const std::filesystem::path& path) const override;
    std::string scriptFileName(const std::string& prefix) const override;
    std::string generateReplacementScript(const updater::ReplacementPaths& paths,
                                          const std::string& productName) const override;
    bool launchScript(const std::filesystem::path& scriptPath) const override;
    bool openUrl(const std::string& url) const override;

private:
    std::string name_;
    std::string openCommand_;
};

std::unique_ptr<IHostPlatform> CreateHostPlatform();

// Single-quote a value for /bin/sh
std::string ShellQuote(const std::string& s);

} // namespace platform
