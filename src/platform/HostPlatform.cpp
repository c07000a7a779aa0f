#include "HostPlatform.hpp"
#include "ProcessUtils.hpp"
#include "../utils/StringUtils.hpp"

#include <plog/Log.h>

#ifdef _WIN32
#include <windows.h>
#endif

namespace fs = std::filesystem;

namespace platform
{

namespace
{

// Paths inside batch files: '%' would start a variable expansion
std::string batchPath(const fs::path& p)
{
    return utils::ReplaceAll(fs::absolute(p).string(), "%", "%%");
}

// Text passed to batch "echo"
std::string batchText(const std::string& s)
{
    std::string out;
    for (char c : s)
    {
        if (c == '^' || c == '&' || c == '|' || c == '<' || c == '>')
            out.push_back('^');
        if (c == '%')
            out.push_back('%');
        out.push_back(c);
    }
    return out;
}

fs::path windowsCommandProcessor()
{
#ifdef _WIN32
    char systemDir[MAX_PATH];
    UINT len = GetSystemDirectoryA(systemDir, MAX_PATH);
    if (len > 0 && len < MAX_PATH)
    {
        return fs::path(systemDir) / "cmd.exe";
    }
#endif
    return fs::path("cmd.exe");
}

const char* kBatchTemplate = R"(@echo off
echo Updating __PRODUCT__...
timeout /t __INITIAL_DELAY__ /nobreak > nul
set /a ATTEMPTS=0
goto retry

:locked
echo Update failed! "__CURRENT_EXE__" is still in use.
pause
exit /b 1

:copyfailed
echo Update failed! Could not copy "__NEW_EXE__".
pause
exit /b 1

:retry
del /f /q "__CURRENT_EXE__" > nul 2>&1
if not exist "__CURRENT_EXE__" goto replace
set /a ATTEMPTS+=1
if %ATTEMPTS% GEQ __MAX_ATTEMPTS__ goto locked
timeout /t 1 /nobreak > nul
goto retry

:replace
copy /y "__NEW_EXE__" "__CURRENT_EXE__" > nul
if errorlevel 1 goto copyfailed
start "" "__CURRENT_EXE__"
del /f /q "__ARCHIVE__" > nul 2>&1
rmdir /s /q "__SCRATCH_DIR__" > nul 2>&1
del "%~f0"
)";

const char* kShellTemplate = R"(#!/bin/sh
PRODUCT=__PRODUCT__
CURRENT_EXE=__CURRENT_EXE__
NEW_EXE=__NEW_EXE__
ARCHIVE=__ARCHIVE__
SCRATCH_DIR=__SCRATCH_DIR__

fail() {
    echo "Update failed! $1"
    printf 'Press Enter to close...'
    read -r _ || true
    exit 1
}

echo "Updating $PRODUCT..."
sleep __INITIAL_DELAY__

attempts=0
rm -f "$CURRENT_EXE" 2>/dev/null
while [ -e "$CURRENT_EXE" ]; do
    attempts=$((attempts + 1))
    if [ "$attempts" -ge __MAX_ATTEMPTS__ ]; then
        fail "$CURRENT_EXE is still in use."
    fi
    sleep 1
    rm -f "$CURRENT_EXE" 2>/dev/null
done

cp "$NEW_EXE" "$CURRENT_EXE" || fail "Could not copy $NEW_EXE."
chmod 755 "$CURRENT_EXE" || fail "Could not make $CURRENT_EXE executable."
nohup "$CURRENT_EXE" >/dev/null 2>&1 &
rm -f "$ARCHIVE"
rm -rf "$SCRATCH_DIR"
rm -f "$0"
)";

// Fill the script placeholders in one pass so a path or product name that
// happens to contain a placeholder is copied verbatim
std::string fillScript(const char* tmpl, const std::string& product, const std::string& currentExe,
                       const std::string& newExe, const std::string& archive, const std::string& scratchDir)
{
    return utils::FillTemplate(tmpl, {
                                         { "__PRODUCT__", product },
                                         { "__CURRENT_EXE__", currentExe },
                                         { "__NEW_EXE__", newExe },
                                         { "__ARCHIVE__", archive },
                                         { "__SCRATCH_DIR__", scratchDir },
                                         { "__INITIAL_DELAY__", std::to_string(IHostPlatform::kInitialDelaySeconds) },
                                         { "__MAX_ATTEMPTS__", std::to_string(IHostPlatform::kMaxDeleteAttempts) },
                                     });
}

} // namespace

std::string ShellQuote(const std::string& s)
{
    std::string result = "'";
    for (char c : s)
    {
        if (c == '\'')
        {
            result += "'\\''";
        }
        else
        {
            result += c;
        }
    }
    result += "'";
    return result;
}

// ── Windows ──────────────────────────────────────────────────────

fs::path WindowsPlatform::currentExecutablePath() const { return utils::ProcessUtils::GetExecutablePath(); }

bool WindowsPlatform::isNativeExecutable(const fs::path& path) const
{
    std::error_code ec;
    return fs::is_regular_file(path, ec) && utils::EqualsIgnoreCase(path.extension().string(), ".exe");
}

std::string WindowsPlatform::scriptFileName(const std::string& prefix) const { return prefix + "-updater.bat"; }

std::string WindowsPlatform::generateReplacementScript(const updater::ReplacementPaths& paths,
                                                       const std::string& productName) const
{
    std::string script = fillScript(kBatchTemplate, batchText(productName), batchPath(paths.currentExecutable),
                                    batchPath(paths.newExecutable), batchPath(paths.archivePath),
                                    batchPath(paths.scratchDirectory));
    // cmd.exe wants CRLF line endings
    return utils::ReplaceAll(script, "\n", "\r\n");
}

bool WindowsPlatform::launchScript(const fs::path& scriptPath) const
{
    utils::ProcessUtils::LaunchOptions options;
    options.detached = true;
    options.newConsole = true; // pause on failure needs a visible console
    options.workingDirectory = scriptPath.parent_path();
    return utils::ProcessUtils::LaunchProcess(windowsCommandProcessor(), { "/c", scriptPath.string() }, options);
}

bool WindowsPlatform::openUrl(const std::string& url) const
{
    utils::ProcessUtils::LaunchOptions options;
    return utils::ProcessUtils::LaunchProcess("rundll32", { "url.dll,FileProtocolHandler", url }, options);
}

// ── POSIX ────────────────────────────────────────────────────────

PosixPlatform::PosixPlatform(std::string name, std::string openCommand)
    : name_(std::move(name))
    , openCommand_(std::move(openCommand))
{
}

fs::path PosixPlatform::currentExecutablePath() const { return utils::ProcessUtils::GetExecutablePath(); }

bool PosixPlatform::isNativeExecutable(const fs::path& path) const
{
    std::error_code ec;
    auto status = fs::status(path, ec);
    if (ec || !fs::is_regular_file(status) || path.has_extension())
    {
        return false;
    }
    return (status.permissions() & fs::perms::owner_exec) != fs::perms::none;
}

std::string PosixPlatform::scriptFileName(const std::string& prefix) const { return prefix + "-updater.sh"; }

std::string PosixPlatform::generateReplacementScript(const updater::ReplacementPaths& paths,
                                                     const std::string& productName) const
{
    return fillScript(kShellTemplate, ShellQuote(productName), ShellQuote(fs::absolute(paths.currentExecutable).string()),
                      ShellQuote(fs::absolute(paths.newExecutable).string()),
                      ShellQuote(fs::absolute(paths.archivePath).string()),
                      ShellQuote(fs::absolute(paths.scratchDirectory).string()));
}

bool PosixPlatform::launchScript(const fs::path& scriptPath) const
{
    utils::ProcessUtils::LaunchOptions options;
    options.detached = true;
    options.workingDirectory = scriptPath.parent_path();
    return utils::ProcessUtils::LaunchProcess("/bin/sh", { scriptPath.string() }, options);
}

bool PosixPlatform::openUrl(const std::string& url) const
{
    utils::ProcessUtils::LaunchOptions options;
    return utils::ProcessUtils::LaunchProcess(openCommand_, { url }, options);
}

std::unique_ptr<IHostPlatform> CreateHostPlatform()
{
#ifdef _WIN32
    return std::make_unique<WindowsPlatform>();
#elif defined(__APPLE__)
    return std::make_unique<PosixPlatform>("macos", "open");
#else
    return std::make_unique<PosixPlatform>("linux", "xdg-open");
#endif
}

} // namespace platform
