#include "ProcessUtils.hpp"

#include <plog/Log.h>

#ifdef _WIN32
#include <windows.h>
#else
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

#ifdef __APPLE__
#include <mach-o/dyld.h>
#endif

namespace utils
{

std::filesystem::path ProcessUtils::GetExecutablePath()
{
#ifdef _WIN32
    std::wstring buffer(MAX_PATH, L'\0');
    DWORD size = GetModuleFileNameW(nullptr, buffer.data(), static_cast<DWORD>(buffer.size()));
    if (size == 0)
    {
        PLOG_ERROR << "GetModuleFileNameW failed: " << GetLastError();
        return {};
    }

    while (size == buffer.size())
    {
        buffer.resize(buffer.size() * 2, L'\0');
        size = GetModuleFileNameW(nullptr, buffer.data(), static_cast<DWORD>(buffer.size()));
        if (size == 0)
        {
            PLOG_ERROR << "GetModuleFileNameW failed: " << GetLastError();
            return {};
        }
    }
    buffer.resize(size);

    return std::filesystem::absolute(std::filesystem::path(buffer));
#elif defined(__APPLE__)
    char rawPath[4096];
    uint32_t size = sizeof(rawPath);
    if (_NSGetExecutablePath(rawPath, &size) != 0)
    {
        PLOG_ERROR << "_NSGetExecutablePath failed, buffer needs " << size << " bytes";
        return {};
    }

    char resolved[PATH_MAX];
    if (realpath(rawPath, resolved))
    {
        return std::filesystem::path(resolved);
    }
    return std::filesystem::absolute(std::filesystem::path(rawPath));
#else
    std::error_code ec;
    auto exePath = std::filesystem::canonical("/proc/self/exe", ec);
    if (ec)
    {
        PLOG_ERROR << "Failed to resolve /proc/self/exe: " << ec.message();
        return {};
    }
    return exePath;
#endif
}

bool ProcessUtils::LaunchProcess(const std::filesystem::path& program, const std::vector<std::string>& args,
                                 const LaunchOptions& options)
{
    if (program.empty())
    {
        PLOG_ERROR << "No program given to launch";
        return false;
    }

    if (program.has_parent_path() && !std::filesystem::exists(program))
    {
        PLOG_ERROR << "Invalid executable path: " << program.string();
        return false;
    }

#ifdef _WIN32
    std::string cmdLine = "\"" + program.string() + "\"";
    for (const auto& arg : args)
    {
        cmdLine += " \"" + arg + "\"";
    }

    STARTUPINFOA si = { sizeof(si) };
    PROCESS_INFORMATION pi = {};
    si.dwFlags = STARTF_USESHOWWINDOW;
    si.wShowWindow = SW_SHOW;

    DWORD creationFlags = 0;
    if (options.newConsole)
        creationFlags |= CREATE_NEW_CONSOLE;
    else if (options.detached)
        creationFlags |= DETACHED_PROCESS;
    if (options.detached)
        creationFlags |= CREATE_NEW_PROCESS_GROUP;

    std::string workDir = options.workingDirectory.string();

    if (!CreateProcessA(nullptr, const_cast<char*>(cmdLine.c_str()), nullptr, nullptr, FALSE, creationFlags, nullptr,
                        workDir.empty() ? nullptr : workDir.c_str(), &si, &pi))
    {
        PLOG_ERROR << "CreateProcessA failed: " << GetLastError();
        return false;
    }

    if (!options.detached)
    {
        WaitForSingleObject(pi.hProcess, INFINITE);
    }

    CloseHandle(pi.hProcess);
    CloseHandle(pi.hThread);

    PLOG_INFO << "Launched process: " << program.string();
    return true;
#else
    // exec failures are reported back through a close-on-exec pipe
    int errPipe[2];
    if (pipe(errPipe) == -1)
    {
        PLOG_ERROR << "pipe() failed: " << strerror(errno);
        return false;
    }
    fcntl(errPipe[1], F_SETFD, FD_CLOEXEC);

    std::vector<char*> argv;
    std::string programStr = program.string();
    argv.push_back(const_cast<char*>(programStr.c_str()));
    for (const auto& arg : args)
    {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    std::string workDir = options.workingDirectory.string();
    bool usePath = !program.has_parent_path();

    // No logging between fork and exec
    auto execChild = [&]()
    {
        close(errPipe[0]);
        if (!workDir.empty() && chdir(workDir.c_str()) != 0)
        {
            int err = errno;
            (void)!write(errPipe[1], &err, sizeof(err));
            _exit(127);
        }
        if (usePath)
            execvp(argv[0], argv.data());
        else
            execv(argv[0], argv.data());
        int err = errno;
        (void)!write(errPipe[1], &err, sizeof(err));
        _exit(127);
    };

    pid_t pid = fork();
    if (pid < 0)
    {
        PLOG_ERROR << "fork() failed: " << strerror(errno);
        close(errPipe[0]);
        close(errPipe[1]);
        return false;
    }

    if (pid == 0)
    {
        if (options.detached)
        {
            // Double fork so the launched process is reparented to init and never
            // becomes our zombie
            if (setsid() < 0)
            {
                int err = errno;
                (void)!write(errPipe[1], &err, sizeof(err));
                _exit(127);
            }
            pid_t grandchild = fork();
            if (grandchild < 0)
            {
                int err = errno;
                (void)!write(errPipe[1], &err, sizeof(err));
                _exit(127);
            }
            if (grandchild > 0)
            {
                _exit(0);
            }
        }
        execChild();
    }

    close(errPipe[1]);

    int childErr = 0;
    ssize_t n;
    do
    {
        n = read(errPipe[0], &childErr, sizeof(childErr));
    } while (n < 0 && errno == EINTR);
    close(errPipe[0]);

    int status = 0;
    waitpid(pid, &status, 0);

    if (n > 0)
    {
        PLOG_ERROR << "Failed to start " << programStr << ": " << strerror(childErr);
        return false;
    }

    if (!options.detached && !(WIFEXITED(status) && WEXITSTATUS(status) == 0))
    {
        PLOG_WARNING << programStr << " exited abnormally (status " << status << ")";
    }

    PLOG_INFO << "Launched process: " << programStr;
    return true;
#endif
}

} // namespace utils
