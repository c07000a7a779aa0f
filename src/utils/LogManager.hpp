#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include <plog/Severity.h>

namespace plog
{
class IAppender;
}

namespace utils
{

class LogManager
{
public:
    struct LoggerConfig
    {
        std::string filepath = "logs/fkey-updater.log";
        plog::Severity level = plog::info;
        size_t max_file_size = 5 * 1024 * 1024;
        size_t backup_count = 3;
        bool add_console_appender = true;
    };

    // Set up the default plog instance. Only the first successful call has an
    // effect; plog keeps the appenders for the rest of the process.
    static bool Initialize(const LoggerConfig& config, std::string& outError);

    static bool IsInitialized() { return s_initialized; }

    // Map the 0-6 config level (none..verbose) onto plog, clamping out-of-range values
    static plog::Severity SeverityFromInt(long long level);

private:
    LogManager() = default;

    static bool s_initialized;
    static std::vector<std::unique_ptr<plog::IAppender>> s_appenders;
};

} // namespace utils
