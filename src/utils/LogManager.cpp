#include "LogManager.hpp"

#include <filesystem>

#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>
#include <plog/Init.h>
#include <plog/Log.h>

namespace utils
{

bool LogManager::s_initialized = false;
std::vector<std::unique_ptr<plog::IAppender>> LogManager::s_appenders;

bool LogManager::Initialize(const LoggerConfig& config, std::string& outError)
{
    if (s_initialized)
        return true;

    try
    {
        if (config.filepath.empty())
        {
            auto console_appender = std::make_unique<plog::ConsoleAppender<plog::TxtFormatter>>();
            plog::init(config.level, console_appender.get());
            s_appenders.push_back(std::move(console_appender));
            s_initialized = true;
            return true;
        }

        std::error_code ec;
        auto parent = std::filesystem::path(config.filepath).parent_path();
        if (!parent.empty())
        {
            std::filesystem::create_directories(parent, ec);
            if (ec)
            {
                outError = "Unable to prepare log directory " + parent.string() + ": " + ec.message();
                return false;
            }
        }

        auto file_appender = std::make_unique<plog::RollingFileAppender<plog::TxtFormatter>>(
            config.filepath.c_str(), config.max_file_size, static_cast<int>(config.backup_count));

        plog::init(config.level, file_appender.get());

        if (config.add_console_appender)
        {
            auto console_appender = std::make_unique<plog::ConsoleAppender<plog::TxtFormatter>>();
            if (auto logger = plog::get())
            {
                logger->addAppender(console_appender.get());
                s_appenders.push_back(std::move(console_appender));
            }
        }

        s_appenders.push_back(std::move(file_appender));
        s_initialized = true;
        return true;
    }
    catch (const std::exception& ex)
    {
        outError = std::string("Failed to initialize logging: ") + ex.what();
        return false;
    }
}

plog::Severity LogManager::SeverityFromInt(long long level)
{
    if (level < plog::none)
        return plog::none;
    if (level > plog::verbose)
        return plog::verbose;
    return static_cast<plog::Severity>(level);
}

} // namespace utils
