#include "AppConfig.hpp"

#include <plog/Log.h>
#include <toml++/toml.h>

#include <filesystem>
#include <fstream>
#include <sstream>

namespace
{

void readString(const toml::table& t, const char* key, std::string& out)
{
    if (auto v = t[key].value<std::string>())
        out = *v;
}

bool applyUpdaterTable(const toml::table& t, updater::UpdaterConfig& cfg, std::string& outError)
{
    readString(t, "current_version", cfg.currentVersion);
    readString(t, "owner", cfg.owner);
    readString(t, "repo", cfg.repo);
    readString(t, "branch", cfg.branch);
    readString(t, "product_name", cfg.productName);
    readString(t, "user_agent", cfg.userAgent);
    readString(t, "version_url", cfg.versionUrlTemplate);
    readString(t, "download_url", cfg.downloadUrlTemplate);
    readString(t, "release_url", cfg.releaseUrlTemplate);
    readString(t, "asset_name", cfg.assetNameTemplate);
    readString(t, "temp_prefix", cfg.tempPrefix);

    if (auto dir = t["temp_directory"].value<std::string>())
        cfg.tempDirectory = *dir;

    if (auto hours = t["check_interval_hours"].value<int64_t>())
    {
        if (*hours <= 0)
        {
            outError = "updater.check_interval_hours must be positive";
            return false;
        }
        cfg.checkInterval = std::chrono::hours(*hours);
    }
    return true;
}

bool applyLogTable(const toml::table& t, utils::LogManager::LoggerConfig& cfg, std::string& outError)
{
    readString(t, "file", cfg.filepath);

    if (auto level = t["level"].value<int64_t>())
        cfg.level = utils::LogManager::SeverityFromInt(*level);

    if (auto size = t["max_file_size"].value<int64_t>())
    {
        if (*size <= 0)
        {
            outError = "log.max_file_size must be positive";
            return false;
        }
        cfg.max_file_size = static_cast<size_t>(*size);
    }

    if (auto count = t["backup_count"].value<int64_t>())
    {
        if (*count < 0)
        {
            outError = "log.backup_count must not be negative";
            return false;
        }
        cfg.backup_count = static_cast<size_t>(*count);
    }

    if (auto console = t["console"].value<bool>())
        cfg.add_console_appender = *console;

    return true;
}

} // namespace

namespace config
{

bool ParseAppConfig(const std::string& tomlText, AppConfig& outConfig, std::string& outError)
{
    toml::table root;
    try
    {
        root = toml::parse(tomlText);
    }
    catch (const toml::parse_error& pe)
    {
        outError = std::string("config parse error: ") + std::string(pe.description());
        if (pe.source().begin.line > 0)
        {
            outError += " at line " + std::to_string(pe.source().begin.line);
        }
        return false;
    }

    AppConfig parsed = outConfig;
    if (auto updaterTable = root["updater"].as_table())
    {
        if (!applyUpdaterTable(*updaterTable, parsed.updater, outError))
            return false;
    }
    if (auto logTable = root["log"].as_table())
    {
        if (!applyLogTable(*logTable, parsed.log, outError))
            return false;
    }

    outConfig = std::move(parsed);
    return true;
}

bool LoadAppConfig(const std::string& path, bool required, AppConfig& outConfig, std::string& outError)
{
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs)
    {
        if (required)
        {
            outError = "config file not found: " + path;
            return false;
        }
        PLOG_DEBUG << "No config file at " << path << ", using defaults";
        return true;
    }

    std::ostringstream content;
    content << ifs.rdbuf();
    if (!ParseAppConfig(content.str(), outConfig, outError))
    {
        outError += " (" + path + ")";
        return false;
    }
    return true;
}

} // namespace config
