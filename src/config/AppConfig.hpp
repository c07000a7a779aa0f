#pragma once

#include "../updater/UpdaterConfig.hpp"
#include "../utils/LogManager.hpp"

#include <string>

namespace config
{

struct AppConfig
{
    updater::UpdaterConfig updater;
    utils::LogManager::LoggerConfig log;
};

// Load [updater] and [log] tables from a TOML file on top of the defaults in
// outConfig. A missing file is an error only when required is true.
bool LoadAppConfig(const std::string& path, bool required, AppConfig& outConfig, std::string& outError);

// Same, from TOML text already in memory
bool ParseAppConfig(const std::string& tomlText, AppConfig& outConfig, std::string& outError);

} // namespace config
