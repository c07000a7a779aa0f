#pragma once

#include "UpdateTypes.hpp"
#include "UpdaterConfig.hpp"

#include <string>

namespace updater
{

// Combine the configured current version with a freshly fetched latest version.
// Both are compared without their 'v' prefix; latestVersion is reported with one.
UpdateDecision BuildUpdateDecision(const UpdaterConfig& config, const std::string& latestVersion);

} // namespace updater
