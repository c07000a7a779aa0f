#include "UpdateInfoBuilder.hpp"
#include "Version.hpp"

namespace updater
{

UpdateDecision BuildUpdateDecision(const UpdaterConfig& config, const std::string& latestVersion)
{
    std::string latest = StripVersionPrefix(latestVersion);
    std::string current = StripVersionPrefix(config.currentVersion);

    UpdateDecision decision;
    decision.currentVersion = config.currentVersion;
    decision.latestVersion = "v" + latest;
    decision.downloadUrl = config.expand(config.downloadUrlTemplate, latest);
    decision.releaseUrl = config.expand(config.releaseUrlTemplate, latest);
    decision.releaseNotesUrl = decision.releaseUrl;
    decision.assetName = config.expand(config.assetNameTemplate, latest);
    decision.assetSize = kUnknownSize;
    decision.available = IsNewerVersion(current, latest);
    return decision;
}

} // namespace updater
