#include "UpdaterConfig.hpp"
#include "Version.hpp"
#include "../utils/StringUtils.hpp"

#include <system_error>

namespace fs = std::filesystem;

namespace updater
{

std::string UpdaterConfig::expand(const std::string& tmpl, const std::string& version) const
{
    return utils::FillTemplate(tmpl, {
                                         { "{owner}", owner },
                                         { "{repo}", repo },
                                         { "{branch}", branch },
                                         { "{product}", productName },
                                         { "{version}", StripVersionPrefix(version) },
                                     });
}

fs::path UpdaterConfig::tempRoot() const
{
    if (!tempDirectory.empty())
    {
        return tempDirectory;
    }

    std::error_code ec;
    fs::path tmp = fs::temp_directory_path(ec);
    if (ec)
    {
#ifdef _WIN32
        return fs::path("C:\\Windows\\Temp");
#else
        return fs::path("/tmp");
#endif
    }
    return tmp;
}

fs::path UpdaterConfig::artifactPath(const std::string& fileName) const
{
    return tempRoot() / (tempPrefix + "-update-" + fileName);
}

fs::path UpdaterConfig::scratchDirectory() const
{
    return tempRoot() / (tempPrefix + "-update-extract");
}

bool UpdaterConfig::validate(std::string& outError) const
{
    if (currentVersion.empty())
    {
        outError = "current_version must not be empty";
        return false;
    }
    if (owner.empty() || repo.empty())
    {
        outError = "owner and repo must not be empty";
        return false;
    }
    if (checkInterval.count() <= 0)
    {
        outError = "check interval must be positive";
        return false;
    }
    if (tempPrefix.empty() || tempPrefix.find_first_of("/\\") != std::string::npos)
    {
        outError = "temp_prefix must be a plain, non-empty name";
        return false;
    }
    if (versionUrlTemplate.empty() || downloadUrlTemplate.empty())
    {
        outError = "version_url and download_url must not be empty";
        return false;
    }
    return true;
}

} // namespace updater
