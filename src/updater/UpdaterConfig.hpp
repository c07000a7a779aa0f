#pragma once

#include <chrono>
#include <filesystem>
#include <string>

namespace updater
{

// Everything the embedding application tells the updater at construction.
// Nothing here is read from the environment.
//
// URL and name templates understand {owner}, {repo}, {branch}, {version}
// and {product}. {version} is always substituted without the 'v' prefix.
struct UpdaterConfig
{
    std::string currentVersion;
    std::string owner = "miken90";
    std::string repo = "fkey";
    std::string branch = "main";
    std::string productName = "FKey";
    std::chrono::seconds checkInterval = std::chrono::hours(24);
    std::string userAgent = "FKey-Updater/1.0";

    std::string versionUrlTemplate = "https://raw.githubusercontent.com/{owner}/{repo}/{branch}/VERSION";
    std::string downloadUrlTemplate =
        "https://github.com/{owner}/{repo}/releases/download/v{version}/{product}-v{version}-portable.zip";
    std::string releaseUrlTemplate = "https://github.com/{owner}/{repo}/releases/tag/v{version}";
    std::string assetNameTemplate = "{product}-v{version}-portable.zip";

    // Prefix for every temp artifact ("fkey" -> fkey-update-*, fkey-updater.*)
    std::string tempPrefix = "fkey";
    // Empty means the system temp directory
    std::filesystem::path tempDirectory;

    std::string expand(const std::string& tmpl, const std::string& version = {}) const;

    std::string versionUrl() const { return expand(versionUrlTemplate); }

    std::filesystem::path tempRoot() const;

    // <temp>/<prefix>-update-<fileName>
    std::filesystem::path artifactPath(const std::string& fileName) const;

    // <temp>/<prefix>-update-extract
    std::filesystem::path scratchDirectory() const;

    bool validate(std::string& outError) const;
};

} // namespace updater
