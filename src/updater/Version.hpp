#pragma once

#include <compare>
#include <string>

namespace updater
{

// Semantic version (major.minor.patch) with lenient parsing.
//
// Parsing never fails: a leading 'v' is dropped, everything from the first '-'
// (pre-release/build metadata) is ignored, and any missing or non-numeric
// component becomes 0. Two builds that differ only by suffix compare equal.
class Version
{
public:
    // Construct from version string (e.g., "0.1.0", "v1.2.3-beta")
    explicit Version(const std::string& versionString);

    // Construct from components
    Version(int major, int minor, int patch);

    // Default constructor (0.0.0)
    Version();

    int major() const { return major_; }

    int minor() const { return minor_; }

    int patch() const { return patch_; }

    // Convert to string (e.g., "0.1.0")
    std::string toString() const;

    auto operator<=>(const Version& other) const = default;

private:
    int major_;
    int minor_;
    int patch_;

    void parseString(const std::string& versionString);
};

// Remove one leading 'v' if present ("v1.2.0" -> "1.2.0")
std::string StripVersionPrefix(const std::string& version);

// True when latest is strictly newer than current under Version ordering
bool IsNewerVersion(const std::string& current, const std::string& latest);

} // namespace updater
