#include "Version.hpp"

#include <charconv>
#include <sstream>

namespace updater
{

namespace
{

// Leading decimal digits of a field, 0 when there are none or on overflow
int parseField(const std::string& field)
{
    int value = 0;
    auto result = std::from_chars(field.data(), field.data() + field.size(), value);
    if (result.ec != std::errc())
    {
        return 0;
    }
    return value < 0 ? 0 : value;
}

} // namespace

Version::Version() : major_(0), minor_(0), patch_(0)
{
}

Version::Version(int major, int minor, int patch) : major_(major), minor_(minor), patch_(patch)
{
}

Version::Version(const std::string& versionString) : major_(0), minor_(0), patch_(0)
{
    parseString(versionString);
}

std::string Version::toString() const
{
    std::ostringstream oss;
    oss << major_ << "." << minor_ << "." << patch_;
    return oss.str();
}

void Version::parseString(const std::string& versionString)
{
    // Supported shapes, all of which parse:
    // - "1.2.3", "v1.2.3"
    // - "1.2" / "1" (missing components are 0)
    // - "1.2.3-beta" (suffix ignored)
    // - "1.x.0" (non-numeric component is 0)
    std::string cleaned = StripVersionPrefix(versionString);

    size_t dash = cleaned.find('-');
    if (dash != std::string::npos)
    {
        cleaned.erase(dash);
    }

    int* fields[] = { &major_, &minor_, &patch_ };
    size_t start = 0;
    for (int* field : fields)
    {
        if (start > cleaned.size())
        {
            break;
        }

        size_t dot = cleaned.find('.', start);
        std::string part = cleaned.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
        *field = parseField(part);

        if (dot == std::string::npos)
        {
            break;
        }
        start = dot + 1;
    }
}

std::string StripVersionPrefix(const std::string& version)
{
    if (!version.empty() && version[0] == 'v')
    {
        return version.substr(1);
    }
    return version;
}

bool IsNewerVersion(const std::string& current, const std::string& latest)
{
    return Version(latest) > Version(current);
}

} // namespace updater
