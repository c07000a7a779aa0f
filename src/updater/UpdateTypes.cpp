#include "UpdateTypes.hpp"

namespace updater
{

std::string UpdateError::describe() const
{
    if (technicalInfo.empty())
    {
        return message;
    }
    return message + " (" + technicalInfo + ")";
}

const char* UpdateErrorKindToString(UpdateErrorKind kind)
{
    switch (kind)
    {
    case UpdateErrorKind::None:
        return "none";
    case UpdateErrorKind::Network:
        return "network error";
    case UpdateErrorKind::NotFound:
        return "not found";
    case UpdateErrorKind::Server:
        return "server error";
    case UpdateErrorKind::CorruptArchive:
        return "corrupt archive";
    case UpdateErrorKind::IO:
        return "I/O error";
    }
    return "unknown";
}

} // namespace updater
