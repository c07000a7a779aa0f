#pragma once

#include "../updater/UpdateTypes.hpp"

#include <string>

namespace utils
{

// ZIP extraction for release artifacts, built on miniz.
//
// Every entry is reduced to its base name and written directly into the
// destination directory, so the archive's own directory layout is flattened.
// That is what keeps entries like "../../x" or "/etc/x" inside destDir. It is
// only suitable for the flat release archive shape and must not be turned into
// a path-preserving extractor.
class ArchiveExtractor
{
public:
    // Extract zipPath into the existing directory targetDir.
    // Errors: CorruptArchive when the container cannot be parsed, IO for a
    // missing/unreadable file or any entry that cannot be written.
    static bool Extract(const std::string& zipPath, const std::string& targetDir, updater::UpdateError& outError);

    // Name an entry would be extracted under, or empty when it is skipped
    // (empty base name, hidden "." name, or a name carrying a drive/stream colon)
    static std::string SafeEntryName(const std::string& entryName);
};

} // namespace utils
