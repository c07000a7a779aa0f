#include "ArchiveExtractor.hpp"

#include <plog/Log.h>

#define MINIZ_NO_ZLIB_APIS
#define MINIZ_NO_ARCHIVE_WRITING_APIS
#include <miniz.h>

#include <algorithm>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

using updater::UpdateError;
using updater::UpdateErrorKind;

namespace
{

// Host system code stored by Unix zip tools in the "version made by" field
constexpr mz_uint16 kZipHostUnix = 3;

struct ZipReader
{
    mz_zip_archive zip{};
    bool open = false;

    ~ZipReader()
    {
        if (open)
        {
            mz_zip_reader_end(&zip);
        }
    }
};

size_t writeToStream(void* opaque, mz_uint64, const void* buf, size_t n)
{
    auto* out = static_cast<std::ofstream*>(opaque);
    out->write(static_cast<const char*>(buf), static_cast<std::streamsize>(n));
    return *out ? n : 0;
}

void applyUnixMode(const mz_zip_archive_file_stat& stat, const fs::path& path)
{
#ifndef _WIN32
    if ((stat.m_version_made_by >> 8) != kZipHostUnix)
    {
        return;
    }

    auto mode = static_cast<unsigned>(stat.m_external_attr >> 16) & 0777u;
    if (mode == 0)
    {
        return;
    }

    std::error_code ec;
    fs::permissions(path, static_cast<fs::perms>(mode), fs::perm_options::replace, ec);
    if (ec)
    {
        PLOG_WARNING << "Could not apply mode " << std::oct << mode << std::dec << " to " << path.string() << ": "
                     << ec.message();
    }
#else
    (void)stat;
    (void)path;
#endif
}

} // namespace

namespace utils
{

std::string ArchiveExtractor::SafeEntryName(const std::string& entryName)
{
    std::string name = entryName;
    std::replace(name.begin(), name.end(), '\\', '/');
    while (!name.empty() && name.back() == '/')
    {
        name.pop_back();
    }

    size_t slash = name.rfind('/');
    if (slash != std::string::npos)
    {
        name = name.substr(slash + 1);
    }

    if (name.empty() || name[0] == '.' || name.find(':') != std::string::npos)
    {
        return {};
    }
    return name;
}

bool ArchiveExtractor::Extract(const std::string& zipPath, const std::string& targetDir, UpdateError& outError)
{
    std::error_code ec;
    if (!fs::is_regular_file(zipPath, ec))
    {
        outError = UpdateError(UpdateErrorKind::IO, "Archive does not exist", zipPath);
        PLOG_ERROR << outError.describe();
        return false;
    }

    ZipReader reader;
    if (!mz_zip_reader_init_file(&reader.zip, zipPath.c_str(), 0))
    {
        mz_zip_error err = mz_zip_get_last_error(&reader.zip);
        auto kind = err == MZ_ZIP_FILE_OPEN_FAILED || err == MZ_ZIP_FILE_READ_FAILED ? UpdateErrorKind::IO
                                                                                      : UpdateErrorKind::CorruptArchive;
        outError = UpdateError(kind, "Failed to open ZIP archive: " + zipPath, mz_zip_get_error_string(err));
        PLOG_ERROR << outError.describe();
        return false;
    }
    reader.open = true;

    mz_uint fileCount = mz_zip_reader_get_num_files(&reader.zip);
    PLOG_INFO << "Extracting " << fileCount << " entries from " << zipPath << " into " << targetDir;

    for (mz_uint i = 0; i < fileCount; ++i)
    {
        mz_zip_archive_file_stat fileStat{};
        if (!mz_zip_reader_file_stat(&reader.zip, i, &fileStat))
        {
            outError = UpdateError(UpdateErrorKind::CorruptArchive, "Failed to read entry header",
                                   "entry #" + std::to_string(i) + " in " + zipPath);
            PLOG_ERROR << outError.describe();
            return false;
        }

        std::string entryName = fileStat.m_filename;
        std::string safeName = SafeEntryName(entryName);
        if (safeName.empty())
        {
            PLOG_WARNING << "Skipping entry: '" << entryName << "'";
            continue;
        }

        fs::path destPath = fs::path(targetDir) / safeName;

        if (fileStat.m_is_directory)
        {
            fs::create_directories(destPath, ec);
            if (ec)
            {
                outError = UpdateError(UpdateErrorKind::IO, "Failed to create directory " + destPath.string(),
                                       ec.message());
                PLOG_ERROR << outError.describe();
                return false;
            }
            continue;
        }

        PLOG_DEBUG << "Extracting: '" << entryName << "' -> '" << destPath.string() << "'";

        std::ofstream outFile(destPath, std::ios::binary | std::ios::trunc);
        if (!outFile)
        {
            outError = UpdateError(UpdateErrorKind::IO, "Failed to create file " + destPath.string(),
                                   "entry '" + entryName + "'");
            PLOG_ERROR << outError.describe();
            return false;
        }

        if (!mz_zip_reader_extract_to_callback(&reader.zip, i, writeToStream, &outFile, 0))
        {
            mz_zip_error err = mz_zip_get_last_error(&reader.zip);
            outError = UpdateError(UpdateErrorKind::IO, "Failed to extract entry '" + entryName + "'",
                                   mz_zip_get_error_string(err));
            PLOG_ERROR << outError.describe();
            return false;
        }

        outFile.close();
        if (outFile.fail())
        {
            outError = UpdateError(UpdateErrorKind::IO, "Failed to write " + destPath.string());
            PLOG_ERROR << outError.describe();
            return false;
        }

        applyUnixMode(fileStat, destPath);
    }

    PLOG_INFO << "ZIP extraction completed successfully";
    return true;
}

} // namespace utils
