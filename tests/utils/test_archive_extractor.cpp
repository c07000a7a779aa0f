#include <catch2/catch_test_macros.hpp>
#include "utils/ArchiveExtractor.hpp"
#include "zip_fixture.hpp"
#include "temp_dir.hpp"

#include <filesystem>

using utils::ArchiveExtractor;
using updater::UpdateError;
using updater::UpdateErrorKind;

namespace fs = std::filesystem;

TEST_CASE("ArchiveExtractor flattens entries into the destination", "[utils][archive]") {
    test_utils::TempDir temp;
    fs::path zip = temp / "release.zip";
    fs::path dest = temp / "out";
    fs::create_directories(dest);

    REQUIRE(test_utils::writeZip(zip, {
                                          { "FKey/", "" },
                                          { "FKey/FKey.exe", "MZ-binary" },
                                          { "FKey/docs/README.txt", "readme" },
                                          { ".hidden", "secret" },
                                          { "FKey/.DS_Store", "junk" },
                                      }));

    UpdateError error;
    REQUIRE(ArchiveExtractor::Extract(zip.string(), dest.string(), error));
    REQUIRE_FALSE(error.isError());

    REQUIRE(test_utils::readFile(dest / "FKey.exe") == "MZ-binary");
    REQUIRE(test_utils::readFile(dest / "README.txt") == "readme");
    REQUIRE(fs::is_directory(dest / "FKey"));
    REQUIRE_FALSE(fs::exists(dest / "FKey" / "FKey.exe"));
    REQUIRE_FALSE(fs::exists(dest / ".hidden"));
    REQUIRE_FALSE(fs::exists(dest / ".DS_Store"));
}

#ifndef _WIN32
TEST_CASE("ArchiveExtractor restores Unix permissions", "[utils][archive]") {
    test_utils::TempDir temp;
    fs::path zip = temp / "release.zip";
    fs::path dest = temp / "out";
    fs::create_directories(dest);

    REQUIRE(test_utils::writeZip(zip, {
                                          { "FKey/fkey", "ELF", 0755 },
                                          { "FKey/README", "notes", 0644 },
                                          { "FKey/plain.txt", "no mode" },
                                      }));

    UpdateError error;
    REQUIRE(ArchiveExtractor::Extract(zip.string(), dest.string(), error));

    auto exe = fs::status(dest / "fkey").permissions();
    REQUIRE((exe & fs::perms::owner_exec) != fs::perms::none);
    REQUIRE((exe & fs::perms::others_exec) != fs::perms::none);

    auto readme = fs::status(dest / "README").permissions();
    REQUIRE((readme & fs::perms::owner_exec) == fs::perms::none);
    REQUIRE((readme & fs::perms::owner_read) != fs::perms::none);

    REQUIRE(test_utils::readFile(dest / "plain.txt") == "no mode");
}
#endif

TEST_CASE("ArchiveExtractor keeps traversal entries inside the destination", "[utils][archive]") {
    test_utils::TempDir temp;
    fs::path zip = temp / "evil.zip";
    fs::path dest = temp / "a" / "b" / "out";
    fs::create_directories(dest);

    REQUIRE(test_utils::writeZip(zip, {
                                          { "../../escape.txt", "x" },
                                          { "dir/../../../up.txt", "y" },
                                          { "..", "z" },
                                      }));

    UpdateError error;
    REQUIRE(ArchiveExtractor::Extract(zip.string(), dest.string(), error));

    REQUIRE(test_utils::readFile(dest / "escape.txt") == "x");
    REQUIRE(test_utils::readFile(dest / "up.txt") == "y");
    REQUIRE_FALSE(fs::exists(temp / "a" / "escape.txt"));
    REQUIRE_FALSE(fs::exists(temp / "escape.txt"));
    REQUIRE_FALSE(fs::exists(temp / "up.txt"));
    REQUIRE_FALSE(fs::exists(temp / "a" / "b" / "up.txt"));
}

TEST_CASE("ArchiveExtractor overwrites existing files", "[utils][archive]") {
    test_utils::TempDir temp;
    fs::path zip = temp / "release.zip";
    fs::path dest = temp / "out";
    fs::create_directories(dest);
    test_utils::writeFile(dest / "FKey.exe", "an older and much longer binary");

    REQUIRE(test_utils::writeZip(zip, { { "FKey.exe", "new" } }));

    UpdateError error;
    REQUIRE(ArchiveExtractor::Extract(zip.string(), dest.string(), error));
    REQUIRE(test_utils::readFile(dest / "FKey.exe") == "new");
}

TEST_CASE("ArchiveExtractor error kinds", "[utils][archive]") {
    test_utils::TempDir temp;
    fs::path dest = temp / "out";
    fs::create_directories(dest);
    UpdateError error;

    SECTION("Missing archive is an IO error") {
        REQUIRE_FALSE(ArchiveExtractor::Extract((temp / "nope.zip").string(), dest.string(), error));
        REQUIRE(error.kind == UpdateErrorKind::IO);
    }

    SECTION("Garbage is a corrupt archive") {
        test_utils::writeFile(temp / "bad.zip", std::string(1000, 'Q'));
        REQUIRE_FALSE(ArchiveExtractor::Extract((temp / "bad.zip").string(), dest.string(), error));
        REQUIRE(error.kind == UpdateErrorKind::CorruptArchive);
    }

    SECTION("Truncated archive is a corrupt archive") {
        fs::path zip = temp / "cut.zip";
        REQUIRE(test_utils::writeZip(zip, { { "FKey.exe", std::string(5000, 'b') } }));
        std::string bytes = test_utils::readFile(zip);
        test_utils::writeFile(zip, bytes.substr(0, bytes.size() / 2));

        REQUIRE_FALSE(ArchiveExtractor::Extract(zip.string(), dest.string(), error));
        REQUIRE(error.kind == UpdateErrorKind::CorruptArchive);
    }
}

TEST_CASE("ArchiveExtractor::SafeEntryName", "[utils][archive]") {
    REQUIRE(ArchiveExtractor::SafeEntryName("FKey.exe") == "FKey.exe");
    REQUIRE(ArchiveExtractor::SafeEntryName("FKey/bin/FKey.exe") == "FKey.exe");
    REQUIRE(ArchiveExtractor::SafeEntryName("..\\..\\Windows\\evil.dll") == "evil.dll");
    REQUIRE(ArchiveExtractor::SafeEntryName("/etc/passwd") == "passwd");
    REQUIRE(ArchiveExtractor::SafeEntryName("FKey/") == "FKey");
    REQUIRE(ArchiveExtractor::SafeEntryName("..").empty());
    REQUIRE(ArchiveExtractor::SafeEntryName("dir/.env").empty());
    REQUIRE(ArchiveExtractor::SafeEntryName("C:evil.exe").empty());
    REQUIRE(ArchiveExtractor::SafeEntryName("file.txt:stream").empty());
    REQUIRE(ArchiveExtractor::SafeEntryName("").empty());
    REQUIRE(ArchiveExtractor::SafeEntryName("///").empty());
}
