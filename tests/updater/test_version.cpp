#include <catch2/catch_test_macros.hpp>
#include "updater/Version.hpp"

#include <string>
#include <tuple>

using namespace updater;

TEST_CASE("Version parsing", "[updater][version]") {
    SECTION("Full triple") {
        Version v("1.2.3");
        REQUIRE(v.major() == 1);
        REQUIRE(v.minor() == 2);
        REQUIRE(v.patch() == 3);
        REQUIRE(v.toString() == "1.2.3");
    }

    SECTION("Leading v is stripped") {
        REQUIRE(Version("v2.0.1") == Version(2, 0, 1));
    }

    SECTION("Missing components default to zero") {
        REQUIRE(Version("3") == Version(3, 0, 0));
        REQUIRE(Version("3.4") == Version(3, 4, 0));
        REQUIRE(Version("") == Version(0, 0, 0));
    }

    SECTION("Suffix after the first dash is ignored") {
        REQUIRE(Version("1.0.0-beta") == Version(1, 0, 0));
        REQUIRE(Version("v1.4.2-wails+build.7") == Version(1, 4, 2));
    }

    SECTION("Non-numeric components parse as zero") {
        REQUIRE(Version("1.x.0") == Version(1, 0, 0));
        REQUIRE(Version("garbage") == Version(0, 0, 0));
        REQUIRE(Version("2rc.1") == Version(2, 1, 0));
    }

    SECTION("Extra components are ignored") {
        REQUIRE(Version("1.2.3.4") == Version(1, 2, 3));
    }
}

TEST_CASE("IsNewerVersion ordering", "[updater][version]") {
    SECTION("Numeric triples compare as integer tuples") {
        REQUIRE(IsNewerVersion("1.2.0", "1.3.0"));
        REQUIRE_FALSE(IsNewerVersion("2.0.0", "1.9.9"));
        REQUIRE_FALSE(IsNewerVersion("1.0.0", "1.0.0"));
        REQUIRE(IsNewerVersion("1.9.9", "1.10.0"));
        REQUIRE(IsNewerVersion("0.0.9", "0.0.10"));
        REQUIRE_FALSE(IsNewerVersion("1.10.0", "1.9.99"));
    }

    SECTION("Prefix on either side does not matter") {
        REQUIRE(IsNewerVersion("v1.2.0", "1.2.1"));
        REQUIRE(IsNewerVersion("1.2.0", "v1.2.1"));
        REQUIRE_FALSE(IsNewerVersion("v1.2.1", "v1.2.1"));
    }

    SECTION("Suffix-only differences are equal") {
        REQUIRE_FALSE(IsNewerVersion("1.0.0-beta", "1.0.0-rc"));
        REQUIRE_FALSE(IsNewerVersion("1.0.0-rc", "1.0.0-beta"));
        REQUIRE_FALSE(IsNewerVersion("1.0.0", "1.0.0-hotfix"));
    }

    SECTION("Malformed input is lenient") {
        REQUIRE(IsNewerVersion("1.x.0", "1.1.0"));
        REQUIRE(IsNewerVersion("", "0.0.1"));
        REQUIRE_FALSE(IsNewerVersion("0.0.1", "not-a-version"));
    }

    SECTION("Exhaustive small grid agrees with tuple ordering") {
        for (int a = 0; a < 3; ++a)
            for (int b = 0; b < 3; ++b)
                for (int c = 0; c < 3; ++c)
                    for (int x = 0; x < 3; ++x)
                        for (int y = 0; y < 3; ++y)
                            for (int z = 0; z < 3; ++z) {
                                std::string cur = std::to_string(a) + "." + std::to_string(b) + "." + std::to_string(c);
                                std::string lat = std::to_string(x) + "." + std::to_string(y) + "." + std::to_string(z);
                                bool expected = std::make_tuple(x, y, z) > std::make_tuple(a, b, c);
                                REQUIRE(IsNewerVersion(cur, lat) == expected);
                            }
    }
}

TEST_CASE("StripVersionPrefix", "[updater][version]") {
    REQUIRE(StripVersionPrefix("v1.2.3") == "1.2.3");
    REQUIRE(StripVersionPrefix("1.2.3") == "1.2.3");
    REQUIRE(StripVersionPrefix("vv1") == "v1");
    REQUIRE(StripVersionPrefix("") == "");
}
