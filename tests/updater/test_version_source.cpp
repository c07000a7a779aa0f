#include <catch2/catch_test_macros.hpp>
#include "updater/VersionSource.hpp"
#include "../utils/mock_http.hpp"

#include <memory>

using namespace updater;
using test_utils::MockHttpClient;
using test_utils::MockResponses;

namespace {

const char* kVersionUrl = "https://raw.githubusercontent.com/miken90/fkey/main/VERSION";

UpdaterConfig testConfig() {
    UpdaterConfig config;
    config.currentVersion = "1.2.0";
    return config;
}

} // namespace

TEST_CASE("HttpVersionSource - URL and request", "[updater][version_source]") {
    auto http = std::make_shared<MockHttpClient>();
    HttpVersionSource source(http, testConfig());

    SECTION("URL is built from owner, repo and branch") {
        REQUIRE(source.url() == kVersionUrl);
    }

    SECTION("Custom branch and template are honoured") {
        UpdaterConfig config = testConfig();
        config.owner = "acme";
        config.repo = "tool";
        config.branch = "release";
        config.versionUrlTemplate = "https://cdn.example.com/{owner}/{repo}@{branch}/VERSION";
        HttpVersionSource custom(http, config);
        REQUIRE(custom.url() == "https://cdn.example.com/acme/tool@release/VERSION");
    }

    SECTION("Sends the user agent with a 10 second timeout") {
        http->setResponse(kVersionUrl, MockResponses::text("1.0.0"));
        std::string version;
        UpdateError error;
        REQUIRE(source.fetchLatest(version, error));

        auto cfg = http->lastConfig();
        REQUIRE(test_utils::headerValue(cfg, "User-Agent") == "FKey-Updater/1.0");
        REQUIRE(cfg.timeout_ms == 10000);
    }
}

TEST_CASE("HttpVersionSource - responses", "[updater][version_source]") {
    auto http = std::make_shared<MockHttpClient>();
    HttpVersionSource source(http, testConfig());
    std::string version;
    UpdateError error;

    SECTION("Body is trimmed and returned verbatim") {
        http->setResponse(kVersionUrl, MockResponses::text("  v1.3.0\r\n"));
        REQUIRE(source.fetchLatest(version, error));
        REQUIRE(version == "v1.3.0");
        REQUIRE_FALSE(error.isError());
    }

    SECTION("Content is not validated here") {
        http->setResponse(kVersionUrl, MockResponses::text("\tnightly-build\n"));
        REQUIRE(source.fetchLatest(version, error));
        REQUIRE(version == "nightly-build");
    }

    SECTION("404 means the version file is missing") {
        http->setResponse(kVersionUrl, MockResponses::status(404));
        REQUIRE_FALSE(source.fetchLatest(version, error));
        REQUIRE(error.kind == UpdateErrorKind::NotFound);
    }

    SECTION("Other statuses are server errors carrying the code") {
        http->setResponse(kVersionUrl, MockResponses::status(503));
        REQUIRE_FALSE(source.fetchLatest(version, error));
        REQUIRE(error.kind == UpdateErrorKind::Server);
        REQUIRE(error.errorCode == 503);
    }

    SECTION("Transport failures are network errors wrapping the cause") {
        http->setResponse(kVersionUrl, MockResponses::timeout_error());
        REQUIRE_FALSE(source.fetchLatest(version, error));
        REQUIRE(error.kind == UpdateErrorKind::Network);
        REQUIRE(error.technicalInfo == "Request timeout");
    }
}
