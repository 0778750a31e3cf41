#include <catch2/catch.hpp>

#include "dlmanager/config.hpp"
#include "dlmanager/errors.hpp"
#include "test_support.hpp"

using namespace dlmanager;

TEST_CASE("default configuration") {
    DownloadManagerConfig config;
    REQUIRE(config.maxConcurrentDownloads == 3);
    REQUIRE(config.maxQueueSize == 100);
    REQUIRE(config.maxRetryAttempts == 3);
    REQUIRE(config.allowsCellularAccess);
    REQUIRE(config.minFreeDiskSpace == 1024ULL * 1024ULL * 1024ULL);
    REQUIRE(config.timeoutSeconds == 60);
    REQUIRE(config.schedulerInterval == std::chrono::milliseconds(1000));
    REQUIRE(config.journalPath.empty());
    REQUIRE_FALSE(config.downloadDirectory.empty());
    REQUIRE_NOTHROW(config.validate());
}

TEST_CASE("parseConfigString applies known keys") {
    const std::string env =
        "# comment\n"
        "max_concurrent_downloads=5\n"
        "MAX_QUEUE_SIZE = 10\n"
        "allows_cellular_access=false\n"
        "download_directory=\"/data/downloads\"\n"
        "min_free_disk_space=0\n"
        "timeout_seconds=15\r\n"
        "scheduler_interval_ms=250\n"
        "journal_path=/data/journal.json\n"
        "log_level=Debug\n"
        "not_a_key=1\n";

    DownloadManagerConfig config;
    parseConfigString(env, config);
    REQUIRE(config.maxConcurrentDownloads == 5);
    REQUIRE(config.maxQueueSize == 10);
    REQUIRE_FALSE(config.allowsCellularAccess);
    REQUIRE(config.downloadDirectory == "/data/downloads");
    REQUIRE(config.minFreeDiskSpace == 0);
    REQUIRE(config.timeoutSeconds == 15);
    REQUIRE(config.schedulerInterval == std::chrono::milliseconds(250));
    REQUIRE(config.journalPath == "/data/journal.json");
    REQUIRE(config.logLevel == "debug");
    REQUIRE_NOTHROW(config.validate());
}

TEST_CASE("parseConfigString rejects malformed values") {
    DownloadManagerConfig config;
    REQUIRE_THROWS_AS(parseConfigString("max_queue_size=lots\n", config), DownloadError);
    REQUIRE_THROWS_AS(parseConfigString("allows_cellular_access=maybe\n", config), DownloadError);
    REQUIRE_THROWS_AS(parseConfigString("timeout_seconds=-4\n", config), DownloadError);
}

TEST_CASE("parseConfigString rejects integers that do not fit the setting") {
    DownloadManagerConfig config;
    REQUIRE_THROWS_AS(parseConfigString("timeout_seconds=4294967297\n", config), DownloadError);
    REQUIRE_THROWS_AS(parseConfigString("max_retry_attempts=2147483648\n", config), DownloadError);
    REQUIRE(config.timeoutSeconds == DownloadManagerConfig{}.timeoutSeconds);

    parseConfigString("timeout_seconds=2147483647\n", config);
    REQUIRE(config.timeoutSeconds == 2147483647);
}

TEST_CASE("validate rejects out of range settings") {
    auto expectInvalid = [](const DownloadManagerConfig& config) {
        try {
            config.validate();
            FAIL("validate should throw");
        } catch (const DownloadError& ex) {
            REQUIRE(ex.kind() == ErrorKind::InvalidConfig);
        }
    };

    DownloadManagerConfig config;
    config.maxConcurrentDownloads = 0;
    expectInvalid(config);

    config = DownloadManagerConfig{};
    config.maxQueueSize = 0;
    expectInvalid(config);

    config = DownloadManagerConfig{};
    config.timeoutSeconds = 0;
    expectInvalid(config);

    config = DownloadManagerConfig{};
    config.logLevel = "chatty";
    expectInvalid(config);
}

TEST_CASE("loadConfigFile reads a file and reports a missing one") {
    dlmanager::testing::TempDir temp;
    const auto path = temp.path() / "dlmanager.env";
    dlmanager::testing::writeFile(path, "max_concurrent_downloads=7\n");

    DownloadManagerConfig config;
    loadConfigFile(path, config);
    REQUIRE(config.maxConcurrentDownloads == 7);

    REQUIRE_THROWS_AS(loadConfigFile(temp.path() / "missing.env", config), DownloadError);
}
