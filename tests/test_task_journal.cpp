#include <catch2/catch.hpp>

#include "dlmanager/errors.hpp"
#include "dlmanager/task_journal.hpp"
#include "test_support.hpp"

using namespace dlmanager;

namespace {

const std::string kIdA = "0F8FAD5B-D9CB-469F-A165-70867728950E";
const std::string kIdB = "7C9E6679-7425-40DE-944B-E07FC1F90AE7";

} // namespace

TEST_CASE("journal survives a save and load") {
    dlmanager::testing::TempDir temp;
    TaskJournal journal(temp.path() / "state" / "journal.json");

    DownloadTask first;
    first.id = kIdA;
    first.url = "https://example.com/a.zip";
    first.fileName = "a.zip";
    first.priority = DownloadPriority::High;
    first.state = DownloadState::Completed;
    first.progress = 1.0;

    DownloadTask second;
    second.id = kIdB;
    second.url = "https://example.com/b";
    second.fileName = "odd\tname \"quoted\"";
    second.state = DownloadState::Failed;
    second.error = std::string{"line one\nline two \\ end"};

    journal.save({first, second});
    const auto loaded = journal.load();

    REQUIRE(loaded.size() == 2);
    REQUIRE(loaded[0].id == kIdA);
    REQUIRE(loaded[0].priority == DownloadPriority::High);
    REQUIRE(loaded[0].state == DownloadState::Completed);
    REQUIRE(loaded[0].progress == Approx(1.0));
    REQUIRE_FALSE(loaded[0].error.has_value());
    REQUIRE(loaded[1].fileName == "odd\tname \"quoted\"");
    REQUIRE(loaded[1].error == std::string{"line one\nline two \\ end"});
}

TEST_CASE("a missing journal loads as empty") {
    dlmanager::testing::TempDir temp;
    TaskJournal journal(temp.path() / "nothing.json");
    REQUIRE(journal.load().empty());
}

TEST_CASE("malformed journal entries are skipped") {
    const std::string contents = R"([
        {"id": "0F8FAD5B-D9CB-469F-A165-70867728950E", "state": "queued", "priority": "normal",
         "progress": 0.0, "url": "https://example.com/a", "fileName": "a", "error": null},
        {"id": "7C9E6679-7425-40DE-944B-E07FC1F90AE7", "state": "queued"},
        {"id": "7C9E6679-7425-40DE-944B-E07FC1F90AE7", "state": "bogus", "priority": "normal",
         "progress": 0.0, "url": "https://example.com/b", "fileName": "b", "error": null},
        {"id": "7C9E6679-7425-40DE-944B-E07FC1F90AE7", "state": "paused", "priority": "low",
         "progress": "half", "url": "https://example.com/c", "fileName": "c", "error": null},
        "not an object",
        {"id": "7C9E6679-7425-40DE-944B-E07FC1F90AE7", "state": "paused", "priority": "low",
         "progress": 0.25, "url": "https://example.com/d", "fileName": "d"}
    ])";

    const auto tasks = TaskJournal::parse(contents);
    REQUIRE(tasks.size() == 2);
    REQUIRE(tasks[0].id == kIdA);
    REQUIRE(tasks[1].url == "https://example.com/d");
    REQUIRE(tasks[1].state == DownloadState::Paused);
    REQUIRE(tasks[1].progress == Approx(0.25));
    REQUIRE_FALSE(tasks[1].error.has_value());
}

TEST_CASE("journal entries that would escape the download directory are dropped") {
    const std::string contents = R"([
        {"id": "..", "state": "failed", "priority": "normal",
         "progress": 0.0, "url": "https://example.com/a", "fileName": "a", "error": null},
        {"id": "not-a-generated-id", "state": "failed", "priority": "normal",
         "progress": 0.0, "url": "https://example.com/a", "fileName": "a", "error": null},
        {"id": "0F8FAD5B-D9CB-469F-A165-70867728950E", "state": "completed", "priority": "normal",
         "progress": 1.0, "url": "https://example.com/a", "fileName": "../../etc/passwd", "error": null},
        {"id": "0F8FAD5B-D9CB-469F-A165-70867728950E", "state": "completed", "priority": "normal",
         "progress": 1.0, "url": "https://example.com/a", "fileName": "..", "error": null}
    ])";

    REQUIRE(TaskJournal::parse(contents).empty());
}

TEST_CASE("a journal that is not a JSON array is a storage failure") {
    try {
        (void)TaskJournal::parse("{ this is not json");
        FAIL("parse should throw");
    } catch (const DownloadError& ex) {
        REQUIRE(ex.kind() == ErrorKind::StorageFailure);
    }
    REQUIRE_THROWS_AS(TaskJournal::parse(R"({"id": "x"})"), DownloadError);
}

TEST_CASE("task ids and file names are checked as single path components") {
    REQUIRE(isValidTaskId(generateTaskId()));
    REQUIRE_FALSE(isValidTaskId(".."));
    REQUIRE_FALSE(isValidTaskId("0F8FAD5B-D9CB-469F-A165-70867728950E/.."));
    REQUIRE(isPlainFileName("report.pdf"));
    REQUIRE_FALSE(isPlainFileName("a/b.pdf"));
    REQUIRE_FALSE(isPlainFileName(".."));
    REQUIRE_FALSE(isPlainFileName(""));
}
