#include <catch2/catch.hpp>

#include "dlmanager/download_storage.hpp"
#include "dlmanager/errors.hpp"
#include "test_support.hpp"

using namespace dlmanager;
using dlmanager::testing::TempDir;
using dlmanager::testing::readFile;
using dlmanager::testing::writeFile;

namespace {

DownloadTask makeTask(const std::string& id, const std::string& file_name) {
    DownloadTask task;
    task.id = id;
    task.url = "https://example.com/" + file_name;
    task.fileName = file_name;
    return task;
}

} // namespace

TEST_CASE("storage keeps one directory per task") {
    TempDir temp;
    DownloadStorage storage(temp.path() / "base");
    REQUIRE(std::filesystem::is_directory(temp.path() / "base"));

    const auto task = makeTask("T1", "file.bin");
    storage.createDirectory(task);
    REQUIRE(std::filesystem::is_directory(storage.directoryFor("T1")));
    REQUIRE_FALSE(storage.fileExists(task));

    const auto source = temp.path() / "source.bin";
    writeFile(source, "payload");
    storage.saveFile(source, task);

    REQUIRE(storage.fileExists(task));
    REQUIRE(storage.fileFor(task) == temp.path() / "base" / "T1" / "file.bin");
    REQUIRE(readFile(storage.fileFor(task)) == "payload");
}

TEST_CASE("saveFile overwrites an existing artifact") {
    TempDir temp;
    DownloadStorage storage(temp.path() / "base");
    const auto task = makeTask("T1", "file.bin");

    const auto source = temp.path() / "source.bin";
    writeFile(source, "first");
    storage.saveFile(source, task);
    writeFile(source, "second");
    storage.saveFile(source, task);

    REQUIRE(readFile(storage.fileFor(task)) == "second");
}

TEST_CASE("removeTask and clearAll delete artifacts") {
    TempDir temp;
    DownloadStorage storage(temp.path() / "base");
    const auto first = makeTask("T1", "a.bin");
    const auto second = makeTask("T2", "b.bin");
    const auto source = temp.path() / "source.bin";
    writeFile(source, "x");
    storage.saveFile(source, first);
    storage.saveFile(source, second);

    storage.removeTask("T1");
    REQUIRE_FALSE(std::filesystem::exists(storage.directoryFor("T1")));
    REQUIRE(storage.fileExists(second));

    // Removing an unknown task is not an error.
    REQUIRE_NOTHROW(storage.removeTask("missing"));

    storage.clearAll();
    REQUIRE_FALSE(storage.fileExists(second));
    REQUIRE(std::filesystem::is_directory(storage.baseDirectory()));
}

TEST_CASE("saving a missing source reports a storage failure") {
    TempDir temp;
    DownloadStorage storage(temp.path() / "base");
    const auto task = makeTask("T1", "a.bin");

    try {
        storage.saveFile(temp.path() / "does-not-exist", task);
        FAIL("saveFile should throw");
    } catch (const DownloadError& ex) {
        REQUIRE(ex.kind() == ErrorKind::StorageFailure);
    }
}

TEST_CASE("ids and file names that leave the task directory are refused") {
    TempDir temp;
    DownloadStorage storage(temp.path() / "base");
    writeFile(temp.path() / "sibling.txt", "keep");

    try {
        storage.removeTask("..");
        FAIL("removeTask should throw");
    } catch (const DownloadError& ex) {
        REQUIRE(ex.kind() == ErrorKind::StorageFailure);
    }
    REQUIRE_THROWS_AS(storage.directoryFor("a/b"), DownloadError);
    REQUIRE_THROWS_AS(storage.fileFor(makeTask("T1", "../escape.bin")), DownloadError);
    REQUIRE_FALSE(storage.fileExists(makeTask("..", "sibling.txt")));
    REQUIRE_FALSE(storage.fileExists(makeTask("T1", "../../sibling.txt")));

    REQUIRE(std::filesystem::is_directory(temp.path() / "base"));
    REQUIRE(readFile(temp.path() / "sibling.txt") == "keep");
}
