#include <catch2/catch.hpp>

#include "dlmanager/curl_transport.hpp"
#include "test_support.hpp"

#include <atomic>
#include <filesystem>
#include <mutex>
#include <string>

using namespace dlmanager;
using dlmanager::testing::TempDir;
using dlmanager::testing::readFile;
using dlmanager::testing::waitUntil;
using dlmanager::testing::writeFile;

namespace {

struct Outcome {
    std::mutex mutex;
    std::string body;
    std::string error;
    std::atomic<bool> finished{false};
    std::atomic<bool> failed{false};

    TransferCallbacks callbacks() {
        TransferCallbacks callbacks;
        callbacks.onProgress = [](std::uint64_t, std::uint64_t, std::uint64_t) {};
        callbacks.onError = [this](const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex);
            error = message;
            failed = true;
        };
        callbacks.onFinished = [this](const std::filesystem::path& file) {
            std::lock_guard<std::mutex> lock(mutex);
            body = readFile(file);
            finished = true;
        };
        return callbacks;
    }
};

bool isEmptyDirectory(const std::filesystem::path& directory) {
    return !std::filesystem::exists(directory) || std::filesystem::is_empty(directory);
}

} // namespace

TEST_CASE("curl transport delivers a body and joins its worker without another start") {
    TempDir temp;
    const auto source = temp.path() / "source.txt";
    writeFile(source, "local body");
    const auto scratch = temp.path() / "tmp";

    CurlTransport transport(scratch, 5);
    Outcome outcome;
    auto handle = transport.start("file://" + source.string(), outcome.callbacks());
    REQUIRE(handle != nullptr);

    REQUIRE(waitUntil([&] { return outcome.finished.load(); }));
    REQUIRE(waitUntil([&] { return transport.workerCount() == 0; }));
    REQUIRE_FALSE(outcome.failed.load());
    {
        std::lock_guard<std::mutex> lock(outcome.mutex);
        REQUIRE(outcome.body == "local body");
    }
    REQUIRE(isEmptyDirectory(scratch));
}

TEST_CASE("curl transport reports a transfer that cannot be read") {
    TempDir temp;
    const auto scratch = temp.path() / "tmp";

    CurlTransport transport(scratch, 5);
    Outcome outcome;
    auto handle = transport.start("file://" + (temp.path() / "missing.txt").string(), outcome.callbacks());

    REQUIRE(waitUntil([&] { return outcome.failed.load(); }));
    REQUIRE(waitUntil([&] { return transport.workerCount() == 0; }));
    REQUIRE_FALSE(outcome.finished.load());
    {
        std::lock_guard<std::mutex> lock(outcome.mutex);
        REQUIRE(outcome.error.find("curl error") != std::string::npos);
    }
    REQUIRE(isEmptyDirectory(scratch));
}
