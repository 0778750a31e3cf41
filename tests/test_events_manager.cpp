#include <catch2/catch.hpp>

#include "dlmanager/events_manager.hpp"

#include <mutex>
#include <stdexcept>
#include <variant>
#include <vector>

using namespace dlmanager;

namespace {

DownloadTask makeTask(const std::string& id, DownloadState state = DownloadState::Queued) {
    DownloadTask task;
    task.id = id;
    task.url = "https://example.com/" + id;
    task.fileName = id + ".bin";
    task.state = state;
    return task;
}

} // namespace

TEST_CASE("registry queries reflect updates and removals") {
    EventsManager events;
    events.updateTask(makeTask("a"));
    events.updateTask(makeTask("b", DownloadState::Downloading));
    events.updateTask(makeTask("c", DownloadState::Downloading));

    REQUIRE(events.hasTask("a"));
    REQUIRE(events.getTask("b")->state == DownloadState::Downloading);
    REQUIRE(events.getTasks(DownloadState::Downloading).size() == 2);

    auto a = makeTask("a", DownloadState::Completed);
    events.updateTask(a);
    const auto all = events.getAllTasks();
    REQUIRE(all.size() == 3);
    REQUIRE(all[0].id == "a");
    REQUIRE(all[0].state == DownloadState::Completed);

    events.removeTasks({"a", "b"});
    REQUIRE_FALSE(events.getTask("a").has_value());
    REQUIRE(events.getAllTasks().size() == 1);

    events.clearAllTasks();
    REQUIRE(events.getAllTasks().empty());
}

TEST_CASE("events are delivered in emission order") {
    EventsManager events;
    std::mutex mutex;
    std::vector<DownloadEvent> received;
    auto subscription = events.subscribe([&](const DownloadEvent& event) {
        std::lock_guard<std::mutex> lock(mutex);
        received.push_back(event);
    });

    events.emitStateChange("a", DownloadState::Downloading);
    events.emitProgress("a", 0.5, 128.0);
    events.emitError("a", "boom");
    events.emitQueueChanged();
    events.flush();

    std::lock_guard<std::mutex> lock(mutex);
    REQUIRE(received.size() == 4);
    REQUIRE(std::get<StateChangeEvent>(received[0]).state == DownloadState::Downloading);
    REQUIRE(std::get<ProgressEvent>(received[1]).progress == Approx(0.5));
    REQUIRE(std::get<ErrorEvent>(received[2]).message == "boom");
    REQUIRE(std::holds_alternative<QueueChangedEvent>(received[3]));
}

TEST_CASE("task subscribers get the current snapshot then every change") {
    EventsManager events;
    events.updateTask(makeTask("a"));

    std::mutex mutex;
    std::vector<std::size_t> sizes;
    auto subscription = events.subscribeTasks([&](const std::vector<DownloadTask>& tasks) {
        std::lock_guard<std::mutex> lock(mutex);
        sizes.push_back(tasks.size());
    });

    events.updateTask(makeTask("b"));
    events.removeTask("a");
    events.flush();

    std::lock_guard<std::mutex> lock(mutex);
    REQUIRE(sizes == std::vector<std::size_t>{1, 2, 1});
}

TEST_CASE("updateTaskAndEmitState stores before notifying") {
    EventsManager events;
    std::mutex mutex;
    std::vector<DownloadState> seen;
    auto subscription = events.subscribe([&](const DownloadEvent& event) {
        if (const auto* change = std::get_if<StateChangeEvent>(&event)) {
            // The registry already holds the new state when the event arrives.
            const auto stored = events.getTask(change->id);
            std::lock_guard<std::mutex> lock(mutex);
            seen.push_back(stored ? stored->state : DownloadState::Failed);
        }
    });

    events.updateTaskAndEmitState(makeTask("a", DownloadState::Paused));
    events.flush();

    std::lock_guard<std::mutex> lock(mutex);
    REQUIRE(seen == std::vector<DownloadState>{DownloadState::Paused});
}

TEST_CASE("a released subscription stops receiving events") {
    EventsManager events;
    int calls = 0;
    auto subscription = events.subscribe([&](const DownloadEvent&) { ++calls; });

    events.emitQueueChanged();
    events.flush();
    REQUIRE(calls == 1);

    subscription.reset();
    REQUIRE_FALSE(subscription.active());
    events.emitQueueChanged();
    events.flush();
    REQUIRE(calls == 1);
}

TEST_CASE("a throwing handler does not starve the others") {
    EventsManager events;
    int calls = 0;
    auto failing = events.subscribe([](const DownloadEvent&) { throw std::runtime_error("handler failure"); });
    auto counting = events.subscribe([&](const DownloadEvent&) { ++calls; });

    events.emitQueueChanged();
    events.emitQueueChanged();
    events.flush();
    REQUIRE(calls == 2);
}

TEST_CASE("a subscription may outlive its events manager") {
    Subscription subscription;
    {
        EventsManager events;
        subscription = events.subscribe([](const DownloadEvent&) {});
    }
    REQUIRE(subscription.active());
    subscription.reset();
    REQUIRE_FALSE(subscription.active());
}
