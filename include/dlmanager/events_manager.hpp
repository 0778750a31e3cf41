#pragma once

#include "detail/serial_executor.hpp"
#include "download_event.hpp"
#include "download_task.hpp"
#include "subscription.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace dlmanager {

// Registry of record for every task plus a broadcast bus for DownloadEvents and
// registry snapshots.
//
// Mutations are applied under the registry lock and their notifications are
// queued while still holding it, so the delivery order always matches the
// order in which the registry changed. Handlers run on a dedicated dispatcher
// thread without any lock held and may call back into the registry.
class EventsManager {
public:
    using EventHandler = std::function<void(const DownloadEvent&)>;
    using SnapshotHandler = std::function<void(const std::vector<DownloadTask>&)>;

    EventsManager();
    ~EventsManager();

    EventsManager(const EventsManager&) = delete;
    EventsManager& operator=(const EventsManager&) = delete;

    [[nodiscard]] Subscription subscribe(EventHandler handler);
    // The handler first receives the current snapshot.
    [[nodiscard]] Subscription subscribeTasks(SnapshotHandler handler);

    void emitProgress(const TaskId& id, double progress, double speed);
    void emitStateChange(const TaskId& id, DownloadState state);
    void emitError(const TaskId& id, const std::string& message);
    void emitQueueChanged();

    void updateTask(const DownloadTask& task);
    void updateTasks(const std::vector<DownloadTask>& tasks);
    void removeTask(const TaskId& id);
    void removeTasks(const std::vector<TaskId>& ids);
    void clearAllTasks();

    // Stores the task and queues a StateChange for its current state as one step.
    void updateTaskAndEmitState(const DownloadTask& task);

    [[nodiscard]] std::vector<DownloadTask> getAllTasks() const;
    [[nodiscard]] std::optional<DownloadTask> getTask(const TaskId& id) const;
    [[nodiscard]] bool hasTask(const TaskId& id) const;
    [[nodiscard]] std::vector<DownloadTask> getTasks(DownloadState state) const;

    // Blocks until every notification queued before the call was delivered.
    void flush();

private:
    std::vector<DownloadTask> snapshotLocked() const;
    void publishLocked(DownloadEvent event);
    void publishSnapshotLocked();

    void deliverEvent(const DownloadEvent& event);
    void deliverSnapshot(const std::vector<DownloadTask>& snapshot);

    // Shared with Subscription tokens so they may outlive the manager.
    struct Handlers {
        std::mutex mutex;
        std::uint64_t next_id{1};
        std::map<std::uint64_t, std::shared_ptr<EventHandler>> events;
        std::map<std::uint64_t, std::shared_ptr<SnapshotHandler>> snapshots;
    };

    mutable std::mutex mutex_;
    // Insertion order is kept so snapshots list tasks in submission order.
    std::unordered_map<TaskId, DownloadTask> tasks_;
    std::vector<TaskId> order_;

    std::shared_ptr<Handlers> handlers_;
    detail::SerialExecutor dispatcher_;
};

} // namespace dlmanager
