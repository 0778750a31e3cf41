#pragma once

#include "config.hpp"
#include "connectivity.hpp"
#include "download_event.hpp"
#include "download_storage.hpp"
#include "download_task.hpp"
#include "events_manager.hpp"
#include "subscription.hpp"
#include "task_queue.hpp"
#include "transport.hpp"

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace dlmanager {

struct DownloadRequest {
    std::string url;
    std::optional<std::string> fileName;
    DownloadPriority priority{DownloadPriority::Normal};
};

class DownloadManager {
public:
    using ProgressHandler = std::function<void(double progress, double speed)>;

    // `events` may carry tasks recorded by a previous session; they are
    // reconciled with the download directory before the scheduler starts.
    DownloadManager(DownloadManagerConfig config,
                    std::unique_ptr<Transport> transport,
                    std::shared_ptr<ConnectivityMonitor> connectivity = nullptr,
                    std::shared_ptr<EventsManager> events = nullptr);
    ~DownloadManager();

    DownloadManager(const DownloadManager&) = delete;
    DownloadManager& operator=(const DownloadManager&) = delete;

    // Throws DownloadError (InvalidRequest, QueueFull or StorageFailure).
    DownloadTask download(const std::string& url,
                          const std::optional<std::string>& file_name = std::nullopt,
                          DownloadPriority priority = DownloadPriority::Normal,
                          ProgressHandler progress = {});

    // Submits every request concurrently. Requests that succeeded stay queued
    // when another one fails; the first failure is rethrown.
    std::vector<DownloadTask> downloadMultiple(const std::vector<DownloadRequest>& requests);

    void pauseDownload(const TaskId& id);
    void resumeDownload(const TaskId& id);
    void cancelDownload(const TaskId& id);
    void removeCompletedDownloads();

    [[nodiscard]] Subscription subscribeEvents(EventsManager::EventHandler handler);
    [[nodiscard]] Subscription subscribeTasks(EventsManager::SnapshotHandler handler);
    [[nodiscard]] Subscription subscribeTaskUpdates(const TaskId& id,
                                                    std::function<void(const DownloadTask&)> handler);
    [[nodiscard]] Subscription subscribeProgress(const TaskId& id, ProgressHandler handler);
    [[nodiscard]] Subscription subscribeStateChanges(const TaskId& id,
                                                     std::function<void(DownloadState)> handler);
    [[nodiscard]] Subscription subscribeErrors(const TaskId& id,
                                               std::function<void(const std::string&)> handler);

    [[nodiscard]] std::optional<DownloadTask> task(const TaskId& id) const;
    [[nodiscard]] std::vector<DownloadTask> tasks() const;
    [[nodiscard]] std::size_t activeCount() const;
    [[nodiscard]] std::size_t pendingCount() const;
    [[nodiscard]] const DownloadManagerConfig& config() const noexcept { return config_; }
    [[nodiscard]] DownloadStorage& storage() noexcept { return storage_; }
    [[nodiscard]] EventsManager& events() noexcept { return *events_; }

    // Wakes the scheduler without waiting for the next tick.
    void wakeScheduler();
    // Blocks until every event produced so far was delivered.
    void flushEvents();

private:
    struct Transfer {
        std::unique_ptr<TransferHandle> handle;
        std::uint64_t generation{0};
        // Set while the finished file is handed to storage; pausing is ignored then.
        bool finalizing{false};
    };

    // Shared with the connectivity handler so a notification already in
    // flight finishes before the manager goes away, and later ones are dropped.
    struct ConnectivityGuard {
        std::mutex mutex;
        DownloadManager* owner{nullptr};
    };

    void validateRequest(const std::string& url) const;
    std::string resolveFileName(const std::string& url, const std::optional<std::string>& file_name) const;

    void restoreSession();
    void schedulerLoop();
    void startPendingLocked();
    void startTransferLocked(DownloadTask task);

    void handleProgress(const TaskId& id, std::uint64_t generation, std::uint64_t bytes_written,
                        std::uint64_t total_written, std::uint64_t total_expected);
    void handleFinished(const TaskId& id, std::uint64_t generation, const std::filesystem::path& temp_file);
    void handleError(const TaskId& id, std::uint64_t generation, const std::string& message);
    void failLocked(DownloadTask task, const std::string& message);

    bool isCurrentTransferLocked(const TaskId& id, std::uint64_t generation) const;
    bool isNetworkUsable(const ConnectivityStatus& status) const noexcept;
    void handleConnectivity(const ConnectivityStatus& status);

    const DownloadManagerConfig config_;
    std::unique_ptr<Transport> transport_;
    std::shared_ptr<ConnectivityMonitor> connectivity_;
    std::shared_ptr<EventsManager> events_;
    TaskQueue queue_;
    DownloadStorage storage_;

    mutable std::mutex mutex_;
    std::condition_variable scheduler_cv_;
    bool stopping_{false};
    bool wake_requested_{false};
    // Nothing leaves the queue while false.
    bool network_usable_{true};
    std::uint64_t next_generation_{1};
    std::unordered_map<TaskId, Transfer> active_;
    std::unordered_map<TaskId, Transfer> suspended_;
    std::unordered_map<TaskId, Subscription> progress_bridges_;

    std::shared_ptr<ConnectivityGuard> connectivity_guard_;
    Subscription connectivity_subscription_;
    std::thread scheduler_;
};

} // namespace dlmanager
