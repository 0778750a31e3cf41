#pragma once

#include "download_task.hpp"

#include <cstddef>
#include <mutex>
#include <optional>
#include <vector>

namespace dlmanager {

// Pending tasks ordered by descending priority, FIFO within a priority.
class TaskQueue {
public:
    explicit TaskQueue(std::size_t max_queue_size = 100);

    // Returns false and leaves the queue untouched when it is full.
    bool enqueue(const DownloadTask& task);
    std::optional<DownloadTask> dequeue();

    // Both return whether a task with that id was present.
    bool remove(const TaskId& id);
    bool updateTask(const DownloadTask& task);

    [[nodiscard]] std::vector<DownloadTask> getAllTasks() const;
    [[nodiscard]] bool contains(const TaskId& id) const;
    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] std::size_t capacity() const noexcept { return max_queue_size_; }
    [[nodiscard]] bool full() const;

    void clear();

private:
    const std::size_t max_queue_size_;
    mutable std::mutex mutex_;
    std::vector<DownloadTask> queue_;
};

} // namespace dlmanager
