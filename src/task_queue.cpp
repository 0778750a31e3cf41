#include "dlmanager/task_queue.hpp"

#include <algorithm>

namespace dlmanager {

TaskQueue::TaskQueue(std::size_t max_queue_size) : max_queue_size_(max_queue_size) {}

bool TaskQueue::enqueue(const DownloadTask& task) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.size() >= max_queue_size_) {
        return false;
    }

    // Equal priorities never count as lower, so ties keep arrival order.
    const auto position = std::find_if(queue_.begin(), queue_.end(), [&](const DownloadTask& queued) {
        return static_cast<int>(queued.priority) < static_cast<int>(task.priority);
    });
    queue_.insert(position, task);
    return true;
}

std::optional<DownloadTask> TaskQueue::dequeue() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.empty()) {
        return std::nullopt;
    }
    DownloadTask head = std::move(queue_.front());
    queue_.erase(queue_.begin());
    return head;
}

bool TaskQueue::remove(const TaskId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto before = queue_.size();
    queue_.erase(std::remove_if(queue_.begin(), queue_.end(),
                                [&](const DownloadTask& queued) { return queued.id == id; }),
                 queue_.end());
    return queue_.size() != before;
}

bool TaskQueue::updateTask(const DownloadTask& task) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(queue_.begin(), queue_.end(),
                           [&](const DownloadTask& queued) { return queued.id == task.id; });
    if (it == queue_.end()) {
        return false;
    }
    *it = task;
    return true;
}

std::vector<DownloadTask> TaskQueue::getAllTasks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_;
}

bool TaskQueue::contains(const TaskId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::any_of(queue_.begin(), queue_.end(),
                       [&](const DownloadTask& queued) { return queued.id == id; });
}

std::size_t TaskQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

bool TaskQueue::full() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size() >= max_queue_size_;
}

void TaskQueue::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.clear();
}

} // namespace dlmanager
