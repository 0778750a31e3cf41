#include "dlmanager/events_manager.hpp"

#include <algorithm>
#include <exception>
#include <utility>

#include <spdlog/spdlog.h>

namespace dlmanager {

EventsManager::EventsManager() : handlers_(std::make_shared<Handlers>()) {}

EventsManager::~EventsManager() = default;

Subscription EventsManager::subscribe(EventHandler handler) {
    std::uint64_t id = 0;
    {
        std::lock_guard<std::mutex> lock(handlers_->mutex);
        id = handlers_->next_id++;
        handlers_->events.emplace(id, std::make_shared<EventHandler>(std::move(handler)));
    }

    std::weak_ptr<Handlers> weak = handlers_;
    return Subscription([weak, id]() {
        if (auto handlers = weak.lock()) {
            std::lock_guard<std::mutex> lock(handlers->mutex);
            handlers->events.erase(id);
        }
    });
}

Subscription EventsManager::subscribeTasks(SnapshotHandler handler) {
    auto shared = std::make_shared<SnapshotHandler>(std::move(handler));
    std::uint64_t id = 0;
    {
        // Holding the registry lock orders the initial snapshot before any
        // snapshot produced by a later mutation.
        std::lock_guard<std::mutex> registry_lock(mutex_);
        {
            std::lock_guard<std::mutex> lock(handlers_->mutex);
            id = handlers_->next_id++;
            handlers_->snapshots.emplace(id, shared);
        }
        dispatcher_.post([shared, snapshot = snapshotLocked()]() { (*shared)(snapshot); });
    }

    std::weak_ptr<Handlers> weak = handlers_;
    return Subscription([weak, id]() {
        if (auto handlers = weak.lock()) {
            std::lock_guard<std::mutex> lock(handlers->mutex);
            handlers->snapshots.erase(id);
        }
    });
}

void EventsManager::emitProgress(const TaskId& id, double progress, double speed) {
    std::lock_guard<std::mutex> lock(mutex_);
    publishLocked(ProgressEvent{id, progress, speed});
}

void EventsManager::emitStateChange(const TaskId& id, DownloadState state) {
    std::lock_guard<std::mutex> lock(mutex_);
    publishLocked(StateChangeEvent{id, state});
}

void EventsManager::emitError(const TaskId& id, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    publishLocked(ErrorEvent{id, message});
}

void EventsManager::emitQueueChanged() {
    std::lock_guard<std::mutex> lock(mutex_);
    publishLocked(QueueChangedEvent{});
}

void EventsManager::updateTask(const DownloadTask& task) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto [it, inserted] = tasks_.insert_or_assign(task.id, task);
    (void)it;
    if (inserted) {
        order_.push_back(task.id);
    }
    publishSnapshotLocked();
}

void EventsManager::updateTasks(const std::vector<DownloadTask>& tasks) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& task : tasks) {
        auto [it, inserted] = tasks_.insert_or_assign(task.id, task);
        (void)it;
        if (inserted) {
            order_.push_back(task.id);
        }
    }
    publishSnapshotLocked();
}

void EventsManager::updateTaskAndEmitState(const DownloadTask& task) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto [it, inserted] = tasks_.insert_or_assign(task.id, task);
    (void)it;
    if (inserted) {
        order_.push_back(task.id);
    }
    publishSnapshotLocked();
    publishLocked(StateChangeEvent{task.id, task.state});
}

void EventsManager::removeTask(const TaskId& id) {
    removeTasks({id});
}

void EventsManager::removeTasks(const std::vector<TaskId>& ids) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& id : ids) {
        if (tasks_.erase(id) > 0) {
            order_.erase(std::remove(order_.begin(), order_.end(), id), order_.end());
        }
    }
    publishSnapshotLocked();
}

void EventsManager::clearAllTasks() {
    std::lock_guard<std::mutex> lock(mutex_);
    tasks_.clear();
    order_.clear();
    publishSnapshotLocked();
}

std::vector<DownloadTask> EventsManager::getAllTasks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return snapshotLocked();
}

std::optional<DownloadTask> EventsManager::getTask(const TaskId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(id);
    if (it == tasks_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool EventsManager::hasTask(const TaskId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.count(id) > 0;
}

std::vector<DownloadTask> EventsManager::getTasks(DownloadState state) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<DownloadTask> out;
    for (const auto& id : order_) {
        const auto& task = tasks_.at(id);
        if (task.state == state) {
            out.push_back(task);
        }
    }
    return out;
}

void EventsManager::flush() {
    dispatcher_.drain();
}

std::vector<DownloadTask> EventsManager::snapshotLocked() const {
    std::vector<DownloadTask> out;
    out.reserve(order_.size());
    for (const auto& id : order_) {
        out.push_back(tasks_.at(id));
    }
    return out;
}

void EventsManager::publishLocked(DownloadEvent event) {
    dispatcher_.post([this, event = std::move(event)]() { deliverEvent(event); });
}

void EventsManager::publishSnapshotLocked() {
    dispatcher_.post([this, snapshot = snapshotLocked()]() { deliverSnapshot(snapshot); });
}

void EventsManager::deliverEvent(const DownloadEvent& event) {
    std::vector<std::shared_ptr<EventHandler>> targets;
    {
        std::lock_guard<std::mutex> lock(handlers_->mutex);
        targets.reserve(handlers_->events.size());
        for (const auto& entry : handlers_->events) {
            targets.push_back(entry.second);
        }
    }

    for (const auto& handler : targets) {
        try {
            (*handler)(event);
        } catch (const std::exception& ex) {
            spdlog::error("Event handler threw: {}", ex.what());
        }
    }
}

void EventsManager::deliverSnapshot(const std::vector<DownloadTask>& snapshot) {
    std::vector<std::shared_ptr<SnapshotHandler>> targets;
    {
        std::lock_guard<std::mutex> lock(handlers_->mutex);
        targets.reserve(handlers_->snapshots.size());
        for (const auto& entry : handlers_->snapshots) {
            targets.push_back(entry.second);
        }
    }

    for (const auto& handler : targets) {
        try {
            (*handler)(snapshot);
        } catch (const std::exception& ex) {
            spdlog::error("Snapshot handler threw: {}", ex.what());
        }
    }
}

} // namespace dlmanager
