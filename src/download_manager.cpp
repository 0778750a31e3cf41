#include "dlmanager/download_manager.hpp"
#include "dlmanager/detail/curl_utils.hpp"
#include "dlmanager/errors.hpp"
#include "dlmanager/mime_detector.hpp"

#include <algorithm>
#include <exception>
#include <filesystem>
#include <future>
#include <system_error>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace dlmanager {

namespace fs = std::filesystem;

namespace {

DownloadManagerConfig validated(DownloadManagerConfig config) {
    config.validate();
    return config;
}

void removeQuietly(const fs::path& path) {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        spdlog::warn("Cannot remove {}: {}", path.string(), ec.message());
    }
}

} // namespace

DownloadManager::DownloadManager(DownloadManagerConfig config,
                                 std::unique_ptr<Transport> transport,
                                 std::shared_ptr<ConnectivityMonitor> connectivity,
                                 std::shared_ptr<EventsManager> events)
    : config_(validated(std::move(config))),
    transport_(std::move(transport)),
    connectivity_(std::move(connectivity)),
    events_(events ? std::move(events) : std::make_shared<EventsManager>()),
    queue_(config_.maxQueueSize),
    storage_(config_.downloadDirectory) {
    if (!transport_) {
        throw DownloadError(ErrorKind::InvalidConfig, "DownloadManager requires a transport");
    }

    restoreSession();

    if (connectivity_) {
        network_usable_ = isNetworkUsable(connectivity_->current());
        connectivity_guard_ = std::make_shared<ConnectivityGuard>();
        connectivity_guard_->owner = this;
        connectivity_subscription_ = connectivity_->subscribe(
            [guard = connectivity_guard_](const ConnectivityStatus& status) {
                std::lock_guard<std::mutex> lock(guard->mutex);
                if (guard->owner) {
                    guard->owner->handleConnectivity(status);
                }
            });
    }

    scheduler_ = std::thread(&DownloadManager::schedulerLoop, this);
    spdlog::debug("DownloadManager started (max {} concurrent, queue {}, directory {})",
                  config_.maxConcurrentDownloads, config_.maxQueueSize, config_.downloadDirectory.string());
}

DownloadManager::~DownloadManager() {
    if (connectivity_guard_) {
        // Waits for a handler that is already running.
        std::lock_guard<std::mutex> lock(connectivity_guard_->mutex);
        connectivity_guard_->owner = nullptr;
    }
    connectivity_subscription_.reset();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
        for (auto& entry : active_) {
            entry.second.handle->cancel();
        }
        for (auto& entry : suspended_) {
            entry.second.handle->cancel();
        }
    }
    scheduler_cv_.notify_all();
    if (scheduler_.joinable()) {
        scheduler_.join();
    }

    // Joins every transfer thread; their callbacks see stopping_ and bail out.
    transport_.reset();

    std::unordered_map<TaskId, Subscription> bridges;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        active_.clear();
        suspended_.clear();
        bridges.swap(progress_bridges_);
    }
    bridges.clear();
    events_->flush();
}

DownloadTask DownloadManager::download(const std::string& url,
                                       const std::optional<std::string>& file_name,
                                       DownloadPriority priority,
                                       ProgressHandler progress) {
    validateRequest(url);

    DownloadTask task;
    task.id = generateTaskId();
    task.url = url;
    task.fileName = resolveFileName(url, file_name);
    task.priority = priority;
    task.state = DownloadState::Queued;

    storage_.createDirectory(task);

    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!queue_.enqueue(task)) {
            lock.unlock();
            try {
                storage_.removeTask(task.id);
            } catch (const DownloadError& ex) {
                spdlog::warn("Cannot roll back directory of rejected task {}: {}", task.id, ex.what());
            }
            throw DownloadError(ErrorKind::QueueFull,
                                fmt::format("Download queue is full ({} pending)", queue_.capacity()));
        }

        if (progress) {
            progress_bridges_.emplace(task.id, subscribeProgress(task.id, std::move(progress)));
        }
        events_->updateTaskAndEmitState(task);
        events_->emitQueueChanged();
        wake_requested_ = true;
    }
    scheduler_cv_.notify_all();

    spdlog::info("Queued {} as {} ({}, priority {})", url, task.id, task.fileName, toString(priority));
    return task;
}

std::vector<DownloadTask> DownloadManager::downloadMultiple(const std::vector<DownloadRequest>& requests) {
    std::vector<std::future<DownloadTask>> submissions;
    submissions.reserve(requests.size());
    for (const auto& request : requests) {
        submissions.push_back(std::async(std::launch::async, [this, request]() {
            return download(request.url, request.fileName, request.priority);
        }));
    }

    std::vector<DownloadTask> tasks;
    tasks.reserve(requests.size());
    std::exception_ptr first_failure;
    for (auto& submission : submissions) {
        try {
            tasks.push_back(submission.get());
        } catch (const std::exception& ex) {
            spdlog::warn("Batch submission failed: {}", ex.what());
            if (!first_failure) {
                first_failure = std::current_exception();
            }
        }
    }

    if (first_failure) {
        std::rethrow_exception(first_failure);
    }
    return tasks;
}

void DownloadManager::pauseDownload(const TaskId& id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = active_.find(id);
        if (it == active_.end() || it->second.finalizing) {
            return;
        }

        it->second.handle->suspend();
        suspended_[id] = std::move(it->second);
        active_.erase(it);

        if (auto task = events_->getTask(id)) {
            task->state = DownloadState::Paused;
            task->speed = 0.0;
            events_->updateTaskAndEmitState(*task);
        }
        wake_requested_ = true;
    }
    scheduler_cv_.notify_all();
    spdlog::info("Paused {}", id);
}

void DownloadManager::resumeDownload(const TaskId& id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto task = events_->getTask(id);
        if (!task || task->state != DownloadState::Paused) {
            return;
        }

        task->state = DownloadState::Queued;
        task->progress = 0.0;
        task->speed = 0.0;
        task->error.reset();
        if (!queue_.enqueue(*task)) {
            throw DownloadError(ErrorKind::QueueFull,
                                fmt::format("Cannot resume {}: download queue is full", id));
        }

        // The transfer restarts from zero, so the suspended one is discarded.
        if (auto it = suspended_.find(id); it != suspended_.end()) {
            it->second.handle->cancel();
            suspended_.erase(it);
        }

        events_->updateTaskAndEmitState(*task);
        events_->emitQueueChanged();
        wake_requested_ = true;
    }
    scheduler_cv_.notify_all();
    spdlog::info("Resumed {}", id);
}

void DownloadManager::cancelDownload(const TaskId& id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto task = events_->getTask(id);
        if (!task || isTerminal(task->state)) {
            return;
        }

        if (auto it = active_.find(id); it != active_.end()) {
            it->second.handle->cancel();
            active_.erase(it);
        }
        if (auto it = suspended_.find(id); it != suspended_.end()) {
            it->second.handle->cancel();
            suspended_.erase(it);
        }
        const bool was_pending = queue_.remove(id);

        task->state = DownloadState::Cancelled;
        task->speed = 0.0;
        events_->updateTaskAndEmitState(*task);
        if (was_pending) {
            events_->emitQueueChanged();
        }
        progress_bridges_.erase(id);
        wake_requested_ = true;
    }
    scheduler_cv_.notify_all();
    spdlog::info("Cancelled {}", id);

    storage_.removeTask(id);
}

void DownloadManager::removeCompletedDownloads() {
    std::vector<DownloadTask> completed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        completed = events_->getTasks(DownloadState::Completed);
    }

    for (const auto& task : completed) {
        storage_.removeTask(task.id);

        std::lock_guard<std::mutex> lock(mutex_);
        events_->removeTask(task.id);
        progress_bridges_.erase(task.id);
        spdlog::debug("Removed completed task {}", task.id);
    }
}

Subscription DownloadManager::subscribeEvents(EventsManager::EventHandler handler) {
    return events_->subscribe(std::move(handler));
}

Subscription DownloadManager::subscribeTasks(EventsManager::SnapshotHandler handler) {
    return events_->subscribeTasks(std::move(handler));
}

Subscription DownloadManager::subscribeTaskUpdates(const TaskId& id,
                                                   std::function<void(const DownloadTask&)> handler) {
    return events_->subscribeTasks([id, handler = std::move(handler)](const std::vector<DownloadTask>& snapshot) {
        auto it = std::find_if(snapshot.begin(), snapshot.end(),
                               [&](const DownloadTask& task) { return task.id == id; });
        if (it != snapshot.end()) {
            handler(*it);
        }
    });
}

Subscription DownloadManager::subscribeProgress(const TaskId& id, ProgressHandler handler) {
    return events_->subscribe([id, handler = std::move(handler)](const DownloadEvent& event) {
        if (const auto* progress = std::get_if<ProgressEvent>(&event); progress && progress->id == id) {
            handler(progress->progress, progress->speed);
        }
    });
}

Subscription DownloadManager::subscribeStateChanges(const TaskId& id, std::function<void(DownloadState)> handler) {
    return events_->subscribe([id, handler = std::move(handler)](const DownloadEvent& event) {
        if (const auto* change = std::get_if<StateChangeEvent>(&event); change && change->id == id) {
            handler(change->state);
        }
    });
}

Subscription DownloadManager::subscribeErrors(const TaskId& id, std::function<void(const std::string&)> handler) {
    return events_->subscribe([id, handler = std::move(handler)](const DownloadEvent& event) {
        if (const auto* error = std::get_if<ErrorEvent>(&event); error && error->id == id) {
            handler(error->message);
        }
    });
}

std::optional<DownloadTask> DownloadManager::task(const TaskId& id) const {
    return events_->getTask(id);
}

std::vector<DownloadTask> DownloadManager::tasks() const {
    return events_->getAllTasks();
}

std::size_t DownloadManager::activeCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_.size();
}

std::size_t DownloadManager::pendingCount() const {
    return queue_.size();
}

void DownloadManager::wakeScheduler() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        wake_requested_ = true;
    }
    scheduler_cv_.notify_all();
}

void DownloadManager::flushEvents() {
    events_->flush();
}

void DownloadManager::validateRequest(const std::string& url) const {
    const auto parts = detail::parseUrl(url);
    if (!parts || parts->host.empty()) {
        throw DownloadError(ErrorKind::InvalidRequest, fmt::format("Invalid URL: '{}'", url));
    }
    if (parts->scheme != "https") {
        throw DownloadError(ErrorKind::InvalidRequest,
                            fmt::format("Refusing insecure URL scheme '{}': {}", parts->scheme, url));
    }

    std::error_code ec;
    const auto space = fs::space(config_.downloadDirectory, ec);
    if (ec) {
        throw DownloadError(ErrorKind::InvalidRequest,
                            fmt::format("Cannot read free space of {}: {}",
                                        config_.downloadDirectory.string(), ec.message()));
    }
    if (space.available <= config_.minFreeDiskSpace) {
        throw DownloadError(ErrorKind::InvalidRequest,
                            fmt::format("Not enough free disk space: {} bytes available, more than {} required",
                                        space.available, config_.minFreeDiskSpace));
    }
}

std::string DownloadManager::resolveFileName(const std::string& url,
                                             const std::optional<std::string>& file_name) const {
    std::string name;
    if (file_name) {
        // Only the last component is kept so a name never escapes the task directory.
        name = fs::path(*file_name).filename().string();
    }
    if (name.empty() || name == "." || name == "..") {
        name = detail::lastPathSegment(url);
    }
    if (name.empty() || name == "." || name == "..") {
        name = "download";
    }
    return name;
}

void DownloadManager::restoreSession() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto task : events_->getAllTasks()) {
        if (storage_.fileExists(task)) {
            switch (task.state) {
                case DownloadState::Downloading:
                case DownloadState::Queued:
                    task.state = DownloadState::Queued;
                    task.progress = 0.0;
                    task.speed = 0.0;
                    if (queue_.enqueue(task)) {
                        events_->updateTaskAndEmitState(task);
                    } else {
                        failLocked(std::move(task), "Download queue is full, task was not restored");
                    }
                    break;
                case DownloadState::Paused:
                    // Stays out of the run queue until resumed explicitly.
                    spdlog::debug("Restored paused task {}", task.id);
                    break;
                case DownloadState::Completed:
                    break;
                case DownloadState::Cancelled:
                case DownloadState::Failed:
                    try {
                        storage_.removeTask(task.id);
                    } catch (const DownloadError& ex) {
                        spdlog::warn("Cannot purge {}: {}", task.id, ex.what());
                    }
                    break;
            }
        } else if (task.state == DownloadState::Completed) {
            spdlog::info("Artifact of completed task {} is missing, downloading it again", task.id);
            task.state = DownloadState::Queued;
            task.progress = 0.0;
            task.speed = 0.0;
            if (queue_.enqueue(task)) {
                events_->updateTaskAndEmitState(task);
            } else {
                failLocked(std::move(task), "Download queue is full, task was not restored");
            }
        }
    }
    if (queue_.size() > 0) {
        events_->emitQueueChanged();
    }
}

void DownloadManager::schedulerLoop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopping_) {
        startPendingLocked();
        scheduler_cv_.wait_for(lock, config_.schedulerInterval, [this] { return stopping_ || wake_requested_; });
        wake_requested_ = false;
    }
}

void DownloadManager::startPendingLocked() {
    if (!network_usable_) {
        return;
    }
    while (active_.size() < config_.maxConcurrentDownloads) {
        auto next = queue_.dequeue();
        if (!next) {
            break;
        }
        events_->emitQueueChanged();

        auto current = events_->getTask(next->id);
        if (!current || current->state != DownloadState::Queued) {
            spdlog::debug("Dropping stale queue entry {}", next->id);
            continue;
        }
        startTransferLocked(std::move(*current));
    }
}

void DownloadManager::startTransferLocked(DownloadTask task) {
    task.state = DownloadState::Downloading;
    task.progress = 0.0;
    task.speed = 0.0;
    task.error.reset();
    events_->updateTaskAndEmitState(task);

    const TaskId id = task.id;
    const std::uint64_t generation = next_generation_++;

    TransferCallbacks callbacks;
    callbacks.onProgress = [this, id, generation](std::uint64_t bytes_written, std::uint64_t total_written,
                                                  std::uint64_t total_expected) {
        handleProgress(id, generation, bytes_written, total_written, total_expected);
    };
    callbacks.onError = [this, id, generation](const std::string& message) {
        handleError(id, generation, message);
    };
    callbacks.onFinished = [this, id, generation](const fs::path& temp_file) {
        handleFinished(id, generation, temp_file);
    };

    try {
        auto handle = transport_->start(task.url, std::move(callbacks));
        active_[id] = Transfer{std::move(handle), generation};
        spdlog::info("Downloading {} ({})", task.url, id);
    } catch (const std::exception& ex) {
        failLocked(std::move(task), fmt::format("Cannot start transfer: {}", ex.what()));
    }
}

void DownloadManager::handleProgress(const TaskId& id, std::uint64_t generation, std::uint64_t bytes_written,
                                     std::uint64_t total_written, std::uint64_t total_expected) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopping_ || !isCurrentTransferLocked(id, generation)) {
        return;
    }
    auto task = events_->getTask(id);
    if (!task || task->state != DownloadState::Downloading) {
        return;
    }

    task->progress = total_expected > 0
        ? std::min(1.0, static_cast<double>(total_written) / static_cast<double>(total_expected))
        : 0.0;
    task->speed = static_cast<double>(bytes_written);
    events_->updateTask(*task);
    events_->emitProgress(id, task->progress, task->speed);
}

void DownloadManager::handleFinished(const TaskId& id, std::uint64_t generation, const fs::path& temp_file) {
    std::optional<DownloadTask> task;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_ || !isCurrentTransferLocked(id, generation)) {
            return;
        }
        task = events_->getTask(id);
        if (!task) {
            return;
        }
    }

    // The transport reclaims its file once this call returns, so work on a copy.
    const fs::path copy = config_.temporaryDirectory / (generateTaskId() + ".download");
    std::string file_name = task->fileName;
    try {
        fs::create_directories(config_.temporaryDirectory);
        fs::copy_file(temp_file, copy, fs::copy_options::overwrite_existing);

        if (file_name.find('.') == std::string::npos) {
            auto mime = detectMimeType(copy);
            if (!mime) {
                mime = mimeTypeForExtension(fs::path(detail::lastPathSegment(task->url)).extension().string());
            }
            file_name += "." + (mime ? mime->extension : std::string{"download"});
        }
    } catch (const std::exception& ex) {
        removeQuietly(copy);
        std::lock_guard<std::mutex> lock(mutex_);
        if (!stopping_ && isCurrentTransferLocked(id, generation)) {
            if (auto current = events_->getTask(id)) {
                failLocked(std::move(*current), fmt::format("Cannot stage download: {}", ex.what()));
            }
            wake_requested_ = true;
            scheduler_cv_.notify_all();
        }
        return;
    }

    DownloadTask finished;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        // Cancelled or paused while the copy was made.
        if (stopping_ || !isCurrentTransferLocked(id, generation)) {
            removeQuietly(copy);
            return;
        }
        auto current = events_->getTask(id);
        if (!current) {
            active_.erase(id);
            removeQuietly(copy);
            return;
        }
        active_[id].finalizing = true;
        finished = std::move(*current);
        finished.fileName = file_name;
    }

    // Storage may be slow; the manager stays responsive meanwhile. A cancel
    // arriving now takes the transfer out of active_ and is honoured below.
    try {
        storage_.saveFile(copy, finished);
    } catch (const DownloadError& ex) {
        removeQuietly(copy);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_ || !isCurrentTransferLocked(id, generation)) {
                return;
            }
            if (auto current = events_->getTask(id)) {
                failLocked(std::move(*current), ex.what());
            } else {
                active_.erase(id);
            }
            wake_requested_ = true;
        }
        scheduler_cv_.notify_all();
        return;
    }
    removeQuietly(copy);

    bool roll_back = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return;
        }
        auto current = events_->getTask(id);
        if (!isCurrentTransferLocked(id, generation) || !current) {
            roll_back = !current || current->state == DownloadState::Cancelled;
        } else {
            active_.erase(id);
            current->fileName = finished.fileName;
            current->state = DownloadState::Completed;
            current->progress = 1.0;
            current->speed = 0.0;
            current->error.reset();
            events_->updateTaskAndEmitState(*current);
            progress_bridges_.erase(id);
            wake_requested_ = true;
            spdlog::info("Completed {} -> {}", id, storage_.fileFor(*current).string());
        }
    }
    scheduler_cv_.notify_all();

    if (roll_back) {
        try {
            storage_.removeTask(id);
        } catch (const DownloadError& ex) {
            spdlog::warn("Cannot remove artifact of cancelled task {}: {}", id, ex.what());
        }
    }
}

void DownloadManager::handleError(const TaskId& id, std::uint64_t generation, const std::string& message) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_ || !isCurrentTransferLocked(id, generation)) {
            return;
        }
        auto task = events_->getTask(id);
        if (!task) {
            active_.erase(id);
            return;
        }
        failLocked(std::move(*task), message);
        wake_requested_ = true;
    }
    scheduler_cv_.notify_all();
}

void DownloadManager::failLocked(DownloadTask task, const std::string& message) {
    active_.erase(task.id);
    suspended_.erase(task.id);

    task.state = DownloadState::Failed;
    task.speed = 0.0;
    task.error = message;
    events_->updateTask(task);
    events_->emitError(task.id, message);
    events_->emitStateChange(task.id, DownloadState::Failed);
    progress_bridges_.erase(task.id);
    spdlog::error("Download {} failed: {}", task.id, message);
}

bool DownloadManager::isCurrentTransferLocked(const TaskId& id, std::uint64_t generation) const {
    auto it = active_.find(id);
    return it != active_.end() && it->second.generation == generation;
}

bool DownloadManager::isNetworkUsable(const ConnectivityStatus& status) const noexcept {
    return status.connected && (config_.allowsCellularAccess || !status.cellular);
}

void DownloadManager::handleConnectivity(const ConnectivityStatus& status) {
    const bool usable = isNetworkUsable(status);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        network_usable_ = usable;
        wake_requested_ = true;
    }
    scheduler_cv_.notify_all();

    if (!usable) {
        spdlog::info("Network unavailable, pausing active downloads");
        for (const auto& task : events_->getTasks(DownloadState::Downloading)) {
            try {
                pauseDownload(task.id);
            } catch (const std::exception& ex) {
                spdlog::warn("Cannot pause {}: {}", task.id, ex.what());
            }
        }
        return;
    }

    spdlog::info("Network available, resuming paused downloads");
    for (const auto& task : events_->getTasks(DownloadState::Paused)) {
        try {
            resumeDownload(task.id);
        } catch (const std::exception& ex) {
            spdlog::warn("Cannot resume {}: {}", task.id, ex.what());
        }
    }
}

} // namespace dlmanager
