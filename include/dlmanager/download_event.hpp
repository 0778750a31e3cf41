#pragma once

#include "download_task.hpp"

#include <string>
#include <variant>

namespace dlmanager {

struct ProgressEvent {
    TaskId id;
    double progress{0.0};
    double speed{0.0};
};

struct StateChangeEvent {
    TaskId id;
    DownloadState state{DownloadState::Queued};
};

struct ErrorEvent {
    TaskId id;
    std::string message;
};

struct QueueChangedEvent {};

using DownloadEvent = std::variant<ProgressEvent, StateChangeEvent, ErrorEvent, QueueChangedEvent>;

} // namespace dlmanager
