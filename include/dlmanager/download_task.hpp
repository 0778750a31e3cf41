#pragma once

#include <optional>
#include <string>

namespace dlmanager {

using TaskId = std::string;

enum class DownloadPriority {
    Low = 0,
    Normal = 1,
    High = 2,
};

enum class DownloadState {
    Queued,
    Downloading,
    Paused,
    Completed,
    Failed,
    Cancelled,
};

struct DownloadTask {
    TaskId id;
    std::string url;
    std::string fileName;
    DownloadPriority priority{DownloadPriority::Normal};
    DownloadState state{DownloadState::Queued};
    double progress{0.0};
    // Bytes delivered by the most recent progress callback.
    double speed{0.0};
    std::optional<std::string> error;
};

[[nodiscard]] bool isTerminal(DownloadState state) noexcept;

[[nodiscard]] const char* toString(DownloadState state) noexcept;
[[nodiscard]] const char* toString(DownloadPriority priority) noexcept;

[[nodiscard]] std::optional<DownloadState> parseState(const std::string& text);
[[nodiscard]] std::optional<DownloadPriority> parsePriority(const std::string& text);

// Random RFC 4122 version 4 identifier.
[[nodiscard]] TaskId generateTaskId();

// True for the 8-4-4-4-12 hexadecimal form produced by generateTaskId().
[[nodiscard]] bool isValidTaskId(const std::string& id);
// True for a single path component other than "." and "..".
[[nodiscard]] bool isPlainFileName(const std::string& name);

} // namespace dlmanager
