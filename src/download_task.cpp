#include "dlmanager/download_task.hpp"
#include "dlmanager/errors.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <random>

#include <fmt/format.h>

namespace dlmanager {

namespace {

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return text;
}

} // namespace

bool isTerminal(DownloadState state) noexcept {
    return state == DownloadState::Completed ||
           state == DownloadState::Failed ||
           state == DownloadState::Cancelled;
}

const char* toString(DownloadState state) noexcept {
    switch (state) {
        case DownloadState::Queued: return "queued";
        case DownloadState::Downloading: return "downloading";
        case DownloadState::Paused: return "paused";
        case DownloadState::Completed: return "completed";
        case DownloadState::Failed: return "failed";
        case DownloadState::Cancelled: return "cancelled";
    }
    return "unknown";
}

const char* toString(DownloadPriority priority) noexcept {
    switch (priority) {
        case DownloadPriority::Low: return "low";
        case DownloadPriority::Normal: return "normal";
        case DownloadPriority::High: return "high";
    }
    return "unknown";
}

const char* toString(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::InvalidRequest: return "InvalidRequest";
        case ErrorKind::TransportFailure: return "TransportFailure";
        case ErrorKind::StorageFailure: return "StorageFailure";
        case ErrorKind::QueueFull: return "QueueFull";
        case ErrorKind::InvalidConfig: return "InvalidConfig";
    }
    return "Unknown";
}

std::optional<DownloadState> parseState(const std::string& text) {
    const std::string value = toLower(text);
    for (auto state : {DownloadState::Queued, DownloadState::Downloading, DownloadState::Paused,
                       DownloadState::Completed, DownloadState::Failed, DownloadState::Cancelled}) {
        if (value == toString(state)) {
            return state;
        }
    }
    return std::nullopt;
}

std::optional<DownloadPriority> parsePriority(const std::string& text) {
    const std::string value = toLower(text);
    for (auto priority : {DownloadPriority::Low, DownloadPriority::Normal, DownloadPriority::High}) {
        if (value == toString(priority)) {
            return priority;
        }
    }
    return std::nullopt;
}

TaskId generateTaskId() {
    static std::mutex mutex;
    static std::mt19937_64 engine{std::random_device{}()};

    std::array<std::uint8_t, 16> bytes{};
    {
        std::lock_guard<std::mutex> lock(mutex);
        for (std::size_t i = 0; i < bytes.size(); i += 8) {
            std::uint64_t chunk = engine();
            for (std::size_t j = 0; j < 8; ++j) {
                bytes[i + j] = static_cast<std::uint8_t>(chunk >> (j * 8));
            }
        }
    }
    bytes[6] = static_cast<std::uint8_t>((bytes[6] & 0x0F) | 0x40);
    bytes[8] = static_cast<std::uint8_t>((bytes[8] & 0x3F) | 0x80);

    std::string id;
    id.reserve(36);
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            id.push_back('-');
        }
        id += fmt::format("{:02X}", bytes[i]);
    }
    return id;
}

bool isValidTaskId(const std::string& id) {
    if (id.size() != 36) {
        return false;
    }
    for (std::size_t i = 0; i < id.size(); ++i) {
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (id[i] != '-') {
                return false;
            }
        } else if (!std::isxdigit(static_cast<unsigned char>(id[i]))) {
            return false;
        }
    }
    return true;
}

bool isPlainFileName(const std::string& name) {
    if (name.empty() || name == "." || name == "..") {
        return false;
    }
    return std::filesystem::path(name).filename().string() == name;
}

} // namespace dlmanager
