#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

namespace dlmanager {

struct DownloadManagerConfig {
    std::size_t maxConcurrentDownloads{3};
    std::size_t maxQueueSize{100};
    // Carried for the request client; the engine never retries on its own.
    int maxRetryAttempts{3};
    bool allowsCellularAccess{true};
    std::filesystem::path downloadDirectory{defaultDownloadDirectory()};
    std::filesystem::path temporaryDirectory{defaultTemporaryDirectory()};
    std::uint64_t minFreeDiskSpace{1024ULL * 1024ULL * 1024ULL};
    int timeoutSeconds{60};
    std::chrono::milliseconds schedulerInterval{1000};
    std::filesystem::path journalPath;
    std::string logLevel{"info"};

    // Throws DownloadError(ErrorKind::InvalidConfig) on the first bad field.
    void validate() const;

    [[nodiscard]] static std::filesystem::path defaultDownloadDirectory();
    [[nodiscard]] static std::filesystem::path defaultTemporaryDirectory();
};

// Applies `key=value` lines on top of `config`. Blank lines and lines starting
// with '#' or ';' are skipped, unknown keys are ignored with a warning.
void parseConfigString(const std::string& contents, DownloadManagerConfig& config);

void loadConfigFile(const std::filesystem::path& path, DownloadManagerConfig& config);

} // namespace dlmanager
