#pragma once

#include "detail/serial_executor.hpp"
#include "download_task.hpp"

#include <filesystem>

namespace dlmanager {

// One directory per task under a base directory. Every operation runs on a
// private serial executor; public calls block until their job completed and
// report failures as DownloadError(ErrorKind::StorageFailure). Ids and file
// names must be single path components; anything else is rejected the same way.
class DownloadStorage {
public:
    explicit DownloadStorage(std::filesystem::path base_directory);

    DownloadStorage(const DownloadStorage&) = delete;
    DownloadStorage& operator=(const DownloadStorage&) = delete;

    void createDirectory(const DownloadTask& task);
    void saveFile(const std::filesystem::path& source, const DownloadTask& task);
    void removeTask(const TaskId& id);
    void clearAll();
    [[nodiscard]] bool fileExists(const DownloadTask& task);

    [[nodiscard]] const std::filesystem::path& baseDirectory() const noexcept { return base_directory_; }
    [[nodiscard]] std::filesystem::path directoryFor(const TaskId& id) const;
    [[nodiscard]] std::filesystem::path fileFor(const DownloadTask& task) const;

private:
    std::filesystem::path base_directory_;
    detail::SerialExecutor io_;
};

} // namespace dlmanager
