#pragma once

#include "download_task.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace dlmanager {

// JSON record of the task registry: an array with one object per task holding
// id, state, priority, progress, url, fileName and an optional error.
class TaskJournal {
public:
    explicit TaskJournal(std::filesystem::path path);

    // A missing file yields an empty list; malformed entries are skipped.
    // Throws DownloadError(ErrorKind::StorageFailure) when the file is not a
    // JSON array.
    [[nodiscard]] std::vector<DownloadTask> load() const;
    // Writes through a temporary file renamed over the journal.
    void save(const std::vector<DownloadTask>& tasks) const;

    [[nodiscard]] static std::string serialize(const std::vector<DownloadTask>& tasks);
    [[nodiscard]] static std::vector<DownloadTask> parse(const std::string& contents);

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

} // namespace dlmanager
