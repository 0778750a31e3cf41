#pragma once

#include "download_task.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace dlmanager {

// Terminal rendering of a registry snapshot, redrawn in place.
class ProgressPanel {
public:
    [[nodiscard]] static std::string build(const std::vector<DownloadTask>& tasks);
    [[nodiscard]] static std::string formatTaskLine(const DownloadTask& task);
    [[nodiscard]] static std::string formatSize(std::uint64_t bytes);

    void redraw(const std::string& panel);

private:
    std::size_t previous_lines_{0};
};

} // namespace dlmanager
