#include "dlmanager/progress_panel.hpp"

#include <algorithm>
#include <iostream>

#include <fmt/format.h>

namespace dlmanager {

std::string ProgressPanel::build(const std::vector<DownloadTask>& tasks) {
    std::string panel;
    panel.reserve(tasks.size() * 128 + 256);
    panel.append("==================================================\n");
    panel += fmt::format("Download Manager ({} tasks)\n", tasks.size());
    panel.append("--------------------------------------------------\n");

    double progress_sum = 0.0;
    std::size_t finished = 0;
    for (const auto& task : tasks) {
        panel += formatTaskLine(task);
        panel.push_back('\n');

        progress_sum += task.progress;
        if (isTerminal(task.state)) {
            ++finished;
        }
    }

    panel.append("--------------------------------------------------\n");
    if (!tasks.empty()) {
        const double ratio = progress_sum / static_cast<double>(tasks.size());
        panel += fmt::format("Overall: {:>3}% ({}/{} finished)", static_cast<int>(ratio * 100.0),
                             finished, tasks.size());
    } else {
        panel.append("Overall: N/A");
    }
    panel.push_back('\n');
    panel.append("==================================================\n");

    return panel;
}

std::string ProgressPanel::formatTaskLine(const DownloadTask& task) {
    std::string display_name = task.fileName;
    if (display_name.size() > 20) {
        display_name = display_name.substr(0, 20);
    }
    if (display_name.empty()) {
        display_name = "(unnamed)";
    }

    const double ratio = std::clamp(task.progress, 0.0, 1.0);
    const int percent = static_cast<int>(ratio * 100.0);
    constexpr int bar_width = 30;
    const int bar_pos = static_cast<int>(ratio * bar_width);

    std::string bar;
    bar.reserve(static_cast<std::size_t>(bar_width) * 3);
    for (int i = 0; i < bar_width; ++i) {
        bar += (i < bar_pos) ? "█" : "░";
    }

    std::string line = fmt::format("{:<20} [{}] {:>3}% {:<11}", display_name, bar, percent, toString(task.state));

    switch (task.state) {
        case DownloadState::Downloading:
            line += fmt::format("  {}/chunk", formatSize(static_cast<std::uint64_t>(task.speed)));
            break;
        case DownloadState::Completed:
            line.append("  ✅ Done");
            break;
        case DownloadState::Failed:
            line += fmt::format("  ❌ {}", task.error.value_or("unknown error"));
            break;
        default:
            break;
    }
    return line;
}

std::string ProgressPanel::formatSize(std::uint64_t bytes) {
    constexpr double KB = 1024.0;
    constexpr double MB = KB * 1024.0;
    constexpr double GB = MB * 1024.0;

    const double value = static_cast<double>(bytes);
    if (bytes >= static_cast<std::uint64_t>(GB)) {
        return fmt::format("{:.1f} GB", value / GB);
    } else if (bytes >= static_cast<std::uint64_t>(MB)) {
        return fmt::format("{:.1f} MB", value / MB);
    } else if (bytes >= static_cast<std::uint64_t>(KB)) {
        return fmt::format("{:.1f} KB", value / KB);
    } else {
        return fmt::format("{} B", bytes);
    }
}

void ProgressPanel::redraw(const std::string& panel) {
    const auto current_lines = static_cast<std::size_t>(std::count(panel.begin(), panel.end(), '\n'));
    if (previous_lines_ > 0) {
        std::cout << "\033[" << previous_lines_ << "F\033[J";
    }
    std::cout << panel << std::flush;
    previous_lines_ = current_lines;
}

} // namespace dlmanager
