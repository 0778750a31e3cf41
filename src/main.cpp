#include "dlmanager/config.hpp"
#include "dlmanager/connectivity.hpp"
#include "dlmanager/curl_transport.hpp"
#include "dlmanager/detail/curl_utils.hpp"
#include "dlmanager/download_manager.hpp"
#include "dlmanager/errors.hpp"
#include "dlmanager/events_manager.hpp"
#include "dlmanager/progress_panel.hpp"
#include "dlmanager/task_journal.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

namespace {

void printUsage(const char* programName) {
    std::cerr << "Usage: " << programName
              << " [-d <directory>] [-c <count>] [-p <priority>] [-f <config>] [-j <journal>] [-v]"
              << " <url1> [<file1>] [<url2> [<file2>] ...]"
              << std::endl;
    std::cerr << "Options:\n"
              << "  -d <directory>   Set download directory (default: ~/Downloads/dlmanager)\n"
              << "  -c <count>       Maximum concurrent downloads (default: 3)\n"
              << "  -p <priority>    Priority of the given URLs: low, normal or high (default: normal)\n"
              << "  -f <config>      Read key=value settings from a file\n"
              << "  -j <journal>     Restore tasks from and save them to a journal file\n"
              << "  -v               Verbose logging\n"
              << "  -h, --help       Show this message" << std::endl;
}

bool looksLikeUrl(const std::string& arg) {
    return arg.find("://") != std::string::npos;
}

bool hasUnfinishedWork(const std::vector<dlmanager::DownloadTask>& tasks) {
    return std::any_of(tasks.begin(), tasks.end(), [](const dlmanager::DownloadTask& task) {
        return task.state == dlmanager::DownloadState::Queued ||
               task.state == dlmanager::DownloadState::Downloading;
    });
}

} // namespace

int main(int argc, char** argv) {
    try {
        dlmanager::detail::ensureCurlInitialized();

        std::optional<std::filesystem::path> config_file;
        std::optional<std::filesystem::path> download_dir;
        std::optional<std::filesystem::path> journal_path;
        std::optional<std::size_t> max_concurrent;
        dlmanager::DownloadPriority priority = dlmanager::DownloadPriority::Normal;
        bool verbose = false;
        int arg_index = 1;

        while (arg_index < argc && argv[arg_index][0] == '-') {
            const std::string option = argv[arg_index];
            const bool takes_value = option == "-d" || option == "-c" || option == "-p" ||
                                     option == "-f" || option == "-j";
            if (takes_value && arg_index + 1 >= argc) {
                printUsage(argv[0]);
                return 1;
            }

            if (option == "-d") {
                download_dir = argv[arg_index + 1];
                arg_index += 2;
            } else if (option == "-c") {
                try {
                    const int count = std::stoi(argv[arg_index + 1]);
                    if (count <= 0) {
                        throw std::out_of_range("count");
                    }
                    max_concurrent = static_cast<std::size_t>(count);
                } catch (const std::exception&) {
                    throw std::runtime_error("Invalid concurrent download count: " + std::string(argv[arg_index + 1]));
                }
                arg_index += 2;
            } else if (option == "-p") {
                const auto parsed = dlmanager::parsePriority(argv[arg_index + 1]);
                if (!parsed) {
                    throw std::runtime_error("Invalid priority: " + std::string(argv[arg_index + 1]));
                }
                priority = *parsed;
                arg_index += 2;
            } else if (option == "-f") {
                config_file = argv[arg_index + 1];
                arg_index += 2;
            } else if (option == "-j") {
                journal_path = argv[arg_index + 1];
                arg_index += 2;
            } else if (option == "-v") {
                verbose = true;
                arg_index += 1;
            } else if (option == "-h" || option == "--help") {
                printUsage(argv[0]);
                return 0;
            } else {
                printUsage(argv[0]);
                return 1;
            }
        }

        std::vector<dlmanager::DownloadRequest> requests;
        for (; arg_index < argc; ++arg_index) {
            const std::string arg = argv[arg_index];
            if (looksLikeUrl(arg)) {
                requests.push_back(dlmanager::DownloadRequest{arg, std::nullopt, priority});
            } else if (!requests.empty() && !requests.back().fileName) {
                requests.back().fileName = arg;
            } else {
                printUsage(argv[0]);
                return 1;
            }
        }

        // Defaults, then the config file, then flags.
        dlmanager::DownloadManagerConfig config;
        if (config_file) {
            dlmanager::loadConfigFile(*config_file, config);
        }
        if (download_dir) {
            config.downloadDirectory = *download_dir;
        }
        if (max_concurrent) {
            config.maxConcurrentDownloads = *max_concurrent;
        }
        if (journal_path) {
            config.journalPath = *journal_path;
        }
        if (verbose) {
            config.logLevel = "debug";
        }
        config.validate();
        spdlog::set_level(spdlog::level::from_str(config.logLevel));

        std::optional<dlmanager::TaskJournal> journal;
        auto events = std::make_shared<dlmanager::EventsManager>();
        if (!config.journalPath.empty()) {
            journal.emplace(config.journalPath);
            events->updateTasks(journal->load());
        }

        if (requests.empty() && events->getAllTasks().empty()) {
            printUsage(argv[0]);
            return 1;
        }

        auto transport = std::make_unique<dlmanager::CurlTransport>(config.temporaryDirectory, config.timeoutSeconds);
        auto connectivity = std::make_shared<dlmanager::ManualConnectivityMonitor>();
        dlmanager::DownloadManager manager(config, std::move(transport), connectivity, events);

        int failures = 0;
        for (const auto& request : requests) {
            try {
                manager.download(request.url, request.fileName, request.priority);
            } catch (const dlmanager::DownloadError& ex) {
                std::cerr << "Cannot download " << request.url << ": " << ex.what() << std::endl;
                ++failures;
            }
        }

        dlmanager::ProgressPanel panel;
        while (true) {
            const auto tasks = manager.tasks();
            panel.redraw(dlmanager::ProgressPanel::build(tasks));
            if (!hasUnfinishedWork(tasks)) {
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        for (const auto& task : manager.tasks()) {
            if (task.state == dlmanager::DownloadState::Failed) {
                std::cerr << "Error: " << task.url << ": " << task.error.value_or("unknown error") << std::endl;
                ++failures;
            } else if (task.state == dlmanager::DownloadState::Completed) {
                std::cout << manager.storage().fileFor(task).string() << std::endl;
            }
        }

        if (journal) {
            journal->save(manager.tasks());
        }
        return failures == 0 ? 0 : 1;
    } catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << std::endl;
        return 1;
    }
}
