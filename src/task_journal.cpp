#include "dlmanager/task_journal.hpp"
#include "dlmanager/errors.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <utility>

#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace dlmanager {

using json = nlohmann::json;

namespace {

DownloadTask taskFromJson(const json& item) {
    const auto state = parseState(item.at("state").get<std::string>());
    const auto priority = parsePriority(item.at("priority").get<std::string>());
    if (!state || !priority) {
        throw std::invalid_argument("unknown state or priority");
    }

    DownloadTask task;
    task.id = item.at("id").get<std::string>();
    task.url = item.at("url").get<std::string>();
    task.fileName = item.at("fileName").get<std::string>();
    task.state = *state;
    task.priority = *priority;
    task.progress = item.at("progress").get<double>();
    if (item.contains("error") && !item["error"].is_null()) {
        task.error = item["error"].get<std::string>();
    }

    // Both end up as path components under the download directory.
    if (!isValidTaskId(task.id)) {
        throw std::invalid_argument("invalid task id '" + task.id + "'");
    }
    if (!isPlainFileName(task.fileName)) {
        throw std::invalid_argument("invalid file name '" + task.fileName + "'");
    }
    return task;
}

} // namespace

TaskJournal::TaskJournal(std::filesystem::path path) : path_(std::move(path)) {}

std::vector<DownloadTask> TaskJournal::load() const {
    std::ifstream in(path_, std::ios::binary);
    if (!in) {
        spdlog::debug("No task journal at {}", path_.string());
        return {};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    auto tasks = parse(buffer.str());
    spdlog::info("Loaded {} task(s) from {}", tasks.size(), path_.string());
    return tasks;
}

void TaskJournal::save(const std::vector<DownloadTask>& tasks) const {
    if (path_.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path_.parent_path(), ec);
        if (ec) {
            throw DownloadError(ErrorKind::StorageFailure,
                                fmt::format("Cannot create directory {}: {}",
                                            path_.parent_path().string(), ec.message()));
        }
    }

    auto temp = path_;
    temp += ".tmp";
    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw DownloadError(ErrorKind::StorageFailure, "Cannot write task journal " + temp.string());
        }
        out << serialize(tasks);
        out.flush();
        if (!out) {
            throw DownloadError(ErrorKind::StorageFailure, "Cannot write task journal " + temp.string());
        }
    }

    std::error_code ec;
    std::filesystem::rename(temp, path_, ec);
    if (ec) {
        std::filesystem::remove(temp, ec);
        throw DownloadError(ErrorKind::StorageFailure,
                            fmt::format("Cannot replace task journal {}", path_.string()));
    }
    spdlog::debug("Saved {} task(s) to {}", tasks.size(), path_.string());
}

std::string TaskJournal::serialize(const std::vector<DownloadTask>& tasks) {
    json j = json::array();
    for (const auto& task : tasks) {
        json item;
        item["id"] = task.id;
        item["state"] = toString(task.state);
        item["priority"] = toString(task.priority);
        item["progress"] = task.progress;
        item["url"] = task.url;
        item["fileName"] = task.fileName;
        if (task.error) {
            item["error"] = *task.error;
        } else {
            item["error"] = nullptr;
        }
        j.push_back(item);
    }
    return j.dump(2);
}

std::vector<DownloadTask> TaskJournal::parse(const std::string& contents) {
    const json j = json::parse(contents, nullptr, false);
    if (j.is_discarded() || !j.is_array()) {
        throw DownloadError(ErrorKind::StorageFailure, "Task journal is not a JSON array");
    }

    std::vector<DownloadTask> tasks;
    std::size_t index = 0;
    for (const auto& item : j) {
        try {
            tasks.push_back(taskFromJson(item));
        } catch (const std::exception& ex) {
            spdlog::warn("Skipping malformed journal entry {}: {}", index, ex.what());
        }
        ++index;
    }
    return tasks;
}

} // namespace dlmanager
