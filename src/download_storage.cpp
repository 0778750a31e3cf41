#include "dlmanager/download_storage.hpp"
#include "dlmanager/errors.hpp"

#include <system_error>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace dlmanager {

namespace fs = std::filesystem;

namespace {

[[noreturn]] void throwStorageError(const std::string& what, const fs::path& path, const std::error_code& ec) {
    throw DownloadError(ErrorKind::StorageFailure,
                        fmt::format("{} {}: {}", what, path.string(), ec.message()));
}

void createDirectories(const fs::path& directory) {
    std::error_code ec;
    fs::create_directories(directory, ec);
    if (ec) {
        throwStorageError("Cannot create directory", directory, ec);
    }
}

} // namespace

DownloadStorage::DownloadStorage(fs::path base_directory) : base_directory_(std::move(base_directory)) {
    io_.run([this] { createDirectories(base_directory_); });
}

fs::path DownloadStorage::directoryFor(const TaskId& id) const {
    if (!isPlainFileName(id)) {
        throw DownloadError(ErrorKind::StorageFailure, fmt::format("Invalid task id '{}'", id));
    }
    return base_directory_ / id;
}

fs::path DownloadStorage::fileFor(const DownloadTask& task) const {
    if (!isPlainFileName(task.fileName)) {
        throw DownloadError(ErrorKind::StorageFailure,
                            fmt::format("Invalid file name '{}' for task {}", task.fileName, task.id));
    }
    return directoryFor(task.id) / task.fileName;
}

void DownloadStorage::createDirectory(const DownloadTask& task) {
    io_.run([&] {
        const auto directory = directoryFor(task.id);
        if (!fs::exists(directory)) {
            createDirectories(directory);
        }
    });
}

void DownloadStorage::saveFile(const fs::path& source, const DownloadTask& task) {
    io_.run([&] {
        const auto directory = directoryFor(task.id);
        const auto destination = fileFor(task);
        createDirectories(directory);

        std::error_code ec;
        fs::copy_file(source, destination, fs::copy_options::overwrite_existing, ec);
        if (ec) {
            throwStorageError("Cannot copy " + source.string() + " to", destination, ec);
        }
        spdlog::debug("Stored {} for task {}", destination.string(), task.id);
    });
}

void DownloadStorage::removeTask(const TaskId& id) {
    io_.run([&] {
        const auto directory = directoryFor(id);
        std::error_code ec;
        fs::remove_all(directory, ec);
        if (ec) {
            throwStorageError("Cannot remove", directory, ec);
        }
    });
}

void DownloadStorage::clearAll() {
    io_.run([&] {
        std::error_code ec;
        fs::remove_all(base_directory_, ec);
        if (ec) {
            throwStorageError("Cannot clear", base_directory_, ec);
        }
        createDirectories(base_directory_);
    });
}

bool DownloadStorage::fileExists(const DownloadTask& task) {
    if (!isPlainFileName(task.id) || !isPlainFileName(task.fileName)) {
        return false;
    }
    return io_.run([&] {
        std::error_code ec;
        const bool exists = fs::is_regular_file(fileFor(task), ec);
        return exists && !ec;
    });
}

} // namespace dlmanager
