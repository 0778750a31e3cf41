#include "dlmanager/config.hpp"
#include "dlmanager/errors.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <limits>
#include <sstream>
#include <stdexcept>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace dlmanager {

namespace {

std::string toLower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

void trim(std::string& s) {
    while (!s.empty() && (s.back() == '\r' || s.back() == '\n' || s.back() == ' ' || s.back() == '\t')) s.pop_back();
    std::size_t i = 0;
    while (i < s.size() && (s[i] == ' ' || s[i] == '\t')) i++;
    s = s.substr(i);
}

bool parseBool(const std::string& key, const std::string& value) {
    const std::string v = toLower(value);
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    throw DownloadError(ErrorKind::InvalidConfig, fmt::format("{}: expected a boolean, got '{}'", key, value));
}

template <typename Int>
Int parseInteger(const std::string& key, const std::string& value) {
    try {
        std::size_t consumed = 0;
        const long long parsed = std::stoll(value, &consumed);
        if (consumed != value.size() || parsed < 0 ||
            static_cast<unsigned long long>(parsed) >
                static_cast<unsigned long long>(std::numeric_limits<Int>::max())) {
            throw std::invalid_argument(value);
        }
        return static_cast<Int>(parsed);
    } catch (const std::exception&) {
        throw DownloadError(ErrorKind::InvalidConfig,
                            fmt::format("{}: expected a non-negative integer, got '{}'", key, value));
    }
}

} // namespace

std::filesystem::path DownloadManagerConfig::defaultDownloadDirectory() {
    if (const char* home = std::getenv("HOME"); home != nullptr && *home != '\0') {
        return std::filesystem::path(home) / "Downloads" / "dlmanager";
    }
    return std::filesystem::current_path() / "downloads";
}

std::filesystem::path DownloadManagerConfig::defaultTemporaryDirectory() {
    std::error_code ec;
    auto base = std::filesystem::temp_directory_path(ec);
    if (ec) {
        base = "/tmp";
    }
    return base / "dlmanager";
}

void DownloadManagerConfig::validate() const {
    if (maxConcurrentDownloads == 0) {
        throw DownloadError(ErrorKind::InvalidConfig, "max_concurrent_downloads must be at least 1");
    }
    if (maxQueueSize == 0) {
        throw DownloadError(ErrorKind::InvalidConfig, "max_queue_size must be at least 1");
    }
    if (maxRetryAttempts < 0) {
        throw DownloadError(ErrorKind::InvalidConfig, "max_retry_attempts must not be negative");
    }
    if (downloadDirectory.empty()) {
        throw DownloadError(ErrorKind::InvalidConfig, "download_directory must be set");
    }
    if (temporaryDirectory.empty()) {
        throw DownloadError(ErrorKind::InvalidConfig, "temporary_directory must be set");
    }
    if (timeoutSeconds <= 0) {
        throw DownloadError(ErrorKind::InvalidConfig, "timeout_seconds must be positive");
    }
    if (schedulerInterval.count() <= 0) {
        throw DownloadError(ErrorKind::InvalidConfig, "scheduler_interval_ms must be positive");
    }
    if (spdlog::level::from_str(logLevel) == spdlog::level::off && logLevel != "off") {
        throw DownloadError(ErrorKind::InvalidConfig, fmt::format("unknown log_level '{}'", logLevel));
    }
}

void parseConfigString(const std::string& contents, DownloadManagerConfig& config) {
    std::istringstream in(contents);
    std::string line;
    while (std::getline(in, line)) {
        trim(line);
        if (line.empty()) continue;
        if (line[0] == '#' || line[0] == ';') continue;
        auto pos = line.find('=');
        if (pos == std::string::npos) continue;
        std::string key = toLower(line.substr(0, pos));
        std::string val = line.substr(pos + 1);
        trim(key); trim(val);
        if (val.size() >= 2 && val.front() == '"' && val.back() == '"') {
            val = val.substr(1, val.size() - 2);
        }

        if (key == "max_concurrent_downloads") config.maxConcurrentDownloads = parseInteger<std::size_t>(key, val);
        else if (key == "max_queue_size") config.maxQueueSize = parseInteger<std::size_t>(key, val);
        else if (key == "max_retry_attempts") config.maxRetryAttempts = parseInteger<int>(key, val);
        else if (key == "allows_cellular_access") config.allowsCellularAccess = parseBool(key, val);
        else if (key == "download_directory") config.downloadDirectory = val;
        else if (key == "temporary_directory") config.temporaryDirectory = val;
        else if (key == "min_free_disk_space") config.minFreeDiskSpace = parseInteger<std::uint64_t>(key, val);
        else if (key == "timeout_seconds") config.timeoutSeconds = parseInteger<int>(key, val);
        else if (key == "scheduler_interval_ms") {
            config.schedulerInterval = std::chrono::milliseconds(parseInteger<long long>(key, val));
        } else if (key == "journal_path") config.journalPath = val;
        else if (key == "log_level") config.logLevel = toLower(val);
        else spdlog::warn("Ignoring unknown config key '{}'", key);
    }
}

void loadConfigFile(const std::filesystem::path& path, DownloadManagerConfig& config) {
    std::ifstream file(path, std::ios::in | std::ios::binary);
    if (!file) {
        throw DownloadError(ErrorKind::InvalidConfig, fmt::format("Cannot open config file: {}", path.string()));
    }
    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    parseConfigString(content, config);
    spdlog::debug("Loaded config from {}", path.string());
}

} // namespace dlmanager
