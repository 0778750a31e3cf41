#pragma once

#include <stdexcept>
#include <string>

namespace dlmanager {

enum class ErrorKind {
    InvalidRequest,
    TransportFailure,
    StorageFailure,
    QueueFull,
    InvalidConfig,
};

[[nodiscard]] const char* toString(ErrorKind kind) noexcept;

class DownloadError : public std::runtime_error {
public:
    DownloadError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace dlmanager
