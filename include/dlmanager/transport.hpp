#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>

namespace dlmanager {

// Callback slots of one transfer. They may be invoked from any thread; at most
// one of onError/onFinished fires, and nothing fires after cancel().
struct TransferCallbacks {
    // bytes_written is the amount delivered since the previous call.
    std::function<void(std::uint64_t bytes_written,
                       std::uint64_t total_written,
                       std::uint64_t total_expected)> onProgress;
    std::function<void(const std::string& message)> onError;
    // The file is only valid for the duration of the call.
    std::function<void(const std::filesystem::path& temp_file)> onFinished;
};

class TransferHandle {
public:
    virtual ~TransferHandle() = default;

    // Stops the byte flow while keeping the connection and buffers.
    virtual void suspend() = 0;
    // Never blocks on the transfer thread.
    virtual void cancel() = 0;
};

class Transport {
public:
    virtual ~Transport() = default;

    [[nodiscard]] virtual std::unique_ptr<TransferHandle> start(const std::string& url,
                                                                TransferCallbacks callbacks) = 0;
};

} // namespace dlmanager
