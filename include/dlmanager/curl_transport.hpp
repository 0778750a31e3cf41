#pragma once

#include "transport.hpp"

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>

namespace dlmanager {

// Transport backed by one libcurl easy handle and one worker thread per
// transfer. Bodies are streamed into `<temporary_directory>/<random>.part`,
// which is deleted after onFinished returns.
class CurlTransport final : public Transport {
public:
    CurlTransport(std::filesystem::path temporary_directory, int timeout_seconds);
    ~CurlTransport() override;

    [[nodiscard]] std::unique_ptr<TransferHandle> start(const std::string& url,
                                                        TransferCallbacks callbacks) override;

    // Transfers whose thread has not been joined yet.
    [[nodiscard]] std::size_t workerCount() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace dlmanager
