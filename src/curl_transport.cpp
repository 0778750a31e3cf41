#include "dlmanager/curl_transport.hpp"
#include "dlmanager/detail/curl_utils.hpp"
#include "dlmanager/download_task.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdio>
#include <iterator>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

#include <curl/curl.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace dlmanager {

namespace {

struct TransferState {
    std::string url;
    TransferCallbacks callbacks;
    std::filesystem::path part_file;
    std::atomic<bool> cancelled{false};
    std::atomic<bool> suspended{false};
    bool finished{false}; // guarded by the transport's workers mutex
};

class CurlTransferHandle final : public TransferHandle {
public:
    explicit CurlTransferHandle(std::shared_ptr<TransferState> state) : state_(std::move(state)) {}

    void suspend() override { state_->suspended = true; }
    void cancel() override { state_->cancelled = true; }

private:
    std::shared_ptr<TransferState> state_;
};

} // namespace

class CurlTransport::Impl {
public:
    Impl(std::filesystem::path temporary_directory, int timeout_seconds)
        : temporary_directory_(std::move(temporary_directory)),
        timeout_seconds_(std::max(1, timeout_seconds)) {
        reaper_ = std::thread([this]() { reapLoop(); });
    }

    ~Impl() {
        {
            std::lock_guard<std::mutex> lock(workers_mutex_);
            stopping_ = true;
        }
        reap_cv_.notify_all();
        if (reaper_.joinable()) {
            reaper_.join();
        }

        std::vector<Worker> workers;
        {
            std::lock_guard<std::mutex> lock(workers_mutex_);
            workers.swap(workers_);
        }
        for (auto& worker : workers) {
            worker.state->cancelled = true;
        }
        for (auto& worker : workers) {
            if (worker.thread.joinable()) {
                worker.thread.join();
            }
        }
    }

    std::unique_ptr<TransferHandle> start(const std::string& url, TransferCallbacks callbacks) {
        detail::ensureCurlInitialized();

        std::error_code ec;
        std::filesystem::create_directories(temporary_directory_, ec);
        if (ec) {
            throw std::runtime_error("Cannot create temporary directory: "
                + temporary_directory_.string() + " - " + ec.message());
        }

        auto state = std::make_shared<TransferState>();
        state->url = url;
        state->callbacks = std::move(callbacks);
        state->part_file = temporary_directory_ / (generateTaskId() + ".part");

        std::lock_guard<std::mutex> lock(workers_mutex_);
        workers_.push_back(Worker{std::thread([this, state]() {
            run(*state);
            {
                std::lock_guard<std::mutex> done(workers_mutex_);
                state->finished = true;
            }
            reap_cv_.notify_all();
        }), state});
        return std::make_unique<CurlTransferHandle>(state);
    }

    std::size_t workerCount() {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        return workers_.size();
    }

private:
    struct Worker {
        std::thread thread;
        std::shared_ptr<TransferState> state;
    };

    struct FileDeleter {
        void operator()(FILE* fp) const noexcept {
            if (fp) {
                std::fclose(fp);
            }
        }
    };

    struct WriteContext {
        TransferState* state{nullptr};
        CURL* curl{nullptr};
        FILE* file{nullptr};
        std::uint64_t written{0};
        bool write_failed{false};
    };

    // Joins worker threads as soon as their transfer is over.
    void reapLoop() {
        const auto is_finished = [](const Worker& worker) { return worker.state->finished; };

        std::unique_lock<std::mutex> lock(workers_mutex_);
        while (!stopping_) {
            reap_cv_.wait(lock, [&] {
                return stopping_ || std::any_of(workers_.begin(), workers_.end(), is_finished);
            });

            auto first_done = std::stable_partition(workers_.begin(), workers_.end(),
                                                    [&](const Worker& worker) { return !is_finished(worker); });
            std::vector<Worker> done(std::make_move_iterator(first_done), std::make_move_iterator(workers_.end()));
            workers_.erase(first_done, workers_.end());

            lock.unlock();
            for (auto& worker : done) {
                if (worker.thread.joinable()) {
                    worker.thread.join();
                }
            }
            lock.lock();
        }
    }

    void run(TransferState& state) {
        using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;

        std::unique_ptr<FILE, FileDeleter> file{std::fopen(state.part_file.c_str(), "wb")};
        if (!file) {
            reportError(state, "Cannot create temporary file " + state.part_file.string());
            return;
        }

        CurlHandle curl{curl_easy_init(), &curl_easy_cleanup};
        if (!curl) {
            file.reset();
            removePartFile(state);
            reportError(state, "Failed to allocate curl handle");
            return;
        }

        WriteContext ctx{&state, curl.get(), file.get(), 0, false};
        char error_buffer[CURL_ERROR_SIZE] = {0};

        curl_easy_setopt(curl.get(), CURLOPT_URL, state.url.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &Impl::writeCallback);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &ctx);
        curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, &Impl::xferInfoCallback);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &state);
        curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buffer);
        curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, static_cast<long>(timeout_seconds_));
        // Idle timeout: abort when less than one byte per second arrives for the whole window.
        curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_TIME, static_cast<long>(timeout_seconds_));

        const CURLcode res = curl_easy_perform(curl.get());
        std::fflush(file.get());
        file.reset();

        if (state.cancelled) {
            removePartFile(state);
            spdlog::debug("Transfer of {} cancelled", state.url);
            return;
        }

        if (res != CURLE_OK || ctx.write_failed) {
            std::string message;
            if (ctx.write_failed) {
                message = "Failed to write " + state.part_file.string();
            } else {
                long code = 0;
                curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &code);
                message = std::string{"curl error: "} + (error_buffer[0] != '\0' ? error_buffer : curl_easy_strerror(res));
                if (code >= 400) {
                    message += fmt::format(" (HTTP {})", code);
                }
            }
            removePartFile(state);
            reportError(state, message);
            return;
        }

        if (state.callbacks.onFinished) {
            state.callbacks.onFinished(state.part_file);
        }
        removePartFile(state);
    }

    static size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
        auto* ctx = static_cast<WriteContext*>(userdata);
        if (!ctx || !ctx->state || !ctx->file) {
            return 0;
        }

        const size_t total = size * nmemb;
        if (total == 0) {
            return 0;
        }
        if (ctx->state->cancelled) {
            return 0;
        }

        const size_t written = std::fwrite(ptr, 1, total, ctx->file);
        if (written != total) {
            ctx->write_failed = true;
            return written;
        }
        ctx->written += written;

        curl_off_t expected = -1;
        curl_easy_getinfo(ctx->curl, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &expected);
        if (ctx->state->callbacks.onProgress) {
            ctx->state->callbacks.onProgress(written, ctx->written,
                                             expected > 0 ? static_cast<std::uint64_t>(expected) : 0);
        }
        return written;
    }

    // Suspension parks the transfer thread here so no bytes are read while the
    // connection stays open.
    static int xferInfoCallback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
        auto* state = static_cast<TransferState*>(userdata);
        while (state->suspended && !state->cancelled) {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
        return state->cancelled ? 1 : 0;
    }

    static void reportError(TransferState& state, const std::string& message) {
        spdlog::warn("Transfer of {} failed: {}", state.url, message);
        if (state.callbacks.onError) {
            state.callbacks.onError(message);
        }
    }

    static void removePartFile(const TransferState& state) {
        std::error_code ec;
        std::filesystem::remove(state.part_file, ec);
        if (ec) {
            spdlog::warn("Cannot remove {}: {}", state.part_file.string(), ec.message());
        }
    }

    std::filesystem::path temporary_directory_;
    int timeout_seconds_;

    std::mutex workers_mutex_;
    std::condition_variable reap_cv_;
    bool stopping_{false};
    std::vector<Worker> workers_;
    std::thread reaper_;
};

CurlTransport::CurlTransport(std::filesystem::path temporary_directory, int timeout_seconds)
    : impl_(std::make_unique<Impl>(std::move(temporary_directory), timeout_seconds)) {}

CurlTransport::~CurlTransport() = default;

std::unique_ptr<TransferHandle> CurlTransport::start(const std::string& url, TransferCallbacks callbacks) {
    return impl_->start(url, std::move(callbacks));
}

std::size_t CurlTransport::workerCount() const {
    return impl_->workerCount();
}

} // namespace dlmanager
