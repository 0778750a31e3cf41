#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <mutex>
#include <thread>
#include <type_traits>
#include <utility>

namespace dlmanager::detail {

// Single worker thread draining a FIFO of jobs.
// - Jobs run one at a time in submission order.
// - run() blocks the caller until its job finished and rethrows its exception.
// - run() called from the worker thread itself executes inline; post() always
//   queues, so a job may post follow-up jobs without re-entering.
// - The destructor finishes every job already posted, then joins.
class SerialExecutor {
public:
    SerialExecutor() : worker_(&SerialExecutor::workerLoop, this) {}

    ~SerialExecutor() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stop_requested_ = true;
        }
        cv_.notify_one();
        if (worker_.joinable()) {
            worker_.join();
        }
    }

    SerialExecutor(const SerialExecutor&) = delete;
    SerialExecutor& operator=(const SerialExecutor&) = delete;

    void post(std::function<void()> job) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            jobs_.push_back(std::move(job));
        }
        cv_.notify_one();
    }

    template <typename Fn>
    auto run(Fn&& fn) -> std::invoke_result_t<Fn> {
        using Result = std::invoke_result_t<Fn>;
        if (onWorkerThread()) {
            return fn();
        }

        auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<Fn>(fn));
        auto future = task->get_future();
        post([task]() { (*task)(); });
        return future.get();
    }

    // Blocks until every job posted before this call has run.
    void drain() {
        run([] {});
    }

    [[nodiscard]] bool onWorkerThread() const noexcept {
        return std::this_thread::get_id() == worker_.get_id();
    }

private:
    void workerLoop() {
        while (true) {
            std::function<void()> job;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [&] { return stop_requested_ || !jobs_.empty(); });
                if (jobs_.empty()) {
                    break;
                }
                job = std::move(jobs_.front());
                jobs_.pop_front();
            }
            job();
        }
    }

    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::function<void()>> jobs_;
    bool stop_requested_{false};
    std::thread worker_;
};

} // namespace dlmanager::detail
