#pragma once

#include "cancellation.hpp"

#include <chrono>
#include <cstddef>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace ridge_texture::core {

enum class TaskStatus {
    Ok,
    TimedOut,
    Failed,
    Cancelled
};

inline std::string task_status_to_string(TaskStatus s) {
    switch (s) {
        case TaskStatus::Ok: return "ok";
        case TaskStatus::TimedOut: return "timed_out";
        case TaskStatus::Failed: return "failed";
        case TaskStatus::Cancelled: return "cancelled";
        default: return "unknown";
    }
}

template <typename T>
struct BoundedResult {
    TaskStatus status = TaskStatus::Failed;
    std::optional<T> value;
    std::string reason;

    bool ok() const { return status == TaskStatus::Ok; }
};

// Owns task threads that outlived their bounded wait. join_all() (and the
// destructor) blocks until every one of them has returned.
class TaskGroup {
public:
    TaskGroup() = default;
    TaskGroup(const TaskGroup&) = delete;
    TaskGroup& operator=(const TaskGroup&) = delete;
    ~TaskGroup() { join_all(); }

    void adopt(std::thread t) {
        std::lock_guard<std::mutex> lock(mutex_);
        threads_.push_back(std::move(t));
    }

    size_t pending() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return threads_.size();
    }

    void join_all() {
        std::vector<std::thread> threads;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            threads.swap(threads_);
        }
        for (auto& t : threads) {
            if (t.joinable()) t.join();
        }
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::thread> threads_;
};

// Runs `fn` on its own thread and waits at most `timeout` for the result.
// When the wait ends early (timeout or `cancel`), the token passed to `fn`
// is raised so the task can wind down, and the thread moves to `abandoned`
// to be joined later. `fn` must own everything it touches.
template <typename T>
BoundedResult<T> run_bounded(std::function<T(const CancelToken&)> fn,
                             std::chrono::milliseconds timeout, const CancelToken* cancel,
                             TaskGroup& abandoned,
                             std::chrono::milliseconds poll = std::chrono::milliseconds(20)) {
    auto stop = std::make_shared<CancelToken>();
    auto task = std::make_shared<std::packaged_task<T()>>(
        [fn = std::move(fn), stop]() { return fn(*stop); });
    std::future<T> fut = task->get_future();
    std::thread worker([task]() { (*task)(); });

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    BoundedResult<T> out;
    while (true) {
        const auto now = std::chrono::steady_clock::now();
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        const auto wait = remaining < poll ? remaining : poll;
        if (fut.wait_for(wait > std::chrono::milliseconds(0) ? wait : std::chrono::milliseconds(0)) ==
            std::future_status::ready) {
            worker.join();
            try {
                out.value = fut.get();
                out.status = TaskStatus::Ok;
            } catch (const std::exception& e) {
                out.status = TaskStatus::Failed;
                out.reason = e.what();
            }
            return out;
        }
        if (stop_requested(cancel)) {
            out.status = TaskStatus::Cancelled;
            out.reason = "cancelled by caller";
            break;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            out.status = TaskStatus::TimedOut;
            out.reason = "no result after " + std::to_string(timeout.count()) + " ms";
            break;
        }
    }
    stop->request_stop();
    abandoned.adopt(std::move(worker));
    return out;
}

} // namespace ridge_texture::core
