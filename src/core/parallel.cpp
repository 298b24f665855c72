#include "ridge_texture/core/parallel.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <thread>
#include <vector>

namespace ridge_texture::core {

int compute_worker_count(int requested, int task_count) {
    int workers = requested;
    if (workers < 1) {
        workers = 1;
    }
    int cpu_cores = static_cast<int>(std::thread::hardware_concurrency());
    if (cpu_cores > 0) {
        workers = std::min(workers, cpu_cores);
    }
    if (task_count > 0) {
        workers = std::min(workers, task_count);
    }
    return std::max(1, workers);
}

void parallel_rows(int rows, int workers, const std::function<void(int)>& row_fn) {
    if (rows <= 0) return;
    const int n_workers = compute_worker_count(workers, rows);

    std::atomic<int> next{0};
    std::atomic<bool> failed{false};
    std::mutex error_mutex;
    std::exception_ptr first_error;

    auto worker = [&]() {
        while (!failed.load(std::memory_order_relaxed)) {
            const int y = next.fetch_add(1);
            if (y >= rows) {
                break;
            }
            try {
                row_fn(y);
            } catch (...) {
                failed.store(true, std::memory_order_relaxed);
                std::lock_guard<std::mutex> lock(error_mutex);
                if (!first_error) {
                    first_error = std::current_exception();
                }
            }
        }
    };

    if (n_workers > 1) {
        std::vector<std::thread> threads;
        threads.reserve(static_cast<size_t>(n_workers));
        for (int w = 0; w < n_workers; ++w) {
            threads.emplace_back(worker);
        }
        for (auto& t : threads) {
            if (t.joinable()) {
                t.join();
            }
        }
    } else {
        worker();
    }

    if (first_error) {
        std::rethrow_exception(first_error);
    }
}

} // namespace ridge_texture::core
