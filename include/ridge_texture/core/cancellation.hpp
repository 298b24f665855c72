#pragma once

#include <atomic>

namespace ridge_texture::core {

// Set by the caller (e.g. on client disconnect), polled by the run.
class CancelToken {
public:
    void request_stop() { stop_.store(true, std::memory_order_relaxed); }
    bool stop_requested() const { return stop_.load(std::memory_order_relaxed); }

private:
    std::atomic<bool> stop_{false};
};

inline bool stop_requested(const CancelToken* token) {
    return token != nullptr && token->stop_requested();
}

} // namespace ridge_texture::core
