/**
 * @file cancellation.cpp
 * @brief Implementation of cancellation_source
 */

#include "kcenon/batch_transfer/core/cancellation.h"

#include <algorithm>

namespace kcenon::batch_transfer {

auto cancellation_source::request() -> bool {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (requested_.exchange(true, std::memory_order_acq_rel)) {
            return false;
        }
    }
    cv_.notify_all();

    // Listeners run under listener_mutex_ so remove_listener() can wait for
    // an in-progress call to finish.
    std::lock_guard<std::mutex> lock(listener_mutex_);
    for (auto& [id, listener] : listeners_) {
        if (listener) {
            listener();
        }
    }
    listeners_.clear();
    return true;
}

auto cancellation_source::sleep_until(std::chrono::steady_clock::time_point deadline) const
    -> bool {
    std::unique_lock<std::mutex> lock(mutex_);
    return !cv_.wait_until(lock, deadline, [this] {
        return requested_.load(std::memory_order_acquire);
    });
}

auto cancellation_source::add_listener(std::function<void()> listener) -> listener_id {
    {
        std::lock_guard<std::mutex> lock(listener_mutex_);
        if (!requested_.load(std::memory_order_acquire)) {
            auto id = next_id_++;
            listeners_.emplace_back(id, std::move(listener));
            return id;
        }
    }
    if (listener) {
        listener();
    }
    return 0;
}

void cancellation_source::remove_listener(listener_id id) {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    listeners_.erase(std::remove_if(listeners_.begin(), listeners_.end(),
                                    [id](const auto& entry) { return entry.first == id; }),
                     listeners_.end());
}

}  // namespace kcenon::batch_transfer
