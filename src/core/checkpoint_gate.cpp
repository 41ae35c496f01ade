/**
 * @file checkpoint_gate.cpp
 * @brief Implementation of checkpoint_gate
 */

#include "kcenon/batch_transfer/core/checkpoint_gate.h"

namespace kcenon::batch_transfer {

auto checkpoint_gate::request(const std::function<void()>& on_pending,
                              cancellation_source& cancel) -> bool {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_ = true;
        decision_.reset();
    }

    if (on_pending) {
        on_pending();
    }

    cancellation_listener listener(cancel, [this] { deliver(false); });

    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return decision_.has_value(); });
    pending_ = false;
    return *decision_;
}

auto checkpoint_gate::answer(bool proceed) -> result<void> {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!pending_ || decision_.has_value()) {
            return unexpected{error{error_code::no_pending_checkpoint,
                                    "No checkpoint is waiting for an answer"}};
        }
        decision_ = proceed;
    }
    cv_.notify_all();
    return {};
}

auto checkpoint_gate::is_pending() const -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_ && !decision_.has_value();
}

void checkpoint_gate::deliver(bool proceed) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!pending_ || decision_.has_value()) {
            return;
        }
        decision_ = proceed;
    }
    cv_.notify_all();
}

}  // namespace kcenon::batch_transfer
