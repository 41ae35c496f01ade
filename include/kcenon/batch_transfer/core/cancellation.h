/**
 * @file cancellation.h
 * @brief One-way cancellation flag with wake-up support
 */

#ifndef KCENON_BATCH_TRANSFER_CORE_CANCELLATION_H
#define KCENON_BATCH_TRANSFER_CORE_CANCELLATION_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace kcenon::batch_transfer {

/**
 * @brief Cancellation flag shared between a run and its controller
 *
 * Once requested the flag never resets. Sleepers blocked in sleep_until()
 * are woken immediately and registered listeners are invoked once, on the
 * thread that called request().
 */
class cancellation_source {
public:
    using listener_id = std::uint64_t;

    cancellation_source() = default;

    cancellation_source(const cancellation_source&) = delete;
    auto operator=(const cancellation_source&) -> cancellation_source& = delete;

    /**
     * @brief Request cancellation
     * @return true if this call set the flag, false if it was already set
     */
    auto request() -> bool;

    [[nodiscard]] auto is_requested() const noexcept -> bool {
        return requested_.load(std::memory_order_acquire);
    }

    /**
     * @brief Block until the deadline passes or cancellation is requested
     * @return true if the deadline was reached, false if cancelled
     */
    [[nodiscard]] auto sleep_until(std::chrono::steady_clock::time_point deadline) const
        -> bool;

    /**
     * @brief Register a callback run when cancellation is requested
     *
     * If cancellation was already requested the callback runs immediately
     * on the calling thread and the returned id is 0.
     */
    auto add_listener(std::function<void()> listener) -> listener_id;

    /**
     * @brief Unregister a listener
     *
     * After this returns the listener is not running and will not run.
     */
    void remove_listener(listener_id id);

private:
    std::atomic<bool> requested_{false};

    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;

    std::mutex listener_mutex_;
    listener_id next_id_{1};
    std::vector<std::pair<listener_id, std::function<void()>>> listeners_;
};

/**
 * @brief RAII registration of a cancellation listener
 */
class cancellation_listener {
public:
    cancellation_listener(cancellation_source& source, std::function<void()> listener)
        : source_(source), id_(source.add_listener(std::move(listener))) {}

    ~cancellation_listener() {
        if (id_ != 0) {
            source_.remove_listener(id_);
        }
    }

    cancellation_listener(const cancellation_listener&) = delete;
    auto operator=(const cancellation_listener&) -> cancellation_listener& = delete;

private:
    cancellation_source& source_;
    cancellation_source::listener_id id_;
};

}  // namespace kcenon::batch_transfer

#endif  // KCENON_BATCH_TRANSFER_CORE_CANCELLATION_H
