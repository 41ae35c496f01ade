/**
 * @file countdown_waiter.h
 * @brief Interruptible per-tick countdown wait
 */

#ifndef KCENON_BATCH_TRANSFER_CORE_COUNTDOWN_WAITER_H
#define KCENON_BATCH_TRANSFER_CORE_COUNTDOWN_WAITER_H

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

#include "kcenon/batch_transfer/core/cancellation.h"

namespace kcenon::batch_transfer {

/**
 * @brief Render remaining seconds as "MMm SSs"
 *
 * Minutes are not wrapped at 60: 3725 seconds renders as "62m 05s".
 */
[[nodiscard]] auto format_countdown(std::uint32_t remaining_seconds) -> std::string;

/**
 * @brief Sleeps for a whole number of ticks, reporting the time left
 *
 * One tick represents one second of countdown. The tick length is
 * configurable so tests can run a 5 second countdown in a few milliseconds.
 *
 * @code
 * countdown_waiter waiter;
 * bool completed = waiter.wait(30,
 *     [](std::uint32_t remaining) { show(format_countdown(remaining)); },
 *     cancel);
 * @endcode
 */
class countdown_waiter {
public:
    using tick_callback = std::function<void(std::uint32_t remaining_seconds)>;

    explicit countdown_waiter(
        std::chrono::milliseconds tick_interval = std::chrono::seconds(1));

    /**
     * @brief Wait for @p seconds ticks
     *
     * on_tick is called at the start of every tick with the remaining count
     * (seconds, seconds - 1, ..., 1). A cancellation request wakes the wait
     * immediately.
     *
     * @return true if the full duration elapsed, false if cancelled first
     */
    [[nodiscard]] auto wait(std::uint32_t seconds,
                            const tick_callback& on_tick,
                            const cancellation_source& cancel) const -> bool;

    /**
     * @brief Wait variant driven by a cancellation predicate
     *
     * The predicate is polled at least once per tick.
     */
    [[nodiscard]] auto wait(std::uint32_t seconds,
                            const tick_callback& on_tick,
                            const std::function<bool()>& is_cancelled) const -> bool;

    [[nodiscard]] auto tick_interval() const noexcept -> std::chrono::milliseconds {
        return tick_interval_;
    }

private:
    std::chrono::milliseconds tick_interval_;
};

}  // namespace kcenon::batch_transfer

#endif  // KCENON_BATCH_TRANSFER_CORE_COUNTDOWN_WAITER_H
