/**
 * @file countdown_waiter.cpp
 * @brief Implementation of countdown_waiter
 */

#include "kcenon/batch_transfer/core/countdown_waiter.h"

#include <algorithm>
#include <cstdio>
#include <thread>

namespace kcenon::batch_transfer {

namespace {

// Upper bound on how long the predicate variant sleeps between polls.
constexpr auto max_poll_slice = std::chrono::milliseconds(100);

}  // namespace

auto format_countdown(std::uint32_t remaining_seconds) -> std::string {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%02um %02us",
                  static_cast<unsigned>(remaining_seconds / 60),
                  static_cast<unsigned>(remaining_seconds % 60));
    return buf;
}

countdown_waiter::countdown_waiter(std::chrono::milliseconds tick_interval)
    : tick_interval_(tick_interval.count() > 0 ? tick_interval
                                               : std::chrono::milliseconds(1)) {}

auto countdown_waiter::wait(std::uint32_t seconds,
                            const tick_callback& on_tick,
                            const cancellation_source& cancel) const -> bool {
    // Deadlines are anchored to the start so slow callbacks do not stretch
    // the total duration.
    const auto start = std::chrono::steady_clock::now();
    for (std::uint32_t elapsed = 0; elapsed < seconds; ++elapsed) {
        if (cancel.is_requested()) {
            return false;
        }
        if (on_tick) {
            on_tick(seconds - elapsed);
        }
        if (!cancel.sleep_until(start + tick_interval_ * (elapsed + 1))) {
            return false;
        }
    }
    return true;
}

auto countdown_waiter::wait(std::uint32_t seconds,
                            const tick_callback& on_tick,
                            const std::function<bool()>& is_cancelled) const -> bool {
    auto cancelled = [&is_cancelled] { return is_cancelled && is_cancelled(); };
    const auto slice = std::min<std::chrono::milliseconds>(tick_interval_, max_poll_slice);

    const auto start = std::chrono::steady_clock::now();
    for (std::uint32_t elapsed = 0; elapsed < seconds; ++elapsed) {
        if (cancelled()) {
            return false;
        }
        if (on_tick) {
            on_tick(seconds - elapsed);
        }
        const auto deadline = start + tick_interval_ * (elapsed + 1);
        for (auto now = std::chrono::steady_clock::now(); now < deadline;
             now = std::chrono::steady_clock::now()) {
            if (cancelled()) {
                return false;
            }
            std::this_thread::sleep_for(
                std::min<std::chrono::steady_clock::duration>(deadline - now, slice));
        }
    }
    return true;
}

}  // namespace kcenon::batch_transfer
