/**
 * @file event_channel.h
 * @brief Ordered event queue between a run and its observer
 */

#ifndef KCENON_BATCH_TRANSFER_CORE_EVENT_CHANNEL_H
#define KCENON_BATCH_TRANSFER_CORE_EVENT_CHANNEL_H

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

#include "kcenon/batch_transfer/core/batch_types.h"

namespace kcenon::batch_transfer {

/**
 * @brief Unbounded FIFO of batch events with countdown coalescing
 *
 * Events come out in the order they were pushed. The one exception is
 * countdown ticks: a tick pushed while the newest queued event is also a
 * tick replaces it, so a slow consumer only sees the latest countdown.
 *
 * @note Thread-safe. Intended for one producer and one consumer, but any
 *       number of either is tolerated.
 */
class event_channel {
public:
    event_channel() = default;

    event_channel(const event_channel&) = delete;
    auto operator=(const event_channel&) -> event_channel& = delete;

    /**
     * @brief Append an event
     *
     * Events pushed after close() are dropped.
     */
    void push(batch_event event);

    /**
     * @brief Take the oldest event, waiting up to @p timeout
     * @return The event, or std::nullopt on timeout or when closed and empty
     */
    [[nodiscard]] auto pop(std::chrono::milliseconds timeout) -> std::optional<batch_event>;

    /**
     * @brief Take the oldest event without waiting
     */
    [[nodiscard]] auto try_pop() -> std::optional<batch_event>;

    /**
     * @brief Take every queued event
     *
     * Only the newest countdown tick of the batch is kept.
     */
    [[nodiscard]] auto drain() -> std::vector<batch_event>;

    /**
     * @brief Stop accepting events and wake waiting consumers
     */
    void close();

    [[nodiscard]] auto is_closed() const -> bool;
    [[nodiscard]] auto size() const -> std::size_t;

    /**
     * @brief Number of countdown ticks replaced before being consumed
     */
    [[nodiscard]] auto coalesced_count() const -> std::size_t;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<batch_event> queue_;
    bool closed_ = false;
    std::size_t coalesced_ = 0;
};

}  // namespace kcenon::batch_transfer

#endif  // KCENON_BATCH_TRANSFER_CORE_EVENT_CHANNEL_H
