/**
 * @file checkpoint_gate.h
 * @brief Single-slot rendezvous for checkpoint confirmations
 */

#ifndef KCENON_BATCH_TRANSFER_CORE_CHECKPOINT_GATE_H
#define KCENON_BATCH_TRANSFER_CORE_CHECKPOINT_GATE_H

#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>

#include "kcenon/batch_transfer/core/cancellation.h"
#include "kcenon/batch_transfer/core/types.h"

namespace kcenon::batch_transfer {

/**
 * @brief Holds at most one outstanding confirmation request
 *
 * The run calls request() and blocks; the observer calls answer(). A
 * cancellation request while a confirmation is outstanding delivers false.
 */
class checkpoint_gate {
public:
    checkpoint_gate() = default;

    checkpoint_gate(const checkpoint_gate&) = delete;
    auto operator=(const checkpoint_gate&) -> checkpoint_gate& = delete;

    /**
     * @brief Open a request and wait for the decision
     *
     * @p on_pending runs once the gate accepts answers, so an observer
     * reacting to the notification it sends can never miss the slot.
     *
     * @return The delivered decision; false if cancelled
     */
    [[nodiscard]] auto request(const std::function<void()>& on_pending,
                               cancellation_source& cancel) -> bool;

    /**
     * @brief Deliver a decision to the outstanding request
     * @return error_code::no_pending_checkpoint if nothing is outstanding
     */
    [[nodiscard]] auto answer(bool proceed) -> result<void>;

    [[nodiscard]] auto is_pending() const -> bool;

private:
    void deliver(bool proceed);

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool pending_ = false;
    std::optional<bool> decision_;
};

}  // namespace kcenon::batch_transfer

#endif  // KCENON_BATCH_TRANSFER_CORE_CHECKPOINT_GATE_H
