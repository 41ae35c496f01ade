/**
 * @file batch_controller.h
 * @brief Observer-facing control surface for background batch runs
 */

#ifndef KCENON_BATCH_TRANSFER_ORCHESTRATOR_BATCH_CONTROLLER_H
#define KCENON_BATCH_TRANSFER_ORCHESTRATOR_BATCH_CONTROLLER_H

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

#include "kcenon/batch_transfer/adapters/thread_pool_adapter.h"
#include "kcenon/batch_transfer/core/batch_types.h"
#include "kcenon/batch_transfer/core/types.h"
#include "kcenon/batch_transfer/orchestrator/transfer_orchestrator.h"
#include "kcenon/batch_transfer/session/remote_session.h"

namespace kcenon::batch_transfer {

/**
 * @brief Check that a request can be started
 *
 * Host and username are required, the port must be non-zero and key
 * authentication needs a key path. An empty file list is valid.
 */
[[nodiscard]] auto validate_request(const batch_request& request) -> result<void>;

/**
 * @brief Starts batch runs in the background and relays their events
 *
 * Each run executes on its own task of the executor. The observer talks to
 * a run only through its handle: events out, cancellation and checkpoint
 * decisions in. A run that fails unexpectedly still finishes, with
 * finish_reason::aborted.
 *
 * @code
 * auto controller = batch_controller::builder()
 *     .with_connector(std::make_shared<sftp_connector>())
 *     .build();
 *
 * auto handle = controller.value().start(request);
 * while (auto ev = controller.value().next_event(handle.value(), 200ms)) {
 *     if (std::holds_alternative<confirmation_requested>(*ev)) {
 *         controller.value().answer_checkpoint(handle.value(), ask_user());
 *     }
 *     if (is_terminal(*ev)) break;
 * }
 * @endcode
 */
class batch_controller {
public:
    using event_callback = std::function<void(run_handle, const batch_event&)>;

    /**
     * @brief Builder for batch_controller
     */
    class builder {
    public:
        builder();

        /**
         * @brief Set the connector used to open sessions (required)
         */
        auto with_connector(std::shared_ptr<session_connector> connector) -> builder&;

        /**
         * @brief Set the real duration of one countdown second (default: 1s)
         */
        auto with_tick_interval(std::chrono::milliseconds interval) -> builder&;

        /**
         * @brief Number of runs that may execute at the same time (default: 4)
         *
         * Runs started beyond the limit are accepted and wait for a free slot
         * without emitting events. Ignored when an executor is supplied.
         */
        auto with_max_concurrent_runs(std::size_t count) -> builder&;

        /**
         * @brief Use an existing executor instead of creating one
         */
        auto with_executor(std::shared_ptr<adapters::batch_executor_interface> executor)
            -> builder&;

        [[nodiscard]] auto build() -> result<batch_controller>;

    private:
        std::shared_ptr<session_connector> connector_;
        std::shared_ptr<adapters::batch_executor_interface> executor_;
        orchestrator_config config_;
        std::size_t max_concurrent_runs_ = 4;
    };

    batch_controller(const batch_controller&) = delete;
    auto operator=(const batch_controller&) -> batch_controller& = delete;
    batch_controller(batch_controller&&) noexcept;
    auto operator=(batch_controller&&) noexcept -> batch_controller&;

    /**
     * @brief Cancels every unfinished run and waits for it to end
     */
    ~batch_controller();

    /**
     * @brief Validate the request and start a run in the background
     */
    [[nodiscard]] auto start(batch_request request) -> result<run_handle>;

    /**
     * @brief Request cancellation; repeated calls are harmless
     *
     * A pending checkpoint is answered with false.
     */
    auto cancel(run_handle handle) -> result<void>;

    /**
     * @brief Answer the run's outstanding confirmation request
     * @return error_code::no_pending_checkpoint when nothing is outstanding
     */
    [[nodiscard]] auto answer_checkpoint(run_handle handle, bool proceed) -> result<void>;

    /**
     * @brief Take the run's next event, waiting up to @p timeout
     * @return std::nullopt on timeout, unknown handle, or after the last event
     */
    [[nodiscard]] auto next_event(run_handle handle, std::chrono::milliseconds timeout)
        -> std::optional<batch_event>;

    /**
     * @brief Take every queued event, keeping only the newest countdown tick
     */
    [[nodiscard]] auto drain_events(run_handle handle) -> std::vector<batch_event>;

    /**
     * @brief Block until the run has finished
     */
    [[nodiscard]] auto wait(run_handle handle) -> result<run_finished>;

    /**
     * @brief Block until the run has finished or the timeout passes
     */
    [[nodiscard]] auto wait_for(run_handle handle, std::chrono::milliseconds timeout)
        -> result<run_finished>;

    [[nodiscard]] auto is_running(run_handle handle) const -> bool;

    [[nodiscard]] auto has_pending_checkpoint(run_handle handle) const -> bool;

    /**
     * @brief Forget a finished run and its undelivered events
     *
     * Finished runs stay queryable (wait(), drain_events()) until released
     * or the controller is destroyed; long-lived controllers should release
     * each run once its outcome has been read.
     *
     * @return error_code::invalid_request while the run is still running
     */
    auto release(run_handle handle) -> result<void>;

    /**
     * @brief Subscribe to events of every run
     *
     * The callback runs on the run's execution context, after the event was
     * queued for next_event(). Pass an empty function to unsubscribe.
     */
    void on_event(event_callback callback);

    [[nodiscard]] auto config() const -> const orchestrator_config&;

private:
    batch_controller(std::shared_ptr<session_connector> connector,
                     std::shared_ptr<adapters::batch_executor_interface> executor,
                     orchestrator_config config);

    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::batch_transfer

#endif  // KCENON_BATCH_TRANSFER_ORCHESTRATOR_BATCH_CONTROLLER_H
