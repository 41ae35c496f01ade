/**
 * @file transfer_orchestrator.h
 * @brief Sequential batch upload state machine
 */

#ifndef KCENON_BATCH_TRANSFER_ORCHESTRATOR_TRANSFER_ORCHESTRATOR_H
#define KCENON_BATCH_TRANSFER_ORCHESTRATOR_TRANSFER_ORCHESTRATOR_H

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>

#include "kcenon/batch_transfer/core/batch_types.h"
#include "kcenon/batch_transfer/core/cancellation.h"
#include "kcenon/batch_transfer/core/checkpoint_gate.h"
#include "kcenon/batch_transfer/session/remote_session.h"

namespace kcenon::batch_transfer {

/**
 * @brief Run-independent orchestrator settings
 */
struct orchestrator_config {
    /// Real duration of one countdown second
    std::chrono::milliseconds tick_interval{1000};
};

/**
 * @brief Build the remote path a local file is uploaded to
 *
 * Trailing slashes of @p remote_dir are stripped; an empty directory yields
 * the bare file name, i.e. the session's default directory.
 */
[[nodiscard]] auto remote_path_for(const std::string& remote_dir,
                                   const std::filesystem::path& local_path) -> std::string;

/**
 * @brief Runs one batch from scheduled start to teardown
 *
 * run() executes on the caller's thread and owns the session for the
 * duration of the call. Files are uploaded strictly in order.
 *
 * Event sequence of a run:
 * - optional start-delay countdown, then connect
 * - per file: skip, or (reconnect) upload; then checkpoint; then delay
 * - teardown: session closed, exactly one run_finished
 *
 * @code
 * transfer_orchestrator orchestrator(connector);
 * cancellation_source cancel;
 * checkpoint_gate gate;
 * auto finished = orchestrator.run(request,
 *     [](batch_event ev) { render(ev); }, cancel, gate);
 * @endcode
 */
class transfer_orchestrator {
public:
    using event_sink = std::function<void(batch_event)>;

    explicit transfer_orchestrator(std::shared_ptr<session_connector> connector,
                                   orchestrator_config config = {});

    /**
     * @brief Execute a batch to completion or cancellation
     *
     * @param request Batch description
     * @param emit Receives every event, run_finished last
     * @param cancel Cancellation flag observed at every suspension point
     * @param gate Rendezvous used for the checkpoint confirmation
     * @param run_id Identifier attached to library log records
     * @return The run_finished event that was emitted
     */
    auto run(const batch_request& request,
             const event_sink& emit,
             cancellation_source& cancel,
             checkpoint_gate& gate,
             uint64_t run_id = 0) -> run_finished;

    [[nodiscard]] auto config() const noexcept -> const orchestrator_config& {
        return config_;
    }

private:
    std::shared_ptr<session_connector> connector_;
    orchestrator_config config_;
};

}  // namespace kcenon::batch_transfer

#endif  // KCENON_BATCH_TRANSFER_ORCHESTRATOR_TRANSFER_ORCHESTRATOR_H
