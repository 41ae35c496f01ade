/**
 * @file batch_types.h
 * @brief Request, policy and event types for batch runs
 */

#ifndef KCENON_BATCH_TRANSFER_CORE_BATCH_TYPES_H
#define KCENON_BATCH_TRANSFER_CORE_BATCH_TYPES_H

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "kcenon/batch_transfer/core/types.h"
#include "kcenon/batch_transfer/session/remote_session.h"

namespace kcenon::batch_transfer {

/**
 * @brief Reconnect threshold used when a policy does not override it
 *
 * Idle SSH sessions are commonly dropped after about a minute.
 */
inline constexpr std::chrono::seconds default_reconnect_threshold{55};

/**
 * @brief Timing and confirmation policy of one batch
 */
struct batch_policy {
    std::chrono::seconds start_delay{0};        ///< Wait before connecting
    std::chrono::seconds inter_file_delay{0};   ///< Wait between files (0 = none)
    std::size_t checkpoint_after = 0;           ///< Confirm after this file (0 = never)
    std::chrono::seconds reconnect_threshold = default_reconnect_threshold;
};

/**
 * @brief Immutable description of one batch run
 */
struct batch_request {
    session_options session;
    std::vector<std::filesystem::path> files;
    batch_policy policy;
};

/**
 * @brief Handle identifying a run started by batch_controller
 */
struct run_handle {
    uint64_t id = 0;

    [[nodiscard]] auto is_valid() const noexcept -> bool { return id != 0; }

    friend auto operator==(const run_handle&, const run_handle&) -> bool = default;
};

/**
 * @brief Severity of a log event
 */
enum class event_severity {
    debug,
    info,
    warning,
    error
};

[[nodiscard]] constexpr auto to_string(event_severity severity) noexcept -> const char* {
    switch (severity) {
        case event_severity::debug: return "debug";
        case event_severity::info: return "info";
        case event_severity::warning: return "warning";
        case event_severity::error: return "error";
        default: return "unknown";
    }
}

/**
 * @brief What a log event reports
 */
enum class log_kind {
    scheduled,
    connecting,
    connected,
    connect_failed,
    file_skipped,
    upload_started,
    upload_succeeded,
    upload_failed,
    connection_lost,
    reconnected,
    reconnect_failed,
    checkpoint_reached,
    checkpoint_continue,
    checkpoint_stop,
    stopped_by_user,
    session_closed,
    info
};

[[nodiscard]] constexpr auto to_string(log_kind kind) noexcept -> const char* {
    switch (kind) {
        case log_kind::scheduled: return "scheduled";
        case log_kind::connecting: return "connecting";
        case log_kind::connected: return "connected";
        case log_kind::connect_failed: return "connect_failed";
        case log_kind::file_skipped: return "file_skipped";
        case log_kind::upload_started: return "upload_started";
        case log_kind::upload_succeeded: return "upload_succeeded";
        case log_kind::upload_failed: return "upload_failed";
        case log_kind::connection_lost: return "connection_lost";
        case log_kind::reconnected: return "reconnected";
        case log_kind::reconnect_failed: return "reconnect_failed";
        case log_kind::checkpoint_reached: return "checkpoint_reached";
        case log_kind::checkpoint_continue: return "checkpoint_continue";
        case log_kind::checkpoint_stop: return "checkpoint_stop";
        case log_kind::stopped_by_user: return "stopped_by_user";
        case log_kind::session_closed: return "session_closed";
        case log_kind::info: return "info";
        default: return "unknown";
    }
}

/**
 * @brief File-level details attached to a log event
 */
struct file_context {
    std::optional<std::size_t> file_index;  ///< 1-based
    std::optional<std::size_t> total_files;
    std::string filename;
    std::optional<std::string> remote_path;
    std::optional<std::string> error_message;
};

/**
 * @brief Human-readable progress line
 */
struct log_event {
    log_kind kind = log_kind::info;
    event_severity severity = event_severity::info;
    std::string message;
    file_context context;
};

/**
 * @brief Which wait a countdown tick belongs to
 */
enum class countdown_phase {
    none,              ///< No countdown active (clears the display)
    start_delay,
    inter_file_delay
};

/**
 * @brief Remaining time of an active wait
 */
struct countdown_tick {
    countdown_phase phase = countdown_phase::none;
    std::string label;
    std::uint32_t remaining_seconds = 0;
    std::optional<std::size_t> next_file_index;

    [[nodiscard]] auto is_clear() const noexcept -> bool {
        return phase == countdown_phase::none;
    }

    /**
     * @brief Render as "<label>  MMm SSs  [n]", or empty when clear
     */
    [[nodiscard]] auto to_display_string() const -> std::string;
};

/**
 * @brief The run is paused waiting for answer_checkpoint()
 */
struct confirmation_requested {
    std::size_t completed_files = 0;
    std::size_t total_files = 0;
};

/**
 * @brief Why a run ended
 */
enum class finish_reason {
    completed,
    stopped_by_user,
    stopped_at_checkpoint,
    reconnect_failed,
    connect_failed,
    cancelled_before_start,
    aborted   ///< Unexpected internal failure; the run was torn down
};

[[nodiscard]] constexpr auto to_string(finish_reason reason) noexcept -> const char* {
    switch (reason) {
        case finish_reason::completed: return "completed";
        case finish_reason::stopped_by_user: return "stopped_by_user";
        case finish_reason::stopped_at_checkpoint: return "stopped_at_checkpoint";
        case finish_reason::reconnect_failed: return "reconnect_failed";
        case finish_reason::connect_failed: return "connect_failed";
        case finish_reason::cancelled_before_start: return "cancelled_before_start";
        case finish_reason::aborted: return "aborted";
        default: return "unknown";
    }
}

/**
 * @brief Per-run counters
 */
struct run_summary {
    std::size_t attempted = 0;   ///< Upload calls made
    std::size_t succeeded = 0;
    std::size_t failed = 0;
    std::size_t skipped = 0;     ///< Local file missing
};

/**
 * @brief Terminal event, emitted exactly once per run
 *
 * completed_normally is false only when the run ended before a session was
 * established (pre-start cancellation or initial connect failure). Every
 * other ending, including a user stop or a failed reconnect, reports true;
 * use reason to tell them apart.
 */
struct run_finished {
    bool completed_normally = false;
    finish_reason reason = finish_reason::completed;
    run_summary summary;
};

using batch_event = std::variant<log_event, countdown_tick, confirmation_requested, run_finished>;

/**
 * @brief Check whether an event is the terminal run_finished
 */
[[nodiscard]] inline auto is_terminal(const batch_event& event) noexcept -> bool {
    return std::holds_alternative<run_finished>(event);
}

}  // namespace kcenon::batch_transfer

#endif  // KCENON_BATCH_TRANSFER_CORE_BATCH_TYPES_H
