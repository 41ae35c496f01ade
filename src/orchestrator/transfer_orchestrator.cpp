/**
 * @file transfer_orchestrator.cpp
 * @brief Implementation of transfer_orchestrator
 */

#include "kcenon/batch_transfer/orchestrator/transfer_orchestrator.h"

#include <algorithm>
#include <cstdio>
#include <ctime>
#include <exception>
#include <limits>
#include <optional>
#include <string_view>
#include <system_error>

#include "kcenon/batch_transfer/core/countdown_waiter.h"
#include "kcenon/batch_transfer/core/logging.h"

namespace kcenon::batch_transfer {

namespace {

// ============================================================================
// Formatting helpers
// ============================================================================

auto file_tag(std::size_t index, std::size_t total) -> std::string {
    char buf[48];
    std::snprintf(buf, sizeof(buf), "[%02zu/%zu]", index, total);
    return buf;
}

auto wall_clock_after(std::chrono::seconds delay) -> std::string {
    auto eta = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now() + delay);
    std::tm tm_buf{};
#if defined(_WIN32)
    localtime_s(&tm_buf, &eta);
#else
    localtime_r(&eta, &tm_buf);
#endif
    char buf[16];
    std::strftime(buf, sizeof(buf), "%H:%M:%S", &tm_buf);
    return buf;
}

auto to_tick_count(std::chrono::seconds duration) -> std::uint32_t {
    auto count = duration.count();
    if (count <= 0) {
        return 0;
    }
    return static_cast<std::uint32_t>(
        std::min<long long>(count, std::numeric_limits<std::uint32_t>::max()));
}

auto to_log_level(event_severity severity) -> log_level {
    switch (severity) {
        case event_severity::debug: return log_level::debug;
        case event_severity::info: return log_level::info;
        case event_severity::warning: return log_level::warn;
        case event_severity::error: return log_level::error;
        default: return log_level::info;
    }
}

// ============================================================================
// batch_run: state of one run() invocation
// ============================================================================

class batch_run {
public:
    batch_run(const batch_request& request,
              const transfer_orchestrator::event_sink& emit,
              cancellation_source& cancel,
              checkpoint_gate& gate,
              session_connector& connector,
              const orchestrator_config& config,
              uint64_t run_id)
        : request_(request),
          emit_(emit),
          cancel_(cancel),
          gate_(gate),
          connector_(connector),
          waiter_(config.tick_interval),
          run_id_(run_id) {}

    auto execute() -> run_finished {
        const auto start_delay = to_tick_count(request_.policy.start_delay);
        if (start_delay > 0) {
            log(log_kind::scheduled, event_severity::info,
                "Upload scheduled to start at " +
                    wall_clock_after(request_.policy.start_delay));

            if (!countdown(countdown_phase::start_delay, "Starting in", start_delay,
                           std::nullopt)) {
                log(log_kind::stopped_by_user, event_severity::info,
                    "Stopped during initial delay.");
                return finish(false, finish_reason::cancelled_before_start);
            }
        }

        if (cancel_.is_requested()) {
            log(log_kind::stopped_by_user, event_severity::info,
                "Stopped before connecting.");
            return finish(false, finish_reason::cancelled_before_start);
        }

        if (!connect()) {
            return finish(false, finish_reason::connect_failed);
        }

        auto reason = run_files();
        teardown();
        return finish(true, reason);
    }

private:
    auto connect() -> bool {
        log(log_kind::connecting, event_severity::info,
            "Connecting to " + request_.session.endpoint_string() + " ...");

        auto opened = open_session();
        if (!opened.has_value()) {
            file_context ctx;
            ctx.error_message = opened.error().message;
            log(log_kind::connect_failed, event_severity::error,
                "Connection failed: " + opened.error().message, ctx);
            return false;
        }
        session_ = std::move(opened.value());

        auto home = guarded("home directory lookup",
                            [this] { return session_->home_directory(); });
        if (home.has_value()) {
            log(log_kind::connected, event_severity::info,
                "Connected (remote home: " + home.value() + ")");
        } else {
            BT_LOG_DEBUG(log_category::orchestrator,
                         "Remote home lookup failed: " + home.error().message);
            log(log_kind::connected, event_severity::info, "Connected");
        }
        return true;
    }

    auto run_files() -> finish_reason {
        const auto& files = request_.files;
        const auto total = files.size();
        const auto& policy = request_.policy;
        const auto delay = to_tick_count(policy.inter_file_delay);

        for (std::size_t index = 1; index <= total; ++index) {
            if (cancel_.is_requested()) {
                log(log_kind::stopped_by_user, event_severity::info, "Stopped by user.");
                return finish_reason::stopped_by_user;
            }

            const auto& file = files[index - 1];
            std::error_code ec;
            if (!std::filesystem::exists(file, ec)) {
                ++summary_.skipped;
                log(log_kind::file_skipped, event_severity::warning,
                    file_tag(index, total) + " SKIP (not found): " +
                        file.filename().string(),
                    make_context(index, file));
            } else {
                if (!session_alive()) {
                    if (!reconnect("Connection lost - reconnecting ...")) {
                        return finish_reason::reconnect_failed;
                    }
                }
                upload(index, file);
            }

            if (policy.checkpoint_after > 0 && index == policy.checkpoint_after) {
                if (auto stop = checkpoint(index)) {
                    return *stop;
                }
            }

            if (delay > 0 && index < total && !cancel_.is_requested()) {
                if (!countdown(countdown_phase::inter_file_delay, "Next upload in", delay,
                               index + 1)) {
                    log(log_kind::stopped_by_user, event_severity::info, "Stopped by user.");
                    return finish_reason::stopped_by_user;
                }
                // Long idle periods may have dropped the session.
                if (policy.inter_file_delay >= policy.reconnect_threshold &&
                    !session_alive()) {
                    if (!reconnect("Reconnecting after long delay ...")) {
                        return finish_reason::reconnect_failed;
                    }
                }
            }
        }
        return finish_reason::completed;
    }

    auto reconnect(std::string_view announcement) -> bool {
        log(log_kind::connection_lost, event_severity::warning, std::string(announcement));
        close_session();

        auto opened = open_session();
        if (!opened.has_value()) {
            file_context ctx;
            ctx.error_message = opened.error().message;
            log(log_kind::reconnect_failed, event_severity::error,
                "Reconnect failed: " + opened.error().message, ctx);
            return false;
        }
        session_ = std::move(opened.value());
        log(log_kind::reconnected, event_severity::info, "Reconnected");
        return true;
    }

    void upload(std::size_t index, const std::filesystem::path& file) {
        const auto tag = file_tag(index, request_.files.size());
        const auto remote = remote_path_for(request_.session.remote_dir, file);

        auto ctx = make_context(index, file);
        ctx.remote_path = remote;
        log(log_kind::upload_started, event_severity::info,
            tag + " Uploading " + file.filename().string() + " -> " + remote + " ...", ctx);

        ++summary_.attempted;
        auto uploaded = guarded("upload", [&] { return session_->upload(file, remote); });
        if (uploaded.has_value()) {
            ++summary_.succeeded;
            log(log_kind::upload_succeeded, event_severity::info, tag + " done", ctx);
        } else {
            ++summary_.failed;
            ctx.error_message = uploaded.error().message;
            log(log_kind::upload_failed, event_severity::error,
                tag + " Error: " + uploaded.error().message, ctx);
        }
    }

    // Returns the finish reason when the run must stop here.
    auto checkpoint(std::size_t index) -> std::optional<finish_reason> {
        if (cancel_.is_requested()) {
            return std::nullopt;
        }

        const auto total = request_.files.size();
        log(log_kind::checkpoint_reached, event_severity::info,
            "Test batch done (" + std::to_string(index) + " files)");

        bool proceed = gate_.request(
            [this, index, total] { emit_(confirmation_requested{index, total}); }, cancel_);

        if (!proceed) {
            if (cancel_.is_requested()) {
                log(log_kind::stopped_by_user, event_severity::info, "Stopped by user.");
                return finish_reason::stopped_by_user;
            }
            log(log_kind::checkpoint_stop, event_severity::info, "Stopped after test batch.");
            return finish_reason::stopped_at_checkpoint;
        }

        log(log_kind::checkpoint_continue, event_severity::info, "Continuing ...");
        return std::nullopt;
    }

    auto countdown(countdown_phase phase,
                   const std::string& label,
                   std::uint32_t seconds,
                   std::optional<std::size_t> next_file_index) -> bool {
        bool completed = waiter_.wait(
            seconds,
            [&](std::uint32_t remaining) {
                emit_(countdown_tick{phase, label, remaining, next_file_index});
            },
            cancel_);
        emit_(countdown_tick{});
        return completed;
    }

    void teardown() {
        if (session_) {
            close_session();
            log(log_kind::session_closed, event_severity::debug, "Session closed.");
        }
    }

    void close_session() {
        if (!session_) {
            return;
        }
        auto closed = guarded("close", [this] { return session_->close(); });
        if (!closed.has_value()) {
            BT_LOG_DEBUG(log_category::orchestrator,
                         "Ignoring session close error: " + closed.error().message);
        }
        session_.reset();
    }

    auto open_session() -> result<std::unique_ptr<remote_session>> {
        return guarded("connect", [this] { return connector_.connect(request_.session); });
    }

    auto session_alive() -> bool {
        try {
            return session_->is_active();
        } catch (const std::exception& e) {
            BT_LOG_WARN(log_category::orchestrator,
                        std::string("Session liveness check threw: ") + e.what());
            return false;
        }
    }

    // Session implementations report failures through result<>; an exception
    // from one is turned into an error of the same call.
    template <typename Call>
    auto guarded(std::string_view what, Call&& call) -> decltype(call()) {
        try {
            return call();
        } catch (const std::exception& e) {
            return unexpected{error{error_code::internal_error,
                                    std::string(what) + " threw: " + e.what()}};
        }
    }

    auto finish(bool completed_normally, finish_reason reason) -> run_finished {
        run_finished finished{completed_normally, reason, summary_};

        auto ctx = log_context();
        ctx.total_files = request_.files.size();
        BT_LOG_INFO_CTX(log_category::orchestrator,
                        std::string("Run finished: ") + to_string(reason) + " (attempted " +
                            std::to_string(summary_.attempted) + ", succeeded " +
                            std::to_string(summary_.succeeded) + ", failed " +
                            std::to_string(summary_.failed) + ", skipped " +
                            std::to_string(summary_.skipped) + ")",
                        ctx);

        emit_(finished);
        return finished;
    }

    auto make_context(std::size_t index, const std::filesystem::path& file) const
        -> file_context {
        file_context ctx;
        ctx.file_index = index;
        ctx.total_files = request_.files.size();
        ctx.filename = file.filename().string();
        return ctx;
    }

    auto log_context() const -> batch_log_context {
        batch_log_context ctx;
        if (run_id_ != 0) {
            ctx.run_id = run_id_;
        }
        ctx.server_address = request_.session.endpoint_string();
        return ctx;
    }

    void log(log_kind kind, event_severity severity, std::string message,
             file_context context = {}) {
        auto ctx = log_context();
        ctx.file_index = context.file_index;
        ctx.total_files = context.total_files;
        ctx.filename = context.filename;
        ctx.remote_path = context.remote_path;
        ctx.error_message = context.error_message;
        BT_LOG_CTX(to_log_level(severity), log_category::orchestrator, message, ctx);

        emit_(log_event{kind, severity, std::move(message), std::move(context)});
    }

    const batch_request& request_;
    const transfer_orchestrator::event_sink& emit_;
    cancellation_source& cancel_;
    checkpoint_gate& gate_;
    session_connector& connector_;
    countdown_waiter waiter_;
    uint64_t run_id_;

    std::unique_ptr<remote_session> session_;
    run_summary summary_;
};

}  // namespace

// ============================================================================
// Free functions
// ============================================================================

auto remote_path_for(const std::string& remote_dir, const std::filesystem::path& local_path)
    -> std::string {
    auto name = local_path.filename().string();

    auto end = remote_dir.find_last_not_of('/');
    if (end == std::string::npos) {
        return name;
    }
    return remote_dir.substr(0, end + 1) + "/" + name;
}

// ============================================================================
// transfer_orchestrator
// ============================================================================

transfer_orchestrator::transfer_orchestrator(std::shared_ptr<session_connector> connector,
                                             orchestrator_config config)
    : connector_(std::move(connector)), config_(config) {}

auto transfer_orchestrator::run(const batch_request& request,
                                const event_sink& emit,
                                cancellation_source& cancel,
                                checkpoint_gate& gate,
                                uint64_t run_id) -> run_finished {
    static const event_sink discard = [](batch_event) {};
    batch_run run(request, emit ? emit : discard, cancel, gate, *connector_, config_, run_id);
    return run.execute();
}

}  // namespace kcenon::batch_transfer
