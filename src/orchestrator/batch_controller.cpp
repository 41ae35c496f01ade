/**
 * @file batch_controller.cpp
 * @brief Implementation of batch_controller
 */

#include "kcenon/batch_transfer/orchestrator/batch_controller.h"

#include <atomic>
#include <condition_variable>
#include <exception>
#include <map>
#include <mutex>
#include <string>

#include "kcenon/batch_transfer/core/cancellation.h"
#include "kcenon/batch_transfer/core/checkpoint_gate.h"
#include "kcenon/batch_transfer/core/event_channel.h"
#include "kcenon/batch_transfer/core/logging.h"

namespace kcenon::batch_transfer {

namespace {

constexpr const char* run_task_label = "batch_run";

auto unknown_run(run_handle handle) -> unexpected {
    return unexpected{error{error_code::unknown_run,
                            "Unknown run handle: " + std::to_string(handle.id)}};
}

}  // namespace

auto validate_request(const batch_request& request) -> result<void> {
    const auto& session = request.session;
    if (session.host.empty()) {
        return unexpected{error{error_code::invalid_request, "Host is required"}};
    }
    if (session.username.empty()) {
        return unexpected{error{error_code::invalid_request, "Username is required"}};
    }
    if (session.port == 0) {
        return unexpected{error{error_code::invalid_request, "Port must be 1-65535"}};
    }
    if (session.auth == auth_method::private_key && session.key_path.empty()) {
        return unexpected{error{error_code::invalid_request,
                                "Key authentication requires a key path"}};
    }
    return {};
}

// ============================================================================
// Per-run record
// ============================================================================

namespace {

struct run_record {
    explicit run_record(batch_request req) : request(std::move(req)) {}

    batch_request request;
    event_channel events;
    cancellation_source cancel;
    checkpoint_gate gate;
    std::future<void> task;

    mutable std::mutex mutex;
    std::condition_variable finished_cv;
    std::optional<run_finished> outcome;

    [[nodiscard]] auto is_finished() const -> bool {
        std::lock_guard<std::mutex> lock(mutex);
        return outcome.has_value();
    }

    void mark_finished(const run_finished& finished) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            outcome = finished;
        }
        finished_cv.notify_all();
    }
};

}  // namespace

// ============================================================================
// batch_controller::impl
// ============================================================================

struct batch_controller::impl {
    std::shared_ptr<session_connector> connector;
    std::shared_ptr<adapters::batch_executor_interface> executor;
    orchestrator_config config;

    mutable std::mutex runs_mutex;
    std::map<uint64_t, std::shared_ptr<run_record>> runs;
    std::atomic<uint64_t> next_id{1};

    std::mutex callback_mutex;
    event_callback callback;

    impl(std::shared_ptr<session_connector> conn,
         std::shared_ptr<adapters::batch_executor_interface> exec,
         orchestrator_config cfg)
        : connector(std::move(conn)), executor(std::move(exec)), config(cfg) {}

    auto find(run_handle handle) const -> std::shared_ptr<run_record> {
        std::lock_guard<std::mutex> lock(runs_mutex);
        auto it = runs.find(handle.id);
        return it != runs.end() ? it->second : nullptr;
    }

    void publish(run_handle handle, run_record& record, batch_event event) {
        event_callback cb;
        {
            std::lock_guard<std::mutex> lock(callback_mutex);
            cb = callback;
        }
        if (!cb) {
            record.events.push(std::move(event));
            return;
        }
        record.events.push(event);
        // The observer's failure must not end the run.
        try {
            cb(handle, event);
        } catch (const std::exception& e) {
            batch_log_context ctx;
            ctx.run_id = handle.id;
            ctx.error_message = e.what();
            BT_LOG_ERROR_CTX(log_category::controller, "Event callback threw", ctx);
        } catch (...) {
            batch_log_context ctx;
            ctx.run_id = handle.id;
            BT_LOG_ERROR_CTX(log_category::controller,
                             "Event callback threw a non-standard exception", ctx);
        }
    }

    void execute(run_handle handle, const std::shared_ptr<run_record>& record) {
        std::optional<run_finished> finished;
        std::string failure;
        try {
            transfer_orchestrator orchestrator(connector, config);
            finished = orchestrator.run(
                record->request,
                [this, handle, &record](batch_event event) {
                    publish(handle, *record, std::move(event));
                },
                record->cancel, record->gate, handle.id);
        } catch (const std::exception& e) {
            failure = e.what();
        } catch (...) {
            failure = "unknown exception";
        }

        if (!finished) {
            // Observers and waiters still get a terminal event.
            batch_log_context ctx;
            ctx.run_id = handle.id;
            ctx.error_message = failure;
            BT_LOG_ERROR_CTX(log_category::controller, "Batch run aborted", ctx);

            finished = run_finished{false, finish_reason::aborted, {}};
            publish(handle, *record,
                    log_event{log_kind::info, event_severity::error, "Run aborted: " + failure,
                              {}});
            publish(handle, *record, *finished);
        }

        record->mark_finished(*finished);
        record->events.close();
    }

    void shutdown() {
        std::vector<std::shared_ptr<run_record>> active;
        {
            std::lock_guard<std::mutex> lock(runs_mutex);
            for (auto& [id, record] : runs) {
                active.push_back(record);
            }
        }
        for (auto& record : active) {
            record->cancel.request();
        }
        for (auto& record : active) {
            if (record->task.valid()) {
                record->task.wait();
            }
        }
    }
};

// ============================================================================
// batch_controller::builder
// ============================================================================

batch_controller::builder::builder() = default;

auto batch_controller::builder::with_connector(std::shared_ptr<session_connector> connector)
    -> builder& {
    connector_ = std::move(connector);
    return *this;
}

auto batch_controller::builder::with_tick_interval(std::chrono::milliseconds interval)
    -> builder& {
    config_.tick_interval = interval;
    return *this;
}

auto batch_controller::builder::with_max_concurrent_runs(std::size_t count) -> builder& {
    max_concurrent_runs_ = count;
    return *this;
}

auto batch_controller::builder::with_executor(
    std::shared_ptr<adapters::batch_executor_interface> executor) -> builder& {
    executor_ = std::move(executor);
    return *this;
}

auto batch_controller::builder::build() -> result<batch_controller> {
    if (!connector_) {
        return unexpected{error{error_code::invalid_configuration,
                                "A session connector is required"}};
    }
    if (config_.tick_interval.count() <= 0) {
        return unexpected{error{error_code::invalid_configuration,
                                "Tick interval must be positive"}};
    }
    if (!executor_ && max_concurrent_runs_ == 0) {
        return unexpected{error{error_code::invalid_configuration,
                                "At least one concurrent run is required"}};
    }

    auto executor = executor_;
    if (!executor) {
        executor = adapters::batch_executor_factory::create(max_concurrent_runs_,
                                                            "batch_transfer_pool");
    }
    return batch_controller{connector_, std::move(executor), config_};
}

// ============================================================================
// batch_controller
// ============================================================================

batch_controller::batch_controller(
    std::shared_ptr<session_connector> connector,
    std::shared_ptr<adapters::batch_executor_interface> executor,
    orchestrator_config config)
    : impl_(std::make_unique<impl>(std::move(connector), std::move(executor), config)) {
    // Initialize logger (safe to call multiple times)
    get_logger().initialize();
}

batch_controller::batch_controller(batch_controller&&) noexcept = default;

auto batch_controller::operator=(batch_controller&& other) noexcept -> batch_controller& {
    if (this != &other) {
        if (impl_) {
            impl_->shutdown();
        }
        impl_ = std::move(other.impl_);
    }
    return *this;
}

batch_controller::~batch_controller() {
    if (impl_) {
        impl_->shutdown();
    }
}

auto batch_controller::start(batch_request request) -> result<run_handle> {
    auto valid = validate_request(request);
    if (!valid.has_value()) {
        BT_LOG_WARN(log_category::controller,
                    "Rejected batch request: " + valid.error().message);
        return unexpected{valid.error()};
    }
    if (!impl_->executor->is_running()) {
        return unexpected{error{error_code::not_initialized, "Executor is not running"}};
    }

    run_handle handle{impl_->next_id.fetch_add(1)};
    auto record = std::make_shared<run_record>(std::move(request));

    batch_log_context ctx;
    ctx.run_id = handle.id;
    ctx.total_files = record->request.files.size();
    ctx.server_address = record->request.session.endpoint_string();
    BT_LOG_INFO_CTX(log_category::controller, "Starting batch run", ctx);

    // The task holds a weak reference: the record owns the task's future,
    // and the controller joins every task before dropping a record.
    auto* self = impl_.get();
    std::weak_ptr<run_record> weak = record;
    {
        std::lock_guard<std::mutex> lock(impl_->runs_mutex);
        impl_->runs.emplace(handle.id, record);
        record->task = impl_->executor->submit(
            [self, handle, weak] {
                if (auto locked = weak.lock()) {
                    self->execute(handle, locked);
                }
            },
            run_task_label);
    }

    return handle;
}

auto batch_controller::cancel(run_handle handle) -> result<void> {
    auto record = impl_->find(handle);
    if (!record) {
        return unknown_run(handle);
    }
    if (record->cancel.request()) {
        batch_log_context ctx;
        ctx.run_id = handle.id;
        BT_LOG_INFO_CTX(log_category::controller, "Cancellation requested", ctx);
    }
    return {};
}

auto batch_controller::answer_checkpoint(run_handle handle, bool proceed) -> result<void> {
    auto record = impl_->find(handle);
    if (!record) {
        return unknown_run(handle);
    }
    return record->gate.answer(proceed);
}

auto batch_controller::next_event(run_handle handle, std::chrono::milliseconds timeout)
    -> std::optional<batch_event> {
    auto record = impl_->find(handle);
    if (!record) {
        return std::nullopt;
    }
    return record->events.pop(timeout);
}

auto batch_controller::drain_events(run_handle handle) -> std::vector<batch_event> {
    auto record = impl_->find(handle);
    if (!record) {
        return {};
    }
    return record->events.drain();
}

auto batch_controller::wait(run_handle handle) -> result<run_finished> {
    auto record = impl_->find(handle);
    if (!record) {
        return unknown_run(handle);
    }
    std::unique_lock<std::mutex> lock(record->mutex);
    record->finished_cv.wait(lock, [&record] { return record->outcome.has_value(); });
    return *record->outcome;
}

auto batch_controller::wait_for(run_handle handle, std::chrono::milliseconds timeout)
    -> result<run_finished> {
    auto record = impl_->find(handle);
    if (!record) {
        return unknown_run(handle);
    }
    std::unique_lock<std::mutex> lock(record->mutex);
    if (!record->finished_cv.wait_for(lock, timeout,
                                      [&record] { return record->outcome.has_value(); })) {
        return unexpected{error{error_code::wait_timeout,
                                "Run did not finish within the timeout"}};
    }
    return *record->outcome;
}

auto batch_controller::is_running(run_handle handle) const -> bool {
    auto record = impl_->find(handle);
    return record && !record->is_finished();
}

auto batch_controller::has_pending_checkpoint(run_handle handle) const -> bool {
    auto record = impl_->find(handle);
    return record && record->gate.is_pending();
}

auto batch_controller::release(run_handle handle) -> result<void> {
    std::shared_ptr<run_record> record;
    {
        std::lock_guard<std::mutex> lock(impl_->runs_mutex);
        auto it = impl_->runs.find(handle.id);
        if (it == impl_->runs.end()) {
            return unknown_run(handle);
        }
        if (!it->second->is_finished()) {
            return unexpected{error{error_code::invalid_request,
                                    "Cannot release a run that is still running"}};
        }
        record = std::move(it->second);
        impl_->runs.erase(it);
    }
    if (record->task.valid()) {
        record->task.wait();
    }
    return {};
}

void batch_controller::on_event(event_callback callback) {
    std::lock_guard<std::mutex> lock(impl_->callback_mutex);
    impl_->callback = std::move(callback);
}

auto batch_controller::config() const -> const orchestrator_config& {
    return impl_->config;
}

}  // namespace kcenon::batch_transfer
