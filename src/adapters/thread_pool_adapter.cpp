// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.cpp
 * @brief Batch executor implementations
 */

#include "kcenon/batch_transfer/adapters/thread_pool_adapter.h"

#include <condition_variable>
#include <exception>
#include <thread>

#include "kcenon/batch_transfer/core/logging.h"

#if KCENON_WITH_THREAD_SYSTEM
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wdeprecated-declarations"
#include <kcenon/thread/core/job.h>
#include <kcenon/thread/core/job_queue.h>
#include <kcenon/thread/core/thread_worker.h>
#pragma clang diagnostic pop
#endif

namespace kcenon::batch_transfer::adapters {

// ============================================================================
// In-flight tracking helper (shared implementation)
// ============================================================================

namespace {

class flight_tracker {
public:
    void begin(const std::string& label) {
        std::lock_guard<std::mutex> lock(mutex_);
        ++total_;
        ++counts_[label];
    }

    void end(const std::string& label) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (total_ > 0) {
            --total_;
        }
        auto it = counts_.find(label);
        if (it != counts_.end() && it->second > 0) {
            --it->second;
        }
    }

    [[nodiscard]] size_t total() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return total_;
    }

    [[nodiscard]] size_t count(const std::string& label) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = counts_.find(label);
        return it != counts_.end() ? it->second : 0;
    }

private:
    mutable std::mutex mutex_;
    size_t total_{0};
    std::unordered_map<std::string, size_t> counts_;
};

// Runs the task, reporting exceptions through the promise so the executor
// thread never unwinds. The task leaves the in-flight count before the
// promise is satisfied.
void run_tracked(const std::function<void()>& task,
                 std::promise<void>& promise,
                 flight_tracker& tracker,
                 const std::string& label) {
    std::exception_ptr failure;
    try {
        task();
    } catch (const std::exception& e) {
        BT_LOG_ERROR(log_category::controller,
                     std::string("Batch task '") + label + "' threw: " + e.what());
        failure = std::current_exception();
    } catch (...) {
        BT_LOG_ERROR(log_category::controller,
                     std::string("Batch task '") + label + "' threw a non-standard exception");
        failure = std::current_exception();
    }
    tracker.end(label);

    if (failure) {
        promise.set_exception(failure);
    } else {
        promise.set_value();
    }
}

}  // namespace

// ============================================================================
// thread_system_batch_executor implementation
// ============================================================================

#if KCENON_WITH_THREAD_SYSTEM

class batch_job : public kcenon::thread::job {
public:
    explicit batch_job(std::function<void()> func, const std::string& name)
        : job(name), func_(std::move(func)) {}

    [[nodiscard]] auto do_work() -> common::VoidResult override {
        if (func_) {
            func_();
        }
        return common::ok();
    }

private:
    std::function<void()> func_;
};

struct thread_system_batch_executor::impl {
    std::shared_ptr<kcenon::thread::thread_pool> pool;
    std::string pool_name;
    size_t worker_count{0};
    flight_tracker tracker;
};

thread_system_batch_executor::thread_system_batch_executor(
    std::shared_ptr<kcenon::thread::thread_pool> pool,
    const std::string& pool_name,
    size_t worker_count)
    : pimpl_(std::make_unique<impl>()) {
    pimpl_->pool = std::move(pool);
    pimpl_->pool_name = pool_name;
    pimpl_->worker_count = worker_count;
}

thread_system_batch_executor::~thread_system_batch_executor() {
    if (pimpl_ && pimpl_->pool) {
        auto stopped = pimpl_->pool->stop(false);
        if (!stopped.is_ok()) {
            BT_LOG_WARN(log_category::controller,
                        "Failed to stop pool '" + pimpl_->pool_name + "'");
        }
    }
}

std::shared_ptr<thread_system_batch_executor>
thread_system_batch_executor::create_default(size_t worker_count,
                                             const std::string& pool_name) {
    if (worker_count == 0) {
        worker_count = std::thread::hardware_concurrency();
        if (worker_count == 0) {
            worker_count = 4;
        }
    }

    auto pool = std::make_shared<kcenon::thread::thread_pool>(pool_name);

    for (size_t i = 0; i < worker_count; ++i) {
        auto worker = std::make_unique<kcenon::thread::thread_worker>();
        worker->set_job_queue(pool->get_job_queue());
        pool->enqueue(std::move(worker));
    }

    pool->start();

    return std::make_shared<thread_system_batch_executor>(std::move(pool), pool_name,
                                                          worker_count);
}

std::future<void> thread_system_batch_executor::submit(std::function<void()> task,
                                                       const std::string& label) {
    pimpl_->tracker.begin(label);

    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();

    // The executor outlives its tasks: the controller joins every run first.
    auto* tracker = &pimpl_->tracker;
    auto wrapped = [task = std::move(task), promise, tracker, label]() {
        run_tracked(task, *promise, *tracker, label);
    };

    pimpl_->pool->enqueue(std::make_unique<batch_job>(std::move(wrapped), label));
    return future;
}

size_t thread_system_batch_executor::worker_count() const {
    return pimpl_->worker_count;
}

bool thread_system_batch_executor::is_running() const {
    return pimpl_->pool != nullptr;
}

size_t thread_system_batch_executor::in_flight() const {
    return pimpl_->tracker.total();
}

size_t thread_system_batch_executor::in_flight(const std::string& label) const {
    return pimpl_->tracker.count(label);
}

std::shared_ptr<kcenon::thread::thread_pool>
thread_system_batch_executor::underlying_pool() const {
    return pimpl_->pool;
}

#endif  // KCENON_WITH_THREAD_SYSTEM

// ============================================================================
// async_batch_executor implementation
// ============================================================================

struct async_batch_executor::impl {
    explicit impl(size_t limit) : max_concurrent(limit) {}

    void acquire() {
        std::unique_lock<std::mutex> lock(slot_mutex);
        slot_cv.wait(lock, [this] { return running < max_concurrent; });
        ++running;
    }

    void release() {
        {
            std::lock_guard<std::mutex> lock(slot_mutex);
            --running;
        }
        slot_cv.notify_one();
    }

    const size_t max_concurrent;
    std::mutex slot_mutex;
    std::condition_variable slot_cv;
    size_t running{0};
    flight_tracker tracker;
};

async_batch_executor::async_batch_executor(size_t max_concurrent) {
    if (max_concurrent == 0) {
        max_concurrent = std::thread::hardware_concurrency();
        if (max_concurrent == 0) {
            max_concurrent = 4;
        }
    }
    pimpl_ = std::make_unique<impl>(max_concurrent);
}

async_batch_executor::~async_batch_executor() = default;

std::future<void> async_batch_executor::submit(std::function<void()> task,
                                               const std::string& label) {
    pimpl_->tracker.begin(label);

    auto* pimpl = pimpl_.get();
    return std::async(std::launch::async,
                      [pimpl, task = std::move(task), label]() {
                          pimpl->acquire();
                          std::promise<void> promise;
                          auto done = promise.get_future();
                          run_tracked(task, promise, pimpl->tracker, label);
                          pimpl->release();
                          done.get();
                      });
}

size_t async_batch_executor::worker_count() const {
    return pimpl_->max_concurrent;
}

size_t async_batch_executor::running() const {
    std::lock_guard<std::mutex> lock(pimpl_->slot_mutex);
    return pimpl_->running;
}

bool async_batch_executor::is_running() const { return true; }

size_t async_batch_executor::in_flight() const {
    return pimpl_->tracker.total();
}

size_t async_batch_executor::in_flight(const std::string& label) const {
    return pimpl_->tracker.count(label);
}

// ============================================================================
// batch_executor_factory implementation
// ============================================================================

std::shared_ptr<batch_executor_interface> batch_executor_factory::create(
    size_t worker_count, const std::string& pool_name) {
#if KCENON_WITH_THREAD_SYSTEM
    return thread_system_batch_executor::create_default(worker_count, pool_name);
#else
    (void)pool_name;
    return std::make_shared<async_batch_executor>(worker_count);
#endif
}

}  // namespace kcenon::batch_transfer::adapters
