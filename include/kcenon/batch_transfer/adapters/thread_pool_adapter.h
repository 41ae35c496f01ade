// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.h
 * @brief Execution contexts for batch runs
 *
 * Every batch run occupies one task for its whole lifetime (waits and
 * checkpoint included), so the pool is sized by how many runs may be in
 * flight, not by CPU count.
 *
 * Features:
 * - thread_system integration when available
 * - Fallback to std::async when thread_system is unavailable
 * - Per-label tracking of in-flight runs
 */

#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "../config/feature_flags.h"

#if KCENON_WITH_THREAD_SYSTEM
#include <kcenon/thread/core/thread_pool.h>
#endif

namespace kcenon::batch_transfer::adapters {

/**
 * @brief Interface for running long-lived batch tasks
 */
class batch_executor_interface {
public:
    virtual ~batch_executor_interface() = default;

    /**
     * @brief Submit a task for execution
     * @param task The task to execute
     * @param label Label used for in-flight tracking (e.g. "batch_run")
     * @return Future completed when the task returns
     */
    virtual std::future<void> submit(std::function<void()> task,
                                     const std::string& label) = 0;

    /**
     * @brief Get the number of worker threads
     */
    [[nodiscard]] virtual size_t worker_count() const = 0;

    /**
     * @brief Check if the executor accepts tasks
     */
    [[nodiscard]] virtual bool is_running() const = 0;

    /**
     * @brief Number of submitted tasks that have not returned yet
     */
    [[nodiscard]] virtual size_t in_flight() const = 0;

    /**
     * @brief Number of in-flight tasks submitted under a label
     */
    [[nodiscard]] virtual size_t in_flight(const std::string& label) const = 0;
};

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Executor backed by thread_system's thread_pool
 *
 * @note Thread-safe: All public methods are safe to call from multiple threads.
 */
class thread_system_batch_executor : public batch_executor_interface {
public:
    explicit thread_system_batch_executor(
        std::shared_ptr<kcenon::thread::thread_pool> pool,
        const std::string& pool_name = "batch_transfer_pool",
        size_t worker_count = 0);

    ~thread_system_batch_executor() override;

    thread_system_batch_executor(const thread_system_batch_executor&) = delete;
    thread_system_batch_executor& operator=(const thread_system_batch_executor&) = delete;

    /**
     * @brief Create a started pool with the given number of workers
     * @param worker_count Number of workers (0 = hardware concurrency)
     */
    [[nodiscard]] static std::shared_ptr<thread_system_batch_executor> create_default(
        size_t worker_count = 0,
        const std::string& pool_name = "batch_transfer_pool");

    std::future<void> submit(std::function<void()> task,
                             const std::string& label) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t in_flight() const override;
    [[nodiscard]] size_t in_flight(const std::string& label) const override;

    [[nodiscard]] std::shared_ptr<kcenon::thread::thread_pool> underlying_pool() const;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

#endif  // KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Fallback executor using std::async
 *
 * Each task gets its own thread, but at most worker_count() tasks run at
 * once; the others block until a running task returns.
 */
class async_batch_executor : public batch_executor_interface {
public:
    /**
     * @param max_concurrent Task limit; 0 selects hardware concurrency
     */
    explicit async_batch_executor(size_t max_concurrent = 0);
    ~async_batch_executor() override;

    async_batch_executor(const async_batch_executor&) = delete;
    async_batch_executor& operator=(const async_batch_executor&) = delete;

    std::future<void> submit(std::function<void()> task,
                             const std::string& label) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t in_flight() const override;
    [[nodiscard]] size_t in_flight(const std::string& label) const override;

    /**
     * @brief Tasks currently executing (in_flight() also counts waiting ones)
     */
    [[nodiscard]] size_t running() const;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

/**
 * @brief Factory selecting the best available executor
 *
 * 1. thread_system_batch_executor (when KCENON_WITH_THREAD_SYSTEM)
 * 2. async_batch_executor (fallback)
 */
class batch_executor_factory {
public:
    [[nodiscard]] static std::shared_ptr<batch_executor_interface> create(
        size_t worker_count = 0,
        const std::string& pool_name = "batch_transfer_pool");

    [[nodiscard]] static constexpr bool has_thread_system() noexcept {
#if KCENON_WITH_THREAD_SYSTEM
        return true;
#else
        return false;
#endif
    }
};

}  // namespace kcenon::batch_transfer::adapters
