// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.h
 * @brief Worker pool abstraction for transfer jobs and enumeration
 *
 * Jobs run their transfer workers and statistics ticker on a pool, and the
 * path enumerator runs directory and file-stat workers on separate pools.
 * When thread_system is part of the build its thread_pool backs the
 * abstraction, otherwise each task gets its own std::async thread.
 */

#pragma once

#include <atomic>
#include <chrono>
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

namespace kcenon::bulk_transfer::adapters {

/**
 * @brief Pool used to run long-lived worker loops and short tasks
 *
 * Every task gets its own future; callers that need to know when a worker
 * loop has finished keep the future and wait on it.
 */
class worker_pool_interface {
public:
    virtual ~worker_pool_interface() = default;

    /**
     * @brief Submit a task for execution
     */
    virtual std::future<void> submit(std::function<void()> task) = 0;

    /**
     * @brief Submit a task that starts after @p delay
     */
    virtual std::future<void> submit_delayed(std::function<void()> task,
                                             std::chrono::milliseconds delay) = 0;

    /**
     * @brief Submit a task tagged with a stage name
     *
     * Stage names ("transfer", "statistics", "directory_walk", ...) only
     * affect pending_tasks(stage) bookkeeping.
     */
    virtual std::future<void> submit_to_stage(std::function<void()> task,
                                              const std::string& stage_name) = 0;

    [[nodiscard]] virtual size_t worker_count() const = 0;

    [[nodiscard]] virtual bool is_running() const = 0;

    /**
     * @brief Tasks submitted but not yet finished
     */
    [[nodiscard]] virtual size_t pending_tasks() const = 0;

    [[nodiscard]] virtual size_t pending_tasks(const std::string& stage_name) const = 0;

    /**
     * @brief Stop accepting work and release the workers
     *
     * Callers wait on their task futures first; tasks still queued when
     * the pool shuts down are dropped.
     */
    virtual void shutdown() = 0;
};

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief worker_pool_interface backed by thread_system's thread_pool
 *
 * @note Thread-safe: All public methods are safe to call from multiple threads.
 */
class thread_system_worker_pool : public worker_pool_interface {
public:
    explicit thread_system_worker_pool(std::shared_ptr<kcenon::thread::thread_pool> pool,
                                       const std::string& pool_name = "bulk_transfer_pool",
                                       size_t worker_count = 0);

    ~thread_system_worker_pool() override;

    // Non-copyable
    thread_system_worker_pool(const thread_system_worker_pool&) = delete;
    thread_system_worker_pool& operator=(const thread_system_worker_pool&) = delete;

    // Movable
    thread_system_worker_pool(thread_system_worker_pool&&) noexcept;
    thread_system_worker_pool& operator=(thread_system_worker_pool&&) noexcept;

    /**
     * @brief Create a started pool with @p worker_count workers
     * @param worker_count Number of worker threads (0 = hardware concurrency)
     */
    [[nodiscard]] static std::shared_ptr<thread_system_worker_pool> create_default(
        size_t worker_count = 0,
        const std::string& pool_name = "bulk_transfer_pool");

    std::future<void> submit(std::function<void()> task) override;
    std::future<void> submit_delayed(std::function<void()> task,
                                     std::chrono::milliseconds delay) override;
    std::future<void> submit_to_stage(std::function<void()> task,
                                      const std::string& stage_name) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t pending_tasks() const override;
    [[nodiscard]] size_t pending_tasks(const std::string& stage_name) const override;
    void shutdown() override;

    [[nodiscard]] std::shared_ptr<kcenon::thread::thread_pool> underlying_pool() const;
    [[nodiscard]] std::string pool_name() const;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

#endif  // KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Fallback pool that runs each task on its own std::async thread
 *
 * worker_count() reports the requested size; concurrency is bounded by the
 * number of tasks the caller submits, which is how jobs and the enumerator
 * use it (one long-lived loop per worker).
 */
class async_worker_pool : public worker_pool_interface {
public:
    explicit async_worker_pool(size_t worker_count = 0);
    ~async_worker_pool() override;

    async_worker_pool(const async_worker_pool&) = delete;
    async_worker_pool& operator=(const async_worker_pool&) = delete;

    std::future<void> submit(std::function<void()> task) override;
    std::future<void> submit_delayed(std::function<void()> task,
                                     std::chrono::milliseconds delay) override;
    std::future<void> submit_to_stage(std::function<void()> task,
                                      const std::string& stage_name) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t pending_tasks() const override;
    [[nodiscard]] size_t pending_tasks(const std::string& stage_name) const override;
    void shutdown() override;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

/**
 * @brief Selects the best available pool implementation
 *
 * 1. thread_system_worker_pool (when KCENON_WITH_THREAD_SYSTEM)
 * 2. async_worker_pool (fallback)
 */
class worker_pool_factory {
public:
    /**
     * @param worker_count Number of worker threads (0 = hardware concurrency)
     * @param pool_name Name used in thread names and logs
     */
    [[nodiscard]] static std::shared_ptr<worker_pool_interface> create(
        size_t worker_count = 0,
        const std::string& pool_name = "bulk_transfer_pool");

    [[nodiscard]] static constexpr bool has_thread_system() noexcept {
#if KCENON_WITH_THREAD_SYSTEM
        return true;
#else
        return false;
#endif
    }
};

}  // namespace kcenon::bulk_transfer::adapters
