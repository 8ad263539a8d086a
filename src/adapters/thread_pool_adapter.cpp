// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.cpp
 * @brief Worker pool implementations for bulk_trans_system
 */

#include "kcenon/bulk_transfer/adapters/thread_pool_adapter.h"

#include <stdexcept>
#include <thread>

#if KCENON_WITH_THREAD_SYSTEM
#include <kcenon/thread/core/job.h>
#include <kcenon/thread/core/job_queue.h>
#include <kcenon/thread/core/thread_worker.h>
#endif

namespace kcenon::bulk_transfer::adapters {

namespace {

auto resolve_worker_count(size_t requested) -> size_t {
    if (requested > 0) {
        return requested;
    }
    auto hw = std::thread::hardware_concurrency();
    return hw > 0 ? hw : 4;
}

class stage_tracker {
public:
    void increment(const std::string& stage_name) {
        std::lock_guard<std::mutex> lock(mutex_);
        ++counts_[stage_name];
    }

    void decrement(const std::string& stage_name) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = counts_.find(stage_name);
        if (it != counts_.end() && it->second > 0) {
            --it->second;
        }
    }

    [[nodiscard]] size_t count(const std::string& stage_name) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = counts_.find(stage_name);
        return it != counts_.end() ? it->second : 0;
    }

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, size_t> counts_;
};

/**
 * @brief Runs @p task and routes its outcome into @p promise
 */
void run_into(const std::function<void()>& task, std::promise<void>& promise) {
    try {
        task();
        promise.set_value();
    } catch (const std::exception&) {
        promise.set_exception(std::current_exception());
    }
}

}  // namespace

// ============================================================================
// thread_system_worker_pool
// ============================================================================

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief thread_system job wrapping a std::function
 */
class function_job : public kcenon::thread::job {
public:
    explicit function_job(std::function<void()> func, const std::string& name)
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

struct thread_system_worker_pool::impl {
    std::shared_ptr<kcenon::thread::thread_pool> pool;
    std::string pool_name;
    size_t worker_count{0};
    std::atomic<size_t> active_tasks{0};
    std::atomic<bool> running{true};
    stage_tracker tracker;

    auto enqueue(std::function<void()> task, const std::string& job_name,
                 const std::string* stage) -> std::future<void> {
        auto promise = std::make_shared<std::promise<void>>();
        auto future = promise->get_future();

        if (stage) {
            tracker.increment(*stage);
        }
        active_tasks.fetch_add(1, std::memory_order_relaxed);

        auto stage_name = stage ? *stage : std::string{};
        auto wrapped = [this, task = std::move(task), promise, stage_name]() {
            run_into(task, *promise);
            active_tasks.fetch_sub(1, std::memory_order_relaxed);
            if (!stage_name.empty()) {
                tracker.decrement(stage_name);
            }
        };

        auto enqueued = pool->enqueue(std::make_unique<function_job>(std::move(wrapped), job_name));
        if (!enqueued.is_ok()) {
            active_tasks.fetch_sub(1, std::memory_order_relaxed);
            if (stage) {
                tracker.decrement(*stage);
            }
            promise->set_exception(std::make_exception_ptr(
                std::runtime_error("thread pool rejected task " + job_name)));
        }
        return future;
    }
};

thread_system_worker_pool::thread_system_worker_pool(
    std::shared_ptr<kcenon::thread::thread_pool> pool,
    const std::string& pool_name,
    size_t worker_count)
    : pimpl_(std::make_unique<impl>()) {
    pimpl_->pool = std::move(pool);
    pimpl_->pool_name = pool_name;
    pimpl_->worker_count = worker_count;
}

thread_system_worker_pool::~thread_system_worker_pool() {
    if (pimpl_) {
        shutdown();
    }
}

thread_system_worker_pool::thread_system_worker_pool(thread_system_worker_pool&&) noexcept =
    default;

thread_system_worker_pool& thread_system_worker_pool::operator=(
    thread_system_worker_pool&&) noexcept = default;

std::shared_ptr<thread_system_worker_pool> thread_system_worker_pool::create_default(
    size_t worker_count, const std::string& pool_name) {
    worker_count = resolve_worker_count(worker_count);

    auto pool = std::make_shared<kcenon::thread::thread_pool>(pool_name);
    for (size_t i = 0; i < worker_count; ++i) {
        auto worker = std::make_unique<kcenon::thread::thread_worker>();
        worker->set_job_queue(pool->get_job_queue());
        pool->enqueue(std::move(worker));
    }
    pool->start();

    return std::make_shared<thread_system_worker_pool>(std::move(pool), pool_name, worker_count);
}

std::future<void> thread_system_worker_pool::submit(std::function<void()> task) {
    return pimpl_->enqueue(std::move(task), pimpl_->pool_name + ".task", nullptr);
}

std::future<void> thread_system_worker_pool::submit_delayed(std::function<void()> task,
                                                            std::chrono::milliseconds delay) {
    auto delayed = [task = std::move(task), delay]() {
        std::this_thread::sleep_for(delay);
        task();
    };
    return pimpl_->enqueue(std::move(delayed), pimpl_->pool_name + ".delayed", nullptr);
}

std::future<void> thread_system_worker_pool::submit_to_stage(std::function<void()> task,
                                                             const std::string& stage_name) {
    return pimpl_->enqueue(std::move(task), pimpl_->pool_name + "." + stage_name, &stage_name);
}

size_t thread_system_worker_pool::worker_count() const { return pimpl_->worker_count; }

bool thread_system_worker_pool::is_running() const {
    return pimpl_->pool != nullptr && pimpl_->running.load();
}

size_t thread_system_worker_pool::pending_tasks() const {
    return pimpl_->active_tasks.load(std::memory_order_relaxed);
}

size_t thread_system_worker_pool::pending_tasks(const std::string& stage_name) const {
    return pimpl_->tracker.count(stage_name);
}

void thread_system_worker_pool::shutdown() {
    if (pimpl_->running.exchange(false) && pimpl_->pool) {
        pimpl_->pool->stop(false);
    }
}

std::shared_ptr<kcenon::thread::thread_pool> thread_system_worker_pool::underlying_pool() const {
    return pimpl_->pool;
}

std::string thread_system_worker_pool::pool_name() const { return pimpl_->pool_name; }

#endif  // KCENON_WITH_THREAD_SYSTEM

// ============================================================================
// async_worker_pool
// ============================================================================

struct async_worker_pool::impl {
    size_t worker_count{0};
    std::atomic<size_t> active_tasks{0};
    std::atomic<bool> running{true};
    stage_tracker tracker;

    auto launch(std::function<void()> task, std::string stage) -> std::future<void> {
        active_tasks.fetch_add(1, std::memory_order_relaxed);
        if (!stage.empty()) {
            tracker.increment(stage);
        }

        return std::async(std::launch::async,
                          [this, task = std::move(task), stage = std::move(stage)]() {
                              std::promise<void> promise;
                              auto outcome = promise.get_future();
                              run_into(task, promise);
                              active_tasks.fetch_sub(1, std::memory_order_relaxed);
                              if (!stage.empty()) {
                                  tracker.decrement(stage);
                              }
                              outcome.get();
                          });
    }
};

async_worker_pool::async_worker_pool(size_t worker_count) : pimpl_(std::make_unique<impl>()) {
    pimpl_->worker_count = resolve_worker_count(worker_count);
}

async_worker_pool::~async_worker_pool() = default;

std::future<void> async_worker_pool::submit(std::function<void()> task) {
    return pimpl_->launch(std::move(task), {});
}

std::future<void> async_worker_pool::submit_delayed(std::function<void()> task,
                                                    std::chrono::milliseconds delay) {
    return pimpl_->launch(
        [task = std::move(task), delay]() {
            std::this_thread::sleep_for(delay);
            task();
        },
        {});
}

std::future<void> async_worker_pool::submit_to_stage(std::function<void()> task,
                                                     const std::string& stage_name) {
    return pimpl_->launch(std::move(task), stage_name);
}

size_t async_worker_pool::worker_count() const { return pimpl_->worker_count; }

bool async_worker_pool::is_running() const { return pimpl_->running.load(); }

size_t async_worker_pool::pending_tasks() const {
    return pimpl_->active_tasks.load(std::memory_order_relaxed);
}

size_t async_worker_pool::pending_tasks(const std::string& stage_name) const {
    return pimpl_->tracker.count(stage_name);
}

void async_worker_pool::shutdown() { pimpl_->running.store(false); }

// ============================================================================
// worker_pool_factory
// ============================================================================

std::shared_ptr<worker_pool_interface> worker_pool_factory::create(size_t worker_count,
                                                                   const std::string& pool_name) {
#if KCENON_WITH_THREAD_SYSTEM
    return thread_system_worker_pool::create_default(worker_count, pool_name);
#else
    (void)pool_name;
    return std::make_shared<async_worker_pool>(worker_count);
#endif
}

}  // namespace kcenon::bulk_transfer::adapters
