/**
 * @file path_queue.h
 * @brief Bounded work queue with a delayed retry lane
 */

#ifndef KCENON_BULK_TRANSFER_JOB_PATH_QUEUE_H
#define KCENON_BULK_TRANSFER_JOB_PATH_QUEUE_H

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>

#include "kcenon/bulk_transfer/core/cancellation.h"
#include "kcenon/bulk_transfer/core/path_record.h"
#include "kcenon/bulk_transfer/core/types.h"

namespace kcenon::bulk_transfer {

/**
 * @brief Unit of work handed to a worker
 */
struct queued_path {
    std::shared_ptr<const transfer_path> path;
    uint32_t attempt = 1;
};

/**
 * @brief Queue shared by the workers of one job
 *
 * Producer pushes are bounded by the capacity; retries scheduled by workers
 * go to a delayed lane that is not bounded, so a worker never blocks on its
 * own queue. The queue also counts paths handed out by pop() until the
 * worker reports them with task_done(), which lets complete() wait for
 * in-flight work and pending retries without polling.
 *
 * @note Thread-safe: All public methods are safe to call from multiple threads.
 */
class path_queue {
public:
    using clock = std::chrono::steady_clock;

    explicit path_queue(std::size_t capacity);

    path_queue(const path_queue&) = delete;
    auto operator=(const path_queue&) -> path_queue& = delete;

    /**
     * @brief Add a path, waiting up to @p max_wait for free capacity
     * @return operation_canceled if @p token fires or the queue is aborted,
     *         queue_full if the wait elapses, invalid_state after close()
     */
    [[nodiscard]] auto push(queued_path entry,
                            const cancellation_token& token,
                            std::chrono::milliseconds max_wait) -> result<void>;

    /**
     * @brief Add a path ignoring the capacity
     *
     * Used when the producer is one of this queue's own workers.
     */
    [[nodiscard]] auto push_unbounded(queued_path entry) -> result<void>;

    /**
     * @brief Schedule a retry that becomes ready at @p ready_at
     *
     * Accepted after close(); dropped after abort().
     */
    void push_delayed(queued_path entry, clock::time_point ready_at);

    /**
     * @brief Take the next ready path
     *
     * Blocks until a path is ready or no more work can arrive (closed, empty
     * and nothing in flight) or the queue is aborted. A returned path must
     * be reported with task_done().
     */
    [[nodiscard]] auto pop() -> std::optional<queued_path>;

    void task_done();

    /**
     * @brief No more producer pushes will be accepted
     */
    void close();

    /**
     * @brief Drop every queued and delayed path and wake all waiters
     * @return Number of dropped paths
     */
    auto abort() -> std::size_t;

    /**
     * @brief Wait until all work is finished or the queue is aborted and idle
     * @param deadline Unset waits without a limit
     * @return false if the deadline passed first
     */
    [[nodiscard]] auto wait_idle(std::optional<clock::time_point> deadline) -> bool;

    [[nodiscard]] auto size() const -> std::size_t;
    [[nodiscard]] auto delayed_count() const -> std::size_t;
    [[nodiscard]] auto in_flight() const -> std::size_t;
    [[nodiscard]] auto capacity() const -> std::size_t { return capacity_; }
    [[nodiscard]] auto is_closed() const -> bool;
    [[nodiscard]] auto is_aborted() const -> bool;

private:
    void promote_due_locked(clock::time_point now);
    [[nodiscard]] auto idle_locked() const -> bool;

    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable ready_cv_;
    std::condition_variable space_cv_;
    std::condition_variable idle_cv_;
    std::deque<queued_path> ready_;
    std::multimap<clock::time_point, queued_path> delayed_;
    std::size_t in_flight_ = 0;
    bool closed_ = false;
    bool aborted_ = false;
};

}  // namespace kcenon::bulk_transfer

#endif  // KCENON_BULK_TRANSFER_JOB_PATH_QUEUE_H
