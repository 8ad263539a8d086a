/**
 * @file statistics_aggregator.h
 * @brief Job-level counters, progress, rate and ETA
 *
 * This file defines the statistics_aggregator class shared by all workers
 * of a job, and the transfer_statistics snapshot it produces.
 */

#ifndef KCENON_BULK_TRANSFER_CORE_STATISTICS_AGGREGATOR_H
#define KCENON_BULK_TRANSFER_CORE_STATISTICS_AGGREGATOR_H

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>

#include "issue.h"

namespace kcenon::bulk_transfer {

using duration = std::chrono::milliseconds;

/**
 * @brief Point-in-time view of a job's statistics
 *
 * Cumulative totals survive retries. The attempt_* counters describe the
 * current retry attempt only and restart when a new attempt begins.
 */
struct transfer_statistics {
    // Cumulative totals
    uint64_t total_transferred_files = 0;
    uint64_t total_transferred_bytes = 0;
    uint64_t total_failed_files = 0;       ///< Includes not-found files
    uint64_t total_files_not_found = 0;
    uint64_t total_bad_path_errors = 0;
    uint64_t total_skipped_files = 0;

    // Expected work
    uint64_t total_requested_files = 0;
    uint64_t total_requested_bytes = 0;
    bool byte_based_progress = false;

    // Current attempt
    uint32_t attempt = 1;
    uint32_t retry_count = 0;              ///< Retries scheduled so far
    uint64_t attempt_transferred_files = 0;
    uint64_t attempt_transferred_bytes = 0;
    uint64_t attempt_failed_files = 0;

    double progress = 0.0;                 ///< 0 - 100
    double transfer_rate = 0.0;            ///< Smoothed bytes per second
    double average_rate = 0.0;             ///< Bytes per second since start
    std::optional<duration> remaining_time;  ///< Empty when indeterminate
    duration elapsed{0};

    [[nodiscard]] auto completed_files() const -> uint64_t {
        return total_transferred_files + total_failed_files + total_skipped_files;
    }

    /**
     * @brief Smoothed rate in megabits per second
     */
    [[nodiscard]] auto transfer_rate_mbps() const -> double {
        return transfer_rate * 8.0 / 1'000'000.0;
    }
};

/**
 * @brief Thread-safe accumulation of job statistics
 *
 * @code
 * statistics_aggregator stats;
 * stats.start();
 * stats.add_expected(4096);
 *
 * // From any worker
 * stats.record_success(4096);
 *
 * auto snap = stats.snapshot();
 * @endcode
 */
class statistics_aggregator {
public:
    struct config {
        std::size_t rate_window_size = 8;      ///< Samples in the rate sliding window
        duration rate_sample_interval{100};    ///< Minimum spacing between samples
    };

    statistics_aggregator();
    explicit statistics_aggregator(config cfg);

    // Non-copyable, movable
    statistics_aggregator(const statistics_aggregator&) = delete;
    auto operator=(const statistics_aggregator&) -> statistics_aggregator& = delete;
    statistics_aggregator(statistics_aggregator&&) noexcept;
    auto operator=(statistics_aggregator&&) noexcept -> statistics_aggregator&;

    ~statistics_aggregator();

    /**
     * @brief Start the elapsed-time clock; idempotent
     */
    void start();

    /**
     * @brief Freeze elapsed time and rates
     */
    void stop();

    [[nodiscard]] auto is_active() const -> bool;

    /**
     * @brief Declare totals known ahead of time (e.g. from enumeration)
     *
     * A non-zero byte total switches progress to byte-based.
     */
    void set_precalculated_totals(uint64_t files, uint64_t bytes);

    /**
     * @brief Account for one more queued path
     * @param bytes Known size, or empty when the size is unknown
     */
    void add_expected(std::optional<uint64_t> bytes);

    /**
     * @brief Undo add_expected for a path that could not be queued
     */
    void remove_expected(std::optional<uint64_t> bytes);

    void record_success(uint64_t bytes);

    /**
     * @brief Record a path that ended with an error issue
     *
     * File-not-found and bad-path classes also bump their dedicated counters.
     */
    void record_failure(const transfer_issue& issue);

    /**
     * @brief Record a path that failed because its source does not exist
     */
    void record_not_found(uint64_t expected_bytes = 0);

    void record_skipped(uint64_t expected_bytes = 0);

    /**
     * @brief Bytes moved on the wire, used only for rate calculation
     */
    void record_bytes_moved(uint64_t bytes);

    /**
     * @brief Count a scheduled retry
     */
    void record_retry();

    /**
     * @brief Enter retry attempt @p attempt, resetting attempt counters
     *
     * Ignored when @p attempt is not greater than the current attempt.
     */
    void begin_attempt(uint32_t attempt);

    [[nodiscard]] auto attempt() const -> uint32_t;

    /**
     * @brief Consistent point-in-time view
     */
    [[nodiscard]] auto snapshot() const -> transfer_statistics;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::bulk_transfer

#endif  // KCENON_BULK_TRANSFER_CORE_STATISTICS_AGGREGATOR_H
