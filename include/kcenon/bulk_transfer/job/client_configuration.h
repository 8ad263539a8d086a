/**
 * @file client_configuration.h
 * @brief Configuration value object for jobs, enumerators and transports
 */

#ifndef KCENON_BULK_TRANSFER_JOB_CLIENT_CONFIGURATION_H
#define KCENON_BULK_TRANSFER_JOB_CLIENT_CONFIGURATION_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

#include "kcenon/bulk_transfer/core/issue.h"
#include "kcenon/bulk_transfer/core/types.h"

namespace kcenon::bulk_transfer {

/**
 * @brief What a transport does when the target file already exists
 */
enum class overwrite_policy {
    always,
    skip_existing,
    fail_if_exists
};

[[nodiscard]] constexpr auto to_string(overwrite_policy policy) -> const char* {
    switch (policy) {
        case overwrite_policy::always: return "always";
        case overwrite_policy::skip_existing: return "skip_existing";
        case overwrite_policy::fail_if_exists: return "fail_if_exists";
        default: return "unknown";
    }
}

/**
 * @brief Client configuration
 *
 * Passed by value into every job, enumerator and transport the client
 * creates. A job keeps its own copy, so changing a client's configuration
 * never affects jobs that are already running.
 */
struct client_configuration {
    // Job
    std::size_t max_job_parallelism = 1;
    uint32_t max_job_retry_attempts = 3;  ///< Attempts per path, first one included
    bool file_not_found_errors_retry = true;
    bool bad_path_errors_retry = false;
    bool permission_errors_retry = false;
    bool transient_errors_retry = true;
    std::size_t max_queued_paths = 10000;
    std::chrono::milliseconds max_backpressure_wait{30000};
    std::chrono::milliseconds transfer_timeout{0};  ///< 0 = no deadline

    // Transport
    uint32_t min_data_rate_mbps = 0;
    uint32_t target_data_rate_mbps = 0;
    std::size_t chunk_size = 1024 * 1024;  // 1MB
    overwrite_policy overwrite = overwrite_policy::always;
    bool preserve_dates = true;
    bool verify_integrity = false;

    // Statistics
    std::chrono::milliseconds statistics_rate{500};
    std::size_t statistics_window_size = 8;
    bool statistics_log_enabled = false;

    // Enumeration
    std::size_t max_directory_parallelism = 1;
    std::size_t max_file_parallelism = 1;
    std::size_t max_paging_parallelism = 1;
    uint64_t max_bytes_per_batch = 100ULL * 1000 * 1000 * 1000;  // 100GB
    uint64_t max_files_per_batch = 50000;
    bool skip_too_long_paths = false;
    std::size_t max_path_length = 0;  ///< 0 = use the transport maximum
    bool live_sync_batches = false;

    /**
     * @brief Check value ranges
     * @return invalid_configuration naming the first offending field
     */
    [[nodiscard]] auto validate() const -> result<void>;

    /**
     * @brief Whether an error issue of the given class may be retried
     *
     * Connection, timeout and generic I/O failures fall under
     * transient_errors_retry. Authentication and cancellation never retry.
     */
    [[nodiscard]] auto is_retryable(issue_attributes classification) const -> bool;
};

}  // namespace kcenon::bulk_transfer

#endif  // KCENON_BULK_TRANSFER_JOB_CLIENT_CONFIGURATION_H
