/**
 * @file transfer_request.h
 * @brief Transfer request and result types
 */

#ifndef KCENON_BULK_TRANSFER_JOB_TRANSFER_REQUEST_H
#define KCENON_BULK_TRANSFER_JOB_TRANSFER_REQUEST_H

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "kcenon/bulk_transfer/core/issue.h"
#include "kcenon/bulk_transfer/core/path_record.h"
#include "kcenon/bulk_transfer/core/retry_policy.h"
#include "kcenon/bulk_transfer/core/statistics_aggregator.h"
#include "kcenon/bulk_transfer/job/transfer_context.h"

namespace kcenon::bulk_transfer {

/**
 * @brief Generate a random RFC 4122 version 4 identifier
 * @return Identifier formatted as xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx
 */
[[nodiscard]] auto generate_correlation_id() -> std::string;

/**
 * @brief Description of one transfer
 *
 * A job copies the request when it is created; later changes to the
 * caller's instance do not reach the job.
 *
 * @code
 * auto request = transfer_request::for_upload(
 *     {transfer_path{"/data/a.bin"}, transfer_path{"/data/b.bin"}}, "/mnt/share/in");
 * request.retry = make_fixed_wait(std::chrono::seconds(1));
 * @endcode
 */
struct transfer_request {
    transfer_direction direction = transfer_direction::upload;
    std::vector<transfer_path> paths;  ///< Ignored by job-style transfers
    std::string target_path;
    std::shared_ptr<const retry_policy> retry;  ///< Exponential backoff when unset
    path_resolver source_path_resolver;
    path_resolver target_path_resolver;
    std::string client_request_id;  ///< Generated when empty
    std::string name;
    std::string application;
    std::shared_ptr<const transfer_context> context;

    [[nodiscard]] static auto for_upload(std::vector<transfer_path> paths,
                                         std::string target_path) -> transfer_request;

    [[nodiscard]] static auto for_download(std::vector<transfer_path> paths,
                                           std::string target_path) -> transfer_request;

    [[nodiscard]] static auto for_upload_job(std::string target_path) -> transfer_request;

    [[nodiscard]] static auto for_download_job(std::string target_path) -> transfer_request;

    /**
     * @brief Defaults applied to each path during resolution
     */
    [[nodiscard]] auto defaults() const -> path_defaults;
};

/**
 * @brief Final outcome of a job
 */
struct transfer_result {
    transfer_status status = transfer_status::not_started;
    std::string client_request_id;
    std::string name;
    transfer_direction direction = transfer_direction::upload;
    std::chrono::milliseconds elapsed{0};

    uint64_t total_transferred_files = 0;
    uint64_t total_transferred_bytes = 0;
    uint64_t total_failed_files = 0;
    uint64_t total_files_not_found = 0;
    uint64_t total_bad_path_errors = 0;
    uint64_t total_skipped_files = 0;
    double transfer_rate_mbps = 0.0;  ///< Average over the job
    uint32_t retry_count = 0;

    std::vector<transfer_issue> issues;
    std::optional<transfer_issue> transfer_error;  ///< Set when status is fatal
    transfer_statistics statistics;

    [[nodiscard]] auto is_successful() const -> bool {
        return status == transfer_status::successful;
    }

    [[nodiscard]] auto error_count() const -> std::size_t;
    [[nodiscard]] auto warning_count() const -> std::size_t;
};

}  // namespace kcenon::bulk_transfer

#endif  // KCENON_BULK_TRANSFER_JOB_TRANSFER_REQUEST_H
