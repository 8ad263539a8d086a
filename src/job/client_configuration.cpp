/**
 * @file client_configuration.cpp
 * @brief client_configuration validation and retry classification
 */

#include "kcenon/bulk_transfer/job/client_configuration.h"

namespace kcenon::bulk_transfer {

auto client_configuration::validate() const -> result<void> {
    if (max_job_parallelism == 0) {
        return make_error(error_code::invalid_configuration,
                          "max_job_parallelism must be at least 1");
    }
    if (max_job_retry_attempts == 0) {
        return make_error(error_code::invalid_configuration,
                          "max_job_retry_attempts must be at least 1");
    }
    if (max_queued_paths == 0) {
        return make_error(error_code::invalid_configuration,
                          "max_queued_paths must be at least 1");
    }
    if (chunk_size == 0) {
        return make_error(error_code::invalid_configuration, "chunk_size must be positive");
    }
    if (target_data_rate_mbps != 0 && min_data_rate_mbps > target_data_rate_mbps) {
        return make_error(error_code::invalid_configuration,
                          "min_data_rate_mbps exceeds target_data_rate_mbps");
    }
    if (statistics_rate.count() <= 0) {
        return make_error(error_code::invalid_configuration,
                          "statistics_rate must be positive");
    }
    if (statistics_window_size < 2) {
        return make_error(error_code::invalid_configuration,
                          "statistics_window_size must be at least 2");
    }
    if (max_directory_parallelism == 0 || max_file_parallelism == 0 ||
        max_paging_parallelism == 0) {
        return make_error(error_code::invalid_configuration,
                          "enumeration parallelism must be at least 1");
    }
    if (max_bytes_per_batch == 0 || max_files_per_batch == 0) {
        return make_error(error_code::invalid_configuration,
                          "batch ceilings must be positive");
    }
    return {};
}

auto client_configuration::is_retryable(issue_attributes classification) const -> bool {
    if (has_flag(classification, issue_attributes::authentication) ||
        has_flag(classification, issue_attributes::canceled)) {
        return false;
    }
    if (has_flag(classification, issue_attributes::file_not_found)) {
        return file_not_found_errors_retry;
    }
    if (has_flag(classification, issue_attributes::bad_path) ||
        has_flag(classification, issue_attributes::path_too_long)) {
        return bad_path_errors_retry;
    }
    if (has_flag(classification, issue_attributes::permission)) {
        return permission_errors_retry;
    }
    return transient_errors_retry;
}

}  // namespace kcenon::bulk_transfer
