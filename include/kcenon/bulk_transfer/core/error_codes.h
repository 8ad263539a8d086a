/**
 * @file error_codes.h
 * @brief Error codes for bulk_trans_system (-800 to -899 range)
 *
 * Error code ranges:
 * - -800 to -819: Configuration / usage errors
 * - -820 to -839: Job and cancellation errors
 * - -840 to -859: Path errors
 * - -860 to -879: Transport errors
 * - -880 to -899: Batch file errors
 */

#ifndef KCENON_BULK_TRANSFER_CORE_ERROR_CODES_H
#define KCENON_BULK_TRANSFER_CORE_ERROR_CODES_H

#include <cstdint>
#include <string_view>

namespace kcenon::bulk_transfer {

/**
 * @brief Error codes for bulk transfer operations
 */
enum class error_code : int32_t {
    success = 0,

    // Configuration / usage errors (-800 to -819)
    invalid_configuration = -800,
    invalid_argument = -801,
    invalid_state = -802,
    object_disposed = -803,
    unsupported_operation = -804,
    missing_target_path = -805,

    // Job and cancellation errors (-820 to -839)
    operation_canceled = -820,
    operation_timeout = -821,
    queue_full = -822,
    job_fatal = -823,
    retries_exhausted = -824,

    // Path errors (-840 to -859)
    path_too_long = -840,
    file_not_found = -841,
    bad_path = -842,
    permission_denied = -843,
    path_read_error = -844,
    file_exists = -845,
    integrity_mismatch = -846,

    // Transport errors (-860 to -879)
    connection_failed = -860,
    connection_lost = -861,
    authentication_failed = -862,
    transport_error = -863,
    transport_not_found = -864,
    transport_not_supported = -865,

    // Batch file errors (-880 to -899)
    batch_write_error = -880,
    batch_read_error = -881,
    batch_format_error = -882,
};

/**
 * @brief Convert error_code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) noexcept
    -> std::string_view {
    switch (code) {
        case error_code::success:
            return "success";

        case error_code::invalid_configuration:
            return "invalid configuration";
        case error_code::invalid_argument:
            return "invalid argument";
        case error_code::invalid_state:
            return "operation not valid in the current state";
        case error_code::object_disposed:
            return "object has been disposed";
        case error_code::unsupported_operation:
            return "operation not supported by the transport";
        case error_code::missing_target_path:
            return "target path is required";

        case error_code::operation_canceled:
            return "operation canceled";
        case error_code::operation_timeout:
            return "operation timed out";
        case error_code::queue_full:
            return "path queue is full";
        case error_code::job_fatal:
            return "job stopped by a fatal condition";
        case error_code::retries_exhausted:
            return "retry attempts exhausted";

        case error_code::path_too_long:
            return "path exceeds the maximum supported length";
        case error_code::file_not_found:
            return "file not found";
        case error_code::bad_path:
            return "bad path";
        case error_code::permission_denied:
            return "permission denied";
        case error_code::path_read_error:
            return "path could not be read";
        case error_code::file_exists:
            return "target file already exists";
        case error_code::integrity_mismatch:
            return "target content does not match source";

        case error_code::connection_failed:
            return "connection failed";
        case error_code::connection_lost:
            return "connection lost";
        case error_code::authentication_failed:
            return "authentication failed";
        case error_code::transport_error:
            return "transport error";
        case error_code::transport_not_found:
            return "transport not registered";
        case error_code::transport_not_supported:
            return "transport not supported in this environment";

        case error_code::batch_write_error:
            return "batch file write error";
        case error_code::batch_read_error:
            return "batch file read error";
        case error_code::batch_format_error:
            return "batch file format error";

        default:
            return "unknown error";
    }
}

/**
 * @brief Convert integer error code to string
 */
[[nodiscard]] constexpr auto error_code_to_string(int32_t code) noexcept
    -> std::string_view {
    return to_string(static_cast<error_code>(code));
}

[[nodiscard]] constexpr auto is_usage_error(int32_t code) noexcept -> bool {
    return code <= -800 && code >= -819;
}

[[nodiscard]] constexpr auto is_job_error(int32_t code) noexcept -> bool {
    return code <= -820 && code >= -839;
}

[[nodiscard]] constexpr auto is_path_error(int32_t code) noexcept -> bool {
    return code <= -840 && code >= -859;
}

[[nodiscard]] constexpr auto is_transport_error(int32_t code) noexcept -> bool {
    return code <= -860 && code >= -879;
}

[[nodiscard]] constexpr auto is_batch_error(int32_t code) noexcept -> bool {
    return code <= -880 && code >= -899;
}

[[nodiscard]] constexpr auto is_usage_error(error_code code) noexcept -> bool {
    return is_usage_error(static_cast<int32_t>(code));
}

[[nodiscard]] constexpr auto is_path_error(error_code code) noexcept -> bool {
    return is_path_error(static_cast<int32_t>(code));
}

[[nodiscard]] constexpr auto is_transport_error(error_code code) noexcept -> bool {
    return is_transport_error(static_cast<int32_t>(code));
}

[[nodiscard]] constexpr auto is_job_error(error_code code) noexcept -> bool {
    return is_job_error(static_cast<int32_t>(code));
}

[[nodiscard]] constexpr auto is_batch_error(error_code code) noexcept -> bool {
    return is_batch_error(static_cast<int32_t>(code));
}

}  // namespace kcenon::bulk_transfer

#endif  // KCENON_BULK_TRANSFER_CORE_ERROR_CODES_H
