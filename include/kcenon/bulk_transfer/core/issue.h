/**
 * @file issue.h
 * @brief Per-path and per-job problems and the ledger that records them
 */

#ifndef KCENON_BULK_TRANSFER_CORE_ISSUE_H
#define KCENON_BULK_TRANSFER_CORE_ISSUE_H

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <system_error>
#include <vector>

#include "path_record.h"
#include "types.h"

namespace kcenon::bulk_transfer {

/**
 * @brief Issue attribute flags
 *
 * Exactly one of error or warning is set on every recorded issue. The
 * remaining flags classify the cause and drive retry eligibility.
 */
enum class issue_attributes : uint32_t {
    none = 0,
    error = 1 << 0,
    warning = 1 << 1,
    file_not_found = 1 << 2,
    bad_path = 1 << 3,
    permission = 1 << 4,
    timeout = 1 << 5,
    io = 1 << 6,
    connection = 1 << 7,
    authentication = 1 << 8,
    path_too_long = 1 << 9,
    job = 1 << 10,
    canceled = 1 << 11,
};

[[nodiscard]] constexpr auto operator|(issue_attributes a, issue_attributes b)
    -> issue_attributes {
    return static_cast<issue_attributes>(static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
}

[[nodiscard]] constexpr auto operator&(issue_attributes a, issue_attributes b)
    -> issue_attributes {
    return static_cast<issue_attributes>(static_cast<uint32_t>(a) & static_cast<uint32_t>(b));
}

[[nodiscard]] constexpr auto operator~(issue_attributes a) -> issue_attributes {
    return static_cast<issue_attributes>(~static_cast<uint32_t>(a));
}

constexpr auto operator|=(issue_attributes& a, issue_attributes b) -> issue_attributes& {
    a = a | b;
    return a;
}

[[nodiscard]] constexpr auto has_flag(issue_attributes flags, issue_attributes flag) -> bool {
    return (static_cast<uint32_t>(flags) & static_cast<uint32_t>(flag)) != 0;
}

/**
 * @brief Severity of an issue
 */
enum class issue_severity : uint8_t {
    error,
    warning,
};

/**
 * @brief Map a path-class error code to its issue attribute
 */
[[nodiscard]] constexpr auto attributes_for(error_code code) -> issue_attributes {
    switch (code) {
        case error_code::file_not_found:
            return issue_attributes::file_not_found;
        case error_code::bad_path:
            return issue_attributes::bad_path;
        case error_code::permission_denied:
            return issue_attributes::permission;
        case error_code::path_too_long:
            return issue_attributes::path_too_long | issue_attributes::bad_path;
        case error_code::operation_timeout:
            return issue_attributes::timeout;
        case error_code::connection_failed:
        case error_code::connection_lost:
            return issue_attributes::connection;
        case error_code::authentication_failed:
            return issue_attributes::authentication;
        case error_code::operation_canceled:
            return issue_attributes::canceled;
        default:
            return issue_attributes::io;
    }
}

/**
 * @brief Map a filesystem or socket error to an issue classification
 */
[[nodiscard]] auto classify_filesystem_error(const std::error_code& ec) -> issue_attributes;

/**
 * @brief A recorded problem
 *
 * `path` is null for job-level issues such as a failed connection check.
 */
struct transfer_issue {
    std::shared_ptr<const transfer_path> path;
    issue_attributes attributes = issue_attributes::error;
    std::string message;
    int32_t client_code = 0;
    uint32_t attempt = 1;
    uint32_t max_retry_attempts = 0;
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
    std::size_t index = 0;  ///< Position in the issue_log, assigned on append

    /**
     * @brief Build an issue with exactly one severity flag set
     */
    [[nodiscard]] static auto make(issue_severity severity,
                                   issue_attributes classification,
                                   std::string message,
                                   std::shared_ptr<const transfer_path> path = nullptr,
                                   int32_t client_code = 0) -> transfer_issue;

    [[nodiscard]] auto is_error() const -> bool {
        return has_flag(attributes, issue_attributes::error);
    }

    [[nodiscard]] auto is_warning() const -> bool {
        return has_flag(attributes, issue_attributes::warning);
    }

    [[nodiscard]] auto is_job_level() const -> bool { return path == nullptr; }

    /**
     * @brief Exactly one of error and warning is present
     */
    [[nodiscard]] auto is_well_formed() const -> bool { return is_error() != is_warning(); }

    /**
     * @brief Attributes without the severity flags
     */
    [[nodiscard]] auto classification() const -> issue_attributes {
        return attributes & ~(issue_attributes::error | issue_attributes::warning);
    }
};

/**
 * @brief Append-only, order-preserving, thread-safe issue ledger
 */
class issue_log {
public:
    issue_log() = default;

    issue_log(const issue_log&) = delete;
    auto operator=(const issue_log&) -> issue_log& = delete;

    /**
     * @brief Append an issue
     * @return The monotonically increasing index assigned to the issue, or
     *         invalid_argument when the issue carries both or neither severity
     */
    [[nodiscard]] auto append(transfer_issue issue) -> result<std::size_t>;

    /**
     * @brief Issues appended before the call, in append order
     */
    [[nodiscard]] auto snapshot() const -> std::vector<transfer_issue>;

    [[nodiscard]] auto size() const -> std::size_t;
    [[nodiscard]] auto error_count() const -> std::size_t;
    [[nodiscard]] auto warning_count() const -> std::size_t;

private:
    mutable std::shared_mutex mutex_;
    std::vector<transfer_issue> issues_;
    std::size_t errors_ = 0;
};

}  // namespace kcenon::bulk_transfer

#endif  // KCENON_BULK_TRANSFER_CORE_ISSUE_H
