/**
 * @file transport_client.h
 * @brief Transport client interface and outcome types
 */

#ifndef KCENON_BULK_TRANSFER_TRANSPORT_TRANSPORT_CLIENT_H
#define KCENON_BULK_TRANSFER_TRANSPORT_TRANSPORT_CLIENT_H

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "kcenon/bulk_transfer/core/cancellation.h"
#include "kcenon/bulk_transfer/core/issue.h"
#include "kcenon/bulk_transfer/core/path_record.h"
#include "kcenon/bulk_transfer/core/types.h"
#include "kcenon/bulk_transfer/job/client_configuration.h"

namespace kcenon::bulk_transfer {

/**
 * @brief Per-call options handed to transport_client::transfer
 */
struct transfer_options {
    /// Per-operation deadline; unset means no deadline
    std::optional<std::chrono::steady_clock::time_point> deadline;
    std::size_t chunk_size = 1024 * 1024;
    overwrite_policy overwrite = overwrite_policy::always;
    bool preserve_dates = true;
    bool verify_integrity = false;

    /// Called with the cumulative bytes moved for the current path
    std::function<void(uint64_t)> on_progress;
};

/**
 * @brief Problem reported by a transport for one transfer call
 *
 * A fatal issue stops the whole job (authentication failure, lost
 * connection the transport cannot recover from).
 */
struct transport_issue {
    issue_severity severity = issue_severity::error;
    issue_attributes attributes = issue_attributes::io;
    std::string message;
    int32_t code = 0;
    bool fatal = false;
};

/**
 * @brief Result of one transport_client::transfer call
 */
struct transfer_outcome {
    uint64_t bytes_transferred = 0;
    bool skipped = false;
    std::optional<transport_issue> issue;

    [[nodiscard]] auto is_success() const -> bool {
        return !issue || issue->severity == issue_severity::warning;
    }

    [[nodiscard]] static auto success(uint64_t bytes) -> transfer_outcome {
        return transfer_outcome{bytes, false, std::nullopt};
    }

    [[nodiscard]] static auto skip() -> transfer_outcome {
        return transfer_outcome{0, true, std::nullopt};
    }

    [[nodiscard]] static auto failure(issue_attributes attributes,
                                      std::string message,
                                      int32_t code = 0,
                                      bool fatal = false) -> transfer_outcome {
        return transfer_outcome{
            0, false,
            transport_issue{issue_severity::error, attributes, std::move(message), code, fatal}};
    }
};

/**
 * @brief Result of transport_client::support_check
 */
struct support_result {
    bool supported = false;
    std::string reason;
};

/**
 * @brief What a connection check is asked to verify
 */
struct connection_request {
    transfer_direction direction = transfer_direction::upload;
    std::string target_path;
};

/**
 * @brief Result of transport_client::connection_check
 */
struct connection_result {
    bool connected = false;
    issue_attributes attributes = issue_attributes::connection;
    std::string message;
    int32_t code = 0;
};

/**
 * @brief Entry in a remote directory listing
 */
struct listing_node {
    std::string path;
    std::optional<uint64_t> size;
    std::optional<std::chrono::system_clock::time_point> modified_time;
};

/**
 * @brief One page of a remote directory listing
 */
struct listing_page {
    std::vector<listing_node> files;
    std::vector<listing_node> directories;
    std::optional<std::string> next_page_token;  ///< Unset on the last page
};

/**
 * @brief Protocol-specific implementation that moves the bytes of one path
 *
 * Implementations that are not safe for concurrent transfer() calls return
 * false from is_thread_safe(); the job then serializes its calls.
 */
class transport_client {
public:
    virtual ~transport_client() = default;

    /**
     * @brief Registry identifier ("file_share", ...)
     */
    [[nodiscard]] virtual auto id() const -> std::string = 0;

    [[nodiscard]] virtual auto display_name() const -> std::string { return id(); }

    /**
     * @brief Whether this transport can run in the current environment
     */
    [[nodiscard]] virtual auto support_check(const cancellation_token& token)
        -> support_result = 0;

    /**
     * @brief Verify the remote end is reachable for the given request
     */
    [[nodiscard]] virtual auto connection_check(const connection_request& request,
                                                const cancellation_token& token)
        -> connection_result = 0;

    /**
     * @brief Transfer one resolved path
     *
     * Per-path failures are reported through the outcome's issue, never
     * thrown. A canceled token should stop the copy at the next chunk
     * boundary and report an issue with the canceled attribute.
     */
    [[nodiscard]] virtual auto transfer(const transfer_path& path,
                                        const transfer_options& options,
                                        const cancellation_token& token)
        -> transfer_outcome = 0;

    [[nodiscard]] virtual auto supports_data_rate_change() const -> bool { return false; }

    /**
     * @brief Adjust throughput hints for active and future transfers
     */
    [[nodiscard]] virtual auto change_data_rate(uint32_t min_mbps,
                                                uint32_t target_mbps,
                                                const cancellation_token& token)
        -> result<void> {
        (void)min_mbps;
        (void)target_mbps;
        (void)token;
        return make_error(error_code::unsupported_operation,
                          id() + " does not support data rate changes");
    }

    /**
     * @brief Longest full target path the transport accepts (0 = unlimited)
     */
    [[nodiscard]] virtual auto max_path_length() const -> std::size_t { return 0; }

    [[nodiscard]] virtual auto is_thread_safe() const -> bool { return true; }

    /**
     * @brief Whether every path needs a target location
     */
    [[nodiscard]] virtual auto requires_target_path() const -> bool { return true; }

    [[nodiscard]] virtual auto supports_listing() const -> bool { return false; }

    /**
     * @brief List one page of a remote directory
     * @param page_token Token from the previous page, empty for the first
     */
    [[nodiscard]] virtual auto list_directory(const std::string& path,
                                              const std::string& page_token,
                                              std::size_t page_size,
                                              const cancellation_token& token)
        -> result<listing_page> {
        (void)path;
        (void)page_token;
        (void)page_size;
        (void)token;
        return make_error(error_code::unsupported_operation,
                          id() + " does not support directory listing");
    }
};

}  // namespace kcenon::bulk_transfer

#endif  // KCENON_BULK_TRANSFER_TRANSPORT_TRANSPORT_CLIENT_H
