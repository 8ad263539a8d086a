/**
 * @file file_share_client.h
 * @brief Transport for local paths and mounted network shares
 */

#ifndef KCENON_BULK_TRANSFER_TRANSPORT_FILE_SHARE_CLIENT_H
#define KCENON_BULK_TRANSFER_TRANSPORT_FILE_SHARE_CLIENT_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "kcenon/bulk_transfer/core/data_rate_limiter.h"
#include "kcenon/bulk_transfer/transport/transport_client.h"

namespace kcenon::bulk_transfer {

/**
 * @brief file_share_client settings
 */
struct file_share_options {
    std::size_t max_path_length = 4096;
    uint32_t min_data_rate_mbps = 0;
    uint32_t target_data_rate_mbps = 0;

    [[nodiscard]] static auto from(const client_configuration& config) -> file_share_options;
};

/**
 * @brief Copies files between local and mounted share paths
 *
 * Files are copied in chunks into a partial file next to the target and
 * renamed into place, so a canceled or failed copy never leaves a truncated
 * target behind. Cancellation and the deadline are checked between chunks.
 */
class file_share_client : public transport_client {
public:
    static constexpr std::string_view identifier = "file_share";

    explicit file_share_client(file_share_options options = {});

    [[nodiscard]] auto id() const -> std::string override { return std::string(identifier); }
    [[nodiscard]] auto display_name() const -> std::string override { return "File share"; }

    [[nodiscard]] auto support_check(const cancellation_token& token) -> support_result override;

    /**
     * @brief The target directory exists (or can be created) and is writable
     */
    [[nodiscard]] auto connection_check(const connection_request& request,
                                        const cancellation_token& token)
        -> connection_result override;

    [[nodiscard]] auto transfer(const transfer_path& path,
                                const transfer_options& options,
                                const cancellation_token& token) -> transfer_outcome override;

    [[nodiscard]] auto supports_data_rate_change() const -> bool override { return true; }

    [[nodiscard]] auto change_data_rate(uint32_t min_mbps,
                                        uint32_t target_mbps,
                                        const cancellation_token& token)
        -> result<void> override;

    [[nodiscard]] auto max_path_length() const -> std::size_t override {
        return options_.max_path_length;
    }

    [[nodiscard]] auto supports_listing() const -> bool override { return true; }

    /**
     * @brief List a directory; page tokens are entry offsets
     */
    [[nodiscard]] auto list_directory(const std::string& path,
                                      const std::string& page_token,
                                      std::size_t page_size,
                                      const cancellation_token& token)
        -> result<listing_page> override;

private:
    file_share_options options_;
    data_rate_limiter limiter_;
};

}  // namespace kcenon::bulk_transfer

#endif  // KCENON_BULK_TRANSFER_TRANSPORT_FILE_SHARE_CLIENT_H
