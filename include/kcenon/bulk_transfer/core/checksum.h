/**
 * @file checksum.h
 * @brief SHA-256 digests used to verify copied files
 */

#ifndef KCENON_BULK_TRANSFER_CORE_CHECKSUM_H
#define KCENON_BULK_TRANSFER_CORE_CHECKSUM_H

#include <cstddef>
#include <filesystem>
#include <span>
#include <string>

#include "cancellation.h"
#include "types.h"

namespace kcenon::bulk_transfer {

/**
 * @brief SHA-256 helpers backed by OpenSSL's EVP interface
 */
class checksum {
public:
    /**
     * @brief SHA-256 of an in-memory buffer as lowercase hex
     */
    [[nodiscard]] static auto sha256(std::span<const std::byte> data) -> std::string;

    /**
     * @brief SHA-256 of a file as lowercase hex
     *
     * Reads in 1 MiB blocks and checks @p token between blocks.
     */
    [[nodiscard]] static auto sha256_file(const std::filesystem::path& path,
                                          const cancellation_token& token = {})
        -> result<std::string>;

    /**
     * @brief Whether two files have identical SHA-256 digests
     * @return integrity_mismatch error when they differ
     */
    [[nodiscard]] static auto verify_same_content(const std::filesystem::path& source,
                                                  const std::filesystem::path& target,
                                                  const cancellation_token& token = {})
        -> result<void>;
};

}  // namespace kcenon::bulk_transfer

#endif  // KCENON_BULK_TRANSFER_CORE_CHECKSUM_H
