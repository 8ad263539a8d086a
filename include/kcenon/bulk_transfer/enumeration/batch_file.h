/**
 * @file batch_file.h
 * @brief JSON batch files holding serialized path records
 */

#ifndef KCENON_BULK_TRANSFER_ENUMERATION_BATCH_FILE_H
#define KCENON_BULK_TRANSFER_ENUMERATION_BATCH_FILE_H

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "kcenon/bulk_transfer/core/path_record.h"
#include "kcenon/bulk_transfer/core/types.h"

namespace kcenon::bulk_transfer {

/**
 * @brief Trailing summary block of a batch file
 */
struct batch_summary {
    uint32_t batch_number = 0;
    uint64_t file_count = 0;
    uint64_t byte_count = 0;
    bool complete = false;  ///< false while a live-synced walk is still writing
};

/**
 * @brief Records and summary read back from a batch file
 */
struct batch_contents {
    batch_summary summary;
    std::vector<transfer_path> paths;
};

/**
 * @brief Writes one batch file
 *
 * Layout:
 * @code
 * {
 *   "version": 1,
 *   "batch_number": 1,
 *   "paths": [
 *     {"source_path": "/data/a.bin", "bytes": 10, ...},
 *     {"source_path": "/data/b.bin", "bytes": 20, ...}
 *   ],
 *   "summary": {"file_count": 2, "byte_count": 30, "complete": true}
 * }
 * @endcode
 *
 * One record per line. With live sync the summary is rewritten after every
 * record so readers of an unfinished walk see a valid file.
 */
class batch_writer {
public:
    /**
     * @return batch_write_error when the file cannot be created
     */
    [[nodiscard]] static auto create(const std::filesystem::path& file,
                                     uint32_t batch_number,
                                     bool live_sync) -> result<std::unique_ptr<batch_writer>>;

    batch_writer(const batch_writer&) = delete;
    auto operator=(const batch_writer&) -> batch_writer& = delete;
    ~batch_writer();

    [[nodiscard]] auto append(const transfer_path& path) -> result<void>;

    /**
     * @brief Write the final summary and close the file
     */
    [[nodiscard]] auto finalize() -> result<batch_summary>;

    [[nodiscard]] auto file_count() const -> uint64_t { return summary_.file_count; }
    [[nodiscard]] auto byte_count() const -> uint64_t { return summary_.byte_count; }
    [[nodiscard]] auto batch_number() const -> uint32_t { return summary_.batch_number; }
    [[nodiscard]] auto location() const -> const std::filesystem::path& { return file_; }

private:
    batch_writer(std::filesystem::path file, uint32_t batch_number, bool live_sync);

    [[nodiscard]] auto write_trailer() -> result<void>;

    std::filesystem::path file_;
    std::ofstream out_;
    batch_summary summary_;
    bool live_sync_ = false;
    bool finalized_ = false;
    std::streamoff records_end_ = 0;
};

/**
 * @brief Batch file encoding helpers and reader
 */
class batch_file {
public:
    static constexpr int format_version = 1;

    /**
     * @brief One-line JSON object for a record
     */
    [[nodiscard]] static auto encode(const transfer_path& path) -> std::string;

    /**
     * @return batch_format_error for malformed input
     */
    [[nodiscard]] static auto decode(std::string_view line) -> result<transfer_path>;

    /**
     * @brief Read a batch file
     * @return batch_read_error when the file cannot be opened,
     *         batch_format_error when it is malformed
     */
    [[nodiscard]] static auto read(const std::filesystem::path& file) -> result<batch_contents>;

    /**
     * @brief File name for a batch: <prefix>_<number, 6 digits>.json
     */
    [[nodiscard]] static auto file_name(std::string_view prefix, uint32_t batch_number)
        -> std::string;
};

}  // namespace kcenon::bulk_transfer

#endif  // KCENON_BULK_TRANSFER_ENUMERATION_BATCH_FILE_H
