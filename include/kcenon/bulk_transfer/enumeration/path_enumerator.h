/**
 * @file path_enumerator.h
 * @brief Walks local or remote trees and produces path records
 */

#ifndef KCENON_BULK_TRANSFER_ENUMERATION_PATH_ENUMERATOR_H
#define KCENON_BULK_TRANSFER_ENUMERATION_PATH_ENUMERATOR_H

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "kcenon/bulk_transfer/core/cancellation.h"
#include "kcenon/bulk_transfer/core/issue.h"
#include "kcenon/bulk_transfer/core/path_record.h"
#include "kcenon/bulk_transfer/core/types.h"
#include "kcenon/bulk_transfer/job/client_configuration.h"
#include "kcenon/bulk_transfer/transport/transport_client.h"

namespace kcenon::bulk_transfer {

/**
 * @brief Running totals reported while a walk is in progress
 */
struct enumeration_statistics {
    uint64_t total_files = 0;
    uint64_t total_bytes = 0;
    uint64_t total_directories = 0;
    uint64_t total_error_paths = 0;
    std::chrono::milliseconds elapsed{0};
};

/**
 * @brief Path that could not be read or was rejected by the long-path policy
 */
struct enumeration_path_error {
    std::string path;
    issue_attributes attributes = issue_attributes::io;
    std::string message;
    int32_t code = 0;  ///< errno or error_code value
};

/**
 * @brief What to walk and how
 */
struct enumeration_context {
    std::vector<std::string> search_paths;
    std::string target_path;  ///< Records get target locations when set
    transfer_direction direction = transfer_direction::upload;

    /// Wildcards ('*', '?') matched against file names; empty includes all
    std::vector<std::string> include_patterns;
    std::vector<std::string> exclude_patterns;
    /// Wildcards matched against directory names
    std::vector<std::string> exclude_directories;

    bool recursive = true;
    bool preserve_folders = true;  ///< Mirror the relative folder under target_path

    bool skip_too_long_paths = false;
    std::size_t max_path_length = 0;  ///< 0 = unlimited

    std::size_t max_directory_parallelism = 1;
    std::size_t max_file_parallelism = 1;
    std::size_t max_paging_parallelism = 1;
    std::size_t page_size = 1000;

    uint64_t max_bytes_per_batch = 100ULL * 1000 * 1000 * 1000;
    uint64_t max_files_per_batch = 50000;
    bool live_sync = false;
    std::string batch_file_prefix = "batch";

    std::chrono::milliseconds statistics_interval{1000};
    std::function<void(const enumeration_statistics&)> on_statistics;

    /// Raised synchronously for every unreadable or rejected path
    std::function<void(const enumeration_path_error&)> on_path_error;

    /**
     * @brief Context with the limits and policies taken from a configuration
     */
    [[nodiscard]] static auto from(const client_configuration& config) -> enumeration_context;
};

/**
 * @brief Outcome of enumerate()
 */
struct enumeration_result {
    std::vector<transfer_path> paths;  ///< Sorted by source path
    uint64_t total_files = 0;
    uint64_t total_bytes = 0;
    uint64_t total_directories = 0;
    std::chrono::milliseconds elapsed{0};
    std::vector<enumeration_path_error> error_paths;
};

/**
 * @brief One serialized batch
 */
struct batch_descriptor {
    uint32_t batch_number = 0;
    uint64_t file_count = 0;
    uint64_t byte_count = 0;
    std::filesystem::path location;
};

/**
 * @brief Outcome of serialize()
 */
struct serialization_result {
    std::vector<batch_descriptor> batches;
    uint64_t total_files = 0;
    uint64_t total_bytes = 0;
    uint64_t total_directories = 0;
    std::chrono::milliseconds elapsed{0};
    std::vector<enumeration_path_error> error_paths;
};

/**
 * @brief Receives records as they are discovered; calls are serialized
 * @return An error to stop the walk
 */
using path_sink = std::function<result<void>(transfer_path&&)>;

/**
 * @brief Directory listing backend of the enumerator
 */
class path_source {
public:
    /**
     * @brief Entries of one directory
     */
    struct listing {
        std::vector<listing_node> files;
        std::vector<std::string> directories;
        std::vector<enumeration_path_error> errors;
    };

    virtual ~path_source() = default;

    /**
     * @return An error when the directory itself cannot be read
     */
    [[nodiscard]] virtual auto list(const std::string& directory,
                                    const cancellation_token& token) -> result<listing> = 0;

    /**
     * @brief Fill in missing file sizes
     */
    [[nodiscard]] virtual auto stat(listing_node& node) -> result<void> = 0;

    /**
     * @brief Whether the root exists and is a directory
     */
    [[nodiscard]] virtual auto is_directory(const std::string& path) -> bool = 0;
};

/**
 * @brief Local filesystem walk through std::filesystem
 */
class local_path_source : public path_source {
public:
    [[nodiscard]] auto list(const std::string& directory, const cancellation_token& token)
        -> result<listing> override;
    [[nodiscard]] auto stat(listing_node& node) -> result<void> override;
    [[nodiscard]] auto is_directory(const std::string& path) -> bool override;
};

/**
 * @brief Remote walk through transport_client::list_directory paging
 *
 * At most max_paging_parallelism page requests run at the same time across
 * all directory workers.
 */
class remote_path_source : public path_source {
public:
    remote_path_source(std::shared_ptr<transport_client> client,
                       std::size_t page_size,
                       std::size_t max_paging_parallelism);
    ~remote_path_source() override;

    [[nodiscard]] auto list(const std::string& directory, const cancellation_token& token)
        -> result<listing> override;
    [[nodiscard]] auto stat(listing_node& node) -> result<void> override;
    [[nodiscard]] auto is_directory(const std::string& path) -> bool override;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

/**
 * @brief Produces path records from one or more search roots
 *
 * Directories are walked by a pool of max_directory_parallelism workers and
 * discovered files are checked by a separate pool of max_file_parallelism
 * workers. A path longer than max_path_length, source or resolved target,
 * aborts the walk with path_too_long unless skip_too_long_paths is set, in
 * which case it is reported as an error path and the walk continues.
 *
 * @code
 * path_enumerator enumerator(std::make_shared<local_path_source>());
 * auto context = enumeration_context::from(config);
 * context.search_paths = {"/data/incoming"};
 * context.target_path = "/mnt/share/archive";
 *
 * auto batches = enumerator.serialize("/tmp/batches", context);
 * @endcode
 */
class path_enumerator {
public:
    explicit path_enumerator(std::shared_ptr<path_source> source);

    /**
     * @brief Walk all roots and return the records in memory
     */
    [[nodiscard]] auto enumerate(const enumeration_context& context,
                                 const cancellation_token& token = {})
        -> result<enumeration_result>;

    /**
     * @brief Walk all roots, handing each record to @p sink as it is found
     * @return Totals; result.paths stays empty
     */
    [[nodiscard]] auto enumerate_lazy(const enumeration_context& context,
                                      const path_sink& sink,
                                      const cancellation_token& token = {})
        -> result<enumeration_result>;

    /**
     * @brief Walk all roots and write the records into batch files
     *
     * A batch is closed before a record would push it over either ceiling;
     * a single file larger than max_bytes_per_batch gets a batch of its own.
     */
    [[nodiscard]] auto serialize(const std::filesystem::path& batch_directory,
                                 const enumeration_context& context,
                                 const cancellation_token& token = {})
        -> result<serialization_result>;

private:
    std::shared_ptr<path_source> source_;
};

/**
 * @brief Whether @p name matches a '*' / '?' wildcard pattern
 */
[[nodiscard]] auto wildcard_match(std::string_view pattern, std::string_view name) -> bool;

}  // namespace kcenon::bulk_transfer

#endif  // KCENON_BULK_TRANSFER_ENUMERATION_PATH_ENUMERATOR_H
