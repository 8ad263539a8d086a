/**
 * @file path_record.h
 * @brief Unit of transfer work: one file with its source and target location
 */

#ifndef KCENON_BULK_TRANSFER_CORE_PATH_RECORD_H
#define KCENON_BULK_TRANSFER_CORE_PATH_RECORD_H

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "types.h"

namespace kcenon::bulk_transfer {

/**
 * @brief Direction of a transfer relative to the local filesystem
 */
enum class transfer_direction : uint8_t {
    upload,
    download,
};

[[nodiscard]] constexpr auto to_string(transfer_direction direction) -> const char* {
    switch (direction) {
        case transfer_direction::upload:
            return "upload";
        case transfer_direction::download:
            return "download";
        default:
            return "unknown";
    }
}

[[nodiscard]] inline auto parse_direction(std::string_view text)
    -> std::optional<transfer_direction> {
    if (text == "upload") return transfer_direction::upload;
    if (text == "download") return transfer_direction::download;
    return std::nullopt;
}

/**
 * @brief Maps a path to another path (e.g. a share prefix rewrite)
 */
using path_resolver = std::function<std::string(const std::string&)>;

/**
 * @brief One file to transfer
 *
 * Direction, target path and target file name are optional when the record
 * is built and are filled in from the owning request by resolve_path().
 * Once resolved the engine only hands out const references to it.
 */
struct transfer_path {
    std::string source_path;
    std::optional<std::string> target_path;
    std::optional<std::string> target_file_name;
    std::optional<transfer_direction> direction;
    std::optional<int64_t> order;
    std::optional<uint64_t> bytes;
    std::map<std::string, std::string> metadata;
    std::optional<std::string> tag;

    transfer_path() = default;
    explicit transfer_path(std::string source) : source_path(std::move(source)) {}
    transfer_path(std::string source, std::string target)
        : source_path(std::move(source)), target_path(std::move(target)) {}

    /**
     * @brief Target directory joined with the target file name
     */
    [[nodiscard]] auto target_full_path() const -> std::string;

    /**
     * @brief Whether direction, target path and file name are all set
     */
    [[nodiscard]] auto is_resolved() const -> bool {
        return direction.has_value() && target_path.has_value() &&
               target_file_name.has_value();
    }

    [[nodiscard]] auto operator==(const transfer_path& other) const -> bool = default;
};

/**
 * @brief Request-level defaults used to resolve a transfer_path
 */
struct path_defaults {
    transfer_direction direction = transfer_direction::upload;
    std::string target_path;
    path_resolver source_path_resolver;
    path_resolver target_path_resolver;
};

/**
 * @brief Fill in direction, target path and target file name exactly once
 *
 * Resolvers run on the source path and on the target path respectively.
 * Fails with invalid_argument for an empty source path and with
 * missing_target_path when no target can be derived.
 */
[[nodiscard]] auto resolve_path(transfer_path path, const path_defaults& defaults)
    -> result<transfer_path>;

/**
 * @brief Final path component of @p path, accepting '/' and '\\'
 */
[[nodiscard]] auto file_name_of(std::string_view path) -> std::string;

/**
 * @brief Join a directory and a relative component with a single separator
 */
[[nodiscard]] auto join_path(std::string_view directory, std::string_view component)
    -> std::string;

}  // namespace kcenon::bulk_transfer

#endif  // KCENON_BULK_TRANSFER_CORE_PATH_RECORD_H
