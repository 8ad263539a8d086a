/**
 * @file benchmark_helpers.h
 * @brief Helper utilities for benchmarks
 */

#ifndef KCENON_BULK_TRANSFER_BENCHMARKS_BENCHMARK_HELPERS_H
#define KCENON_BULK_TRANSFER_BENCHMARKS_BENCHMARK_HELPERS_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <random>
#include <string>
#include <vector>

namespace kcenon::bulk_transfer::benchmark {

/**
 * @brief Helper class for generating test data for benchmarks
 */
class test_data_generator {
public:
    /**
     * @brief Generate random binary data
     * @param size Size in bytes
     * @param seed Random seed (0 for random)
     * @return Vector of random bytes
     */
    static auto generate_random_data(std::size_t size, uint32_t seed = 0)
        -> std::vector<std::byte>;
};

/**
 * @brief Helper class for managing temporary benchmark files
 */
class temp_file_manager {
public:
    /**
     * @brief Constructor
     * @param base_dir Base directory for temporary files
     */
    explicit temp_file_manager(const std::filesystem::path& base_dir = {});

    ~temp_file_manager();

    temp_file_manager(const temp_file_manager&) = delete;
    auto operator=(const temp_file_manager&) -> temp_file_manager& = delete;

    temp_file_manager(temp_file_manager&&) noexcept;
    auto operator=(temp_file_manager&&) noexcept -> temp_file_manager&;

    /**
     * @brief Create a file with the given content, creating parent folders
     * @param name Path relative to the base directory
     */
    auto create_file(const std::string& name, const std::vector<std::byte>& data)
        -> std::filesystem::path;

    auto create_random_file(const std::string& name, std::size_t size, uint32_t seed = 0)
        -> std::filesystem::path;

    /**
     * @brief Create @p directories folders under @p root holding
     *        @p files_per_directory files of @p file_size bytes each
     * @return The tree root
     */
    auto create_tree(const std::string& root,
                     std::size_t directories,
                     std::size_t files_per_directory,
                     std::size_t file_size) -> std::filesystem::path;

    [[nodiscard]] auto base_dir() const -> const std::filesystem::path&;

    /**
     * @brief Clean up all temporary files
     */
    void cleanup();

private:
    std::filesystem::path base_dir_;
    std::vector<std::filesystem::path> created_files_;
    bool owns_dir_ = false;
};

/**
 * @brief Format bytes as human-readable string
 * @param bytes Number of bytes
 * @return Formatted string (e.g., "1.5 GB")
 */
auto format_bytes(uint64_t bytes) -> std::string;

/**
 * @brief Format throughput as human-readable string
 * @param bytes_per_second Throughput in bytes per second
 * @return Formatted string (e.g., "500 MB/s")
 */
auto format_throughput(double bytes_per_second) -> std::string;

/**
 * @brief Size constants for benchmarks
 */
namespace sizes {
constexpr std::size_t KB = 1024;
constexpr std::size_t MB = 1024 * KB;
constexpr std::size_t GB = 1024 * MB;

constexpr std::size_t tiny_file = 4 * KB;
constexpr std::size_t small_file = 100 * KB;
constexpr std::size_t medium_file = 10 * MB;
}  // namespace sizes

}  // namespace kcenon::bulk_transfer::benchmark

#endif  // KCENON_BULK_TRANSFER_BENCHMARKS_BENCHMARK_HELPERS_H
