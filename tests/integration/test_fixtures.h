/**
 * @file test_fixtures.h
 * @brief Test fixtures for integration tests
 */

#ifndef KCENON_BULK_TRANSFER_TEST_FIXTURES_H
#define KCENON_BULK_TRANSFER_TEST_FIXTURES_H

#include <gtest/gtest.h>

#include <kcenon/bulk_transfer/bulk_transfer.h>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <random>
#include <string>
#include <vector>

namespace kcenon::bulk_transfer::test {

/**
 * @brief Test fixture for temporary directory management
 */
class TempDirectoryFixture : public ::testing::Test {
protected:
    void SetUp() override {
        get_logger().set_console_output(false);
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("bulk_trans_test_" + std::to_string(std::random_device{}()));
        std::filesystem::create_directories(test_dir_);
        source_dir_ = test_dir_ / "source";
        std::filesystem::create_directories(source_dir_);
        target_dir_ = test_dir_ / "target";
        std::filesystem::create_directories(target_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
        get_logger().set_console_output(true);
    }

    auto create_test_file(const std::string& name, std::size_t size)
        -> std::filesystem::path {
        auto path = source_dir_ / name;
        std::filesystem::create_directories(path.parent_path());
        std::ofstream file(path, std::ios::binary);

        std::mt19937 gen(42);  // Fixed seed for reproducibility
        std::uniform_int_distribution<> dis(0, 255);

        std::vector<char> block(64 * 1024);
        std::size_t written = 0;
        while (written < size) {
            auto count = std::min(block.size(), size - written);
            for (std::size_t i = 0; i < count; ++i) {
                block[i] = static_cast<char>(dis(gen));
            }
            file.write(block.data(), static_cast<std::streamsize>(count));
            written += count;
        }

        return path;
    }

    static auto files_equal(const std::filesystem::path& a, const std::filesystem::path& b)
        -> bool {
        std::ifstream fa(a, std::ios::binary);
        std::ifstream fb(b, std::ios::binary);
        if (!fa || !fb) {
            return false;
        }
        return std::equal(std::istreambuf_iterator<char>(fa), std::istreambuf_iterator<char>(),
                          std::istreambuf_iterator<char>(fb), std::istreambuf_iterator<char>());
    }

    std::filesystem::path test_dir_;
    std::filesystem::path source_dir_;
    std::filesystem::path target_dir_;
};

/**
 * @brief Client over the file share transport with immediate retries
 */
class FileShareFixture : public TempDirectoryFixture {
protected:
    void SetUp() override {
        TempDirectoryFixture::SetUp();
        config_.max_job_parallelism = 2;
        config_.statistics_rate = std::chrono::milliseconds(20);
    }

    void TearDown() override {
        client_.reset();
        TempDirectoryFixture::TearDown();
    }

    void build_client() {
        auto client_result = bulk_transfer_client::builder()
                                 .with_configuration(config_)
                                 .with_transport("file_share")
                                 .with_retry_policy(make_fixed_wait(std::chrono::milliseconds(0)))
                                 .build();

        ASSERT_TRUE(client_result.has_value()) << "Failed to create client";
        client_ = std::make_unique<bulk_transfer_client>(std::move(client_result.value()));
    }

    auto upload_request(const std::vector<std::filesystem::path>& files) -> transfer_request {
        std::vector<transfer_path> paths;
        for (const auto& file : files) {
            paths.emplace_back(file.string());
        }
        return transfer_request::for_upload(std::move(paths), target_dir_.string());
    }

    client_configuration config_;
    std::unique_ptr<bulk_transfer_client> client_;
};

/**
 * @brief Test data sizes
 */
namespace test_data {
    constexpr std::size_t small_file_size = 1024;              // 1KB
    constexpr std::size_t medium_file_size = 5 * 1024 * 1024;  // 5MB
    constexpr std::size_t large_file_size = 10 * 1024 * 1024;  // 10MB
}

}  // namespace kcenon::bulk_transfer::test

#endif  // KCENON_BULK_TRANSFER_TEST_FIXTURES_H
