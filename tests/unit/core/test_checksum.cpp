/**
 * @file test_checksum.cpp
 * @brief Unit tests for SHA-256 helpers
 */

#include <gtest/gtest.h>

#include <kcenon/bulk_transfer/core/checksum.h>

#include <cstring>
#include <filesystem>
#include <fstream>
#include <random>
#include <string>
#include <vector>

namespace kcenon::bulk_transfer::test {

class ChecksumTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("bulk_trans_test_checksum_" + std::to_string(std::random_device{}()));
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    auto create_test_file(const std::string& name, const std::string& content)
        -> std::filesystem::path {
        auto path = test_dir_ / name;
        std::ofstream file(path, std::ios::binary);
        file.write(content.data(), static_cast<std::streamsize>(content.size()));
        return path;
    }

    static auto as_bytes(const std::string& text) -> std::vector<std::byte> {
        std::vector<std::byte> bytes(text.size());
        if (!text.empty()) {
            std::memcpy(bytes.data(), text.data(), text.size());
        }
        return bytes;
    }

    std::filesystem::path test_dir_;
};

TEST_F(ChecksumTest, Sha256_KnownVectors) {
    EXPECT_EQ(checksum::sha256(as_bytes("")),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(checksum::sha256(as_bytes("abc")),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_F(ChecksumTest, Sha256File_MatchesInMemoryHash) {
    std::string content(300'000, 'x');
    auto path = create_test_file("large.bin", content);

    auto hashed = checksum::sha256_file(path);
    ASSERT_TRUE(hashed.has_value());
    EXPECT_EQ(hashed.value(), checksum::sha256(as_bytes(content)));
}

TEST_F(ChecksumTest, Sha256File_MissingFileFails) {
    auto hashed = checksum::sha256_file(test_dir_ / "missing.bin");
    ASSERT_FALSE(hashed.has_value());
    EXPECT_EQ(hashed.error().code, error_code::path_read_error);
}

TEST_F(ChecksumTest, Sha256File_CanceledTokenStops) {
    auto path = create_test_file("data.bin", std::string(100'000, 'y'));
    cancellation_source source;
    source.cancel();

    auto hashed = checksum::sha256_file(path, source.token());
    ASSERT_FALSE(hashed.has_value());
    EXPECT_EQ(hashed.error().code, error_code::operation_canceled);
}

TEST_F(ChecksumTest, VerifySameContent) {
    auto a = create_test_file("a.bin", "identical content");
    auto b = create_test_file("b.bin", "identical content");
    auto c = create_test_file("c.bin", "different content");

    EXPECT_TRUE(checksum::verify_same_content(a, b).has_value());

    auto mismatch = checksum::verify_same_content(a, c);
    ASSERT_FALSE(mismatch.has_value());
    EXPECT_EQ(mismatch.error().code, error_code::integrity_mismatch);
}

}  // namespace kcenon::bulk_transfer::test
