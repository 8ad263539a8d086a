/**
 * @file test_file_share_client.cpp
 * @brief Unit tests for the file share transport
 */

#include <gtest/gtest.h>

#include <kcenon/bulk_transfer/core/logging.h>
#include <kcenon/bulk_transfer/transport/file_share_client.h>

#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>

namespace kcenon::bulk_transfer::test {

namespace fs = std::filesystem;
using namespace std::chrono_literals;

class FileShareClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        get_logger().set_console_output(false);
        test_dir_ = fs::temp_directory_path() /
                    ("bulk_trans_test_share_" + std::to_string(std::random_device{}()));
        source_dir_ = test_dir_ / "source";
        target_dir_ = test_dir_ / "target";
        fs::create_directories(source_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(test_dir_, ec);
        get_logger().set_console_output(true);
    }

    auto create_file(const fs::path& path, const std::string& content) -> fs::path {
        fs::create_directories(path.parent_path());
        std::ofstream file(path, std::ios::binary);
        file.write(content.data(), static_cast<std::streamsize>(content.size()));
        return path;
    }

    static auto read_file(const fs::path& path) -> std::string {
        std::ifstream file(path, std::ios::binary);
        std::ostringstream oss;
        oss << file.rdbuf();
        return oss.str();
    }

    auto path_for(const fs::path& source) const -> transfer_path {
        transfer_path path(source.string(), target_dir_.string());
        path.target_file_name = source.filename().string();
        path.direction = transfer_direction::upload;
        return path;
    }

    fs::path test_dir_;
    fs::path source_dir_;
    fs::path target_dir_;
    file_share_client client_;
};

TEST_F(FileShareClientTest, Identity) {
    EXPECT_EQ(client_.id(), "file_share");
    EXPECT_TRUE(client_.support_check({}).supported);
    EXPECT_TRUE(client_.supports_data_rate_change());
    EXPECT_EQ(client_.max_path_length(), 4096u);
}

TEST_F(FileShareClientTest, ConnectionCheck_CreatesTarget) {
    auto result = client_.connection_check(
        connection_request{transfer_direction::upload, target_dir_.string()}, {});
    EXPECT_TRUE(result.connected);
    EXPECT_TRUE(fs::is_directory(target_dir_));
    EXPECT_TRUE(fs::is_empty(target_dir_));
}

TEST_F(FileShareClientTest, ConnectionCheck_FailsWhenTargetIsAFile) {
    auto blocker = create_file(test_dir_ / "blocker", "x");
    auto result = client_.connection_check(
        connection_request{transfer_direction::upload, blocker.string()}, {});
    EXPECT_FALSE(result.connected);
    EXPECT_TRUE(has_flag(result.attributes, issue_attributes::connection));
}

TEST_F(FileShareClientTest, Transfer_CopiesContent) {
    std::string content(3 * 1024 * 1024 + 17, 'q');
    auto source = create_file(source_dir_ / "data.bin", content);

    std::vector<uint64_t> progress;
    transfer_options options;
    options.chunk_size = 1024 * 1024;
    options.on_progress = [&](uint64_t bytes) { progress.push_back(bytes); };

    auto outcome = client_.transfer(path_for(source), options, {});
    ASSERT_TRUE(outcome.is_success());
    EXPECT_EQ(outcome.bytes_transferred, content.size());
    EXPECT_EQ(read_file(target_dir_ / "data.bin"), content);
    EXPECT_FALSE(fs::exists(target_dir_ / "data.bin.btpart"));

    ASSERT_EQ(progress.size(), 4u);
    EXPECT_EQ(progress.back(), content.size());
}

TEST_F(FileShareClientTest, Transfer_EmptyFile) {
    auto source = create_file(source_dir_ / "empty.txt", "");
    auto outcome = client_.transfer(path_for(source), {}, {});
    ASSERT_TRUE(outcome.is_success());
    EXPECT_EQ(outcome.bytes_transferred, 0u);
    EXPECT_TRUE(fs::exists(target_dir_ / "empty.txt"));
}

TEST_F(FileShareClientTest, Transfer_MissingSourceIsFileNotFound) {
    auto outcome = client_.transfer(path_for(source_dir_ / "absent.bin"), {}, {});
    ASSERT_FALSE(outcome.is_success());
    EXPECT_TRUE(has_flag(outcome.issue->attributes, issue_attributes::file_not_found));
}

TEST_F(FileShareClientTest, Transfer_DirectorySourceIsBadPath) {
    fs::create_directories(source_dir_ / "folder");
    auto outcome = client_.transfer(path_for(source_dir_ / "folder"), {}, {});
    ASSERT_FALSE(outcome.is_success());
    EXPECT_TRUE(has_flag(outcome.issue->attributes, issue_attributes::bad_path));
}

TEST_F(FileShareClientTest, Transfer_OverwritePolicies) {
    auto source = create_file(source_dir_ / "a.txt", "new");
    create_file(target_dir_ / "a.txt", "old");

    transfer_options options;
    options.overwrite = overwrite_policy::skip_existing;
    auto skipped = client_.transfer(path_for(source), options, {});
    ASSERT_TRUE(skipped.is_success());
    EXPECT_TRUE(skipped.skipped);
    EXPECT_EQ(read_file(target_dir_ / "a.txt"), "old");

    options.overwrite = overwrite_policy::fail_if_exists;
    auto failed = client_.transfer(path_for(source), options, {});
    ASSERT_FALSE(failed.is_success());
    EXPECT_EQ(failed.issue->code, static_cast<int32_t>(error_code::file_exists));

    options.overwrite = overwrite_policy::always;
    auto copied = client_.transfer(path_for(source), options, {});
    ASSERT_TRUE(copied.is_success());
    EXPECT_EQ(read_file(target_dir_ / "a.txt"), "new");
}

TEST_F(FileShareClientTest, Transfer_CanceledLeavesNoTarget) {
    auto source = create_file(source_dir_ / "a.bin", std::string(1000, 'a'));
    cancellation_source canceled;
    canceled.cancel();

    auto outcome = client_.transfer(path_for(source), {}, canceled.token());
    ASSERT_FALSE(outcome.is_success());
    EXPECT_TRUE(has_flag(outcome.issue->attributes, issue_attributes::canceled));
    EXPECT_FALSE(fs::exists(target_dir_ / "a.bin"));
}

TEST_F(FileShareClientTest, Transfer_ExpiredDeadlineTimesOut) {
    auto source = create_file(source_dir_ / "a.bin", std::string(1000, 'a'));
    transfer_options options;
    options.deadline = std::chrono::steady_clock::now() - 1s;

    auto outcome = client_.transfer(path_for(source), options, {});
    ASSERT_FALSE(outcome.is_success());
    EXPECT_TRUE(has_flag(outcome.issue->attributes, issue_attributes::timeout));
    EXPECT_FALSE(fs::exists(target_dir_ / "a.bin"));
    EXPECT_FALSE(fs::exists(target_dir_ / "a.bin.btpart"));
}

TEST_F(FileShareClientTest, Transfer_VerifiesIntegrity) {
    auto source = create_file(source_dir_ / "v.bin", std::string(50'000, 'v'));
    transfer_options options;
    options.verify_integrity = true;
    auto outcome = client_.transfer(path_for(source), options, {});
    EXPECT_TRUE(outcome.is_success());
    EXPECT_FALSE(outcome.issue.has_value());
}

TEST_F(FileShareClientTest, Transfer_PreservesModificationTime) {
    auto source = create_file(source_dir_ / "dated.txt", "dated");
    auto stamp = fs::file_time_type::clock::now() - std::chrono::hours(48);
    fs::last_write_time(source, stamp);

    auto outcome = client_.transfer(path_for(source), {}, {});
    ASSERT_TRUE(outcome.is_success());
    EXPECT_EQ(fs::last_write_time(target_dir_ / "dated.txt"), fs::last_write_time(source));
}

TEST_F(FileShareClientTest, ChangeDataRate) {
    EXPECT_TRUE(client_.change_data_rate(0, 100, {}).has_value());

    auto inverted = client_.change_data_rate(50, 10, {});
    ASSERT_FALSE(inverted.has_value());
    EXPECT_EQ(inverted.error().code, error_code::invalid_argument);

    cancellation_source canceled;
    canceled.cancel();
    auto aborted = client_.change_data_rate(0, 10, canceled.token());
    ASSERT_FALSE(aborted.has_value());
    EXPECT_EQ(aborted.error().code, error_code::operation_canceled);
}

TEST_F(FileShareClientTest, ListDirectory_PagesThroughEntries) {
    for (int i = 0; i < 5; ++i) {
        create_file(source_dir_ / ("f" + std::to_string(i) + ".txt"), std::string(i, 'x'));
    }
    fs::create_directories(source_dir_ / "sub");

    auto first = client_.list_directory(source_dir_.string(), "", 4, {});
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first.value().files.size(), 4u);
    ASSERT_TRUE(first.value().next_page_token.has_value());

    auto second =
        client_.list_directory(source_dir_.string(), *first.value().next_page_token, 4, {});
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second.value().files.size(), 1u);
    EXPECT_EQ(second.value().directories.size(), 1u);
    EXPECT_FALSE(second.value().next_page_token.has_value());

    ASSERT_TRUE(first.value().files[0].size.has_value());
    EXPECT_EQ(*first.value().files[0].size, 0u);
}

TEST_F(FileShareClientTest, ListDirectory_Errors) {
    auto missing = client_.list_directory((test_dir_ / "nope").string(), "", 10, {});
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, error_code::file_not_found);

    auto bad_token = client_.list_directory(source_dir_.string(), "abc", 10, {});
    ASSERT_FALSE(bad_token.has_value());
    EXPECT_EQ(bad_token.error().code, error_code::invalid_argument);
}

}  // namespace kcenon::bulk_transfer::test
