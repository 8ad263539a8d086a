/**
 * @file test_path_record.cpp
 * @brief Unit tests for path records and resolution
 */

#include <gtest/gtest.h>

#include <kcenon/bulk_transfer/core/path_record.h>

namespace kcenon::bulk_transfer::test {

class PathRecordTest : public ::testing::Test {
protected:
    path_defaults defaults_{transfer_direction::upload, "/mnt/share/in", {}, {}};
};

TEST_F(PathRecordTest, FileNameOf_HandlesBothSeparators) {
    EXPECT_EQ(file_name_of("/data/a.bin"), "a.bin");
    EXPECT_EQ(file_name_of("C:\\data\\b.bin"), "b.bin");
    EXPECT_EQ(file_name_of("plain.txt"), "plain.txt");
    EXPECT_EQ(file_name_of("/data/dir/"), "dir");
}

TEST_F(PathRecordTest, JoinPath_UsesSingleSeparator) {
    EXPECT_EQ(join_path("/mnt/share", "a.bin"), "/mnt/share/a.bin");
    EXPECT_EQ(join_path("/mnt/share/", "/a.bin"), "/mnt/share/a.bin");
    EXPECT_EQ(join_path("\\\\server\\share", "a.bin"), "\\\\server\\share\\a.bin");
    EXPECT_EQ(join_path("", "a.bin"), "a.bin");
}

TEST_F(PathRecordTest, Resolve_FillsDefaults) {
    auto resolved = resolve_path(transfer_path{"/data/a.bin"}, defaults_);
    ASSERT_TRUE(resolved.has_value());

    const auto& path = resolved.value();
    EXPECT_TRUE(path.is_resolved());
    EXPECT_EQ(path.direction, transfer_direction::upload);
    EXPECT_EQ(path.target_path, "/mnt/share/in");
    EXPECT_EQ(path.target_file_name, "a.bin");
    EXPECT_EQ(path.target_full_path(), "/mnt/share/in/a.bin");
}

TEST_F(PathRecordTest, Resolve_KeepsExplicitValues) {
    transfer_path path("/data/a.bin", "/other");
    path.target_file_name = "renamed.bin";
    path.direction = transfer_direction::download;

    auto resolved = resolve_path(path, defaults_);
    ASSERT_TRUE(resolved.has_value());
    EXPECT_EQ(resolved.value().target_full_path(), "/other/renamed.bin");
    EXPECT_EQ(resolved.value().direction, transfer_direction::download);
}

TEST_F(PathRecordTest, Resolve_AppliesResolversOnce) {
    int source_calls = 0;
    int target_calls = 0;
    defaults_.source_path_resolver = [&](const std::string& p) {
        ++source_calls;
        return "/mirror" + p;
    };
    defaults_.target_path_resolver = [&](const std::string& p) {
        ++target_calls;
        return p + "/archive";
    };

    auto resolved = resolve_path(transfer_path{"/data/a.bin"}, defaults_);
    ASSERT_TRUE(resolved.has_value());
    EXPECT_EQ(resolved.value().source_path, "/mirror/data/a.bin");
    EXPECT_EQ(resolved.value().target_path, "/mnt/share/in/archive");
    EXPECT_EQ(source_calls, 1);
    EXPECT_EQ(target_calls, 1);
}

TEST_F(PathRecordTest, Resolve_EmptySourceFails) {
    auto resolved = resolve_path(transfer_path{}, defaults_);
    ASSERT_FALSE(resolved.has_value());
    EXPECT_EQ(resolved.error().code, error_code::invalid_argument);
}

TEST_F(PathRecordTest, Resolve_NoTargetFails) {
    defaults_.target_path.clear();
    auto resolved = resolve_path(transfer_path{"/data/a.bin"}, defaults_);
    ASSERT_FALSE(resolved.has_value());
    EXPECT_EQ(resolved.error().code, error_code::missing_target_path);
}

TEST_F(PathRecordTest, ParseDirection) {
    EXPECT_EQ(parse_direction("upload"), transfer_direction::upload);
    EXPECT_EQ(parse_direction("download"), transfer_direction::download);
    EXPECT_FALSE(parse_direction("sideways").has_value());
}

}  // namespace kcenon::bulk_transfer::test
