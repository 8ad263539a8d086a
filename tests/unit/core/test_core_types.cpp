/**
 * @file test_core_types.cpp
 * @brief Unit tests for result types and error codes
 */

#include <gtest/gtest.h>

#include <kcenon/bulk_transfer/core/error_codes.h>
#include <kcenon/bulk_transfer/core/types.h>

#include <memory>
#include <string>

namespace kcenon::bulk_transfer::test {

class ResultTest : public ::testing::Test {};

TEST_F(ResultTest, Value_HasValue) {
    result<int> r = 42;
    ASSERT_TRUE(r.has_value());
    EXPECT_TRUE(static_cast<bool>(r));
    EXPECT_EQ(r.value(), 42);
}

TEST_F(ResultTest, Error_CarriesCodeAndMessage) {
    result<int> r = make_error(error_code::queue_full, "no room");
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, error_code::queue_full);
    EXPECT_EQ(r.error().message, "no room");
}

TEST_F(ResultTest, ErrorWithoutMessage_UsesCodeDescription) {
    result<void> r = make_error(error_code::object_disposed);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().message, std::string(to_string(error_code::object_disposed)));
}

TEST_F(ResultTest, Void_DefaultIsSuccess) {
    result<void> r;
    EXPECT_TRUE(r.has_value());
}

TEST_F(ResultTest, MoveOnlyValue) {
    result<std::unique_ptr<int>> r = std::make_unique<int>(7);
    ASSERT_TRUE(r.has_value());
    auto owned = std::move(r).value();
    ASSERT_NE(owned, nullptr);
    EXPECT_EQ(*owned, 7);
}

class ErrorCodeTest : public ::testing::Test {};

TEST_F(ErrorCodeTest, Ranges_AreDisjoint) {
    EXPECT_TRUE(is_usage_error(error_code::invalid_configuration));
    EXPECT_TRUE(is_usage_error(error_code::missing_target_path));
    EXPECT_TRUE(is_job_error(error_code::operation_canceled));
    EXPECT_TRUE(is_job_error(error_code::retries_exhausted));
    EXPECT_TRUE(is_path_error(error_code::path_too_long));
    EXPECT_TRUE(is_path_error(error_code::integrity_mismatch));
    EXPECT_TRUE(is_transport_error(error_code::transport_not_supported));
    EXPECT_TRUE(is_batch_error(error_code::batch_format_error));

    EXPECT_FALSE(is_path_error(error_code::invalid_configuration));
    EXPECT_FALSE(is_usage_error(error_code::path_too_long));
    EXPECT_FALSE(is_batch_error(error_code::connection_failed));
    EXPECT_FALSE(is_job_error(error_code::success));
}

TEST_F(ErrorCodeTest, ToString_IsNonEmptyForEveryCode) {
    for (auto code : {error_code::invalid_configuration, error_code::invalid_state,
                      error_code::operation_timeout, error_code::job_fatal,
                      error_code::file_not_found, error_code::connection_lost,
                      error_code::batch_read_error}) {
        EXPECT_FALSE(to_string(code).empty());
    }
}

TEST_F(ErrorCodeTest, IntegerLookup_MatchesEnumLookup) {
    EXPECT_EQ(error_code_to_string(static_cast<int32_t>(error_code::bad_path)),
              to_string(error_code::bad_path));
}

}  // namespace kcenon::bulk_transfer::test
