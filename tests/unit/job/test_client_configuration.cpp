/**
 * @file test_client_configuration.cpp
 * @brief Unit tests for client_configuration
 */

#include <gtest/gtest.h>

#include <kcenon/bulk_transfer/job/client_configuration.h>

namespace kcenon::bulk_transfer::test {

class ClientConfigurationTest : public ::testing::Test {
protected:
    client_configuration config_;
};

TEST_F(ClientConfigurationTest, Defaults_AreValid) {
    EXPECT_TRUE(config_.validate().has_value());
    EXPECT_EQ(config_.max_job_parallelism, 1u);
    EXPECT_EQ(config_.max_job_retry_attempts, 3u);
    EXPECT_EQ(config_.max_files_per_batch, 50000u);
    EXPECT_EQ(config_.overwrite, overwrite_policy::always);
}

TEST_F(ClientConfigurationTest, Validate_RejectsZeroParallelism) {
    config_.max_job_parallelism = 0;
    auto checked = config_.validate();
    ASSERT_FALSE(checked.has_value());
    EXPECT_EQ(checked.error().code, error_code::invalid_configuration);
}

TEST_F(ClientConfigurationTest, Validate_RejectsZeroAttempts) {
    config_.max_job_retry_attempts = 0;
    EXPECT_FALSE(config_.validate().has_value());
}

TEST_F(ClientConfigurationTest, Validate_RejectsInvertedDataRates) {
    config_.min_data_rate_mbps = 100;
    config_.target_data_rate_mbps = 10;
    EXPECT_FALSE(config_.validate().has_value());

    // An unlimited target accepts any floor
    config_.target_data_rate_mbps = 0;
    EXPECT_TRUE(config_.validate().has_value());
}

TEST_F(ClientConfigurationTest, Validate_RejectsZeroBatchCeilings) {
    config_.max_files_per_batch = 0;
    EXPECT_FALSE(config_.validate().has_value());
    config_.max_files_per_batch = 10;
    config_.max_bytes_per_batch = 0;
    EXPECT_FALSE(config_.validate().has_value());
}

TEST_F(ClientConfigurationTest, Validate_RejectsZeroEnumerationParallelism) {
    config_.max_paging_parallelism = 0;
    EXPECT_FALSE(config_.validate().has_value());
}

TEST_F(ClientConfigurationTest, IsRetryable_FollowsSwitches) {
    EXPECT_TRUE(config_.is_retryable(issue_attributes::file_not_found));
    EXPECT_FALSE(config_.is_retryable(issue_attributes::bad_path));
    EXPECT_FALSE(config_.is_retryable(issue_attributes::permission));
    EXPECT_TRUE(config_.is_retryable(issue_attributes::io));
    EXPECT_TRUE(config_.is_retryable(issue_attributes::connection));

    config_.file_not_found_errors_retry = false;
    config_.transient_errors_retry = false;
    config_.bad_path_errors_retry = true;
    EXPECT_FALSE(config_.is_retryable(issue_attributes::file_not_found));
    EXPECT_FALSE(config_.is_retryable(issue_attributes::timeout));
    EXPECT_TRUE(config_.is_retryable(issue_attributes::bad_path | issue_attributes::path_too_long));
}

TEST_F(ClientConfigurationTest, IsRetryable_NeverForAuthenticationOrCancel) {
    config_.transient_errors_retry = true;
    EXPECT_FALSE(config_.is_retryable(issue_attributes::authentication));
    EXPECT_FALSE(config_.is_retryable(issue_attributes::canceled | issue_attributes::io));
}

TEST_F(ClientConfigurationTest, OverwritePolicyNames) {
    EXPECT_STREQ(to_string(overwrite_policy::skip_existing), "skip_existing");
    EXPECT_STREQ(to_string(overwrite_policy::fail_if_exists), "fail_if_exists");
}

}  // namespace kcenon::bulk_transfer::test
