/**
 * @file test_retry_policy.cpp
 * @brief Unit tests for retry wait strategies
 */

#include <gtest/gtest.h>

#include <kcenon/bulk_transfer/core/retry_policy.h>

namespace kcenon::bulk_transfer::test {

using namespace std::chrono_literals;

class RetryPolicyTest : public ::testing::Test {};

TEST_F(RetryPolicyTest, Exponential_DoublesPerAttempt) {
    exponential_backoff_policy policy(100ms, 10s);
    EXPECT_EQ(policy.wait_time(1), 100ms);
    EXPECT_EQ(policy.wait_time(2), 200ms);
    EXPECT_EQ(policy.wait_time(3), 400ms);
    EXPECT_EQ(policy.wait_time(4), 800ms);
}

TEST_F(RetryPolicyTest, Exponential_IsCappedByMaxWait) {
    exponential_backoff_policy policy(1s, 5s);
    EXPECT_EQ(policy.wait_time(3), 4s);
    EXPECT_EQ(policy.wait_time(4), 5s);
    EXPECT_EQ(policy.wait_time(60), 5s);
    EXPECT_EQ(policy.wait_time(1000), 5s);
}

TEST_F(RetryPolicyTest, Exponential_IsMonotonic) {
    exponential_backoff_policy policy(3ms, 1min);
    auto previous = policy.wait_time(1);
    for (uint32_t attempt = 2; attempt < 64; ++attempt) {
        auto current = policy.wait_time(attempt);
        EXPECT_GE(current, previous);
        previous = current;
    }
}

TEST_F(RetryPolicyTest, Exponential_ZeroBaseNeverWaits) {
    exponential_backoff_policy policy(0ms, 1s);
    EXPECT_EQ(policy.wait_time(1), 0ms);
    EXPECT_EQ(policy.wait_time(10), 0ms);
}

TEST_F(RetryPolicyTest, Exponential_DefaultsAreTwoSecondsAndFiveMinutes) {
    exponential_backoff_policy policy;
    EXPECT_EQ(policy.base(), 2s);
    EXPECT_EQ(policy.max_wait(), 5min);
    EXPECT_EQ(policy.name(), "exponential_backoff");
}

TEST_F(RetryPolicyTest, Fixed_AlwaysSameWait) {
    auto policy = make_fixed_wait(250ms);
    EXPECT_EQ(policy->wait_time(1), 250ms);
    EXPECT_EQ(policy->wait_time(7), 250ms);
    EXPECT_EQ(policy->name(), "fixed_wait");
}

}  // namespace kcenon::bulk_transfer::test
