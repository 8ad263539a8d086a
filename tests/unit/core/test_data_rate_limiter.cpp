/**
 * @file test_data_rate_limiter.cpp
 * @brief Unit tests for the data rate limiter
 */

#include <gtest/gtest.h>

#include <kcenon/bulk_transfer/core/data_rate_limiter.h>

#include <chrono>
#include <thread>

namespace kcenon::bulk_transfer::test {

using namespace std::chrono_literals;

class DataRateLimiterTest : public ::testing::Test {
protected:
    static constexpr std::size_t KB = 1000;
};

TEST_F(DataRateLimiterTest, MbpsConversion) {
    EXPECT_EQ(mbps_to_bytes_per_second(8), 1'000'000u);
    EXPECT_EQ(mbps_to_bytes_per_second(0), 0u);
}

TEST_F(DataRateLimiterTest, Default_IsUnlimited) {
    data_rate_limiter limiter;
    EXPECT_FALSE(limiter.is_enabled());

    auto start = std::chrono::steady_clock::now();
    EXPECT_TRUE(limiter.acquire(100 * 1000 * KB, {}));
    EXPECT_LT(std::chrono::steady_clock::now() - start, 100ms);
}

TEST_F(DataRateLimiterTest, Construction_StoresRates) {
    data_rate_limiter limiter(2, 8);
    EXPECT_TRUE(limiter.is_enabled());
    EXPECT_EQ(limiter.min_mbps(), 2u);
    EXPECT_EQ(limiter.target_mbps(), 8u);
}

TEST_F(DataRateLimiterTest, Construction_InvalidFloorKeepsCap) {
    data_rate_limiter limiter(10, 5);
    EXPECT_EQ(limiter.min_mbps(), 0u);
    EXPECT_EQ(limiter.target_mbps(), 5u);
}

TEST_F(DataRateLimiterTest, SetRate_RejectsFloorAboveTarget) {
    data_rate_limiter limiter;
    auto changed = limiter.set_rate(20, 10);
    ASSERT_FALSE(changed.has_value());
    EXPECT_EQ(changed.error().code, error_code::invalid_argument);
    EXPECT_FALSE(limiter.is_enabled());
}

TEST_F(DataRateLimiterTest, SetRate_ZeroTargetDisables) {
    data_rate_limiter limiter(0, 8);
    ASSERT_TRUE(limiter.set_rate(0, 0).has_value());
    EXPECT_FALSE(limiter.is_enabled());
}

TEST_F(DataRateLimiterTest, Acquire_ThrottlesToTarget) {
    // 8 Mbps = 1,000,000 bytes per second
    data_rate_limiter limiter(0, 8);

    // Drain the initial bucket, then ask for half a second's worth.
    ASSERT_TRUE(limiter.acquire(1000 * KB, {}));
    auto start = std::chrono::steady_clock::now();
    ASSERT_TRUE(limiter.acquire(500 * KB, {}));
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_GE(elapsed, 350ms);
    EXPECT_LT(elapsed, 2s);
}

TEST_F(DataRateLimiterTest, Acquire_ReturnsFalseWhenCanceled) {
    data_rate_limiter limiter(0, 1);
    ASSERT_TRUE(limiter.acquire(125 * KB, {}));

    cancellation_source source;
    std::thread canceler([&] {
        std::this_thread::sleep_for(30ms);
        source.cancel();
    });

    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(limiter.acquire(125 * KB, source.token()));
    EXPECT_LT(std::chrono::steady_clock::now() - start, 900ms);
    canceler.join();
}

TEST_F(DataRateLimiterTest, SetRate_WakesWaiters) {
    data_rate_limiter limiter(0, 1);
    ASSERT_TRUE(limiter.acquire(125 * KB, {}));

    std::thread raiser([&] {
        std::this_thread::sleep_for(30ms);
        (void)limiter.set_rate(0, 0);
    });

    auto start = std::chrono::steady_clock::now();
    EXPECT_TRUE(limiter.acquire(125 * KB, {}));
    EXPECT_LT(std::chrono::steady_clock::now() - start, 900ms);
    raiser.join();
}

}  // namespace kcenon::bulk_transfer::test
