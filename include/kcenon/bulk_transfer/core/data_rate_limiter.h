/**
 * @file data_rate_limiter.h
 * @brief Token bucket that applies min/target data-rate hints
 */

#ifndef KCENON_BULK_TRANSFER_CORE_DATA_RATE_LIMITER_H
#define KCENON_BULK_TRANSFER_CORE_DATA_RATE_LIMITER_H

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>

#include "cancellation.h"
#include "types.h"

namespace kcenon::bulk_transfer {

/**
 * @brief Convert megabits per second to bytes per second
 */
[[nodiscard]] constexpr auto mbps_to_bytes_per_second(uint32_t mbps) -> uint64_t {
    return static_cast<uint64_t>(mbps) * 1'000'000 / 8;
}

/**
 * @brief Shared throttle for all transfers issued by one transport client
 *
 * The target rate caps throughput; 0 disables throttling. The minimum rate
 * is an advisory floor reported to transports that can negotiate it and is
 * never enforced here. The bucket holds one second worth of tokens so short
 * bursts are allowed.
 *
 * @code
 * data_rate_limiter limiter;
 * limiter.set_rate(0, 100);            // 100 Mbps
 * if (!limiter.acquire(chunk, token)) {
 *     return;                          // canceled while throttled
 * }
 * @endcode
 */
class data_rate_limiter {
public:
    data_rate_limiter() = default;
    data_rate_limiter(uint32_t min_mbps, uint32_t target_mbps);

    data_rate_limiter(const data_rate_limiter&) = delete;
    auto operator=(const data_rate_limiter&) -> data_rate_limiter& = delete;

    /**
     * @brief Change the rate hints at runtime
     * @return invalid_argument when a non-zero target is below the minimum
     */
    [[nodiscard]] auto set_rate(uint32_t min_mbps, uint32_t target_mbps) -> result<void>;

    /**
     * @brief Take @p bytes tokens, blocking while the bucket is empty
     * @return false if @p token was canceled while waiting
     */
    [[nodiscard]] auto acquire(std::size_t bytes, const cancellation_token& token) -> bool;

    [[nodiscard]] auto min_mbps() const -> uint32_t;
    [[nodiscard]] auto target_mbps() const -> uint32_t;
    [[nodiscard]] auto is_enabled() const -> bool;

private:
    void refill_locked();

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    uint32_t min_mbps_ = 0;
    uint32_t target_mbps_ = 0;
    double tokens_ = 0.0;
    double capacity_ = 0.0;
    std::chrono::steady_clock::time_point last_refill_ = std::chrono::steady_clock::now();
};

}  // namespace kcenon::bulk_transfer

#endif  // KCENON_BULK_TRANSFER_CORE_DATA_RATE_LIMITER_H
