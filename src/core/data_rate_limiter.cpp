/**
 * @file data_rate_limiter.cpp
 * @brief Token bucket throttling driven by data-rate hints
 */

#include "kcenon/bulk_transfer/core/data_rate_limiter.h"

#include <algorithm>

namespace kcenon::bulk_transfer {

namespace {

// Waits are sliced so cancellation is noticed without a callback.
constexpr auto max_wait_slice = std::chrono::milliseconds(50);

}  // namespace

data_rate_limiter::data_rate_limiter(uint32_t min_mbps, uint32_t target_mbps) {
    auto applied = set_rate(min_mbps, target_mbps);
    if (!applied) {
        // Reject the floor but keep the cap, the safer of the two.
        min_mbps_ = 0;
        (void)set_rate(0, target_mbps);
    }
}

auto data_rate_limiter::set_rate(uint32_t min_mbps, uint32_t target_mbps) -> result<void> {
    if (target_mbps != 0 && min_mbps > target_mbps) {
        return make_error(error_code::invalid_argument,
                          "minimum data rate exceeds target data rate");
    }

    {
        std::lock_guard lock(mutex_);
        refill_locked();
        min_mbps_ = min_mbps;
        auto old_capacity = capacity_;
        target_mbps_ = target_mbps;
        capacity_ = static_cast<double>(mbps_to_bytes_per_second(target_mbps));

        if (capacity_ > 0.0 && old_capacity > 0.0) {
            tokens_ = std::min(tokens_ * capacity_ / old_capacity, capacity_);
        } else {
            tokens_ = capacity_;
        }
        last_refill_ = std::chrono::steady_clock::now();
    }
    cv_.notify_all();
    return {};
}

auto data_rate_limiter::acquire(std::size_t bytes, const cancellation_token& token) -> bool {
    if (bytes == 0) {
        return !token.is_canceled();
    }

    std::unique_lock lock(mutex_);
    while (true) {
        if (token.is_canceled()) {
            return false;
        }
        if (capacity_ <= 0.0) {
            return true;
        }

        refill_locked();
        // Requests larger than the bucket are admitted once it is full.
        auto needed = std::min(static_cast<double>(bytes), capacity_);
        if (tokens_ >= needed) {
            tokens_ -= static_cast<double>(bytes);
            return true;
        }

        auto deficit = needed - tokens_;
        auto wait = std::chrono::microseconds(
            static_cast<int64_t>(deficit / capacity_ * 1'000'000.0) + 1);
        cv_.wait_for(lock, std::min<std::chrono::microseconds>(wait, max_wait_slice));
    }
}

auto data_rate_limiter::min_mbps() const -> uint32_t {
    std::lock_guard lock(mutex_);
    return min_mbps_;
}

auto data_rate_limiter::target_mbps() const -> uint32_t {
    std::lock_guard lock(mutex_);
    return target_mbps_;
}

auto data_rate_limiter::is_enabled() const -> bool {
    std::lock_guard lock(mutex_);
    return capacity_ > 0.0;
}

void data_rate_limiter::refill_locked() {
    auto now = std::chrono::steady_clock::now();
    if (capacity_ > 0.0) {
        auto elapsed = std::chrono::duration<double>(now - last_refill_).count();
        tokens_ = std::min(tokens_ + elapsed * capacity_, capacity_);
    }
    last_refill_ = now;
}

}  // namespace kcenon::bulk_transfer
