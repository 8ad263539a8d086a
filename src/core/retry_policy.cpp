/**
 * @file retry_policy.cpp
 * @brief Implementation of retry wait strategies
 */

#include "kcenon/bulk_transfer/core/retry_policy.h"

#include <algorithm>

namespace kcenon::bulk_transfer {

exponential_backoff_policy::exponential_backoff_policy(std::chrono::milliseconds base,
                                                       std::chrono::milliseconds max_wait)
    : base_(std::max(base, std::chrono::milliseconds::zero())),
      max_wait_(std::max(max_wait, base_)) {}

auto exponential_backoff_policy::wait_time(uint32_t attempt) const
    -> std::chrono::milliseconds {
    if (attempt == 0) {
        attempt = 1;
    }

    // Beyond 2^40 every realistic base already exceeds max_wait.
    const uint32_t exponent = std::min<uint32_t>(attempt - 1, 40);
    const auto base_ms = static_cast<uint64_t>(base_.count());
    const auto cap_ms = static_cast<uint64_t>(max_wait_.count());
    if (base_ms == 0) {
        return std::chrono::milliseconds::zero();
    }

    const uint64_t factor = uint64_t{1} << exponent;
    if (factor > cap_ms / base_ms) {
        return max_wait_;
    }
    return std::chrono::milliseconds(static_cast<int64_t>(base_ms * factor));
}

}  // namespace kcenon::bulk_transfer
