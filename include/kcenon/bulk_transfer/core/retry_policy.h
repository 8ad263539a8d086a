/**
 * @file retry_policy.h
 * @brief Wait-time strategies between retry attempts
 */

#ifndef KCENON_BULK_TRANSFER_CORE_RETRY_POLICY_H
#define KCENON_BULK_TRANSFER_CORE_RETRY_POLICY_H

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace kcenon::bulk_transfer {

/**
 * @brief Maps a 1-based attempt number to the wait before that retry
 *
 * Purely advisory timing. Whether a failed path is retried at all is
 * decided by the job from the issue classification.
 */
class retry_policy {
public:
    virtual ~retry_policy() = default;

    /**
     * @brief Wait before retrying after failed attempt @p attempt
     * @param attempt 1-based attempt number; 0 is treated as 1
     */
    [[nodiscard]] virtual auto wait_time(uint32_t attempt) const -> std::chrono::milliseconds = 0;

    [[nodiscard]] virtual auto name() const -> std::string = 0;
};

/**
 * @brief wait = base * 2^(attempt - 1), capped at max_wait
 */
class exponential_backoff_policy final : public retry_policy {
public:
    explicit exponential_backoff_policy(
        std::chrono::milliseconds base = std::chrono::seconds(2),
        std::chrono::milliseconds max_wait = std::chrono::minutes(5));

    [[nodiscard]] auto wait_time(uint32_t attempt) const -> std::chrono::milliseconds override;
    [[nodiscard]] auto name() const -> std::string override { return "exponential_backoff"; }

    [[nodiscard]] auto base() const -> std::chrono::milliseconds { return base_; }
    [[nodiscard]] auto max_wait() const -> std::chrono::milliseconds { return max_wait_; }

private:
    std::chrono::milliseconds base_;
    std::chrono::milliseconds max_wait_;
};

/**
 * @brief Same wait for every attempt
 */
class fixed_wait_policy final : public retry_policy {
public:
    explicit fixed_wait_policy(std::chrono::milliseconds wait = std::chrono::seconds(2))
        : wait_(wait) {}

    [[nodiscard]] auto wait_time(uint32_t) const -> std::chrono::milliseconds override {
        return wait_;
    }
    [[nodiscard]] auto name() const -> std::string override { return "fixed_wait"; }

private:
    std::chrono::milliseconds wait_;
};

[[nodiscard]] inline auto make_exponential_backoff(
    std::chrono::milliseconds base,
    std::chrono::milliseconds max_wait = std::chrono::minutes(5))
    -> std::shared_ptr<const retry_policy> {
    return std::make_shared<exponential_backoff_policy>(base, max_wait);
}

[[nodiscard]] inline auto make_fixed_wait(std::chrono::milliseconds wait)
    -> std::shared_ptr<const retry_policy> {
    return std::make_shared<fixed_wait_policy>(wait);
}

}  // namespace kcenon::bulk_transfer

#endif  // KCENON_BULK_TRANSFER_CORE_RETRY_POLICY_H
