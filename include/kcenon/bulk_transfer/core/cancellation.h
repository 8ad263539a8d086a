/**
 * @file cancellation.h
 * @brief Cooperative cancellation shared by jobs, enumeration and transports
 */

#ifndef KCENON_BULK_TRANSFER_CORE_CANCELLATION_H
#define KCENON_BULK_TRANSFER_CORE_CANCELLATION_H

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <thread>
#include <vector>

namespace kcenon::bulk_transfer {

namespace detail {
struct cancellation_state;
}  // namespace detail

class cancellation_registration;

/**
 * @brief Read-only view of a cancellation signal
 *
 * A default constructed token can never be canceled. Tokens are cheap to
 * copy and can be observed from any thread.
 */
class cancellation_token {
public:
    cancellation_token() = default;

    /**
     * @brief A token that can never be canceled
     */
    [[nodiscard]] static auto none() -> cancellation_token { return {}; }

    [[nodiscard]] auto is_canceled() const noexcept -> bool;

    [[nodiscard]] auto can_be_canceled() const noexcept -> bool {
        return state_ != nullptr;
    }

    /**
     * @brief Block for at most @p timeout, returning early on cancellation
     * @return true if the token was canceled
     */
    auto wait_for(std::chrono::milliseconds timeout) const -> bool;

    /**
     * @brief Block until @p deadline, returning early on cancellation
     * @return true if the token was canceled
     */
    auto wait_until(std::chrono::steady_clock::time_point deadline) const -> bool;

    /**
     * @brief Run @p callback once when the token is canceled
     *
     * If the token is already canceled the callback runs synchronously
     * before this returns. The callback is unregistered when the returned
     * registration is destroyed.
     */
    [[nodiscard]] auto register_callback(std::function<void()> callback) const
        -> cancellation_registration;

private:
    friend class cancellation_source;
    explicit cancellation_token(std::shared_ptr<detail::cancellation_state> state)
        : state_(std::move(state)) {}

    std::shared_ptr<detail::cancellation_state> state_;
};

/**
 * @brief RAII handle for a callback registered on a token
 */
class cancellation_registration {
public:
    cancellation_registration() = default;
    ~cancellation_registration();

    cancellation_registration(const cancellation_registration&) = delete;
    auto operator=(const cancellation_registration&) -> cancellation_registration& = delete;
    cancellation_registration(cancellation_registration&& other) noexcept;
    auto operator=(cancellation_registration&& other) noexcept -> cancellation_registration&;

    void reset();

private:
    friend class cancellation_token;
    cancellation_registration(std::weak_ptr<detail::cancellation_state> state, uint64_t id)
        : state_(std::move(state)), id_(id) {}

    std::weak_ptr<detail::cancellation_state> state_;
    uint64_t id_ = 0;
};

/**
 * @brief Owner side of a cancellation signal
 *
 * @code
 * cancellation_source source;
 * auto job = transfer_job::create(request, client, policy, config, source.token());
 * ...
 * source.cancel();   // workers stop between paths
 * @endcode
 */
class cancellation_source {
public:
    cancellation_source();

    /**
     * @brief Create a source that is also canceled when @p parent is
     */
    explicit cancellation_source(const cancellation_token& parent);

    ~cancellation_source();

    cancellation_source(const cancellation_source&) = delete;
    auto operator=(const cancellation_source&) -> cancellation_source& = delete;
    cancellation_source(cancellation_source&&) noexcept;
    auto operator=(cancellation_source&&) noexcept -> cancellation_source&;

    /**
     * @brief Signal cancellation; idempotent
     */
    void cancel();

    /**
     * @brief Cancel automatically once @p delay has elapsed
     */
    void cancel_after(std::chrono::milliseconds delay);

    [[nodiscard]] auto is_canceled() const noexcept -> bool;

    [[nodiscard]] auto token() const -> cancellation_token;

    /**
     * @brief Forward cancellation of @p other into this source
     */
    void link(const cancellation_token& other);

private:
    std::shared_ptr<detail::cancellation_state> state_;
    std::vector<cancellation_registration> links_;
    std::thread timer_;
};

}  // namespace kcenon::bulk_transfer

#endif  // KCENON_BULK_TRANSFER_CORE_CANCELLATION_H
