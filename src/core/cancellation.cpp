/**
 * @file cancellation.cpp
 * @brief Implementation of cooperative cancellation primitives
 */

#include "kcenon/bulk_transfer/core/cancellation.h"

#include <atomic>
#include <condition_variable>
#include <map>
#include <mutex>
#include <thread>

namespace kcenon::bulk_transfer {

namespace detail {

struct cancellation_state {
    std::atomic<bool> canceled{false};
    bool timer_stop{false};
    std::mutex mutex;
    std::condition_variable cv;
    uint64_t next_id{1};
    std::map<uint64_t, std::function<void()>> callbacks;

    // Callback currently executing inside cancel(), 0 when none.
    uint64_t running_id{0};
    std::thread::id running_thread;

    struct running_guard {
        cancellation_state& state;
        std::unique_lock<std::mutex>& lock;

        ~running_guard() {
            lock.lock();
            state.running_id = 0;
            state.running_thread = std::thread::id{};
            state.cv.notify_all();
        }
    };

    void cancel() {
        std::unique_lock lock(mutex);
        if (canceled.exchange(true)) {
            return;
        }
        cv.notify_all();

        // Callbacks run one at a time outside the lock so they may touch
        // other tokens; reset() waits for the one in flight.
        while (!callbacks.empty()) {
            auto node = callbacks.extract(callbacks.begin());
            running_id = node.key();
            running_thread = std::this_thread::get_id();
            lock.unlock();

            running_guard guard{*this, lock};
            auto callback = std::move(node.mapped());
            if (callback) {
                callback();
            }
        }
    }

    void unregister(uint64_t id) {
        std::unique_lock lock(mutex);
        if (callbacks.erase(id) > 0) {
            return;
        }
        // A callback may unregister itself from within cancel().
        if (running_id == id && running_thread != std::this_thread::get_id()) {
            cv.wait(lock, [this, id] { return running_id != id; });
        }
    }
};

}  // namespace detail

// ============================================================================
// cancellation_token
// ============================================================================

auto cancellation_token::is_canceled() const noexcept -> bool {
    return state_ && state_->canceled.load(std::memory_order_acquire);
}

auto cancellation_token::wait_for(std::chrono::milliseconds timeout) const -> bool {
    return wait_until(std::chrono::steady_clock::now() + timeout);
}

auto cancellation_token::wait_until(std::chrono::steady_clock::time_point deadline) const
    -> bool {
    if (!state_) {
        std::this_thread::sleep_until(deadline);
        return false;
    }

    std::unique_lock lock(state_->mutex);
    return state_->cv.wait_until(lock, deadline, [this] {
        return state_->canceled.load(std::memory_order_acquire);
    });
}

auto cancellation_token::register_callback(std::function<void()> callback) const
    -> cancellation_registration {
    if (!state_ || !callback) {
        return {};
    }

    {
        std::lock_guard lock(state_->mutex);
        if (!state_->canceled.load(std::memory_order_acquire)) {
            auto id = state_->next_id++;
            state_->callbacks.emplace(id, std::move(callback));
            return cancellation_registration{state_, id};
        }
    }

    callback();
    return {};
}

// ============================================================================
// cancellation_registration
// ============================================================================

cancellation_registration::~cancellation_registration() { reset(); }

cancellation_registration::cancellation_registration(
    cancellation_registration&& other) noexcept
    : state_(std::move(other.state_)), id_(other.id_) {
    other.id_ = 0;
}

auto cancellation_registration::operator=(cancellation_registration&& other) noexcept
    -> cancellation_registration& {
    if (this != &other) {
        reset();
        state_ = std::move(other.state_);
        id_ = other.id_;
        other.id_ = 0;
    }
    return *this;
}

void cancellation_registration::reset() {
    if (id_ == 0) {
        return;
    }
    if (auto state = state_.lock()) {
        state->unregister(id_);
    }
    state_.reset();
    id_ = 0;
}

// ============================================================================
// cancellation_source
// ============================================================================

cancellation_source::cancellation_source()
    : state_(std::make_shared<detail::cancellation_state>()) {}

cancellation_source::cancellation_source(const cancellation_token& parent)
    : cancellation_source() {
    link(parent);
}

cancellation_source::~cancellation_source() {
    links_.clear();
    if (timer_.joinable()) {
        {
            std::lock_guard lock(state_->mutex);
            state_->timer_stop = true;
        }
        state_->cv.notify_all();
        timer_.join();
    }
}

cancellation_source::cancellation_source(cancellation_source&&) noexcept = default;

auto cancellation_source::operator=(cancellation_source&& other) noexcept
    -> cancellation_source& {
    if (this != &other) {
        if (timer_.joinable()) {
            {
                std::lock_guard lock(state_->mutex);
                state_->timer_stop = true;
            }
            state_->cv.notify_all();
            timer_.join();
        }
        links_ = std::move(other.links_);
        state_ = std::move(other.state_);
        timer_ = std::move(other.timer_);
    }
    return *this;
}

void cancellation_source::cancel() { state_->cancel(); }

void cancellation_source::cancel_after(std::chrono::milliseconds delay) {
    if (timer_.joinable()) {
        return;
    }

    auto state = state_;
    timer_ = std::thread([state, delay] {
        std::unique_lock lock(state->mutex);
        bool stopped = state->cv.wait_for(lock, delay, [&state] {
            return state->timer_stop || state->canceled.load(std::memory_order_acquire);
        });
        lock.unlock();
        if (!stopped) {
            state->cancel();
        }
    });
}

auto cancellation_source::is_canceled() const noexcept -> bool {
    return state_->canceled.load(std::memory_order_acquire);
}

auto cancellation_source::token() const -> cancellation_token {
    return cancellation_token{state_};
}

void cancellation_source::link(const cancellation_token& other) {
    std::weak_ptr<detail::cancellation_state> weak = state_;
    links_.push_back(other.register_callback([weak] {
        if (auto state = weak.lock()) {
            state->cancel();
        }
    }));
}

}  // namespace kcenon::bulk_transfer
