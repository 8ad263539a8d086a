/**
 * @file path_queue.cpp
 * @brief Implementation of the job work queue
 */

#include "kcenon/bulk_transfer/job/path_queue.h"

#include <algorithm>

namespace kcenon::bulk_transfer {

namespace {
constexpr auto cancel_poll_interval = std::chrono::milliseconds(50);
}  // namespace

path_queue::path_queue(std::size_t capacity) : capacity_(std::max<std::size_t>(capacity, 1)) {}

auto path_queue::push(queued_path entry,
                      const cancellation_token& token,
                      std::chrono::milliseconds max_wait) -> result<void> {
    auto deadline = clock::now() + max_wait;

    std::unique_lock lock(mutex_);
    while (true) {
        if (aborted_ || token.is_canceled()) {
            return make_error(error_code::operation_canceled, "path was not queued");
        }
        if (closed_) {
            return make_error(error_code::invalid_state, "queue is closed");
        }
        if (ready_.size() < capacity_) {
            break;
        }
        auto now = clock::now();
        if (now >= deadline) {
            return make_error(error_code::queue_full,
                              "no queue capacity after " + std::to_string(max_wait.count()) +
                                  "ms");
        }
        space_cv_.wait_until(lock, std::min(deadline, now + cancel_poll_interval));
    }

    ready_.push_back(std::move(entry));
    ready_cv_.notify_one();
    return {};
}

auto path_queue::push_unbounded(queued_path entry) -> result<void> {
    std::lock_guard lock(mutex_);
    if (aborted_) {
        return make_error(error_code::operation_canceled, "path was not queued");
    }
    if (closed_) {
        return make_error(error_code::invalid_state, "queue is closed");
    }
    ready_.push_back(std::move(entry));
    ready_cv_.notify_one();
    return {};
}

void path_queue::push_delayed(queued_path entry, clock::time_point ready_at) {
    std::lock_guard lock(mutex_);
    if (aborted_) {
        return;
    }
    delayed_.emplace(ready_at, std::move(entry));
    ready_cv_.notify_one();
}

void path_queue::promote_due_locked(clock::time_point now) {
    while (!delayed_.empty() && delayed_.begin()->first <= now) {
        ready_.push_back(std::move(delayed_.begin()->second));
        delayed_.erase(delayed_.begin());
    }
}

auto path_queue::idle_locked() const -> bool {
    if (in_flight_ > 0) {
        return false;
    }
    return aborted_ || (closed_ && ready_.empty() && delayed_.empty());
}

auto path_queue::pop() -> std::optional<queued_path> {
    std::unique_lock lock(mutex_);
    while (true) {
        if (aborted_) {
            return std::nullopt;
        }
        promote_due_locked(clock::now());
        if (!ready_.empty()) {
            auto entry = std::move(ready_.front());
            ready_.pop_front();
            ++in_flight_;
            space_cv_.notify_one();
            return entry;
        }
        if (closed_ && delayed_.empty() && in_flight_ == 0) {
            return std::nullopt;
        }
        if (!delayed_.empty()) {
            ready_cv_.wait_until(lock, delayed_.begin()->first);
        } else {
            ready_cv_.wait(lock);
        }
    }
}

void path_queue::task_done() {
    std::lock_guard lock(mutex_);
    if (in_flight_ > 0) {
        --in_flight_;
    }
    if (idle_locked()) {
        idle_cv_.notify_all();
        // Workers parked in pop() can exit now
        ready_cv_.notify_all();
    }
}

void path_queue::close() {
    std::lock_guard lock(mutex_);
    closed_ = true;
    ready_cv_.notify_all();
    space_cv_.notify_all();
    if (idle_locked()) {
        idle_cv_.notify_all();
    }
}

auto path_queue::abort() -> std::size_t {
    std::lock_guard lock(mutex_);
    auto dropped = ready_.size() + delayed_.size();
    ready_.clear();
    delayed_.clear();
    aborted_ = true;
    ready_cv_.notify_all();
    space_cv_.notify_all();
    if (idle_locked()) {
        idle_cv_.notify_all();
    }
    return dropped;
}

auto path_queue::wait_idle(std::optional<clock::time_point> deadline) -> bool {
    std::unique_lock lock(mutex_);
    if (deadline) {
        return idle_cv_.wait_until(lock, *deadline, [this] { return idle_locked(); });
    }
    idle_cv_.wait(lock, [this] { return idle_locked(); });
    return true;
}

auto path_queue::size() const -> std::size_t {
    std::lock_guard lock(mutex_);
    return ready_.size() + delayed_.size();
}

auto path_queue::delayed_count() const -> std::size_t {
    std::lock_guard lock(mutex_);
    return delayed_.size();
}

auto path_queue::in_flight() const -> std::size_t {
    std::lock_guard lock(mutex_);
    return in_flight_;
}

auto path_queue::is_closed() const -> bool {
    std::lock_guard lock(mutex_);
    return closed_;
}

auto path_queue::is_aborted() const -> bool {
    std::lock_guard lock(mutex_);
    return aborted_;
}

}  // namespace kcenon::bulk_transfer
