/**
 * @file statistics_aggregator.cpp
 * @brief Implementation of job statistics aggregation
 */

#include "kcenon/bulk_transfer/core/statistics_aggregator.h"

#include <algorithm>
#include <deque>
#include <mutex>

namespace kcenon::bulk_transfer {

using steady_time = std::chrono::steady_clock::time_point;

/**
 * @brief Rate sample for the sliding window
 */
struct rate_sample {
    steady_time timestamp;
    uint64_t bytes_moved;
    uint64_t completed_files;
};

struct statistics_aggregator::impl {
    config cfg;

    mutable std::mutex mutex;
    bool active = false;
    bool started = false;
    steady_time start_time{};
    steady_time stop_time{};

    transfer_statistics counters;
    uint64_t precalculated_files = 0;
    uint64_t precalculated_bytes = 0;
    uint64_t unknown_size_files = 0;
    uint64_t processed_bytes = 0;
    uint64_t bytes_moved = 0;

    // Monotonic floor for progress within the current attempt
    mutable double progress_floor = 0.0;

    mutable std::deque<rate_sample> samples;

    impl() : cfg{} {}
    explicit impl(config c) : cfg(c) {
        if (cfg.rate_window_size < 2) {
            cfg.rate_window_size = 2;
        }
    }

    [[nodiscard]] auto now_or_stop() const -> steady_time {
        return active ? std::chrono::steady_clock::now() : stop_time;
    }

    void sample_locked(bool force) const {
        if (!started) {
            return;
        }
        auto now = now_or_stop();
        if (!force && !samples.empty() &&
            now - samples.back().timestamp < cfg.rate_sample_interval) {
            return;
        }
        if (!samples.empty() && samples.back().timestamp == now) {
            samples.back().bytes_moved = bytes_moved;
            samples.back().completed_files = counters.completed_files();
            return;
        }
        samples.push_back({now, bytes_moved, counters.completed_files()});
        while (samples.size() > cfg.rate_window_size) {
            samples.pop_front();
        }
    }

    [[nodiscard]] auto total_files() const -> uint64_t {
        return std::max(precalculated_files, counters.total_requested_files);
    }

    [[nodiscard]] auto total_bytes() const -> uint64_t {
        if (precalculated_bytes > 0) {
            return std::max(precalculated_bytes, counters.total_requested_bytes);
        }
        return counters.total_requested_bytes;
    }

    [[nodiscard]] auto byte_based() const -> bool {
        if (precalculated_bytes > 0) {
            return true;
        }
        return unknown_size_files == 0 && counters.total_requested_bytes > 0;
    }

    [[nodiscard]] auto raw_progress() const -> double {
        double value = 0.0;
        if (byte_based()) {
            value = static_cast<double>(processed_bytes) /
                    static_cast<double>(total_bytes()) * 100.0;
        } else if (total_files() > 0) {
            value = static_cast<double>(counters.completed_files()) /
                    static_cast<double>(total_files()) * 100.0;
        }
        return std::clamp(value, 0.0, 100.0);
    }

    void record_failure_locked(uint64_t bytes) {
        ++counters.total_failed_files;
        ++counters.attempt_failed_files;
        processed_bytes += bytes;
    }
};

statistics_aggregator::statistics_aggregator() : impl_(std::make_unique<impl>()) {}

statistics_aggregator::statistics_aggregator(config cfg)
    : impl_(std::make_unique<impl>(cfg)) {}

statistics_aggregator::statistics_aggregator(statistics_aggregator&&) noexcept = default;
auto statistics_aggregator::operator=(statistics_aggregator&&) noexcept
    -> statistics_aggregator& = default;
statistics_aggregator::~statistics_aggregator() = default;

void statistics_aggregator::start() {
    std::lock_guard lock(impl_->mutex);
    if (impl_->started) {
        impl_->active = true;
        return;
    }
    impl_->started = true;
    impl_->active = true;
    impl_->start_time = std::chrono::steady_clock::now();
    impl_->samples.clear();
    impl_->samples.push_back({impl_->start_time, impl_->bytes_moved,
                              impl_->counters.completed_files()});
}

void statistics_aggregator::stop() {
    std::lock_guard lock(impl_->mutex);
    if (!impl_->active) {
        return;
    }
    impl_->sample_locked(true);
    impl_->active = false;
    impl_->stop_time = std::chrono::steady_clock::now();
}

auto statistics_aggregator::is_active() const -> bool {
    std::lock_guard lock(impl_->mutex);
    return impl_->active;
}

void statistics_aggregator::set_precalculated_totals(uint64_t files, uint64_t bytes) {
    std::lock_guard lock(impl_->mutex);
    impl_->precalculated_files = files;
    impl_->precalculated_bytes = bytes;
}

void statistics_aggregator::add_expected(std::optional<uint64_t> bytes) {
    std::lock_guard lock(impl_->mutex);
    ++impl_->counters.total_requested_files;
    if (bytes) {
        impl_->counters.total_requested_bytes += *bytes;
    } else {
        ++impl_->unknown_size_files;
    }
}

void statistics_aggregator::remove_expected(std::optional<uint64_t> bytes) {
    std::lock_guard lock(impl_->mutex);
    if (impl_->counters.total_requested_files > 0) {
        --impl_->counters.total_requested_files;
    }
    if (bytes) {
        impl_->counters.total_requested_bytes -=
            std::min(*bytes, impl_->counters.total_requested_bytes);
    } else if (impl_->unknown_size_files > 0) {
        --impl_->unknown_size_files;
    }
}

void statistics_aggregator::record_success(uint64_t bytes) {
    std::lock_guard lock(impl_->mutex);
    ++impl_->counters.total_transferred_files;
    ++impl_->counters.attempt_transferred_files;
    impl_->counters.total_transferred_bytes += bytes;
    impl_->counters.attempt_transferred_bytes += bytes;
    impl_->processed_bytes += bytes;
    impl_->sample_locked(false);
}

void statistics_aggregator::record_failure(const transfer_issue& issue) {
    uint64_t bytes = 0;
    if (issue.path && issue.path->bytes) {
        bytes = *issue.path->bytes;
    }

    std::lock_guard lock(impl_->mutex);
    impl_->record_failure_locked(bytes);
    if (has_flag(issue.attributes, issue_attributes::file_not_found)) {
        ++impl_->counters.total_files_not_found;
    }
    if (has_flag(issue.attributes, issue_attributes::bad_path)) {
        ++impl_->counters.total_bad_path_errors;
    }
    impl_->sample_locked(false);
}

void statistics_aggregator::record_not_found(uint64_t expected_bytes) {
    std::lock_guard lock(impl_->mutex);
    impl_->record_failure_locked(expected_bytes);
    ++impl_->counters.total_files_not_found;
    impl_->sample_locked(false);
}

void statistics_aggregator::record_skipped(uint64_t expected_bytes) {
    std::lock_guard lock(impl_->mutex);
    ++impl_->counters.total_skipped_files;
    impl_->processed_bytes += expected_bytes;
    impl_->sample_locked(false);
}

void statistics_aggregator::record_bytes_moved(uint64_t bytes) {
    std::lock_guard lock(impl_->mutex);
    impl_->bytes_moved += bytes;
    impl_->sample_locked(false);
}

void statistics_aggregator::record_retry() {
    std::lock_guard lock(impl_->mutex);
    ++impl_->counters.retry_count;
}

void statistics_aggregator::begin_attempt(uint32_t attempt) {
    std::lock_guard lock(impl_->mutex);
    if (attempt <= impl_->counters.attempt) {
        return;
    }
    impl_->counters.attempt = attempt;
    impl_->counters.attempt_transferred_files = 0;
    impl_->counters.attempt_transferred_bytes = 0;
    impl_->counters.attempt_failed_files = 0;
    impl_->progress_floor = 0.0;
}

auto statistics_aggregator::attempt() const -> uint32_t {
    std::lock_guard lock(impl_->mutex);
    return impl_->counters.attempt;
}

auto statistics_aggregator::snapshot() const -> transfer_statistics {
    std::lock_guard lock(impl_->mutex);
    impl_->sample_locked(false);

    transfer_statistics snap = impl_->counters;
    snap.total_requested_files = impl_->total_files();
    snap.total_requested_bytes = impl_->total_bytes();
    snap.byte_based_progress = impl_->byte_based();

    impl_->progress_floor = std::max(impl_->progress_floor, impl_->raw_progress());
    snap.progress = impl_->progress_floor;

    if (!impl_->started) {
        return snap;
    }

    auto now = impl_->now_or_stop();
    snap.elapsed = std::chrono::duration_cast<duration>(now - impl_->start_time);

    if (snap.elapsed.count() > 0) {
        snap.average_rate = static_cast<double>(impl_->bytes_moved) * 1000.0 /
                            static_cast<double>(snap.elapsed.count());
    }

    double file_rate = 0.0;
    const auto& samples = impl_->samples;
    if (samples.size() >= 2) {
        const auto& oldest = samples.front();
        const auto& newest = samples.back();
        auto window_ms = std::chrono::duration_cast<duration>(
            newest.timestamp - oldest.timestamp).count();
        if (window_ms > 0) {
            snap.transfer_rate = static_cast<double>(newest.bytes_moved - oldest.bytes_moved) *
                                 1000.0 / static_cast<double>(window_ms);
            file_rate = static_cast<double>(newest.completed_files - oldest.completed_files) *
                        1000.0 / static_cast<double>(window_ms);
        }
    }

    // ETA is indeterminate until the amount of work and a rate are known.
    if (snap.byte_based_progress) {
        auto total = impl_->total_bytes();
        if (impl_->processed_bytes >= total) {
            snap.remaining_time = duration{0};
        } else if (snap.transfer_rate > 0.0) {
            auto remaining = static_cast<double>(total - impl_->processed_bytes);
            snap.remaining_time =
                duration{static_cast<int64_t>(remaining * 1000.0 / snap.transfer_rate)};
        }
    } else if (snap.total_requested_files > 0) {
        auto done = snap.completed_files();
        if (done >= snap.total_requested_files) {
            snap.remaining_time = duration{0};
        } else if (file_rate > 0.0) {
            auto remaining = static_cast<double>(snap.total_requested_files - done);
            snap.remaining_time = duration{static_cast<int64_t>(remaining * 1000.0 / file_rate)};
        }
    }

    return snap;
}

}  // namespace kcenon::bulk_transfer
