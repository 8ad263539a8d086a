/**
 * @file transfer_context.h
 * @brief Observability surface of a transfer job
 */

#ifndef KCENON_BULK_TRANSFER_JOB_TRANSFER_CONTEXT_H
#define KCENON_BULK_TRANSFER_JOB_TRANSFER_CONTEXT_H

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "kcenon/bulk_transfer/core/issue.h"
#include "kcenon/bulk_transfer/core/path_record.h"
#include "kcenon/bulk_transfer/core/statistics_aggregator.h"

namespace kcenon::bulk_transfer {

/**
 * @brief Job state
 */
enum class transfer_status {
    not_started,
    running,
    successful,
    failed,      ///< Ran to completion with at least one path error
    fatal,       ///< Stopped by an unrecoverable condition
    canceled
};

[[nodiscard]] constexpr auto to_string(transfer_status status) -> const char* {
    switch (status) {
        case transfer_status::not_started: return "not_started";
        case transfer_status::running: return "running";
        case transfer_status::successful: return "successful";
        case transfer_status::failed: return "failed";
        case transfer_status::fatal: return "fatal";
        case transfer_status::canceled: return "canceled";
        default: return "unknown";
    }
}

[[nodiscard]] constexpr auto is_terminal(transfer_status status) -> bool {
    return status != transfer_status::not_started && status != transfer_status::running;
}

/**
 * @brief Stage of a single path reported through path progress events
 */
enum class path_status {
    started,
    in_progress,
    succeeded,
    skipped,
    failed
};

[[nodiscard]] constexpr auto to_string(path_status status) -> const char* {
    switch (status) {
        case path_status::started: return "started";
        case path_status::in_progress: return "in_progress";
        case path_status::succeeded: return "succeeded";
        case path_status::skipped: return "skipped";
        case path_status::failed: return "failed";
        default: return "unknown";
    }
}

struct path_progress_event {
    std::string job_id;
    std::shared_ptr<const transfer_path> path;
    path_status status = path_status::started;
    uint64_t bytes_transferred = 0;  ///< Cumulative for this path
    uint32_t attempt = 1;
};

struct path_issue_event {
    std::string job_id;
    transfer_issue issue;
};

struct job_retry_event {
    std::string job_id;
    std::shared_ptr<const transfer_path> path;
    uint32_t attempt = 1;  ///< The attempt that is about to run
    std::chrono::milliseconds delay{0};
    transfer_issue issue;  ///< Issue that triggered the retry
};

struct job_status_event {
    std::string job_id;
    bool started = true;  ///< false for the end event
    transfer_status status = transfer_status::not_started;
};

struct statistics_event {
    std::string job_id;
    transfer_statistics statistics;
    bool is_final = false;
};

/**
 * @brief Handlers registered when a context is constructed
 *
 * Any handler may be left empty.
 */
struct transfer_handlers {
    std::function<void(const path_progress_event&)> on_path_progress;
    std::function<void(const path_issue_event&)> on_path_issue;
    std::function<void(const job_retry_event&)> on_job_retry;
    std::function<void(const job_status_event&)> on_job_status;
    std::function<void(const statistics_event&)> on_statistics;
};

/**
 * @brief Delivers typed job events to caller handlers
 *
 * Events for one path are raised by the worker that owns the path, so they
 * reach the handlers in order and never concurrently with each other.
 * Events for different paths can arrive concurrently. An exception thrown
 * by a handler is logged and does not affect the transfer.
 *
 * @code
 * auto context = std::make_shared<transfer_context>(transfer_handlers{
 *     .on_path_issue = [](const path_issue_event& e) { report(e.issue); },
 *     .on_statistics = [](const statistics_event& e) { draw(e.statistics); },
 * });
 * @endcode
 */
class transfer_context {
public:
    transfer_context() = default;
    explicit transfer_context(transfer_handlers handlers) : handlers_(std::move(handlers)) {}

    void notify(const path_progress_event& event) const;
    void notify(const path_issue_event& event) const;
    void notify(const job_retry_event& event) const;
    void notify(const job_status_event& event) const;
    void notify(const statistics_event& event) const;

    [[nodiscard]] auto wants_path_progress() const -> bool {
        return static_cast<bool>(handlers_.on_path_progress);
    }

    [[nodiscard]] auto handlers() const -> const transfer_handlers& { return handlers_; }

private:
    transfer_handlers handlers_;
};

}  // namespace kcenon::bulk_transfer

#endif  // KCENON_BULK_TRANSFER_JOB_TRANSFER_CONTEXT_H
