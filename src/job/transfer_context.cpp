/**
 * @file transfer_context.cpp
 * @brief Guarded event delivery for transfer_context
 */

#include "kcenon/bulk_transfer/job/transfer_context.h"

#include "kcenon/bulk_transfer/core/logging.h"

namespace kcenon::bulk_transfer {

namespace {

template <typename Handler, typename Event>
void invoke_guarded(const Handler& handler, const Event& event, const char* name) {
    if (!handler) {
        return;
    }
    try {
        handler(event);
    } catch (const std::exception& e) {
        BT_LOG_WARN(log_category::job,
                    std::string("Handler ") + name + " threw: " + e.what());
    }
}

}  // namespace

void transfer_context::notify(const path_progress_event& event) const {
    invoke_guarded(handlers_.on_path_progress, event, "on_path_progress");
}

void transfer_context::notify(const path_issue_event& event) const {
    invoke_guarded(handlers_.on_path_issue, event, "on_path_issue");
}

void transfer_context::notify(const job_retry_event& event) const {
    invoke_guarded(handlers_.on_job_retry, event, "on_job_retry");
}

void transfer_context::notify(const job_status_event& event) const {
    invoke_guarded(handlers_.on_job_status, event, "on_job_status");
}

void transfer_context::notify(const statistics_event& event) const {
    invoke_guarded(handlers_.on_statistics, event, "on_statistics");
}

}  // namespace kcenon::bulk_transfer
