/**
 * @file issue.cpp
 * @brief Implementation of transfer_issue and issue_log
 */

#include "kcenon/bulk_transfer/core/issue.h"

#include <mutex>

namespace kcenon::bulk_transfer {

auto transfer_issue::make(issue_severity severity,
                          issue_attributes classification,
                          std::string message,
                          std::shared_ptr<const transfer_path> path,
                          int32_t client_code) -> transfer_issue {
    transfer_issue issue;
    issue.path = std::move(path);
    issue.message = std::move(message);
    issue.client_code = client_code;
    issue.attributes =
        (classification & ~(issue_attributes::error | issue_attributes::warning)) |
        (severity == issue_severity::error ? issue_attributes::error
                                           : issue_attributes::warning);
    if (issue.path == nullptr) {
        issue.attributes |= issue_attributes::job;
    }
    return issue;
}

auto issue_log::append(transfer_issue issue) -> result<std::size_t> {
    if (!issue.is_well_formed()) {
        return make_error(error_code::invalid_argument,
                          "issue must carry exactly one of error or warning");
    }

    std::unique_lock lock(mutex_);
    issue.index = issues_.size();
    if (issue.is_error()) {
        ++errors_;
    }
    issues_.push_back(std::move(issue));
    return issues_.back().index;
}

auto issue_log::snapshot() const -> std::vector<transfer_issue> {
    std::shared_lock lock(mutex_);
    return issues_;
}

auto issue_log::size() const -> std::size_t {
    std::shared_lock lock(mutex_);
    return issues_.size();
}

auto issue_log::error_count() const -> std::size_t {
    std::shared_lock lock(mutex_);
    return errors_;
}

auto issue_log::warning_count() const -> std::size_t {
    std::shared_lock lock(mutex_);
    return issues_.size() - errors_;
}

auto classify_filesystem_error(const std::error_code& ec) -> issue_attributes {
    if (ec == std::errc::no_such_file_or_directory) {
        return issue_attributes::file_not_found;
    }
    if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted ||
        ec == std::errc::read_only_file_system) {
        return issue_attributes::permission;
    }
    if (ec == std::errc::filename_too_long) {
        return issue_attributes::path_too_long | issue_attributes::bad_path;
    }
    if (ec == std::errc::invalid_argument || ec == std::errc::not_a_directory ||
        ec == std::errc::is_a_directory) {
        return issue_attributes::bad_path;
    }
    if (ec == std::errc::timed_out) {
        return issue_attributes::timeout;
    }
    if (ec == std::errc::host_unreachable || ec == std::errc::network_unreachable ||
        ec == std::errc::connection_reset || ec == std::errc::connection_aborted) {
        return issue_attributes::connection;
    }
    return issue_attributes::io;
}

}  // namespace kcenon::bulk_transfer
