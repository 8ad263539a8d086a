/**
 * @file file_share_client.cpp
 * @brief Implementation of the file share transport
 */

#include "kcenon/bulk_transfer/transport/file_share_client.h"

#include <algorithm>
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <random>
#include <vector>

#include "kcenon/bulk_transfer/core/checksum.h"
#include "kcenon/bulk_transfer/core/logging.h"

namespace kcenon::bulk_transfer {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view partial_suffix = ".btpart";

auto failure_from(const std::error_code& ec, const std::string& what) -> transfer_outcome {
    return transfer_outcome::failure(classify_filesystem_error(ec), what + ": " + ec.message(),
                                     ec.value());
}

auto errno_code() -> std::error_code {
    return std::error_code(errno != 0 ? errno : EIO, std::generic_category());
}

auto canceled_outcome() -> transfer_outcome {
    return transfer_outcome::failure(issue_attributes::canceled, "transfer canceled",
                                     static_cast<int32_t>(error_code::operation_canceled));
}

auto to_system_time(fs::file_time_type ftime) -> std::chrono::system_clock::time_point {
    return std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        ftime - fs::file_time_type::clock::now() + std::chrono::system_clock::now());
}

auto probe_suffix() -> std::string {
    static thread_local std::mt19937_64 gen{std::random_device{}()};
    return std::to_string(gen());
}

void remove_quietly(const fs::path& path) {
    std::error_code ignored;
    fs::remove(path, ignored);
}

}  // namespace

auto file_share_options::from(const client_configuration& config) -> file_share_options {
    file_share_options options;
    if (config.max_path_length > 0) {
        options.max_path_length = config.max_path_length;
    }
    options.min_data_rate_mbps = config.min_data_rate_mbps;
    options.target_data_rate_mbps = config.target_data_rate_mbps;
    return options;
}

file_share_client::file_share_client(file_share_options options)
    : options_(options), limiter_(options.min_data_rate_mbps, options.target_data_rate_mbps) {}

auto file_share_client::support_check(const cancellation_token& token) -> support_result {
    if (token.is_canceled()) {
        return {false, "canceled"};
    }
    return {true, {}};
}

auto file_share_client::connection_check(const connection_request& request,
                                         const cancellation_token& token) -> connection_result {
    connection_result result;
    if (token.is_canceled()) {
        result.attributes = issue_attributes::canceled;
        result.message = "canceled";
        return result;
    }
    if (request.target_path.empty()) {
        result.connected = true;
        return result;
    }

    fs::path target(request.target_path);
    std::error_code ec;
    fs::create_directories(target, ec);
    if (ec || !fs::is_directory(target)) {
        if (!ec) {
            ec = std::make_error_code(std::errc::not_a_directory);
        }
        result.attributes = issue_attributes::connection | classify_filesystem_error(ec);
        result.message = "target '" + request.target_path + "' is not reachable: " + ec.message();
        result.code = ec.value();
        return result;
    }

    // Probe that the share accepts writes.
    auto probe = target / (".bt-probe-" + probe_suffix());
    {
        std::ofstream out(probe, std::ios::binary | std::ios::trunc);
        if (!out) {
            ec = errno_code();
            result.attributes = issue_attributes::connection | classify_filesystem_error(ec);
            result.message = "target '" + request.target_path + "' is not writable";
            result.code = ec.value();
            return result;
        }
    }
    remove_quietly(probe);

    result.connected = true;
    return result;
}

auto file_share_client::transfer(const transfer_path& path,
                                 const transfer_options& options,
                                 const cancellation_token& token) -> transfer_outcome {
    if (token.is_canceled()) {
        return canceled_outcome();
    }

    fs::path source(path.source_path);
    fs::path target(path.target_full_path());
    std::error_code ec;

    auto source_status = fs::status(source, ec);
    if (source_status.type() == fs::file_type::not_found) {
        return transfer_outcome::failure(issue_attributes::file_not_found,
                                         "source file not found: " + path.source_path, ENOENT);
    }
    if (ec) {
        return failure_from(ec, "cannot stat " + path.source_path);
    }
    if (!fs::is_regular_file(source_status)) {
        return transfer_outcome::failure(issue_attributes::bad_path,
                                         "source is not a regular file: " + path.source_path,
                                         static_cast<int32_t>(error_code::bad_path));
    }

    if (fs::exists(target, ec)) {
        switch (options.overwrite) {
            case overwrite_policy::skip_existing:
                return transfer_outcome::skip();
            case overwrite_policy::fail_if_exists:
                return transfer_outcome::failure(
                    issue_attributes::bad_path, "target already exists: " + target.string(),
                    static_cast<int32_t>(error_code::file_exists));
            case overwrite_policy::always:
                break;
        }
    }

    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            return failure_from(ec, "cannot create " + target.parent_path().string());
        }
    }

    std::ifstream in(source, std::ios::binary);
    if (!in) {
        return failure_from(errno_code(), "cannot open " + path.source_path);
    }

    auto partial = target;
    partial += std::string(partial_suffix);
    std::ofstream out(partial, std::ios::binary | std::ios::trunc);
    if (!out) {
        return failure_from(errno_code(), "cannot create " + partial.string());
    }

    std::vector<char> buffer(std::max<std::size_t>(options.chunk_size, 4096));
    uint64_t copied = 0;

    while (in) {
        if (token.is_canceled()) {
            out.close();
            remove_quietly(partial);
            return canceled_outcome();
        }
        if (options.deadline && std::chrono::steady_clock::now() > *options.deadline) {
            out.close();
            remove_quietly(partial);
            return transfer_outcome::failure(
                issue_attributes::timeout, "transfer deadline exceeded for " + path.source_path,
                static_cast<int32_t>(error_code::operation_timeout));
        }

        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        auto count = in.gcount();
        if (count <= 0) {
            break;
        }
        if (!limiter_.acquire(static_cast<std::size_t>(count), token)) {
            out.close();
            remove_quietly(partial);
            return canceled_outcome();
        }

        out.write(buffer.data(), count);
        if (!out) {
            auto write_error = errno_code();
            out.close();
            remove_quietly(partial);
            return failure_from(write_error, "write failed for " + target.string());
        }

        copied += static_cast<uint64_t>(count);
        if (options.on_progress) {
            options.on_progress(copied);
        }
    }

    if (in.bad()) {
        auto read_error = errno_code();
        out.close();
        remove_quietly(partial);
        return failure_from(read_error, "read failed for " + path.source_path);
    }

    out.close();
    if (!out) {
        auto close_error = errno_code();
        remove_quietly(partial);
        return failure_from(close_error, "cannot finish " + partial.string());
    }

    fs::rename(partial, target, ec);
    if (ec) {
        remove_quietly(partial);
        return failure_from(ec, "cannot move " + partial.string() + " into place");
    }

    auto outcome = transfer_outcome::success(copied);

    if (options.verify_integrity) {
        auto verified = checksum::verify_same_content(source, target, token);
        if (!verified) {
            if (verified.error().code == error_code::operation_canceled) {
                return canceled_outcome();
            }
            auto failed = transfer_outcome::failure(issue_attributes::io, verified.error().message,
                                                    static_cast<int32_t>(verified.error().code));
            failed.bytes_transferred = copied;
            return failed;
        }
    }

    if (options.preserve_dates) {
        auto modified = fs::last_write_time(source, ec);
        if (!ec) {
            fs::last_write_time(target, modified, ec);
        }
        if (ec) {
            outcome.issue = transport_issue{issue_severity::warning, classify_filesystem_error(ec),
                                            "dates not preserved for " + target.string() + ": " +
                                                ec.message(),
                                            ec.value(), false};
        }
    }

    return outcome;
}

auto file_share_client::change_data_rate(uint32_t min_mbps,
                                         uint32_t target_mbps,
                                         const cancellation_token& token) -> result<void> {
    if (token.is_canceled()) {
        return make_error(error_code::operation_canceled, "data rate change canceled");
    }
    auto applied = limiter_.set_rate(min_mbps, target_mbps);
    if (applied) {
        BT_LOG_DEBUG(log_category::transport,
                     "file_share data rate set to " + std::to_string(target_mbps) + " Mbps");
    }
    return applied;
}

auto file_share_client::list_directory(const std::string& path,
                                       const std::string& page_token,
                                       std::size_t page_size,
                                       const cancellation_token& token) -> result<listing_page> {
    if (token.is_canceled()) {
        return make_error(error_code::operation_canceled, "listing canceled");
    }

    std::size_t offset = 0;
    if (!page_token.empty()) {
        try {
            offset = static_cast<std::size_t>(std::stoull(page_token));
        } catch (const std::exception&) {
            return make_error(error_code::invalid_argument, "invalid page token: " + page_token);
        }
    }

    std::error_code ec;
    fs::directory_iterator it(path, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        auto code = classify_filesystem_error(ec) == issue_attributes::file_not_found
                        ? error_code::file_not_found
                        : error_code::path_read_error;
        return make_error(code, "cannot list " + path + ": " + ec.message());
    }

    std::vector<fs::directory_entry> entries;
    for (const auto end = fs::directory_iterator(); it != end; it.increment(ec)) {
        if (ec) {
            return make_error(error_code::path_read_error,
                              "cannot list " + path + ": " + ec.message());
        }
        entries.push_back(*it);
    }
    if (ec) {
        return make_error(error_code::path_read_error, "cannot list " + path + ": " + ec.message());
    }
    std::sort(entries.begin(), entries.end(),
              [](const auto& a, const auto& b) { return a.path() < b.path(); });

    listing_page page;
    auto last = page_size == 0 ? entries.size() : std::min(entries.size(), offset + page_size);
    for (auto i = offset; i < last; ++i) {
        const auto& entry = entries[i];
        listing_node node;
        node.path = entry.path().string();

        std::error_code entry_ec;
        if (entry.is_directory(entry_ec)) {
            page.directories.push_back(std::move(node));
            continue;
        }
        if (!entry.is_regular_file(entry_ec)) {
            continue;
        }
        auto size = entry.file_size(entry_ec);
        if (!entry_ec) {
            node.size = size;
        }
        auto modified = entry.last_write_time(entry_ec);
        if (!entry_ec) {
            node.modified_time = to_system_time(modified);
        }
        page.files.push_back(std::move(node));
    }
    if (last < entries.size()) {
        page.next_page_token = std::to_string(last);
    }
    return page;
}

}  // namespace kcenon::bulk_transfer
