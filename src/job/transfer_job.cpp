/**
 * @file transfer_job.cpp
 * @brief Implementation of the transfer job orchestrator
 */

#include "kcenon/bulk_transfer/job/transfer_job.h"

#include <atomic>
#include <future>
#include <mutex>
#include <sstream>

#include "kcenon/bulk_transfer/adapters/thread_pool_adapter.h"
#include "kcenon/bulk_transfer/core/logging.h"
#include "kcenon/bulk_transfer/job/path_queue.h"

namespace kcenon::bulk_transfer {

namespace {

// Job whose worker loop runs on the current thread, if any.
thread_local const void* active_job = nullptr;

/**
 * @brief Reports a popped path back to the queue on every exit
 */
class task_scope {
public:
    explicit task_scope(path_queue& queue) : queue_(queue) {}
    ~task_scope() { queue_.task_done(); }

    task_scope(const task_scope&) = delete;
    auto operator=(const task_scope&) -> task_scope& = delete;

private:
    path_queue& queue_;
};

auto to_mbps(double bytes_per_second) -> double {
    return bytes_per_second * 8.0 / 1'000'000.0;
}

}  // namespace

struct transfer_job::impl {
    transfer_request request;
    path_defaults defaults;
    std::shared_ptr<transport_client> client;
    std::string transport_id;
    std::shared_ptr<const retry_policy> policy;
    client_configuration config;
    std::size_t max_path_length = 0;

    cancellation_source source;
    cancellation_source ticker_stop;
    cancellation_registration abort_on_cancel;

    path_queue queue;
    statistics_aggregator stats;
    issue_log issues;

    std::shared_ptr<adapters::worker_pool_interface> pool;
    std::vector<std::future<void>> futures;

    mutable std::mutex state_mutex;
    std::mutex transport_mutex;
    std::atomic<transfer_status> status{transfer_status::not_started};
    std::atomic<bool> disposed{false};
    std::atomic<bool> fatal{false};
    bool started = false;
    bool complete_in_progress = false;
    bool complete_consumed = false;
    std::optional<transfer_issue> fatal_issue;

    impl(transfer_request req,
         std::shared_ptr<transport_client> transport,
         std::shared_ptr<const retry_policy> retry,
         client_configuration cfg,
         const cancellation_token& token)
        : request(std::move(req)),
          defaults(request.defaults()),
          client(std::move(transport)),
          transport_id(client->id()),
          policy(std::move(retry)),
          config(std::move(cfg)),
          source(token),
          queue(config.max_queued_paths),
          stats(statistics_aggregator::config{config.statistics_window_size,
                                              std::chrono::milliseconds(100)}) {
        max_path_length =
            config.max_path_length > 0 ? config.max_path_length : client->max_path_length();
        abort_on_cancel = source.token().register_callback([this] { queue.abort(); });
    }

    [[nodiscard]] auto job_id() const -> const std::string& { return request.client_request_id; }

    [[nodiscard]] auto log_context(const transfer_path* path) const -> transfer_log_context {
        transfer_log_context ctx;
        ctx.job_id = job_id();
        ctx.transport = transport_id;
        if (path) {
            ctx.path = path->source_path;
            ctx.target = path->target_full_path();
        } else {
            ctx.path = request.target_path;
        }
        return ctx;
    }

    template <typename Event>
    void notify(const Event& event) const {
        if (request.context) {
            request.context->notify(event);
        }
    }

    void notify_path(const queued_path& entry, path_status state, uint64_t bytes) const {
        if (!request.context || !request.context->wants_path_progress()) {
            return;
        }
        request.context->notify(
            path_progress_event{job_id(), entry.path, state, bytes, entry.attempt});
    }

    // ------------------------------------------------------------------
    // Lifecycle
    // ------------------------------------------------------------------

    void ensure_started() {
        {
            std::lock_guard lock(state_mutex);
            if (started || disposed.load()) {
                return;
            }
            started = true;
        }

        auto expected = transfer_status::not_started;
        status.compare_exchange_strong(expected, transfer_status::running);
        stats.start();

        notify(job_status_event{job_id(), true, transfer_status::running});
        auto ctx = log_context(nullptr);
        BT_LOG_INFO_CTX(log_category::job,
                        std::string("Transfer job started (") + to_string(request.direction) +
                            ", parallelism " + std::to_string(config.max_job_parallelism) + ")",
                        ctx);

        if (source.is_canceled()) {
            return;
        }

        connection_result connection;
        try {
            connection = client->connection_check(
                connection_request{request.direction, request.target_path}, source.token());
        } catch (const std::exception& e) {
            connection.connected = false;
            connection.message = e.what();
            connection.code = static_cast<int32_t>(error_code::connection_failed);
        }

        if (!connection.connected) {
            if (source.is_canceled()) {
                return;
            }
            auto attributes = connection.attributes == issue_attributes::none
                                  ? issue_attributes::connection
                                  : connection.attributes;
            fail_fatal(transfer_issue::make(issue_severity::error, attributes,
                                            "connection check failed: " + connection.message,
                                            nullptr, connection.code));
            return;
        }

        std::lock_guard lock(state_mutex);
        if (disposed.load()) {
            return;
        }
        pool = adapters::worker_pool_factory::create(config.max_job_parallelism + 1,
                                                     "bulk_transfer_job");
        for (std::size_t i = 0; i < config.max_job_parallelism; ++i) {
            futures.push_back(pool->submit_to_stage([this] { worker_loop(); }, "transfer"));
        }
        futures.push_back(pool->submit_to_stage([this] { ticker_loop(); }, "statistics"));
    }

    void wait_workers() {
        std::vector<std::future<void>> pending;
        {
            std::lock_guard lock(state_mutex);
            pending.swap(futures);
        }
        for (auto& future : pending) {
            if (!future.valid()) {
                continue;
            }
            try {
                future.get();
            } catch (const std::exception& e) {
                BT_LOG_ERROR(log_category::job, std::string("Job worker failed: ") + e.what());
            }
        }
    }

    void release_pool() {
        std::shared_ptr<adapters::worker_pool_interface> released;
        {
            std::lock_guard lock(state_mutex);
            released.swap(pool);
        }
        if (released) {
            released->shutdown();
        }
    }

    void fail_fatal(transfer_issue issue) {
        {
            std::lock_guard lock(state_mutex);
            if (fatal_issue) {
                return;
            }
            fatal_issue = issue;
        }
        fatal.store(true);

        auto index = issues.append(issue);
        if (index) {
            issue.index = index.value();
        }
        notify(path_issue_event{job_id(), issue});

        auto ctx = log_context(issue.path.get());
        ctx.error_message = issue.message;
        BT_LOG_ERROR_CTX(log_category::job, "Transfer job aborted by a fatal condition", ctx);

        auto dropped = queue.abort();
        if (dropped > 0) {
            BT_LOG_DEBUG(log_category::job,
                         std::to_string(dropped) + " queued paths dropped after fatal condition");
        }
        source.cancel();
    }

    // ------------------------------------------------------------------
    // Workers
    // ------------------------------------------------------------------

    void ticker_loop() {
        auto stop = ticker_stop.token();
        while (!stop.wait_for(config.statistics_rate)) {
            emit_statistics(false);
        }
    }

    void emit_statistics(bool final) {
        auto snap = stats.snapshot();
        notify(statistics_event{job_id(), snap, final});

        if (config.statistics_log_enabled) {
            auto ctx = log_context(nullptr);
            ctx.files = snap.completed_files();
            ctx.bytes = snap.total_transferred_bytes;
            ctx.progress_percent = snap.progress;
            ctx.rate_mbps = snap.transfer_rate_mbps();
            ctx.attempt = snap.attempt;
            ctx.duration_ms = static_cast<uint64_t>(snap.elapsed.count());
            BT_LOG_INFO_CTX(log_category::statistics,
                            final ? "Final statistics" : "Statistics", ctx);
        }
    }

    void worker_loop() {
        active_job = this;
        while (auto entry = queue.pop()) {
            task_scope scope(queue);
            process(*entry);
        }
        active_job = nullptr;
    }

    auto make_options() const -> transfer_options {
        transfer_options options;
        if (config.transfer_timeout.count() > 0) {
            options.deadline = std::chrono::steady_clock::now() + config.transfer_timeout;
        }
        options.chunk_size = config.chunk_size;
        options.overwrite = config.overwrite;
        options.preserve_dates = config.preserve_dates;
        options.verify_integrity = config.verify_integrity;
        return options;
    }

    auto invoke_transport(const transfer_path& path,
                          const transfer_options& options,
                          const cancellation_token& token) -> transfer_outcome {
        try {
            if (client->is_thread_safe()) {
                return client->transfer(path, options, token);
            }
            std::lock_guard lock(transport_mutex);
            return client->transfer(path, options, token);
        } catch (const std::exception& e) {
            return transfer_outcome::failure(issue_attributes::io,
                                             std::string("transport error: ") + e.what(),
                                             static_cast<int32_t>(error_code::transport_error));
        }
    }

    void process(const queued_path& entry) {
        auto token = source.token();
        if (token.is_canceled()) {
            return;
        }
        const auto& path = *entry.path;

        if (max_path_length > 0 && path.target_full_path().size() > max_path_length) {
            auto issue = transfer_issue::make(
                issue_severity::error, attributes_for(error_code::path_too_long),
                "target path is longer than " + std::to_string(max_path_length) + " characters",
                entry.path, static_cast<int32_t>(error_code::path_too_long));
            // The transport is never called, so another attempt cannot succeed.
            handle_error(entry, std::move(issue), false, false);
            return;
        }

        notify_path(entry, path_status::started, 0);

        uint64_t reported = 0;
        auto options = make_options();
        options.on_progress = [this, &entry, &reported](uint64_t cumulative) {
            if (cumulative <= reported) {
                return;
            }
            stats.record_bytes_moved(cumulative - reported);
            reported = cumulative;
            notify_path(entry, path_status::in_progress, cumulative);
        };

        auto outcome = invoke_transport(path, options, token);
        if (outcome.bytes_transferred > reported) {
            stats.record_bytes_moved(outcome.bytes_transferred - reported);
        }

        if (outcome.is_success()) {
            handle_success(entry, outcome);
            return;
        }

        const auto& reported_issue = *outcome.issue;
        if (!reported_issue.fatal &&
            (has_flag(reported_issue.attributes, issue_attributes::canceled) ||
             token.is_canceled())) {
            // Interrupted by cancellation; the path counts as not attempted.
            BT_LOG_DEBUG(log_category::job, "Transfer of '" + path.source_path +
                                                "' interrupted by cancellation");
            return;
        }

        auto issue = transfer_issue::make(issue_severity::error, reported_issue.attributes,
                                          reported_issue.message, entry.path,
                                          reported_issue.code);
        handle_error(entry, std::move(issue), reported_issue.fatal);
    }

    void handle_success(const queued_path& entry, const transfer_outcome& outcome) {
        if (outcome.skipped) {
            stats.record_skipped(entry.path->bytes.value_or(0));
            notify_path(entry, path_status::skipped, 0);
        } else {
            stats.record_success(outcome.bytes_transferred);
            notify_path(entry, path_status::succeeded, outcome.bytes_transferred);
        }

        if (!outcome.issue) {
            return;
        }

        auto warning = transfer_issue::make(issue_severity::warning, outcome.issue->attributes,
                                            outcome.issue->message, entry.path,
                                            outcome.issue->code);
        warning.attempt = entry.attempt;
        warning.max_retry_attempts = config.max_job_retry_attempts;
        auto index = issues.append(warning);
        if (index) {
            warning.index = index.value();
        }
        notify(path_issue_event{job_id(), warning});

        auto ctx = log_context(entry.path.get());
        ctx.error_message = warning.message;
        BT_LOG_WARN_CTX(log_category::job, "Path transferred with a warning", ctx);
    }

    void handle_error(const queued_path& entry,
                      transfer_issue issue,
                      bool is_fatal,
                      bool can_retry = true) {
        issue.attempt = entry.attempt;
        issue.max_retry_attempts = config.max_job_retry_attempts;

        if (!is_fatal) {
            bool retryable = can_retry && config.is_retryable(issue.classification());
            if (retryable && entry.attempt < config.max_job_retry_attempts) {
                schedule_retry(entry, issue);
                return;
            }
            if (retryable && has_flag(issue.attributes, issue_attributes::connection)) {
                issue.message = "exhausted job-level retries: " + issue.message;
                is_fatal = true;
            }
        }

        stats.record_failure(issue);
        notify_path(entry, path_status::failed, 0);

        if (is_fatal) {
            fail_fatal(std::move(issue));
            return;
        }

        auto index = issues.append(issue);
        if (index) {
            issue.index = index.value();
        } else {
            BT_LOG_ERROR(log_category::job, "Malformed issue: " + index.error().message);
        }
        notify(path_issue_event{job_id(), issue});

        auto ctx = log_context(entry.path.get());
        ctx.attempt = entry.attempt;
        ctx.error_message = issue.message;
        BT_LOG_ERROR_CTX(log_category::job, "Path failed", ctx);
    }

    void schedule_retry(const queued_path& entry, const transfer_issue& issue) {
        auto next_attempt = entry.attempt + 1;
        auto delay = policy->wait_time(entry.attempt);

        stats.record_retry();
        stats.begin_attempt(next_attempt);
        queue.push_delayed(queued_path{entry.path, next_attempt},
                           path_queue::clock::now() + delay);

        notify(job_retry_event{job_id(), entry.path, next_attempt, delay, issue});

        auto ctx = log_context(entry.path.get());
        ctx.attempt = next_attempt;
        ctx.error_message = issue.message;
        BT_LOG_WARN_CTX(log_category::retry,
                        "Retrying path in " + std::to_string(delay.count()) + "ms", ctx);
    }

    // ------------------------------------------------------------------
    // Completion
    // ------------------------------------------------------------------

    auto final_status() const -> transfer_status {
        if (fatal.load()) {
            return transfer_status::fatal;
        }
        if (source.is_canceled()) {
            return transfer_status::canceled;
        }
        return issues.error_count() > 0 ? transfer_status::failed : transfer_status::successful;
    }

    auto build_result() -> transfer_result {
        auto snap = stats.snapshot();

        transfer_result result;
        result.status = final_status();
        result.client_request_id = job_id();
        result.name = request.name;
        result.direction = request.direction;
        result.elapsed = snap.elapsed;
        result.total_transferred_files = snap.total_transferred_files;
        result.total_transferred_bytes = snap.total_transferred_bytes;
        result.total_failed_files = snap.total_failed_files;
        result.total_files_not_found = snap.total_files_not_found;
        result.total_bad_path_errors = snap.total_bad_path_errors;
        result.total_skipped_files = snap.total_skipped_files;
        result.transfer_rate_mbps = to_mbps(snap.average_rate);
        result.retry_count = snap.retry_count;
        result.issues = issues.snapshot();
        {
            std::lock_guard lock(state_mutex);
            result.transfer_error = fatal_issue;
        }
        result.statistics = snap;
        return result;
    }

    auto finish() -> transfer_result {
        ticker_stop.cancel();
        wait_workers();
        release_pool();
        stats.stop();

        auto result = build_result();
        status.store(result.status);

        emit_statistics(true);
        notify(job_status_event{job_id(), false, result.status});

        auto ctx = log_context(nullptr);
        ctx.files = result.total_transferred_files;
        ctx.bytes = result.total_transferred_bytes;
        ctx.duration_ms = static_cast<uint64_t>(result.elapsed.count());
        ctx.rate_mbps = result.transfer_rate_mbps;
        BT_LOG_INFO_CTX(log_category::job,
                        std::string("Transfer job finished: ") + to_string(result.status), ctx);
        return result;
    }
};

// ============================================================================
// transfer_job
// ============================================================================

transfer_job::transfer_job(std::unique_ptr<impl> state) : impl_(std::move(state)) {}

transfer_job::~transfer_job() {
    if (impl_) {
        dispose();
    }
}

auto transfer_job::create(transfer_request request,
                          std::shared_ptr<transport_client> client,
                          std::shared_ptr<const retry_policy> policy,
                          client_configuration config,
                          const cancellation_token& token)
    -> result<std::unique_ptr<transfer_job>> {
    if (!client) {
        return make_error(error_code::invalid_configuration, "transport client is required");
    }
    if (auto valid = config.validate(); !valid) {
        return unexpected{valid.error()};
    }
    if (request.target_path.empty() && !request.target_path_resolver &&
        client->requires_target_path()) {
        return make_error(error_code::missing_target_path,
                          "transport " + client->id() +
                              " requires a target path and the request has no target path "
                              "or target path resolver");
    }

    if (request.client_request_id.empty()) {
        request.client_request_id = generate_correlation_id();
    }
    if (!policy) {
        policy = request.retry;
    }
    if (!policy) {
        policy = std::make_shared<exponential_backoff_policy>();
    }

    auto state = std::make_unique<impl>(std::move(request), std::move(client), std::move(policy),
                                        std::move(config), token);
    return std::unique_ptr<transfer_job>(new transfer_job(std::move(state)));
}

auto transfer_job::add_path(transfer_path path, const cancellation_token& token) -> result<void> {
    if (impl_->disposed.load()) {
        return make_error(error_code::object_disposed, "transfer job is disposed");
    }
    {
        std::lock_guard lock(impl_->state_mutex);
        if (impl_->complete_in_progress || impl_->complete_consumed) {
            return make_error(error_code::invalid_state, "complete() was already called");
        }
    }
    if (impl_->fatal.load() || is_terminal(impl_->status.load())) {
        return make_error(error_code::invalid_state, "transfer job has stopped");
    }
    if (token.is_canceled() || impl_->source.is_canceled()) {
        return make_error(error_code::operation_canceled, "transfer job add was canceled");
    }

    auto resolved = resolve_path(std::move(path), impl_->defaults);
    if (!resolved) {
        return unexpected{resolved.error()};
    }

    impl_->ensure_started();

    auto record = std::make_shared<const transfer_path>(std::move(resolved).value());
    auto bytes = record->bytes;
    impl_->stats.add_expected(bytes);

    queued_path entry{std::move(record), 1};
    auto pushed = active_job == impl_.get()
                      ? impl_->queue.push_unbounded(std::move(entry))
                      : impl_->queue.push(std::move(entry), token,
                                          impl_->config.max_backpressure_wait);
    if (!pushed) {
        impl_->stats.remove_expected(bytes);
        if (impl_->fatal.load()) {
            return make_error(error_code::invalid_state, "transfer job has stopped");
        }
        return pushed;
    }
    return {};
}

auto transfer_job::add_paths(std::vector<transfer_path> paths, const cancellation_token& token)
    -> result<void> {
    for (auto& path : paths) {
        auto added = add_path(std::move(path), token);
        if (!added) {
            return added;
        }
    }
    return {};
}

auto transfer_job::change_data_rate(uint32_t min_mbps,
                                    uint32_t target_mbps,
                                    const cancellation_token& token) -> result<void> {
    std::shared_ptr<transport_client> client;
    {
        std::lock_guard lock(impl_->state_mutex);
        if (impl_->disposed.load()) {
            return make_error(error_code::object_disposed, "transfer job is disposed");
        }
        client = impl_->client;
    }
    if (!client->supports_data_rate_change()) {
        return make_error(error_code::unsupported_operation,
                          "transport " + impl_->transport_id +
                              " does not support data rate changes");
    }

    auto changed = client->change_data_rate(min_mbps, target_mbps, token);
    if (changed) {
        BT_LOG_INFO(log_category::job, "Data rate changed to min " + std::to_string(min_mbps) +
                                           " / target " + std::to_string(target_mbps) +
                                           " Mbps");
    }
    return changed;
}

auto transfer_job::complete(const cancellation_token& token,
                            std::optional<std::chrono::milliseconds> max_wait)
    -> result<transfer_result> {
    {
        std::lock_guard lock(impl_->state_mutex);
        if (impl_->disposed.load()) {
            return make_error(error_code::object_disposed, "transfer job is disposed");
        }
        if (impl_->complete_consumed || impl_->complete_in_progress) {
            return make_error(error_code::invalid_state, "complete() was already called");
        }
        impl_->complete_in_progress = true;
    }

    impl_->ensure_started();
    impl_->queue.close();

    bool idle = false;
    {
        auto link = token.register_callback([this] { impl_->source.cancel(); });
        std::optional<path_queue::clock::time_point> deadline;
        if (max_wait) {
            deadline = path_queue::clock::now() + *max_wait;
        }
        idle = impl_->queue.wait_idle(deadline);
    }

    if (!idle) {
        std::lock_guard lock(impl_->state_mutex);
        impl_->complete_in_progress = false;
        return make_error(error_code::operation_timeout,
                          "transfer job did not finish within " +
                              std::to_string(max_wait->count()) + "ms");
    }

    {
        std::lock_guard lock(impl_->state_mutex);
        impl_->complete_consumed = true;
        impl_->complete_in_progress = false;
    }
    return impl_->finish();
}

void transfer_job::dispose() {
    {
        std::lock_guard lock(impl_->state_mutex);
        if (impl_->disposed.exchange(true)) {
            return;
        }
    }

    impl_->source.cancel();
    impl_->ticker_stop.cancel();
    impl_->wait_workers();
    impl_->release_pool();
    impl_->abort_on_cancel.reset();
    impl_->stats.stop();

    auto current = impl_->status.load();
    if (!is_terminal(current)) {
        impl_->status.store(transfer_status::canceled);
        if (current == transfer_status::running) {
            impl_->notify(job_status_event{impl_->job_id(), false, transfer_status::canceled});
            BT_LOG_INFO(log_category::job,
                        "Transfer job " + impl_->job_id() + " disposed before completion");
        }
    }

    std::lock_guard lock(impl_->state_mutex);
    impl_->client.reset();
}

void transfer_job::cancel() { impl_->source.cancel(); }

auto transfer_job::status() const -> transfer_status {
    if (impl_->fatal.load()) {
        return transfer_status::fatal;
    }
    return impl_->status.load();
}

auto transfer_job::is_disposed() const -> bool { return impl_->disposed.load(); }

auto transfer_job::statistics() const -> transfer_statistics { return impl_->stats.snapshot(); }

auto transfer_job::issues() const -> std::vector<transfer_issue> {
    return impl_->issues.snapshot();
}

auto transfer_job::job_id() const -> const std::string& { return impl_->job_id(); }

auto transfer_job::request() const -> const transfer_request& { return impl_->request; }

auto transfer_job::configuration() const -> const client_configuration& {
    return impl_->config;
}

}  // namespace kcenon::bulk_transfer
