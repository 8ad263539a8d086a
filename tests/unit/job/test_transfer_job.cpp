/**
 * @file test_transfer_job.cpp
 * @brief Unit tests for the transfer job orchestrator
 */

#include <gtest/gtest.h>

#include <kcenon/bulk_transfer/core/logging.h>
#include <kcenon/bulk_transfer/job/transfer_job.h>

#include "../fake_transport_client.h"

#include <algorithm>
#include <atomic>
#include <map>
#include <thread>

namespace kcenon::bulk_transfer::test {

using namespace std::chrono_literals;

class TransferJobTest : public ::testing::Test {
protected:
    void SetUp() override {
        client_ = std::make_shared<fake_transport_client>();
        config_.max_job_parallelism = 2;
        config_.statistics_rate = 20ms;
        get_logger().set_console_output(false);
    }

    void TearDown() override { get_logger().set_console_output(true); }

    auto make_job(transfer_request request = transfer_request::for_upload_job("/target"),
                  const cancellation_token& token = {}) -> std::unique_ptr<transfer_job> {
        request.context = recorder_.make_context();
        auto created =
            transfer_job::create(std::move(request), client_, make_fixed_wait(0ms), config_, token);
        EXPECT_TRUE(created.has_value());
        if (!created) {
            return nullptr;
        }
        return std::move(created).value();
    }

    static auto sized(const std::string& source, uint64_t bytes) -> transfer_path {
        transfer_path path(source);
        path.bytes = bytes;
        return path;
    }

    static auto completed(transfer_job& job) -> transfer_result {
        auto result = job.complete({}, 10s);
        EXPECT_TRUE(result.has_value());
        return result ? result.value() : transfer_result{};
    }

    std::shared_ptr<fake_transport_client> client_;
    client_configuration config_;
    event_recorder recorder_;
};

// ============================================================================
// Creation
// ============================================================================

TEST_F(TransferJobTest, Create_RequiresClient) {
    auto created = transfer_job::create(transfer_request::for_upload_job("/t"), nullptr, nullptr,
                                        config_);
    ASSERT_FALSE(created.has_value());
    EXPECT_EQ(created.error().code, error_code::invalid_configuration);
}

TEST_F(TransferJobTest, Create_RejectsInvalidConfiguration) {
    config_.max_job_parallelism = 0;
    auto created = transfer_job::create(transfer_request::for_upload_job("/t"), client_, nullptr,
                                        config_);
    ASSERT_FALSE(created.has_value());
    EXPECT_EQ(created.error().code, error_code::invalid_configuration);
}

TEST_F(TransferJobTest, Create_RequiresTargetWhenTransportDoes) {
    auto created = transfer_job::create(transfer_request::for_upload_job(""), client_, nullptr,
                                        config_);
    ASSERT_FALSE(created.has_value());
    EXPECT_EQ(created.error().code, error_code::missing_target_path);

    // A target resolver is enough
    auto request = transfer_request::for_upload_job("");
    request.target_path_resolver = [](const std::string&) { return std::string("/resolved"); };
    EXPECT_TRUE(transfer_job::create(request, client_, nullptr, config_).has_value());

    client_->set_requires_target_path(false);
    EXPECT_TRUE(transfer_job::create(transfer_request::for_upload_job(""), client_, nullptr,
                                     config_)
                    .has_value());
}

TEST_F(TransferJobTest, Create_GeneratesCorrelationId) {
    auto job = make_job();
    ASSERT_NE(job, nullptr);
    EXPECT_EQ(job->job_id().size(), 36u);
    EXPECT_EQ(job->status(), transfer_status::not_started);
    EXPECT_EQ(client_->connection_checks(), 0);
}

// ============================================================================
// Happy path
// ============================================================================

TEST_F(TransferJobTest, Complete_TransfersEveryPath) {
    auto job = make_job();
    ASSERT_TRUE(job->add_path(sized("/src/a.bin", 100)).has_value());
    ASSERT_TRUE(job->add_path(sized("/src/b.bin", 0)).has_value());
    ASSERT_TRUE(job->add_path(sized("/src/c.bin", 50)).has_value());
    EXPECT_EQ(job->status(), transfer_status::running);

    auto result = completed(*job);
    EXPECT_EQ(result.status, transfer_status::successful);
    EXPECT_TRUE(result.is_successful());
    EXPECT_EQ(result.total_transferred_files, 3u);
    EXPECT_EQ(result.total_transferred_bytes, 150u);
    EXPECT_EQ(result.total_failed_files, 0u);
    EXPECT_TRUE(result.issues.empty());
    EXPECT_EQ(result.client_request_id, job->job_id());
    EXPECT_EQ(client_->connection_checks(), 1);

    auto targets = client_->targets();
    std::sort(targets.begin(), targets.end());
    ASSERT_EQ(targets.size(), 3u);
    EXPECT_EQ(targets[0], "/target/a.bin");
}

TEST_F(TransferJobTest, Complete_WithoutPathsSucceeds) {
    auto job = make_job();
    auto result = completed(*job);
    EXPECT_EQ(result.status, transfer_status::successful);
    EXPECT_EQ(result.total_transferred_files, 0u);
}

TEST_F(TransferJobTest, StatusEvents_StartAndEnd) {
    auto job = make_job();
    ASSERT_TRUE(job->add_path(sized("/src/a.bin", 10)).has_value());
    (void)completed(*job);

    std::lock_guard lock(recorder_.mutex_);
    ASSERT_EQ(recorder_.statuses.size(), 2u);
    EXPECT_TRUE(recorder_.statuses.front().started);
    EXPECT_EQ(recorder_.statuses.front().status, transfer_status::running);
    EXPECT_FALSE(recorder_.statuses.back().started);
    EXPECT_EQ(recorder_.statuses.back().status, transfer_status::successful);

    ASSERT_FALSE(recorder_.statistics.empty());
    EXPECT_TRUE(recorder_.statistics.back().is_final);
    EXPECT_DOUBLE_EQ(recorder_.statistics.back().statistics.progress, 100.0);
}

TEST_F(TransferJobTest, PathProgress_ReportsEveryStage) {
    client_->set_report_progress(true);
    config_.max_job_parallelism = 1;
    auto job = make_job();
    ASSERT_TRUE(job->add_path(sized("/src/a.bin", 1000)).has_value());
    (void)completed(*job);

    std::lock_guard lock(recorder_.mutex_);
    ASSERT_EQ(recorder_.progress.size(), 4u);
    EXPECT_EQ(recorder_.progress[0].status, path_status::started);
    EXPECT_EQ(recorder_.progress[1].status, path_status::in_progress);
    EXPECT_EQ(recorder_.progress[1].bytes_transferred, 500u);
    EXPECT_EQ(recorder_.progress[2].bytes_transferred, 1000u);
    EXPECT_EQ(recorder_.progress[3].status, path_status::succeeded);
}

TEST_F(TransferJobTest, Skipped_CountsAsSkipped) {
    client_->script("/src/a.bin", {transfer_outcome::skip()});
    auto job = make_job();
    ASSERT_TRUE(job->add_path(sized("/src/a.bin", 10)).has_value());
    ASSERT_TRUE(job->add_path(sized("/src/b.bin", 10)).has_value());

    auto result = completed(*job);
    EXPECT_EQ(result.status, transfer_status::successful);
    EXPECT_EQ(result.total_skipped_files, 1u);
    EXPECT_EQ(result.total_transferred_files, 1u);
}

TEST_F(TransferJobTest, Warning_DoesNotFailTheJob) {
    auto outcome = transfer_outcome::success(10);
    outcome.issue = transport_issue{issue_severity::warning, issue_attributes::io,
                                    "dates not preserved", 0, false};
    client_->script("/src/a.bin", {outcome});

    auto job = make_job();
    ASSERT_TRUE(job->add_path(sized("/src/a.bin", 10)).has_value());
    auto result = completed(*job);

    EXPECT_EQ(result.status, transfer_status::successful);
    EXPECT_EQ(result.total_transferred_files, 1u);
    ASSERT_EQ(result.issues.size(), 1u);
    EXPECT_TRUE(result.issues[0].is_warning());
    EXPECT_EQ(result.warning_count(), 1u);
    EXPECT_EQ(result.error_count(), 0u);
}

// ============================================================================
// Retries
// ============================================================================

TEST_F(TransferJobTest, Retry_OnlyFailedPathIsRetried) {
    client_->script("/src/flaky.bin",
                    {transfer_outcome::failure(issue_attributes::io, "reset"),
                     transfer_outcome::success(10)});
    auto job = make_job();
    ASSERT_TRUE(job->add_path(sized("/src/flaky.bin", 10)).has_value());
    ASSERT_TRUE(job->add_path(sized("/src/ok.bin", 10)).has_value());

    auto result = completed(*job);
    EXPECT_EQ(result.status, transfer_status::successful);
    EXPECT_EQ(result.total_transferred_files, 2u);
    EXPECT_EQ(result.retry_count, 1u);
    EXPECT_EQ(client_->calls("/src/flaky.bin"), 2u);
    EXPECT_EQ(client_->calls("/src/ok.bin"), 1u);
    EXPECT_TRUE(result.issues.empty());

    std::lock_guard lock(recorder_.mutex_);
    ASSERT_EQ(recorder_.retries.size(), 1u);
    EXPECT_EQ(recorder_.retries[0].attempt, 2u);
    EXPECT_EQ(recorder_.retries[0].path->source_path, "/src/flaky.bin");
}

TEST_F(TransferJobTest, Retry_StopsAtMaxAttempts) {
    config_.max_job_retry_attempts = 3;
    client_->script("/src/bad.bin", {transfer_outcome::failure(issue_attributes::io, "broken")});
    auto job = make_job();
    ASSERT_TRUE(job->add_path(sized("/src/bad.bin", 10)).has_value());

    auto result = completed(*job);
    EXPECT_EQ(result.status, transfer_status::failed);
    EXPECT_EQ(client_->calls("/src/bad.bin"), 3u);
    EXPECT_EQ(result.total_failed_files, 1u);
    ASSERT_EQ(result.issues.size(), 1u);
    EXPECT_EQ(result.issues[0].attempt, 3u);
    EXPECT_EQ(result.issues[0].max_retry_attempts, 3u);
    EXPECT_EQ(result.statistics.attempt, 3u);
}

TEST_F(TransferJobTest, NonRetryable_FailsImmediately) {
    client_->script("/src/denied.bin",
                    {transfer_outcome::failure(issue_attributes::permission, "denied")});
    auto job = make_job();
    ASSERT_TRUE(job->add_path(sized("/src/denied.bin", 10)).has_value());

    auto result = completed(*job);
    EXPECT_EQ(result.status, transfer_status::failed);
    EXPECT_EQ(client_->calls("/src/denied.bin"), 1u);
    ASSERT_EQ(result.issues.size(), 1u);
    EXPECT_TRUE(has_flag(result.issues[0].attributes, issue_attributes::permission));
    EXPECT_EQ(result.issues[0].path->source_path, "/src/denied.bin");

    std::lock_guard lock(recorder_.mutex_);
    EXPECT_TRUE(recorder_.retries.empty());
    EXPECT_EQ(recorder_.issues.size(), 1u);
}

TEST_F(TransferJobTest, FileNotFound_IsCounted) {
    config_.file_not_found_errors_retry = false;
    client_->script("/src/gone.bin",
                    {transfer_outcome::failure(issue_attributes::file_not_found, "missing")});
    auto job = make_job();
    ASSERT_TRUE(job->add_path(sized("/src/gone.bin", 10)).has_value());
    ASSERT_TRUE(job->add_path(sized("/src/here.bin", 10)).has_value());

    auto result = completed(*job);
    EXPECT_EQ(result.status, transfer_status::failed);
    EXPECT_EQ(result.total_files_not_found, 1u);
    EXPECT_EQ(result.total_failed_files, 1u);
    EXPECT_EQ(result.total_transferred_files, 1u);
}

TEST_F(TransferJobTest, LongTargetPath_FailsWithoutTransfer) {
    config_.max_path_length = 20;
    auto job = make_job();
    ASSERT_TRUE(job->add_path(sized("/src/a_very_long_file_name.bin", 10)).has_value());

    auto result = completed(*job);
    EXPECT_EQ(result.status, transfer_status::failed);
    EXPECT_EQ(client_->total_calls(), 0u);
    EXPECT_EQ(result.total_bad_path_errors, 1u);
    ASSERT_EQ(result.issues.size(), 1u);
    EXPECT_TRUE(has_flag(result.issues[0].attributes, issue_attributes::path_too_long));
}

TEST_F(TransferJobTest, LongTargetPath_IsNotRetriedEvenWhenBadPathsAre) {
    config_.max_path_length = 20;
    config_.bad_path_errors_retry = true;
    config_.max_job_retry_attempts = 4;
    auto job = make_job();
    ASSERT_TRUE(job->add_path(sized("/src/a_very_long_file_name.bin", 10)).has_value());

    auto result = completed(*job);
    EXPECT_EQ(result.status, transfer_status::failed);
    EXPECT_EQ(result.retry_count, 0u);
    EXPECT_TRUE(recorder_.retries.empty());
    EXPECT_EQ(client_->total_calls(), 0u);
    ASSERT_EQ(result.issues.size(), 1u);
    EXPECT_EQ(result.issues[0].attempt, 1u);
}

// ============================================================================
// Fatal conditions
// ============================================================================

TEST_F(TransferJobTest, ConnectionCheckFailure_IsFatal) {
    client_->set_connection(connection_result{false, issue_attributes::connection, "refused", 7});
    auto job = make_job();
    (void)job->add_path(sized("/src/a.bin", 10));

    auto result = completed(*job);
    EXPECT_EQ(result.status, transfer_status::fatal);
    ASSERT_TRUE(result.transfer_error.has_value());
    EXPECT_TRUE(result.transfer_error->is_job_level());
    EXPECT_TRUE(has_flag(result.transfer_error->attributes, issue_attributes::job));
    EXPECT_EQ(client_->total_calls(), 0u);
    EXPECT_EQ(job->status(), transfer_status::fatal);
}

TEST_F(TransferJobTest, FatalOutcome_StopsTheJob) {
    config_.max_job_parallelism = 1;
    client_->script("/src/p0.bin", {transfer_outcome::failure(issue_attributes::authentication,
                                                              "token expired", 0, true)});
    auto job = make_job();
    for (int i = 0; i < 20; ++i) {
        if (!job->add_path(sized("/src/p" + std::to_string(i) + ".bin", 1))) {
            break;
        }
    }

    auto result = completed(*job);
    EXPECT_EQ(result.status, transfer_status::fatal);
    ASSERT_TRUE(result.transfer_error.has_value());
    EXPECT_EQ(result.transfer_error->message, "token expired");
    EXPECT_LT(client_->total_calls(), 20u);

    auto added = job->add_path(sized("/src/late.bin", 1));
    ASSERT_FALSE(added.has_value());
    EXPECT_EQ(added.error().code, error_code::invalid_state);
}

TEST_F(TransferJobTest, ExhaustedConnectionRetries_EscalateToFatal) {
    config_.max_job_retry_attempts = 2;
    client_->script("/src/a.bin",
                    {transfer_outcome::failure(issue_attributes::connection, "link down")});
    auto job = make_job();
    ASSERT_TRUE(job->add_path(sized("/src/a.bin", 10)).has_value());

    auto result = completed(*job);
    EXPECT_EQ(result.status, transfer_status::fatal);
    EXPECT_EQ(client_->calls("/src/a.bin"), 2u);
    ASSERT_TRUE(result.transfer_error.has_value());
    EXPECT_NE(result.transfer_error->message.find("exhausted"), std::string::npos);
}

TEST_F(TransferJobTest, TransportException_BecomesPathError) {
    class throwing_client : public fake_transport_client {
    public:
        auto transfer(const transfer_path&, const transfer_options&, const cancellation_token&)
            -> transfer_outcome override {
            throw std::runtime_error("driver crashed");
        }
    };
    auto thrower = std::make_shared<throwing_client>();
    config_.transient_errors_retry = false;
    auto created = transfer_job::create(transfer_request::for_upload_job("/t"), thrower, nullptr,
                                        config_);
    ASSERT_TRUE(created.has_value());
    auto job = std::move(created).value();
    ASSERT_TRUE(job->add_path(sized("/src/a.bin", 1)).has_value());

    auto result = completed(*job);
    EXPECT_EQ(result.status, transfer_status::failed);
    ASSERT_EQ(result.issues.size(), 1u);
    EXPECT_NE(result.issues[0].message.find("driver crashed"), std::string::npos);
}

// ============================================================================
// Cancellation and lifecycle
// ============================================================================

TEST_F(TransferJobTest, Cancel_StopsOutstandingWork) {
    auto gate = std::make_shared<transfer_gate>();
    client_->set_gate(gate);
    cancellation_source source;
    auto job = make_job(transfer_request::for_upload_job("/target"), source.token());

    for (int i = 0; i < 100; ++i) {
        ASSERT_TRUE(job->add_path(sized("/src/p" + std::to_string(i) + ".bin", 1)).has_value());
    }
    ASSERT_TRUE(gate->wait_for_waiters(2, 5s));
    source.cancel();

    auto result = completed(*job);
    EXPECT_EQ(result.status, transfer_status::canceled);
    EXPECT_LT(result.total_transferred_files, 100u);
    EXPECT_TRUE(result.issues.empty());
}

TEST_F(TransferJobTest, Cancel_LeavesRemainingPathsUnattempted) {
    config_.max_job_parallelism = 1;
    cancellation_source source;
    std::atomic<int> succeeded{0};

    auto request = transfer_request::for_upload_job("/target");
    request.context = std::make_shared<transfer_context>(transfer_handlers{
        .on_path_progress =
            [&](const path_progress_event& e) {
                if (e.status == path_status::succeeded && ++succeeded == 50) {
                    source.cancel();
                }
            },
    });
    auto created = transfer_job::create(std::move(request), client_, make_fixed_wait(0ms),
                                        config_, source.token());
    ASSERT_TRUE(created.has_value());
    auto job = std::move(created).value();

    std::vector<transfer_path> paths;
    for (int i = 0; i < 100; ++i) {
        paths.push_back(sized("/src/p" + std::to_string(i) + ".bin", 1));
    }
    ASSERT_TRUE(job->add_paths(paths).has_value());

    auto result = completed(*job);
    EXPECT_EQ(result.status, transfer_status::canceled);
    EXPECT_EQ(result.total_transferred_files, 50u);
    EXPECT_EQ(client_->total_calls(), 50u);
    EXPECT_TRUE(result.issues.empty());
}

TEST_F(TransferJobTest, CompleteToken_CancelsTheJob) {
    auto gate = std::make_shared<transfer_gate>();
    client_->set_gate(gate);
    auto job = make_job();
    ASSERT_TRUE(job->add_path(sized("/src/a.bin", 1)).has_value());
    ASSERT_TRUE(gate->wait_for_waiters(1, 5s));

    cancellation_source source;
    source.cancel_after(30ms);
    auto result = job->complete(source.token());
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result.value().status, transfer_status::canceled);
}

TEST_F(TransferJobTest, Complete_TimesOutAndCanBeRetried) {
    auto gate = std::make_shared<transfer_gate>();
    client_->set_gate(gate);
    auto job = make_job();
    ASSERT_TRUE(job->add_path(sized("/src/a.bin", 1)).has_value());

    auto first = job->complete({}, 50ms);
    ASSERT_FALSE(first.has_value());
    EXPECT_EQ(first.error().code, error_code::operation_timeout);

    gate->open();
    auto second = job->complete({}, 10s);
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second.value().status, transfer_status::successful);
}

TEST_F(TransferJobTest, AddAfterComplete_IsInvalidState) {
    auto job = make_job();
    (void)completed(*job);

    auto added = job->add_path(sized("/src/a.bin", 1));
    ASSERT_FALSE(added.has_value());
    EXPECT_EQ(added.error().code, error_code::invalid_state);

    auto again = job->complete();
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, error_code::invalid_state);
}

TEST_F(TransferJobTest, Dispose_RejectsLaterCalls) {
    auto job = make_job();
    ASSERT_TRUE(job->add_path(sized("/src/a.bin", 1)).has_value());
    job->dispose();
    job->dispose();

    EXPECT_TRUE(job->is_disposed());
    EXPECT_TRUE(is_terminal(job->status()));

    auto added = job->add_path(sized("/src/b.bin", 1));
    ASSERT_FALSE(added.has_value());
    EXPECT_EQ(added.error().code, error_code::object_disposed);

    auto result = job->complete();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::object_disposed);

    auto rate = job->change_data_rate(0, 10);
    ASSERT_FALSE(rate.has_value());
    EXPECT_EQ(rate.error().code, error_code::object_disposed);
}

TEST_F(TransferJobTest, AddPath_RejectsUnresolvablePath) {
    auto job = make_job();
    auto added = job->add_path(transfer_path{""});
    ASSERT_FALSE(added.has_value());
    EXPECT_EQ(added.error().code, error_code::invalid_argument);
}

TEST_F(TransferJobTest, AddPath_BackpressureReportsQueueFull) {
    auto gate = std::make_shared<transfer_gate>();
    client_->set_gate(gate);
    config_.max_job_parallelism = 1;
    config_.max_queued_paths = 1;
    config_.max_backpressure_wait = 50ms;
    auto job = make_job();

    ASSERT_TRUE(job->add_path(sized("/src/a.bin", 1)).has_value());
    ASSERT_TRUE(gate->wait_for_waiters(1, 5s));
    ASSERT_TRUE(job->add_path(sized("/src/b.bin", 1)).has_value());

    auto full = job->add_path(sized("/src/c.bin", 1));
    ASSERT_FALSE(full.has_value());
    EXPECT_EQ(full.error().code, error_code::queue_full);

    gate->open();
    auto result = completed(*job);
    EXPECT_EQ(result.total_transferred_files, 2u);
    EXPECT_EQ(result.statistics.total_requested_files, 2u);
}

TEST_F(TransferJobTest, AddFromHandler_DoesNotDeadlock) {
    config_.max_job_parallelism = 1;
    config_.max_queued_paths = 1;
    config_.max_backpressure_wait = 50ms;

    transfer_job* self = nullptr;
    std::atomic<int> follow_ups{0};
    transfer_handlers handlers;
    handlers.on_path_progress = [&](const path_progress_event& e) {
        if (e.status == path_status::succeeded && e.path->source_path == "/src/seed.bin") {
            for (int i = 0; i < 5; ++i) {
                if (self->add_path(sized("/src/follow" + std::to_string(i) + ".bin", 1))) {
                    ++follow_ups;
                }
            }
        }
    };
    auto request = transfer_request::for_upload_job("/target");
    request.context = std::make_shared<transfer_context>(std::move(handlers));
    auto created = transfer_job::create(request, client_, nullptr, config_);
    ASSERT_TRUE(created.has_value());
    auto job = std::move(created).value();
    self = job.get();

    ASSERT_TRUE(job->add_path(sized("/src/seed.bin", 1)).has_value());
    // Give the worker time to run the handler before the queue closes
    std::this_thread::sleep_for(100ms);
    auto result = completed(*job);
    EXPECT_EQ(follow_ups.load(), 5);
    EXPECT_EQ(result.total_transferred_files, 6u);
}

TEST_F(TransferJobTest, NonThreadSafeTransport_IsSerialized) {
    client_->set_thread_safe(false);
    client_->set_delay(5ms);
    config_.max_job_parallelism = 4;
    auto job = make_job();
    for (int i = 0; i < 12; ++i) {
        ASSERT_TRUE(job->add_path(sized("/src/p" + std::to_string(i) + ".bin", 1)).has_value());
    }
    auto result = completed(*job);
    EXPECT_EQ(result.total_transferred_files, 12u);
    EXPECT_EQ(client_->peak_concurrency(), 1);
}

TEST_F(TransferJobTest, Parallelism_IsBoundedByConfiguration) {
    client_->set_delay(10ms);
    config_.max_job_parallelism = 3;
    auto job = make_job();
    for (int i = 0; i < 24; ++i) {
        ASSERT_TRUE(job->add_path(sized("/src/p" + std::to_string(i) + ".bin", 1)).has_value());
    }
    (void)completed(*job);
    EXPECT_LE(client_->peak_concurrency(), 3);
}

TEST_F(TransferJobTest, ChangeDataRate_UnsupportedByTransport) {
    auto job = make_job();
    auto changed = job->change_data_rate(0, 10);
    ASSERT_FALSE(changed.has_value());
    EXPECT_EQ(changed.error().code, error_code::unsupported_operation);
}

}  // namespace kcenon::bulk_transfer::test
