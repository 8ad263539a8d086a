/**
 * @file transfer_job.h
 * @brief Transfer job orchestrator
 */

#ifndef KCENON_BULK_TRANSFER_JOB_TRANSFER_JOB_H
#define KCENON_BULK_TRANSFER_JOB_TRANSFER_JOB_H

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "kcenon/bulk_transfer/core/cancellation.h"
#include "kcenon/bulk_transfer/core/issue.h"
#include "kcenon/bulk_transfer/core/retry_policy.h"
#include "kcenon/bulk_transfer/core/statistics_aggregator.h"
#include "kcenon/bulk_transfer/core/types.h"
#include "kcenon/bulk_transfer/job/client_configuration.h"
#include "kcenon/bulk_transfer/job/transfer_request.h"
#include "kcenon/bulk_transfer/transport/transport_client.h"

namespace kcenon::bulk_transfer {

/**
 * @brief Transfers an open-ended stream of paths through one transport
 *
 * Paths added to the job are resolved against the request, queued, and
 * dispatched by max_job_parallelism workers. Failed paths whose issue class
 * is retryable are re-queued after the retry policy's delay until
 * max_job_retry_attempts is reached; only failed paths are retried, never
 * the whole job. complete() closes the job to new paths, waits for all
 * work and pending retries, and returns the aggregated result.
 *
 * The job starts lazily on the first add or on complete(). Starting runs
 * the transport's connection check; a failed check is a fatal condition.
 *
 * @code
 * auto job = transfer_job::create(
 *     transfer_request::for_upload_job("/mnt/share/in"), client, nullptr, config);
 * if (!job) { return job.error(); }
 *
 * for (const auto& file : files) {
 *     if (auto added = job.value()->add_path(transfer_path{file}); !added) {
 *         break;
 *     }
 * }
 * auto result = job.value()->complete();
 * @endcode
 *
 * @note Thread-safe: add_path and add_paths may be called concurrently with
 *       each other, with workers, and from inside event handlers.
 */
class transfer_job {
public:
    /**
     * @brief Create a job for a request
     * @param request Copied into the job
     * @param client Transport performing the transfers
     * @param policy Retry timing; falls back to request.retry, then to
     *               exponential backoff
     * @param config Copied into the job
     * @param token Cancels the job for its whole lifetime
     * @return invalid_configuration for bad settings or a missing client,
     *         missing_target_path when the transport needs a target and the
     *         request has neither a target path nor a target resolver
     */
    [[nodiscard]] static auto create(transfer_request request,
                                     std::shared_ptr<transport_client> client,
                                     std::shared_ptr<const retry_policy> policy,
                                     client_configuration config,
                                     const cancellation_token& token = {})
        -> result<std::unique_ptr<transfer_job>>;

    transfer_job(const transfer_job&) = delete;
    auto operator=(const transfer_job&) -> transfer_job& = delete;
    transfer_job(transfer_job&&) = delete;
    auto operator=(transfer_job&&) -> transfer_job& = delete;

    /**
     * @brief Disposes the job if the caller has not
     */
    ~transfer_job();

    /**
     * @brief Queue a path for transfer
     *
     * Waits at most max_backpressure_wait when the queue is full. Calls made
     * from the job's own worker threads (event handlers) skip the wait.
     *
     * @return object_disposed, invalid_state once complete() was called or
     *         the job stopped, operation_canceled if @p token or the job is
     *         canceled, queue_full when the wait elapses, or the resolution
     *         error of the path
     */
    [[nodiscard]] auto add_path(transfer_path path, const cancellation_token& token = {})
        -> result<void>;

    /**
     * @brief Queue several paths
     *
     * Stops at the first path that cannot be queued and returns its error;
     * paths before it stay queued.
     */
    [[nodiscard]] auto add_paths(std::vector<transfer_path> paths,
                                 const cancellation_token& token = {}) -> result<void>;

    /**
     * @brief Change the transport's data rate hints while the job runs
     * @return object_disposed, or unsupported_operation when the transport
     *         cannot change rates
     */
    [[nodiscard]] auto change_data_rate(uint32_t min_mbps,
                                        uint32_t target_mbps,
                                        const cancellation_token& token = {}) -> result<void>;

    /**
     * @brief Stop accepting paths, wait for all work, and build the result
     *
     * @p token cancels the job while waiting. A fatal condition still returns
     * a value, with status fatal and transfer_error set.
     *
     * @param max_wait Longest time to wait; on expiry operation_timeout is
     *        returned, the job keeps running and complete() may be called
     *        again
     * @return object_disposed, invalid_state on a second successful call,
     *         operation_timeout
     */
    [[nodiscard]] auto complete(const cancellation_token& token = {},
                                std::optional<std::chrono::milliseconds> max_wait = std::nullopt)
        -> result<transfer_result>;

    /**
     * @brief Cancel outstanding work and release the workers and transport
     *
     * Idempotent. A job that had not finished ends canceled. Every later
     * call except status queries fails with object_disposed.
     */
    void dispose();

    /**
     * @brief Request cancellation; complete() then reports canceled
     */
    void cancel();

    [[nodiscard]] auto status() const -> transfer_status;
    [[nodiscard]] auto is_disposed() const -> bool;
    [[nodiscard]] auto statistics() const -> transfer_statistics;
    [[nodiscard]] auto issues() const -> std::vector<transfer_issue>;
    [[nodiscard]] auto job_id() const -> const std::string&;
    [[nodiscard]] auto request() const -> const transfer_request&;
    [[nodiscard]] auto configuration() const -> const client_configuration&;

private:
    struct impl;

    explicit transfer_job(std::unique_ptr<impl> state);

    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::bulk_transfer

#endif  // KCENON_BULK_TRANSFER_JOB_TRANSFER_JOB_H
