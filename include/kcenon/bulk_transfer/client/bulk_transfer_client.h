/**
 * @file bulk_transfer_client.h
 * @brief Entry point that selects a transport and runs transfer jobs
 */

#ifndef KCENON_BULK_TRANSFER_CLIENT_BULK_TRANSFER_CLIENT_H
#define KCENON_BULK_TRANSFER_CLIENT_BULK_TRANSFER_CLIENT_H

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "kcenon/bulk_transfer/core/cancellation.h"
#include "kcenon/bulk_transfer/core/retry_policy.h"
#include "kcenon/bulk_transfer/core/types.h"
#include "kcenon/bulk_transfer/enumeration/path_enumerator.h"
#include "kcenon/bulk_transfer/job/client_configuration.h"
#include "kcenon/bulk_transfer/job/transfer_job.h"
#include "kcenon/bulk_transfer/job/transfer_request.h"
#include "kcenon/bulk_transfer/transport/transport_client.h"
#include "kcenon/bulk_transfer/transport/transport_registry.h"

namespace kcenon::bulk_transfer {

/**
 * @brief Where the enumerator reads directory listings from
 */
enum class enumeration_mode {
    local,   ///< Local filesystem
    remote,  ///< The selected transport's list_directory paging
};

/**
 * @brief Transfer client facade
 *
 * Owns one configuration and one selected transport. Every job created by
 * the client shares that transport.
 *
 * @code
 * auto client = bulk_transfer_client::builder()
 *     .with_configuration(config)
 *     .with_candidates({"file_share"})
 *     .build();
 * if (!client) {
 *     return;
 * }
 *
 * auto request = transfer_request::for_upload(
 *     {transfer_path{"/data/a.bin"}}, "/mnt/share/in");
 * auto result = client.value().transfer(request);
 * @endcode
 */
class bulk_transfer_client {
public:
    /**
     * @brief Builder for bulk_transfer_client
     */
    class builder {
    public:
        builder();

        auto with_configuration(client_configuration config) -> builder&;

        /**
         * @brief Registry used for transport lookup (defaults to with_defaults())
         */
        auto with_registry(std::shared_ptr<transport_registry> registry) -> builder&;

        /**
         * @brief Use exactly this transport identifier
         */
        auto with_transport(std::string id) -> builder&;

        /**
         * @brief Try these identifiers in order and keep the first supported one
         */
        auto with_candidates(std::vector<std::string> ranked_ids) -> builder&;

        /**
         * @brief Use an already constructed transport, bypassing the registry
         */
        auto with_transport_client(std::shared_ptr<transport_client> client) -> builder&;

        /**
         * @brief Retry policy for jobs whose request does not carry one
         */
        auto with_retry_policy(std::shared_ptr<const retry_policy> policy) -> builder&;

        /**
         * @brief Validate the configuration and select the transport
         * @return invalid_configuration, transport_not_found or
         *         transport_not_supported on failure
         */
        [[nodiscard]] auto build(const cancellation_token& token = {})
            -> result<bulk_transfer_client>;

    private:
        client_configuration config_;
        std::shared_ptr<transport_registry> registry_;
        std::vector<std::string> candidates_;
        std::shared_ptr<transport_client> client_;
        std::shared_ptr<const retry_policy> policy_;
    };

    ~bulk_transfer_client();

    bulk_transfer_client(const bulk_transfer_client&) = delete;
    auto operator=(const bulk_transfer_client&) -> bulk_transfer_client& = delete;
    bulk_transfer_client(bulk_transfer_client&&) noexcept;
    auto operator=(bulk_transfer_client&&) noexcept -> bulk_transfer_client&;

    /**
     * @brief Run request.paths as one job and wait for it
     *
     * Path-level failures are reported in the result, not as an error.
     */
    [[nodiscard]] auto transfer(const transfer_request& request,
                                const cancellation_token& token = {})
        -> result<transfer_result>;

    /**
     * @brief Create a job that the caller feeds and completes
     */
    [[nodiscard]] auto create_job(const transfer_request& request,
                                  const cancellation_token& token = {})
        -> result<std::unique_ptr<transfer_job>>;

    /**
     * @brief Enumerator over the local filesystem or the selected transport
     * @return unsupported_operation for remote mode when the transport
     *         cannot list directories
     */
    [[nodiscard]] auto create_enumerator(enumeration_mode mode) const -> result<path_enumerator>;

    /**
     * @brief Enumeration context from the configuration, with the long-path
     *        limit falling back to the selected transport's maximum
     */
    [[nodiscard]] auto enumeration_defaults() const -> enumeration_context;

    /**
     * @brief Run one job per serialized batch, in order
     *
     * Each job copies @p request_template with the batch's records and a
     * fresh correlation id. Stops early on cancellation.
     */
    [[nodiscard]] auto transfer_batches(const std::vector<batch_descriptor>& batches,
                                        const transfer_request& request_template,
                                        const cancellation_token& token = {})
        -> result<std::vector<transfer_result>>;

    /**
     * @brief Change the data rate of the shared transport
     */
    [[nodiscard]] auto change_data_rate(uint32_t min_mbps,
                                        uint32_t target_mbps,
                                        const cancellation_token& token = {}) -> result<void>;

    [[nodiscard]] auto config() const -> const client_configuration&;
    [[nodiscard]] auto transport() const -> std::shared_ptr<transport_client>;

private:
    bulk_transfer_client(client_configuration config,
                         std::shared_ptr<transport_client> transport,
                         std::shared_ptr<const retry_policy> policy);

    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::bulk_transfer

#endif  // KCENON_BULK_TRANSFER_CLIENT_BULK_TRANSFER_CLIENT_H
