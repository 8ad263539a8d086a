/**
 * @file bulk_transfer_client.cpp
 * @brief Implementation of the transfer client facade
 */

#include "kcenon/bulk_transfer/client/bulk_transfer_client.h"

#include <mutex>

#include "kcenon/bulk_transfer/core/logging.h"
#include "kcenon/bulk_transfer/enumeration/batch_file.h"

namespace kcenon::bulk_transfer {

struct bulk_transfer_client::impl {
    client_configuration config;
    std::shared_ptr<transport_client> transport;
    std::shared_ptr<const retry_policy> policy;
    std::mutex rate_mutex;

    impl(client_configuration cfg,
         std::shared_ptr<transport_client> t,
         std::shared_ptr<const retry_policy> p)
        : config(std::move(cfg)), transport(std::move(t)), policy(std::move(p)) {}
};

// ============================================================================
// builder
// ============================================================================

bulk_transfer_client::builder::builder() = default;

auto bulk_transfer_client::builder::with_configuration(client_configuration config)
    -> builder& {
    config_ = std::move(config);
    return *this;
}

auto bulk_transfer_client::builder::with_registry(std::shared_ptr<transport_registry> registry)
    -> builder& {
    registry_ = std::move(registry);
    return *this;
}

auto bulk_transfer_client::builder::with_transport(std::string id) -> builder& {
    candidates_ = {std::move(id)};
    return *this;
}

auto bulk_transfer_client::builder::with_candidates(std::vector<std::string> ranked_ids)
    -> builder& {
    candidates_ = std::move(ranked_ids);
    return *this;
}

auto bulk_transfer_client::builder::with_transport_client(
    std::shared_ptr<transport_client> client) -> builder& {
    client_ = std::move(client);
    return *this;
}

auto bulk_transfer_client::builder::with_retry_policy(std::shared_ptr<const retry_policy> policy)
    -> builder& {
    policy_ = std::move(policy);
    return *this;
}

auto bulk_transfer_client::builder::build(const cancellation_token& token)
    -> result<bulk_transfer_client> {
    if (auto valid = config_.validate(); !valid) {
        return unexpected{valid.error()};
    }

    auto transport = client_;
    if (!transport) {
        auto registry = registry_ ? registry_ : transport_registry::with_defaults();
        auto candidates = candidates_.empty() ? registry->ids() : candidates_;
        auto selected = registry->select_best(candidates, config_, token);
        if (!selected) {
            BT_LOG_ERROR(log_category::client,
                         "No usable transport: " + selected.error().message);
            return unexpected{selected.error()};
        }
        transport = std::move(selected).value();
    }

    BT_LOG_INFO(log_category::client, "Using transport '" + transport->id() + "'");
    return bulk_transfer_client{std::move(config_), std::move(transport), std::move(policy_)};
}

// ============================================================================
// bulk_transfer_client
// ============================================================================

bulk_transfer_client::bulk_transfer_client(client_configuration config,
                                           std::shared_ptr<transport_client> transport,
                                           std::shared_ptr<const retry_policy> policy)
    : impl_(std::make_unique<impl>(std::move(config), std::move(transport), std::move(policy))) {}

bulk_transfer_client::~bulk_transfer_client() = default;

bulk_transfer_client::bulk_transfer_client(bulk_transfer_client&&) noexcept = default;

auto bulk_transfer_client::operator=(bulk_transfer_client&&) noexcept
    -> bulk_transfer_client& = default;

auto bulk_transfer_client::create_job(const transfer_request& request,
                                      const cancellation_token& token)
    -> result<std::unique_ptr<transfer_job>> {
    return transfer_job::create(request, impl_->transport, impl_->policy, impl_->config, token);
}

auto bulk_transfer_client::transfer(const transfer_request& request,
                                    const cancellation_token& token)
    -> result<transfer_result> {
    auto created = create_job(request, token);
    if (!created) {
        return unexpected{created.error()};
    }
    auto job = std::move(created).value();

    auto added = job->add_paths(request.paths, token);
    if (!added && added.error().code != error_code::operation_canceled &&
        !is_terminal(job->status())) {
        job->dispose();
        return unexpected{added.error()};
    }

    // A canceled or aborted job still completes so that the result reports why.
    auto finished = job->complete(token);
    job->dispose();
    return finished;
}

auto bulk_transfer_client::create_enumerator(enumeration_mode mode) const
    -> result<path_enumerator> {
    if (mode == enumeration_mode::local) {
        return path_enumerator(std::make_shared<local_path_source>());
    }
    if (!impl_->transport->supports_listing()) {
        return make_error(error_code::unsupported_operation,
                          "transport '" + impl_->transport->id() +
                              "' cannot list directories");
    }
    return path_enumerator(std::make_shared<remote_path_source>(
        impl_->transport, 1000, impl_->config.max_paging_parallelism));
}

auto bulk_transfer_client::enumeration_defaults() const -> enumeration_context {
    auto context = enumeration_context::from(impl_->config);
    if (context.max_path_length == 0) {
        context.max_path_length = impl_->transport->max_path_length();
    }
    return context;
}

auto bulk_transfer_client::transfer_batches(const std::vector<batch_descriptor>& batches,
                                            const transfer_request& request_template,
                                            const cancellation_token& token)
    -> result<std::vector<transfer_result>> {
    std::vector<transfer_result> results;
    results.reserve(batches.size());

    for (const auto& batch : batches) {
        if (token.is_canceled()) {
            BT_LOG_WARN(log_category::client,
                        "Batch run canceled after " + std::to_string(results.size()) + " of " +
                            std::to_string(batches.size()) + " batches");
            break;
        }

        auto contents = batch_file::read(batch.location);
        if (!contents) {
            return unexpected{contents.error()};
        }

        auto request = request_template;
        request.paths = std::move(contents.value().paths);
        request.client_request_id = generate_correlation_id();
        if (!request_template.name.empty()) {
            request.name = request_template.name + " #" + std::to_string(batch.batch_number);
        }

        BT_LOG_INFO(log_category::client,
                    "Transferring batch " + std::to_string(batch.batch_number) + " (" +
                        std::to_string(request.paths.size()) + " files)");

        auto finished = transfer(request, token);
        if (!finished) {
            return unexpected{finished.error()};
        }
        results.push_back(std::move(finished).value());
    }
    return results;
}

auto bulk_transfer_client::change_data_rate(uint32_t min_mbps,
                                            uint32_t target_mbps,
                                            const cancellation_token& token) -> result<void> {
    if (min_mbps > target_mbps && target_mbps != 0) {
        return make_error(error_code::invalid_argument,
                          "minimum data rate exceeds target data rate");
    }
    if (!impl_->transport->supports_data_rate_change()) {
        return make_error(error_code::unsupported_operation,
                          "transport '" + impl_->transport->id() +
                              "' cannot change its data rate");
    }

    std::lock_guard lock(impl_->rate_mutex);
    auto changed = impl_->transport->change_data_rate(min_mbps, target_mbps, token);
    if (changed) {
        impl_->config.min_data_rate_mbps = min_mbps;
        impl_->config.target_data_rate_mbps = target_mbps;
    }
    return changed;
}

auto bulk_transfer_client::config() const -> const client_configuration& {
    return impl_->config;
}

auto bulk_transfer_client::transport() const -> std::shared_ptr<transport_client> {
    return impl_->transport;
}

}  // namespace kcenon::bulk_transfer
