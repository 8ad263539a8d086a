/**
 * @file transport_registry.cpp
 * @brief Implementation of the transport registry
 */

#include "kcenon/bulk_transfer/transport/transport_registry.h"

#include <mutex>

#include "kcenon/bulk_transfer/core/logging.h"
#include "kcenon/bulk_transfer/transport/file_share_client.h"

namespace kcenon::bulk_transfer {

auto transport_registry::with_defaults() -> std::shared_ptr<transport_registry> {
    auto registry = std::make_shared<transport_registry>();
    auto registered = registry->register_factory(
        std::string(file_share_client::identifier), [](const client_configuration& config) {
            return std::make_shared<file_share_client>(file_share_options::from(config));
        });
    if (!registered) {
        BT_LOG_ERROR(log_category::transport,
                     "Failed to register file_share transport: " + registered.error().message);
    }
    return registry;
}

auto transport_registry::register_factory(const std::string& id, transport_factory factory)
    -> result<void> {
    if (id.empty() || !factory) {
        return make_error(error_code::invalid_argument,
                          "transport id and factory must not be empty");
    }

    std::unique_lock lock(mutex_);
    if (factories_.count(id) > 0) {
        return make_error(error_code::invalid_state, "transport already registered: " + id);
    }
    factories_.emplace(id, std::move(factory));
    return {};
}

auto transport_registry::unregister(const std::string& id) -> bool {
    std::unique_lock lock(mutex_);
    return factories_.erase(id) > 0;
}

auto transport_registry::contains(const std::string& id) const -> bool {
    std::shared_lock lock(mutex_);
    return factories_.count(id) > 0;
}

auto transport_registry::ids() const -> std::vector<std::string> {
    std::shared_lock lock(mutex_);
    std::vector<std::string> result;
    result.reserve(factories_.size());
    for (const auto& [id, factory] : factories_) {
        result.push_back(id);
    }
    return result;
}

auto transport_registry::create(const std::string& id, const client_configuration& config) const
    -> result<std::shared_ptr<transport_client>> {
    transport_factory factory;
    {
        std::shared_lock lock(mutex_);
        auto it = factories_.find(id);
        if (it == factories_.end()) {
            return make_error(error_code::transport_not_found, "unknown transport: " + id);
        }
        factory = it->second;
    }

    auto client = factory(config);
    if (!client) {
        return make_error(error_code::transport_error,
                          "transport factory returned no client: " + id);
    }
    return client;
}

auto transport_registry::select_best(const std::vector<std::string>& ranked_ids,
                                     const client_configuration& config,
                                     const cancellation_token& token) const
    -> result<std::shared_ptr<transport_client>> {
    std::string reasons;
    for (const auto& id : ranked_ids) {
        if (token.is_canceled()) {
            return make_error(error_code::operation_canceled, "transport selection canceled");
        }

        auto created = create(id, config);
        if (!created) {
            BT_LOG_DEBUG(log_category::transport,
                         "Skipping transport " + id + ": " + created.error().message);
            reasons += (reasons.empty() ? "" : "; ") + id + ": " + created.error().message;
            continue;
        }

        auto support = created.value()->support_check(token);
        if (support.supported) {
            BT_LOG_INFO(log_category::transport, "Selected transport " + id);
            return created;
        }
        BT_LOG_DEBUG(log_category::transport,
                     "Transport " + id + " not supported: " + support.reason);
        reasons += (reasons.empty() ? "" : "; ") + id + ": " + support.reason;
    }

    return make_error(error_code::transport_not_supported,
                      reasons.empty() ? "no transport candidates" : reasons);
}

}  // namespace kcenon::bulk_transfer
