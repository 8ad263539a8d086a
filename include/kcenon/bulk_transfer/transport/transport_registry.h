/**
 * @file transport_registry.h
 * @brief Identifier to factory mapping for transport clients
 */

#ifndef KCENON_BULK_TRANSFER_TRANSPORT_TRANSPORT_REGISTRY_H
#define KCENON_BULK_TRANSFER_TRANSPORT_TRANSPORT_REGISTRY_H

#include <functional>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

#include "kcenon/bulk_transfer/core/cancellation.h"
#include "kcenon/bulk_transfer/core/types.h"
#include "kcenon/bulk_transfer/job/client_configuration.h"
#include "kcenon/bulk_transfer/transport/transport_client.h"

namespace kcenon::bulk_transfer {

using transport_factory =
    std::function<std::shared_ptr<transport_client>(const client_configuration&)>;

/**
 * @brief Registry of transport factories
 *
 * Registries are plain objects handed to the client builder; there is no
 * process-wide registry.
 *
 * @code
 * auto registry = transport_registry::with_defaults();
 * registry->register_factory("custom", [](const client_configuration& config) {
 *     return std::make_shared<custom_client>(config);
 * });
 * auto client = registry->select_best({"custom", "file_share"}, config);
 * @endcode
 *
 * @note Thread-safe: All public methods are safe to call from multiple threads.
 */
class transport_registry {
public:
    transport_registry() = default;

    transport_registry(const transport_registry&) = delete;
    auto operator=(const transport_registry&) -> transport_registry& = delete;

    /**
     * @brief Registry with the built-in transports ("file_share")
     */
    [[nodiscard]] static auto with_defaults() -> std::shared_ptr<transport_registry>;

    /**
     * @return invalid_argument for an empty id or factory, invalid_state
     *         when the id is already registered
     */
    [[nodiscard]] auto register_factory(const std::string& id, transport_factory factory)
        -> result<void>;

    auto unregister(const std::string& id) -> bool;

    [[nodiscard]] auto contains(const std::string& id) const -> bool;

    /**
     * @brief Registered identifiers in lexical order
     */
    [[nodiscard]] auto ids() const -> std::vector<std::string>;

    /**
     * @brief Create a transport by identifier
     * @return transport_not_found for an unknown id, transport_error when
     *         the factory returns nothing
     */
    [[nodiscard]] auto create(const std::string& id, const client_configuration& config) const
        -> result<std::shared_ptr<transport_client>>;

    /**
     * @brief First candidate, in the given order, whose support check passes
     * @return transport_not_supported when no candidate is usable,
     *         operation_canceled when @p token fires
     */
    [[nodiscard]] auto select_best(const std::vector<std::string>& ranked_ids,
                                   const client_configuration& config,
                                   const cancellation_token& token = {}) const
        -> result<std::shared_ptr<transport_client>>;

private:
    mutable std::shared_mutex mutex_;
    std::map<std::string, transport_factory> factories_;
};

}  // namespace kcenon::bulk_transfer

#endif  // KCENON_BULK_TRANSFER_TRANSPORT_TRANSPORT_REGISTRY_H
