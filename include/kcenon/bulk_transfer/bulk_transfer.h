/**
 * @file bulk_transfer.h
 * @brief Main header for bulk_trans_system library
 * @version 0.1.0
 *
 * Include this header to access the transfer job engine, the enumerator and
 * the bundled transports.
 *
 * @code
 * #include <kcenon/bulk_transfer/bulk_transfer.h>
 *
 * using namespace kcenon::bulk_transfer;
 *
 * auto client = bulk_transfer_client::builder()
 *     .with_transport("file_share")
 *     .build();
 * @endcode
 */

#ifndef KCENON_BULK_TRANSFER_BULK_TRANSFER_H
#define KCENON_BULK_TRANSFER_BULK_TRANSFER_H

#include <cstdint>
#include <string>

// Core
#include "kcenon/bulk_transfer/core/cancellation.h"
#include "kcenon/bulk_transfer/core/checksum.h"
#include "kcenon/bulk_transfer/core/error_codes.h"
#include "kcenon/bulk_transfer/core/issue.h"
#include "kcenon/bulk_transfer/core/logging.h"
#include "kcenon/bulk_transfer/core/path_record.h"
#include "kcenon/bulk_transfer/core/retry_policy.h"
#include "kcenon/bulk_transfer/core/statistics_aggregator.h"
#include "kcenon/bulk_transfer/core/types.h"

// Job
#include "kcenon/bulk_transfer/job/client_configuration.h"
#include "kcenon/bulk_transfer/job/transfer_context.h"
#include "kcenon/bulk_transfer/job/transfer_job.h"
#include "kcenon/bulk_transfer/job/transfer_request.h"

// Transport
#include "kcenon/bulk_transfer/transport/file_share_client.h"
#include "kcenon/bulk_transfer/transport/transport_client.h"
#include "kcenon/bulk_transfer/transport/transport_registry.h"

// Enumeration
#include "kcenon/bulk_transfer/enumeration/batch_file.h"
#include "kcenon/bulk_transfer/enumeration/path_enumerator.h"

// Client
#include "kcenon/bulk_transfer/client/bulk_transfer_client.h"

namespace kcenon::bulk_transfer {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    /**
     * @brief Get version string
     * @return Version string in format "major.minor.patch"
     */
    static std::string to_string() {
        return std::to_string(major) + "." + std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace kcenon::bulk_transfer

#endif  // KCENON_BULK_TRANSFER_BULK_TRANSFER_H
