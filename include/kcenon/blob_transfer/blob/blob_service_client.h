/**
 * @file blob_service_client.h
 * @brief Entry point for an account's blob endpoint
 */

#ifndef KCENON_BLOB_TRANSFER_BLOB_BLOB_SERVICE_CLIENT_H
#define KCENON_BLOB_TRANSFER_BLOB_BLOB_SERVICE_CLIENT_H

#include "block_blob_client.h"
#include "client_config.h"
#include "service_context.h"
#include "kcenon/blob_transfer/auth/request_signer.h"
#include "kcenon/blob_transfer/auth/storage_credentials.h"
#include "kcenon/blob_transfer/batch/batch_operation.h"
#include "kcenon/blob_transfer/batch/batch_result.h"
#include "kcenon/blob_transfer/core/types.h"
#include "kcenon/blob_transfer/http/http_transport.h"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::blob_transfer {

/**
 * @brief Client for one storage account
 *
 * @code
 * auto client = blob_service_client::from_connection_string(conn);
 * if (!client.has_value()) return;
 *
 * auto blob = client.value()->get_block_blob_client("logs", "today.txt");
 * auto uploaded = blob.upload_text("hello");
 *
 * blob_delete_batch batch;
 * (void)batch.add_delete("logs", "yesterday.txt");
 * auto results = client.value()->execute_batch(batch);
 * @endcode
 */
class blob_service_client {
public:
    /**
     * @brief Create a client after validating @p config
     * @param transport Defaults to the network_system transport
     * @param signer Defaults to storage_request_signer
     */
    [[nodiscard]] static auto create(blob_client_config config,
                                     storage_credentials credentials,
                                     std::shared_ptr<http_transport_interface> transport = nullptr,
                                     std::shared_ptr<request_signer> signer = nullptr)
        -> result<std::unique_ptr<blob_service_client>>;

    [[nodiscard]] static auto from_connection_string(
        const std::string& connection_string,
        std::shared_ptr<http_transport_interface> transport = nullptr)
        -> result<std::unique_ptr<blob_service_client>>;

    blob_service_client(const blob_service_client&) = delete;
    auto operator=(const blob_service_client&) -> blob_service_client& = delete;

    [[nodiscard]] auto get_block_blob_client(const std::string& container,
                                             const std::string& blob) const -> block_blob_client;

    /**
     * @brief Send every operation of @p batch in one request
     *
     * Returns the successes when all operations succeed. When any fails,
     * the error is batch_operation_failed and error::batch_failure() holds
     * both lists. A rejected outer request (for example an empty batch)
     * is a plain service error.
     */
    [[nodiscard]] auto execute_batch(const blob_batch& batch,
                                     const std::optional<blob_request_options>& options =
                                         std::nullopt)
        -> result<std::vector<batch_sub_response>>;

    [[nodiscard]] auto config() const -> const blob_client_config& { return context_->config(); }
    [[nodiscard]] auto endpoint() const -> std::string { return context_->config().primary_endpoint(); }
    [[nodiscard]] auto credentials() const -> const storage_credentials& {
        return context_->credentials();
    }

    [[nodiscard]] auto statistics() const -> transfer_statistics { return context_->statistics(); }
    void reset_statistics() { context_->reset_statistics(); }

private:
    explicit blob_service_client(std::shared_ptr<service_context> context);

    std::shared_ptr<service_context> context_;
};

}  // namespace kcenon::blob_transfer

#endif  // KCENON_BLOB_TRANSFER_BLOB_BLOB_SERVICE_CLIENT_H
