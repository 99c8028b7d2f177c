/**
 * @file service_context.h
 * @brief Shared request execution state for the blob clients
 *
 * One service_context is owned by a blob_service_client and shared by
 * every block_blob_client and write stream created from it. It builds
 * URLs, stamps protocol headers, signs, sends through the transport,
 * retries and turns error responses into errors.
 */

#ifndef KCENON_BLOB_TRANSFER_BLOB_SERVICE_CONTEXT_H
#define KCENON_BLOB_TRANSFER_BLOB_SERVICE_CONTEXT_H

#include "client_config.h"
#include "retry_policy.h"
#include "kcenon/blob_transfer/adapters/thread_pool_adapter.h"
#include "kcenon/blob_transfer/auth/request_signer.h"
#include "kcenon/blob_transfer/auth/storage_credentials.h"
#include "kcenon/blob_transfer/core/types.h"
#include "kcenon/blob_transfer/http/http_transport.h"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace kcenon::blob_transfer {

/**
 * @brief Request and byte counters for a service client
 */
struct transfer_statistics {
    uint64_t requests_sent = 0;
    uint64_t bytes_uploaded = 0;
    uint64_t bytes_downloaded = 0;
    uint64_t retries = 0;
    uint64_t failed_requests = 0;
};

/**
 * @brief Turn a non-success response into an error
 *
 * 404 blob_not_found, 412 precondition_failed, 409 conflict,
 * 304 not_modified, 403 authentication_failed, 503 server_busy,
 * 400 Md5Mismatch/Crc64Mismatch checksum_mismatch, others service_error.
 * The service code, message and request id are attached.
 */
[[nodiscard]] auto classify_response(const http_response& response) -> error;

/**
 * @brief Builds a request for a given storage location
 */
using request_factory = std::function<http_request(storage_location)>;

class service_context {
public:
    service_context(blob_client_config config,
                    storage_credentials credentials,
                    std::shared_ptr<http_transport_interface> transport,
                    std::shared_ptr<request_signer> signer);

    service_context(const service_context&) = delete;
    auto operator=(const service_context&) -> service_context& = delete;

    [[nodiscard]] auto config() const -> const blob_client_config& { return config_; }
    [[nodiscard]] auto credentials() const -> const storage_credentials& { return credentials_; }
    [[nodiscard]] auto signer() const -> request_signer& { return *signer_; }

    /**
     * @brief URL of a blob (or container when @p blob is empty)
     * @param query Raw query without '?', may be empty
     */
    [[nodiscard]] auto resource_url(storage_location location,
                                    const std::string& container,
                                    const std::string& blob,
                                    const std::string& query = {}) const -> std::string;

    /**
     * @brief Service-relative path of a blob, as used inside a batch
     */
    [[nodiscard]] auto resource_path(const std::string& container,
                                     const std::string& blob) const -> std::string;

    /**
     * @brief Stamp protocol headers, sign and send one request
     *
     * Responses whose status is not in @p expected become errors.
     */
    [[nodiscard]] auto send_once(http_request request,
                                 const std::vector<int>& expected) -> result<http_response>;

    /**
     * @brief send_once under the retry policy
     */
    [[nodiscard]] auto execute(const request_factory& factory,
                               const std::vector<int>& expected,
                               const retry_policy& policy,
                               location_mode mode = location_mode::primary_only)
        -> result<http_response>;

    /**
     * @brief Worker pool shared by all transfers of this client
     */
    [[nodiscard]] auto thread_pool() -> std::shared_ptr<adapters::transfer_thread_pool_interface>;

    [[nodiscard]] auto statistics() const -> transfer_statistics;
    void reset_statistics();

private:
    void add_protocol_headers(http_request& request) const;

    blob_client_config config_;
    storage_credentials credentials_;
    std::shared_ptr<http_transport_interface> transport_;
    std::shared_ptr<request_signer> signer_;

    std::mutex pool_mutex_;
    std::shared_ptr<adapters::transfer_thread_pool_interface> pool_;

    std::atomic<uint64_t> requests_sent_{0};
    std::atomic<uint64_t> bytes_uploaded_{0};
    std::atomic<uint64_t> bytes_downloaded_{0};
    std::atomic<uint64_t> retries_{0};
    std::atomic<uint64_t> failed_requests_{0};
};

}  // namespace kcenon::blob_transfer

#endif  // KCENON_BLOB_TRANSFER_BLOB_SERVICE_CONTEXT_H
