/**
 * @file client_config.h
 * @brief Client and per-request configuration
 */

#ifndef KCENON_BLOB_TRANSFER_BLOB_CLIENT_CONFIG_H
#define KCENON_BLOB_TRANSFER_BLOB_CLIENT_CONFIG_H

#include "retry_policy.h"
#include "kcenon/blob_transfer/auth/storage_credentials.h"
#include "kcenon/blob_transfer/core/buffer_pool.h"
#include "kcenon/blob_transfer/core/cancellation.h"
#include "kcenon/blob_transfer/core/types.h"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace kcenon::blob_transfer {

// ============================================================================
// Limits
// ============================================================================

inline constexpr uint64_t kib = 1024;
inline constexpr uint64_t mib = 1024 * kib;

/// Largest block accepted by Put Block
inline constexpr uint64_t max_block_size = 100 * mib;

/// Largest payload accepted by a single Put Blob
inline constexpr uint64_t max_single_shot_threshold = 256 * mib;

/// Largest number of blocks in one committed blob
inline constexpr std::size_t max_block_count = 50000;

/// Ranges up to this size may request a transactional MD5
inline constexpr uint64_t max_transactional_md5_range = 4 * mib;

/**
 * @brief Progress callback: bytes completed so far and total when known
 */
using progress_handler =
    std::function<void(uint64_t bytes_transferred, std::optional<uint64_t> total_bytes)>;

// ============================================================================
// Request options
// ============================================================================

/**
 * @brief Per-operation options for transfers and streams
 */
struct blob_request_options {
    /// Seekable sources of known length up to this size use one Put Blob
    uint64_t single_shot_threshold = 128 * mib;

    /// Block size for uploads and range size for downloads
    uint64_t block_size = 4 * mib;

    /// Buffer size of a write stream; one full buffer becomes one block
    uint64_t stream_write_size = 4 * mib;

    /// Maximum blocks in flight
    std::size_t parallelism = 1;

    /// Compute the whole-content MD5 and store it with the blob
    bool store_content_md5 = false;

    /// Send Content-MD5 with each block and request it for ranges
    bool use_transactional_md5 = false;

    /// Send x-ms-content-crc64 with each block
    bool use_transactional_crc64 = false;

    /// Skip validation of the stored Content-MD5 on whole-blob reads
    bool disable_content_md5_validation = false;

    /// Overrides the client retry policy
    std::optional<retry_policy> retry;

    location_mode location = location_mode::primary_only;

    /// Optional shared buffer pool; a private one is used otherwise
    std::shared_ptr<buffer_pool> pool;

    cancellation_token cancellation;

    progress_handler on_progress;

    /**
     * @brief Reject out-of-range settings before any request is made
     */
    [[nodiscard]] auto validate() const -> result<void>;
};

// ============================================================================
// Client configuration
// ============================================================================

/**
 * @brief Configuration for blob_service_client
 */
struct blob_client_config {
    /// Storage account name
    std::string account_name;

    /// Primary blob endpoint; derived from the account name when empty
    std::string endpoint;

    /// Secondary (read-only) endpoint; derived when empty
    std::string secondary_endpoint;

    bool use_ssl = true;

    /// Value sent as x-ms-version
    std::string api_version = "2019-02-02";

    std::chrono::milliseconds timeout{30000};

    retry_policy retry;

    blob_request_options default_request_options;

    [[nodiscard]] auto primary_endpoint() const -> std::string;
    [[nodiscard]] auto secondary_endpoint_url() const -> std::string;

    [[nodiscard]] auto endpoint_for(storage_location location) const -> std::string {
        return location == storage_location::primary ? primary_endpoint()
                                                     : secondary_endpoint_url();
    }

    [[nodiscard]] auto validate() const -> result<void>;
};

/**
 * @brief Fluent builder for blob_client_config
 */
class blob_client_config_builder {
public:
    blob_client_config_builder() = default;

    /**
     * @brief Start from a connection string (account and endpoint)
     */
    [[nodiscard]] static auto from_connection_string(const std::string& connection_string)
        -> result<blob_client_config_builder>;

    auto with_account(std::string account_name) -> blob_client_config_builder& {
        config_.account_name = std::move(account_name);
        return *this;
    }

    auto with_endpoint(std::string endpoint) -> blob_client_config_builder& {
        config_.endpoint = std::move(endpoint);
        return *this;
    }

    auto with_secondary_endpoint(std::string endpoint) -> blob_client_config_builder& {
        config_.secondary_endpoint = std::move(endpoint);
        return *this;
    }

    auto with_ssl(bool enable) -> blob_client_config_builder& {
        config_.use_ssl = enable;
        return *this;
    }

    auto with_api_version(std::string version) -> blob_client_config_builder& {
        config_.api_version = std::move(version);
        return *this;
    }

    auto with_timeout(std::chrono::milliseconds timeout) -> blob_client_config_builder& {
        config_.timeout = timeout;
        return *this;
    }

    auto with_retry_policy(retry_policy policy) -> blob_client_config_builder& {
        config_.retry = std::move(policy);
        return *this;
    }

    auto with_request_options(blob_request_options options) -> blob_client_config_builder& {
        config_.default_request_options = std::move(options);
        return *this;
    }

    [[nodiscard]] auto build() const -> result<blob_client_config>;

private:
    blob_client_config config_;
};

}  // namespace kcenon::blob_transfer

#endif  // KCENON_BLOB_TRANSFER_BLOB_CLIENT_CONFIG_H
