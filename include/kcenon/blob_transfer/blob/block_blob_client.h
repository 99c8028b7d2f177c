/**
 * @file block_blob_client.h
 * @brief Operations on a single block blob
 */

#ifndef KCENON_BLOB_TRANSFER_BLOB_BLOCK_BLOB_CLIENT_H
#define KCENON_BLOB_TRANSFER_BLOB_BLOCK_BLOB_CLIENT_H

#include "access_condition.h"
#include "blob_types.h"
#include "client_config.h"
#include "service_context.h"
#include "kcenon/blob_transfer/core/types.h"
#include "kcenon/blob_transfer/transfer/block_manifest.h"
#include "kcenon/blob_transfer/transfer/byte_stream.h"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace kcenon::blob_transfer {

class blob_write_stream;

/**
 * @brief Outcome of an upload
 */
struct upload_summary {
    /// Committed manifest; empty for a single-shot upload
    block_manifest manifest;
    bool single_shot = false;
    uint64_t bytes_uploaded = 0;
    std::optional<std::string> content_md5;
    std::string etag;
};

/**
 * @brief Outcome of a download
 */
struct download_summary {
    blob_properties properties;
    uint64_t bytes_downloaded = 0;
    std::size_t range_count = 0;
};

/**
 * @brief Client bound to one blob
 *
 * Cheap to copy; all copies share the owning service's context. Options
 * default to the client configuration's default_request_options.
 */
class block_blob_client {
public:
    using options_ref = const std::optional<blob_request_options>&;

    block_blob_client(std::shared_ptr<service_context> context,
                      std::string container,
                      std::string blob);

    [[nodiscard]] auto container_name() const -> const std::string& { return container_; }
    [[nodiscard]] auto blob_name() const -> const std::string& { return blob_; }
    [[nodiscard]] auto url() const -> std::string;

    /**
     * @brief Client for a snapshot of this blob
     *
     * Every request carries the snapshot parameter. Snapshots are read-only;
     * only reads and delete_blob() succeed against them.
     */
    [[nodiscard]] auto with_snapshot(std::string snapshot) const -> block_blob_client;

    /// Snapshot timestamp; empty for the base blob
    [[nodiscard]] auto snapshot() const -> const std::string& { return snapshot_; }
    [[nodiscard]] auto is_snapshot() const noexcept -> bool { return !snapshot_.empty(); }

    // ========================================================================
    // Block operations
    // ========================================================================

    /**
     * @brief Upload one uncommitted block
     *
     * Sends Content-MD5 or x-ms-content-crc64 when the matching
     * transactional option is set.
     */
    [[nodiscard]] auto put_block(const std::string& block_id,
                                 std::span<const std::byte> data,
                                 options_ref options = std::nullopt) const -> result<void>;

    /**
     * @brief Commit a manifest
     * @param content_md5 Stored as the blob's Content-MD5 when set
     * @return New ETag
     */
    [[nodiscard]] auto put_block_list(const block_manifest& manifest,
                                      const access_condition& condition = {},
                                      const std::optional<std::string>& content_md5 = std::nullopt,
                                      options_ref options = std::nullopt) const
        -> result<std::string>;

    [[nodiscard]] auto get_block_list(block_listing_filter filter = block_listing_filter::committed,
                                      const access_condition& condition = {},
                                      options_ref options = std::nullopt) const
        -> result<block_list>;

    /**
     * @brief Single-request upload
     * @return New ETag
     */
    [[nodiscard]] auto put_blob(std::span<const std::byte> data,
                                const access_condition& condition = {},
                                options_ref options = std::nullopt) const -> result<std::string>;

    // ========================================================================
    // Uploads
    // ========================================================================

    [[nodiscard]] auto upload_from_stream(byte_source& source,
                                          const stream_descriptor& descriptor,
                                          const access_condition& condition = {},
                                          options_ref options = std::nullopt) const
        -> result<upload_summary>;

    [[nodiscard]] auto upload_from_bytes(std::span<const std::byte> data,
                                         const access_condition& condition = {},
                                         options_ref options = std::nullopt) const
        -> result<upload_summary>;

    [[nodiscard]] auto upload_text(std::string_view text,
                                   const access_condition& condition = {},
                                   options_ref options = std::nullopt) const
        -> result<upload_summary>;

    [[nodiscard]] auto upload_from_file(const std::filesystem::path& path,
                                        const access_condition& condition = {},
                                        options_ref options = std::nullopt) const
        -> result<upload_summary>;

    /**
     * @brief Open a buffered write stream
     *
     * With a condition, the current blob state is checked first: a missing
     * blob is accepted unless If-Match is set, 403 is accepted, and
     * If-None-Match "*" on an existing blob fails with conflict. The
     * condition is enforced again when the stream commits.
     */
    [[nodiscard]] auto open_write(const access_condition& condition = {},
                                  options_ref options = std::nullopt) const
        -> result<std::unique_ptr<blob_write_stream>>;

    // ========================================================================
    // Downloads
    // ========================================================================

    [[nodiscard]] auto download_to_sink(byte_sink& sink,
                                        const access_condition& condition = {},
                                        options_ref options = std::nullopt) const
        -> result<download_summary>;

    [[nodiscard]] auto download_to_bytes(const access_condition& condition = {},
                                         options_ref options = std::nullopt) const
        -> result<std::vector<std::byte>>;

    [[nodiscard]] auto download_text(const access_condition& condition = {},
                                     options_ref options = std::nullopt) const
        -> result<std::string>;

    /**
     * @brief Download into a new or truncated file
     *
     * The file is removed again when the download fails.
     */
    [[nodiscard]] auto download_to_file(const std::filesystem::path& path,
                                        const access_condition& condition = {},
                                        options_ref options = std::nullopt) const
        -> result<download_summary>;

    /**
     * @brief Read [offset, offset + length)
     *
     * Requests a transactional MD5 when enabled and the range is at most
     * 4 MiB; a mismatch is checksum_mismatch.
     */
    [[nodiscard]] auto download_range(uint64_t offset, uint64_t length,
                                      const access_condition& condition = {},
                                      options_ref options = std::nullopt) const
        -> result<std::vector<std::byte>>;

    // ========================================================================
    // Properties and management
    // ========================================================================

    [[nodiscard]] auto get_properties(const access_condition& condition = {},
                                      options_ref options = std::nullopt) const
        -> result<blob_properties>;

    [[nodiscard]] auto exists(options_ref options = std::nullopt) const -> result<bool>;

    /**
     * @brief Replace user metadata; empty names or values are invalid_metadata
     */
    [[nodiscard]] auto set_metadata(const std::map<std::string, std::string>& metadata,
                                    const access_condition& condition = {},
                                    options_ref options = std::nullopt) const -> result<void>;

    [[nodiscard]] auto delete_blob(delete_snapshots_option snapshots = delete_snapshots_option::none,
                                   const access_condition& condition = {},
                                   options_ref options = std::nullopt) const -> result<void>;

    [[nodiscard]] auto set_tier(standard_blob_tier tier,
                                std::optional<rehydrate_priority> priority = std::nullopt,
                                options_ref options = std::nullopt) const -> result<void>;

    /**
     * @brief Replace the blob's HTTP properties
     * @return New ETag
     */
    [[nodiscard]] auto set_properties(const blob_http_headers& headers,
                                      const access_condition& condition = {},
                                      options_ref options = std::nullopt) const
        -> result<std::string>;

    // ========================================================================
    // Snapshots and copies
    // ========================================================================

    /**
     * @brief Take a read-only snapshot
     * @param metadata Metadata of the snapshot; the blob's own when empty
     * @return Snapshot timestamp, usable with with_snapshot()
     */
    [[nodiscard]] auto create_snapshot(const std::map<std::string, std::string>& metadata = {},
                                       const access_condition& condition = {},
                                       options_ref options = std::nullopt) const
        -> result<std::string>;

    /**
     * @brief Start a server-side copy of @p source_url into this blob
     *
     * A copy reported as pending can be followed with get_properties() and
     * stopped with abort_copy().
     *
     * @param source_condition Checked against the source blob
     * @param condition Checked against this blob
     * @param metadata Metadata of the copy; the source's own when empty
     */
    [[nodiscard]] auto start_copy(const std::string& source_url,
                                  const access_condition& source_condition = {},
                                  const access_condition& condition = {},
                                  const std::map<std::string, std::string>& metadata = {},
                                  options_ref options = std::nullopt) const
        -> result<copy_state>;

    [[nodiscard]] auto start_copy(const block_blob_client& source,
                                  const access_condition& source_condition = {},
                                  const access_condition& condition = {},
                                  const std::map<std::string, std::string>& metadata = {},
                                  options_ref options = std::nullopt) const
        -> result<copy_state>;

    /**
     * @brief Stop a pending copy, leaving this blob empty
     */
    [[nodiscard]] auto abort_copy(const std::string& copy_id,
                                  const access_condition& condition = {},
                                  options_ref options = std::nullopt) const -> result<void>;

    /**
     * @brief Options after applying the client defaults
     */
    [[nodiscard]] auto resolve_options(options_ref options) const -> blob_request_options;

    [[nodiscard]] auto context() const -> const std::shared_ptr<service_context>& {
        return context_;
    }

private:
    [[nodiscard]] auto retry_for(const blob_request_options& options) const -> retry_policy;

    [[nodiscard]] auto make_request(http_method method, storage_location location,
                                    const std::string& query = {}) const -> http_request;

    std::shared_ptr<service_context> context_;
    std::string container_;
    std::string blob_;
    std::string snapshot_;
};

/**
 * @brief Parse a response's headers into blob properties
 */
[[nodiscard]] auto parse_blob_properties(const http_response& response) -> blob_properties;

/**
 * @brief Parse x-ms-copy-* headers; nullopt when no copy is reported
 */
[[nodiscard]] auto parse_copy_state(const http_response& response) -> std::optional<copy_state>;

/**
 * @brief Parse a Get Block List body
 */
[[nodiscard]] auto parse_block_list(const std::string& xml) -> result<block_list>;

}  // namespace kcenon::blob_transfer

#endif  // KCENON_BLOB_TRANSFER_BLOB_BLOCK_BLOB_CLIENT_H
