/**
 * @file transfer_scheduler.h
 * @brief Chunked upload and download planning for block blobs
 *
 * Uploads pick between a single Put Blob and a sequence of Put Block
 * requests followed by one Put Block List. Downloads read the blob
 * properties first and then fetch either the whole blob or fixed-size
 * ranges pinned to the observed ETag.
 */

#ifndef KCENON_BLOB_TRANSFER_TRANSFER_TRANSFER_SCHEDULER_H
#define KCENON_BLOB_TRANSFER_TRANSFER_TRANSFER_SCHEDULER_H

#include "block_pipeline.h"
#include "byte_stream.h"
#include "kcenon/blob_transfer/blob/access_condition.h"
#include "kcenon/blob_transfer/blob/block_blob_client.h"
#include "kcenon/blob_transfer/blob/client_config.h"
#include "kcenon/blob_transfer/core/types.h"

#include <cstdint>
#include <vector>

namespace kcenon::blob_transfer {

/**
 * @brief Whether an upload of @p descriptor goes out as one Put Blob
 *
 * True only for seekable sources of known length no larger than the
 * single-shot threshold.
 */
[[nodiscard]] auto use_single_shot(const stream_descriptor& descriptor,
                                   const blob_request_options& options) -> bool;

/**
 * @brief Split @p length bytes into consecutive blocks of @p block_size
 *
 * The last block may be shorter. Fails with invalid_argument when more
 * than max_block_count blocks would be needed.
 */
[[nodiscard]] auto plan_blocks(uint64_t length, uint64_t block_size)
    -> result<std::vector<block_task_info>>;

class transfer_scheduler {
public:
    transfer_scheduler(const block_blob_client& client, blob_request_options options);

    /**
     * @brief Upload everything @p source produces
     *
     * Options are validated before any request is sent. On failure no
     * block list is committed; uploaded blocks stay uncommitted.
     */
    [[nodiscard]] auto upload(byte_source& source,
                              const stream_descriptor& descriptor,
                              const access_condition& condition) -> result<upload_summary>;

    /**
     * @brief Download the blob into @p sink
     *
     * @p condition is checked by the initial properties request; every
     * later request carries If-Match with the ETag it returned.
     */
    [[nodiscard]] auto download(byte_sink& sink, const access_condition& condition)
        -> result<download_summary>;

private:
    [[nodiscard]] auto upload_single_shot(byte_source& source,
                                          uint64_t length,
                                          const access_condition& condition)
        -> result<upload_summary>;

    [[nodiscard]] auto upload_blocks(byte_source& source,
                                     const stream_descriptor& descriptor,
                                     const access_condition& condition)
        -> result<upload_summary>;

    void report_progress(uint64_t transferred, std::optional<uint64_t> total) const;

    block_blob_client client_;
    blob_request_options options_;
};

}  // namespace kcenon::blob_transfer

#endif  // KCENON_BLOB_TRANSFER_TRANSFER_TRANSFER_SCHEDULER_H
