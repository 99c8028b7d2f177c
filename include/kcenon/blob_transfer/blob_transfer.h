/**
 * @file blob_transfer.h
 * @brief Main include file for the blob transfer library
 *
 * Chunked block blob uploads and downloads, buffered write streams and
 * blob batch execution over an injectable HTTP transport.
 *
 * @code
 * #include <kcenon/blob_transfer/blob_transfer.h>
 *
 * using namespace kcenon::blob_transfer;
 *
 * auto client = blob_service_client::from_connection_string(conn);
 * auto blob = client.value()->get_block_blob_client("data", "report.csv");
 *
 * blob_request_options options;
 * options.parallelism = 4;
 * options.store_content_md5 = true;
 *
 * auto source = file_byte_source::open("report.csv");
 * auto summary = blob.upload_from_stream(*source.value(),
 *     stream_descriptor::seekable_of(source.value()->size()), {}, options);
 * @endcode
 */

#ifndef KCENON_BLOB_TRANSFER_BLOB_TRANSFER_H
#define KCENON_BLOB_TRANSFER_BLOB_TRANSFER_H

#include "kcenon/blob_transfer/config/feature_flags.h"

#include "kcenon/blob_transfer/core/types.h"
#include "kcenon/blob_transfer/core/cancellation.h"
#include "kcenon/blob_transfer/core/buffer_pool.h"
#include "kcenon/blob_transfer/core/checksum.h"
#include "kcenon/blob_transfer/core/logging.h"

#include "kcenon/blob_transfer/http/http_types.h"
#include "kcenon/blob_transfer/http/http_transport.h"

#include "kcenon/blob_transfer/auth/storage_credentials.h"
#include "kcenon/blob_transfer/auth/request_signer.h"

#include "kcenon/blob_transfer/blob/access_condition.h"
#include "kcenon/blob_transfer/blob/blob_types.h"
#include "kcenon/blob_transfer/blob/client_config.h"
#include "kcenon/blob_transfer/blob/block_blob_client.h"
#include "kcenon/blob_transfer/blob/blob_service_client.h"

#include "kcenon/blob_transfer/transfer/block_manifest.h"
#include "kcenon/blob_transfer/transfer/byte_stream.h"
#include "kcenon/blob_transfer/transfer/transfer_scheduler.h"

#include "kcenon/blob_transfer/stream/blob_write_stream.h"

#include "kcenon/blob_transfer/batch/batch_operation.h"
#include "kcenon/blob_transfer/batch/batch_result.h"

#include <string>

namespace kcenon::blob_transfer {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace kcenon::blob_transfer

#endif  // KCENON_BLOB_TRANSFER_BLOB_TRANSFER_H
