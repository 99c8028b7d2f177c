/**
 * @file batch_request_builder.h
 * @brief Serializes a blob batch into one multipart/mixed request
 */

#ifndef KCENON_BLOB_TRANSFER_BATCH_BATCH_REQUEST_BUILDER_H
#define KCENON_BLOB_TRANSFER_BATCH_BATCH_REQUEST_BUILDER_H

#include "batch_operation.h"
#include "kcenon/blob_transfer/blob/service_context.h"
#include "kcenon/blob_transfer/core/types.h"
#include "kcenon/blob_transfer/http/http_types.h"

#include <string>

namespace kcenon::blob_transfer {

/**
 * @brief Builds batch requests for one service context
 *
 * Every sub-request is a complete HTTP request: it gets its own x-ms-date,
 * operation headers and access condition headers, and is signed with the
 * operation's credentials when it has any, otherwise with the client's.
 * Sub-requests carry no x-ms-version; the outer request does.
 */
class batch_request_builder {
public:
    explicit batch_request_builder(const service_context& context);

    /**
     * @brief Build the outer POST ?comp=batch request
     * @param boundary Multipart boundary; "batch_<uuid>" when empty
     *
     * The result is unsigned; the outer request is signed when sent.
     */
    [[nodiscard]] auto build(const blob_batch& batch, std::string boundary = {}) const
        -> result<http_request>;

    /**
     * @brief Build and sign one sub-request with its absolute URL
     */
    [[nodiscard]] auto build_sub_request(const sub_operation& operation,
                                         batch_operation_type type) const
        -> result<http_request>;

private:
    const service_context& context_;
};

}  // namespace kcenon::blob_transfer

#endif  // KCENON_BLOB_TRANSFER_BATCH_BATCH_REQUEST_BUILDER_H
