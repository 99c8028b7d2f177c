/**
 * @file batch_result.h
 * @brief Parsed batch outcomes and their aggregation into a single result
 */

#ifndef KCENON_BLOB_TRANSFER_BATCH_BATCH_RESULT_H
#define KCENON_BLOB_TRANSFER_BATCH_BATCH_RESULT_H

#include "kcenon/blob_transfer/core/types.h"
#include "kcenon/blob_transfer/http/http_types.h"

#include <cstddef>
#include <string>
#include <vector>

namespace kcenon::blob_transfer {

/**
 * @brief Successful sub-response
 */
struct batch_sub_response {
    std::size_t operation_index = 0;
    int status_code = 0;
    http_headers headers;
};

/**
 * @brief Failed sub-response with the service's error detail
 */
struct batch_sub_error {
    std::size_t operation_index = 0;
    int status_code = 0;
    std::string error_code;
    std::string message;
};

/**
 * @brief Every sub-response of one batch, split by outcome
 *
 * Both lists are in operation index order.
 */
struct batch_outcome {
    std::vector<batch_sub_response> successes;
    std::vector<batch_sub_error> errors;

    [[nodiscard]] auto total() const noexcept -> std::size_t {
        return successes.size() + errors.size();
    }
    [[nodiscard]] auto all_succeeded() const noexcept -> bool { return errors.empty(); }
};

class batch_result_aggregator {
public:
    /**
     * @brief Success list when nothing failed, batch_operation_failed otherwise
     *
     * The error carries the complete outcome (error::batch_failure()) so
     * callers see the successes next to the failures.
     */
    [[nodiscard]] static auto aggregate(batch_outcome outcome)
        -> result<std::vector<batch_sub_response>>;
};

}  // namespace kcenon::blob_transfer

#endif  // KCENON_BLOB_TRANSFER_BATCH_BATCH_RESULT_H
