/**
 * @file batch_result.cpp
 * @brief Batch outcome aggregation
 */

#include "kcenon/blob_transfer/batch/batch_result.h"
#include "kcenon/blob_transfer/core/logging.h"

#include <memory>

namespace kcenon::blob_transfer {

auto batch_result_aggregator::aggregate(batch_outcome outcome)
    -> result<std::vector<batch_sub_response>> {
    if (outcome.all_succeeded()) {
        return std::move(outcome.successes);
    }

    std::string message = std::to_string(outcome.errors.size()) + " of " +
                          std::to_string(outcome.total()) + " batch operations failed";
    const auto& first = outcome.errors.front();
    message += "; first: operation " + std::to_string(first.operation_index) + " " +
               std::to_string(first.status_code) + " " + first.error_code;

    BT_LOG_WARN(log_category::batch, message);

    error err{error_code::batch_operation_failed, std::move(message)};
    err.batch = std::make_shared<batch_outcome>(std::move(outcome));
    return unexpected{std::move(err)};
}

}  // namespace kcenon::blob_transfer
