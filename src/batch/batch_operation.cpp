/**
 * @file batch_operation.cpp
 * @brief Batch sub-operation collection
 */

#include "kcenon/blob_transfer/batch/batch_operation.h"

namespace kcenon::blob_transfer {

auto blob_batch::add_operation(sub_operation operation) -> result<std::size_t> {
    if (operations_.size() >= max_operations) {
        return unexpected{error{error_code::batch_too_large,
            "A batch holds at most " + std::to_string(max_operations) + " operations"}};
    }
    if (operation.container.empty() || operation.blob.empty()) {
        return unexpected{error{error_code::invalid_argument,
            "Batch operations need a container and a blob name"}};
    }
    operation.index = operations_.size();
    operations_.push_back(std::move(operation));
    return operations_.back().index;
}

auto blob_delete_batch::add_delete(std::string container,
                                   std::string blob,
                                   delete_snapshots_option snapshots,
                                   access_condition condition,
                                   std::optional<storage_credentials> credentials)
    -> result<std::size_t> {
    sub_operation op;
    op.container = std::move(container);
    op.blob = std::move(blob);
    op.parameters = delete_parameters{snapshots};
    op.condition = std::move(condition);
    op.credentials = std::move(credentials);
    return add_operation(std::move(op));
}

auto blob_set_tier_batch::add_set_tier(std::string container,
                                       std::string blob,
                                       standard_blob_tier tier,
                                       std::optional<rehydrate_priority> priority,
                                       std::optional<storage_credentials> credentials)
    -> result<std::size_t> {
    sub_operation op;
    op.container = std::move(container);
    op.blob = std::move(blob);
    op.parameters = set_tier_parameters{tier, priority};
    op.credentials = std::move(credentials);
    return add_operation(std::move(op));
}

}  // namespace kcenon::blob_transfer
