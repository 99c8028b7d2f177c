/**
 * @file batch_operation.h
 * @brief Typed sub-operations collected into a blob batch
 */

#ifndef KCENON_BLOB_TRANSFER_BATCH_BATCH_OPERATION_H
#define KCENON_BLOB_TRANSFER_BATCH_BATCH_OPERATION_H

#include "kcenon/blob_transfer/auth/storage_credentials.h"
#include "kcenon/blob_transfer/blob/access_condition.h"
#include "kcenon/blob_transfer/blob/blob_types.h"
#include "kcenon/blob_transfer/core/types.h"

#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace kcenon::blob_transfer {

/**
 * @brief Kind of operation a batch carries; a batch never mixes kinds
 */
enum class batch_operation_type {
    delete_blob,
    set_tier,
};

[[nodiscard]] constexpr auto to_string(batch_operation_type type) -> const char* {
    switch (type) {
        case batch_operation_type::delete_blob:
            return "delete";
        case batch_operation_type::set_tier:
            return "set_tier";
    }
    return "unknown";
}

struct delete_parameters {
    delete_snapshots_option snapshots = delete_snapshots_option::none;
};

struct set_tier_parameters {
    standard_blob_tier tier = standard_blob_tier::hot;
    std::optional<rehydrate_priority> priority;
};

/**
 * @brief One queued sub-request
 *
 * @c index is the position in the batch and becomes the part's Content-ID.
 * @c credentials, when set, sign this sub-request instead of the
 * client's credentials.
 */
struct sub_operation {
    std::size_t index = 0;
    std::string container;
    std::string blob;
    std::variant<delete_parameters, set_tier_parameters> parameters;
    access_condition condition;
    std::optional<storage_credentials> credentials;
};

/**
 * @brief Ordered collection of sub-operations of a single type
 */
class blob_batch {
public:
    static constexpr std::size_t max_operations = 256;

    virtual ~blob_batch() = default;

    [[nodiscard]] auto type() const noexcept -> batch_operation_type { return type_; }
    [[nodiscard]] auto operations() const -> const std::vector<sub_operation>& {
        return operations_;
    }
    [[nodiscard]] auto size() const noexcept -> std::size_t { return operations_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return operations_.empty(); }

protected:
    explicit blob_batch(batch_operation_type type) : type_(type) {}

    /**
     * @brief Append an operation, assigning the next index
     *
     * Fails with batch_too_large past max_operations and with
     * invalid_argument for an empty container or blob name.
     */
    [[nodiscard]] auto add_operation(sub_operation operation) -> result<std::size_t>;

private:
    batch_operation_type type_;
    std::vector<sub_operation> operations_;
};

class blob_delete_batch : public blob_batch {
public:
    blob_delete_batch() : blob_batch(batch_operation_type::delete_blob) {}

    /**
     * @return Index of the queued operation
     */
    [[nodiscard]] auto add_delete(std::string container,
                                  std::string blob,
                                  delete_snapshots_option snapshots = delete_snapshots_option::none,
                                  access_condition condition = {},
                                  std::optional<storage_credentials> credentials = std::nullopt)
        -> result<std::size_t>;
};

class blob_set_tier_batch : public blob_batch {
public:
    blob_set_tier_batch() : blob_batch(batch_operation_type::set_tier) {}

    /**
     * @return Index of the queued operation
     */
    [[nodiscard]] auto add_set_tier(std::string container,
                                    std::string blob,
                                    standard_blob_tier tier,
                                    std::optional<rehydrate_priority> priority = std::nullopt,
                                    std::optional<storage_credentials> credentials = std::nullopt)
        -> result<std::size_t>;
};

}  // namespace kcenon::blob_transfer

#endif  // KCENON_BLOB_TRANSFER_BATCH_BATCH_OPERATION_H
