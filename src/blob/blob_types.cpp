/**
 * @file blob_types.cpp
 * @brief Blob value type helpers
 */

#include "kcenon/blob_transfer/blob/blob_types.h"
#include "kcenon/blob_transfer/core/blob_utils.h"

namespace kcenon::blob_transfer {

auto parse_blob_tier(std::string_view value) -> std::optional<standard_blob_tier> {
    if (blob_utils::iequals(value, "Hot")) return standard_blob_tier::hot;
    if (blob_utils::iequals(value, "Cool")) return standard_blob_tier::cool;
    if (blob_utils::iequals(value, "Archive")) return standard_blob_tier::archive;
    return std::nullopt;
}

auto parse_copy_status(std::string_view value) -> std::optional<copy_status> {
    if (blob_utils::iequals(value, "pending")) return copy_status::pending;
    if (blob_utils::iequals(value, "success")) return copy_status::success;
    if (blob_utils::iequals(value, "aborted")) return copy_status::aborted;
    if (blob_utils::iequals(value, "failed")) return copy_status::failed;
    return std::nullopt;
}

}  // namespace kcenon::blob_transfer
