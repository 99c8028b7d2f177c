/**
 * @file access_condition.cpp
 * @brief Conditional header serialization
 */

#include "kcenon/blob_transfer/blob/access_condition.h"
#include "kcenon/blob_transfer/core/blob_utils.h"

namespace kcenon::blob_transfer {

void access_condition::apply_read_conditions_to(http_headers& headers) const {
    if (if_match) {
        headers["If-Match"] = *if_match;
    }
    if (if_none_match) {
        headers["If-None-Match"] = *if_none_match;
    }
    if (if_modified_since) {
        headers["If-Modified-Since"] = blob_utils::format_rfc1123(*if_modified_since);
    }
    if (if_unmodified_since) {
        headers["If-Unmodified-Since"] = blob_utils::format_rfc1123(*if_unmodified_since);
    }
}

void access_condition::apply_to(http_headers& headers) const {
    apply_read_conditions_to(headers);
    if (if_max_size) {
        headers["x-ms-blob-condition-maxsize"] = std::to_string(*if_max_size);
    }
}

void access_condition::apply_source_conditions_to(http_headers& headers) const {
    if (if_match) {
        headers["x-ms-source-if-match"] = *if_match;
    }
    if (if_none_match) {
        headers["x-ms-source-if-none-match"] = *if_none_match;
    }
    if (if_modified_since) {
        headers["x-ms-source-if-modified-since"] = blob_utils::format_rfc1123(*if_modified_since);
    }
    if (if_unmodified_since) {
        headers["x-ms-source-if-unmodified-since"] =
            blob_utils::format_rfc1123(*if_unmodified_since);
    }
}

}  // namespace kcenon::blob_transfer
