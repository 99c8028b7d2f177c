/**
 * @file access_condition.h
 * @brief Conditional request headers for blob operations
 */

#ifndef KCENON_BLOB_TRANSFER_BLOB_ACCESS_CONDITION_H
#define KCENON_BLOB_TRANSFER_BLOB_ACCESS_CONDITION_H

#include "kcenon/blob_transfer/http/http_types.h"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace kcenon::blob_transfer {

/**
 * @brief Preconditions evaluated by the service
 *
 * Violations surface as precondition_failed (412), not_modified (304 on
 * reads) or conflict (409, If-None-Match "*" on an existing blob).
 */
struct access_condition {
    using time_point = std::chrono::system_clock::time_point;

    std::optional<std::string> if_match;
    std::optional<std::string> if_none_match;
    std::optional<time_point> if_modified_since;
    std::optional<time_point> if_unmodified_since;

    /// x-ms-blob-condition-maxsize
    std::optional<uint64_t> if_max_size;

    [[nodiscard]] static auto none() -> access_condition { return {}; }

    /**
     * @brief Succeeds only if the blob does not exist yet
     */
    [[nodiscard]] static auto if_not_exists() -> access_condition {
        access_condition c;
        c.if_none_match = "*";
        return c;
    }

    [[nodiscard]] static auto if_match_etag(std::string etag) -> access_condition {
        access_condition c;
        c.if_match = std::move(etag);
        return c;
    }

    [[nodiscard]] static auto if_none_match_etag(std::string etag) -> access_condition {
        access_condition c;
        c.if_none_match = std::move(etag);
        return c;
    }

    [[nodiscard]] auto empty() const noexcept -> bool {
        return !if_match && !if_none_match && !if_modified_since &&
               !if_unmodified_since && !if_max_size;
    }

    [[nodiscard]] auto is_if_not_exists() const noexcept -> bool {
        return if_none_match && *if_none_match == "*";
    }

    /**
     * @brief Write all conditions as request headers
     */
    void apply_to(http_headers& headers) const;

    /**
     * @brief Write only the ETag and date conditions
     *
     * Used for property reads, where the size condition has no meaning.
     */
    void apply_read_conditions_to(http_headers& headers) const;

    /**
     * @brief Write the ETag and date conditions as x-ms-source-* headers
     *
     * Applies the condition to the source of a copy.
     */
    void apply_source_conditions_to(http_headers& headers) const;
};

}  // namespace kcenon::blob_transfer

#endif  // KCENON_BLOB_TRANSFER_BLOB_ACCESS_CONDITION_H
