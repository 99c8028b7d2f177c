/**
 * @file blob_types.h
 * @brief Value types shared by the blob clients
 */

#ifndef KCENON_BLOB_TRANSFER_BLOB_BLOB_TYPES_H
#define KCENON_BLOB_TRANSFER_BLOB_BLOB_TYPES_H

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kcenon::blob_transfer {

// ============================================================================
// Block lists
// ============================================================================

/**
 * @brief Which block set a manifest entry refers to
 */
enum class block_list_mode {
    committed,
    uncommitted,
    latest,
};

[[nodiscard]] constexpr auto to_string(block_list_mode mode) -> const char* {
    switch (mode) {
        case block_list_mode::committed: return "Committed";
        case block_list_mode::uncommitted: return "Uncommitted";
        case block_list_mode::latest: return "Latest";
        default: return "Latest";
    }
}

/**
 * @brief Filter for Get Block List
 */
enum class block_listing_filter {
    committed,
    uncommitted,
    all,
};

[[nodiscard]] constexpr auto to_string(block_listing_filter filter) -> const char* {
    switch (filter) {
        case block_listing_filter::committed: return "committed";
        case block_listing_filter::uncommitted: return "uncommitted";
        case block_listing_filter::all: return "all";
        default: return "all";
    }
}

/**
 * @brief One block reported by Get Block List
 */
struct block_list_item {
    std::string block_id;
    uint64_t size = 0;
    bool committed = false;
};

/**
 * @brief Result of Get Block List
 */
struct block_list {
    std::vector<block_list_item> committed_blocks;
    std::vector<block_list_item> uncommitted_blocks;
};

// ============================================================================
// Tiers and deletion
// ============================================================================

enum class standard_blob_tier {
    hot,
    cool,
    archive,
};

[[nodiscard]] constexpr auto to_string(standard_blob_tier tier) -> const char* {
    switch (tier) {
        case standard_blob_tier::hot: return "Hot";
        case standard_blob_tier::cool: return "Cool";
        case standard_blob_tier::archive: return "Archive";
        default: return "Hot";
    }
}

[[nodiscard]] auto parse_blob_tier(std::string_view value) -> std::optional<standard_blob_tier>;

/**
 * @brief Priority for rehydrating an archived blob
 */
enum class rehydrate_priority {
    standard,
    high,
};

[[nodiscard]] constexpr auto to_string(rehydrate_priority priority) -> const char* {
    switch (priority) {
        case rehydrate_priority::standard: return "Standard";
        case rehydrate_priority::high: return "High";
        default: return "Standard";
    }
}

enum class delete_snapshots_option {
    none,
    include_snapshots,
    delete_snapshots_only,
};

/**
 * @brief Header value for x-ms-delete-snapshots, or nullptr for none
 */
[[nodiscard]] constexpr auto to_header_value(delete_snapshots_option option) -> const char* {
    switch (option) {
        case delete_snapshots_option::include_snapshots: return "include";
        case delete_snapshots_option::delete_snapshots_only: return "only";
        default: return nullptr;
    }
}

// ============================================================================
// Copies
// ============================================================================

enum class copy_status {
    pending,
    success,
    aborted,
    failed,
};

[[nodiscard]] constexpr auto to_string(copy_status status) -> const char* {
    switch (status) {
        case copy_status::pending: return "pending";
        case copy_status::success: return "success";
        case copy_status::aborted: return "aborted";
        case copy_status::failed: return "failed";
        default: return "pending";
    }
}

[[nodiscard]] auto parse_copy_status(std::string_view value) -> std::optional<copy_status>;

/**
 * @brief State of the last copy into a blob
 */
struct copy_state {
    std::string copy_id;
    copy_status status = copy_status::pending;
    std::string source;

    /// From x-ms-copy-progress ("copied/total"), when reported
    std::optional<uint64_t> bytes_copied;
    std::optional<uint64_t> total_bytes;

    std::optional<std::string> status_description;
};

// ============================================================================
// Properties
// ============================================================================

/**
 * @brief Standard HTTP properties stored with a blob
 *
 * Set Blob Properties replaces all of them; unset fields are cleared.
 */
struct blob_http_headers {
    std::optional<std::string> content_type;
    std::optional<std::string> content_encoding;
    std::optional<std::string> content_language;
    std::optional<std::string> content_disposition;
    std::optional<std::string> cache_control;
    std::optional<std::string> content_md5;
};

/**
 * @brief Attributes returned by a property fetch
 */
struct blob_properties {
    uint64_t content_length = 0;
    std::string etag;
    std::optional<std::chrono::system_clock::time_point> last_modified;
    std::optional<std::string> content_md5;
    std::optional<std::string> content_type;
    std::optional<std::string> content_encoding;
    std::optional<std::string> content_language;
    std::optional<std::string> content_disposition;
    std::optional<std::string> cache_control;
    std::optional<standard_blob_tier> access_tier;
    std::string blob_type = "BlockBlob";
    std::map<std::string, std::string> metadata;

    /// Present once the blob has been the target of a copy
    std::optional<copy_state> copy;
};

}  // namespace kcenon::blob_transfer

#endif  // KCENON_BLOB_TRANSFER_BLOB_BLOB_TYPES_H
