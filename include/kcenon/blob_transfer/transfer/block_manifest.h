/**
 * @file block_manifest.h
 * @brief Ordered block list committed atomically by Put Block List
 */

#ifndef KCENON_BLOB_TRANSFER_TRANSFER_BLOCK_MANIFEST_H
#define KCENON_BLOB_TRANSFER_TRANSFER_BLOCK_MANIFEST_H

#include "kcenon/blob_transfer/blob/blob_types.h"
#include "kcenon/blob_transfer/core/types.h"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace kcenon::blob_transfer {

/**
 * @brief One manifest entry
 */
struct block_manifest_entry {
    std::string block_id;
    block_list_mode mode = block_list_mode::latest;

    auto operator==(const block_manifest_entry&) const -> bool = default;
};

/**
 * @brief Caller-ordered list of block references
 *
 * The order of entries is the order of content in the committed blob.
 * The same id may appear more than once. Committing a manifest replaces
 * the blob's committed block set as a whole.
 */
class block_manifest {
public:
    block_manifest() = default;

    /**
     * @brief Manifest referencing the committed blocks of a listing, in order
     */
    [[nodiscard]] static auto from_committed(const block_list& list) -> block_manifest;

    /**
     * @brief Append an entry
     *
     * Fails with invalid_block_id for a malformed id and invalid_argument
     * when the manifest is full.
     */
    [[nodiscard]] auto add(std::string block_id,
                           block_list_mode mode = block_list_mode::latest) -> result<void>;

    /**
     * @brief Insert an entry before @p position (size() appends)
     */
    [[nodiscard]] auto insert(std::size_t position, std::string block_id,
                              block_list_mode mode = block_list_mode::latest) -> result<void>;

    [[nodiscard]] auto remove_at(std::size_t position) -> result<void>;

    void clear() noexcept { entries_.clear(); }

    [[nodiscard]] auto entries() const noexcept -> const std::vector<block_manifest_entry>& {
        return entries_;
    }
    [[nodiscard]] auto size() const noexcept -> std::size_t { return entries_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return entries_.empty(); }

    [[nodiscard]] auto operator[](std::size_t i) const -> const block_manifest_entry& {
        return entries_[i];
    }

    /**
     * @brief Check size limit and that all ids have the same encoded length
     */
    [[nodiscard]] auto validate() const -> result<void>;

    /**
     * @brief Serialize as a Put Block List body
     */
    [[nodiscard]] auto to_xml() const -> std::string;

    /**
     * @brief Parse a Put Block List body
     */
    [[nodiscard]] static auto from_xml(const std::string& xml) -> result<block_manifest>;

    /**
     * @brief Base64 with a decoded length of 1 to 64 bytes
     */
    [[nodiscard]] static auto validate_block_id(const std::string& block_id) -> result<void>;

    auto operator==(const block_manifest&) const -> bool = default;

private:
    std::vector<block_manifest_entry> entries_;
};

/**
 * @brief Generates fixed-width block ids for one upload
 *
 * Ids are base64("<prefix>-<6 digit sequence>"); a random prefix keeps
 * concurrent uploads to the same blob from colliding.
 */
class block_id_generator {
public:
    block_id_generator();
    explicit block_id_generator(std::string prefix);

    [[nodiscard]] auto next() -> std::string;

    [[nodiscard]] auto prefix() const -> const std::string& { return prefix_; }

    [[nodiscard]] static auto make_id(const std::string& prefix, uint32_t sequence)
        -> std::string;

private:
    std::string prefix_;
    std::atomic<uint32_t> sequence_{0};
};

}  // namespace kcenon::blob_transfer

#endif  // KCENON_BLOB_TRANSFER_TRANSFER_BLOCK_MANIFEST_H
