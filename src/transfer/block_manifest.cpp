/**
 * @file block_manifest.cpp
 * @brief Block manifest and block id generation
 */

#include "kcenon/blob_transfer/transfer/block_manifest.h"
#include "kcenon/blob_transfer/blob/client_config.h"
#include "kcenon/blob_transfer/core/blob_utils.h"

#include <iomanip>
#include <sstream>

namespace kcenon::blob_transfer {

namespace {

constexpr std::size_t max_block_id_bytes = 64;

auto parse_mode(std::string_view tag) -> std::optional<block_list_mode> {
    if (tag == "Committed") return block_list_mode::committed;
    if (tag == "Uncommitted") return block_list_mode::uncommitted;
    if (tag == "Latest") return block_list_mode::latest;
    return std::nullopt;
}

}  // namespace

// ============================================================================
// block_manifest
// ============================================================================

auto block_manifest::from_committed(const block_list& list) -> block_manifest {
    block_manifest manifest;
    manifest.entries_.reserve(list.committed_blocks.size());
    for (const auto& item : list.committed_blocks) {
        manifest.entries_.push_back({item.block_id, block_list_mode::committed});
    }
    return manifest;
}

auto block_manifest::validate_block_id(const std::string& block_id) -> result<void> {
    if (block_id.empty()) {
        return unexpected{error{error_code::invalid_block_id, "Block id is empty"}};
    }
    auto decoded = blob_utils::base64_decode(block_id);
    if (!decoded) {
        return unexpected{error{error_code::invalid_block_id,
            "Block id is not valid base64: " + block_id}};
    }
    if (decoded->empty() || decoded->size() > max_block_id_bytes) {
        return unexpected{error{error_code::invalid_block_id,
            "Block id must decode to 1-64 bytes: " + block_id}};
    }
    return {};
}

auto block_manifest::add(std::string block_id, block_list_mode mode) -> result<void> {
    return insert(entries_.size(), std::move(block_id), mode);
}

auto block_manifest::insert(std::size_t position, std::string block_id, block_list_mode mode)
    -> result<void> {
    if (position > entries_.size()) {
        return unexpected{error{error_code::invalid_argument,
            "Manifest position " + std::to_string(position) + " out of range"}};
    }
    if (entries_.size() >= max_block_count) {
        return unexpected{error{error_code::invalid_argument,
            "Manifest cannot hold more than " + std::to_string(max_block_count) + " blocks"}};
    }
    if (auto valid = validate_block_id(block_id); !valid.has_value()) {
        return valid;
    }
    entries_.insert(entries_.begin() + static_cast<std::ptrdiff_t>(position),
                    block_manifest_entry{std::move(block_id), mode});
    return {};
}

auto block_manifest::remove_at(std::size_t position) -> result<void> {
    if (position >= entries_.size()) {
        return unexpected{error{error_code::invalid_argument,
            "Manifest position " + std::to_string(position) + " out of range"}};
    }
    entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(position));
    return {};
}

auto block_manifest::validate() const -> result<void> {
    if (entries_.size() > max_block_count) {
        return unexpected{error{error_code::invalid_argument,
            "Manifest exceeds " + std::to_string(max_block_count) + " blocks"}};
    }
    if (entries_.empty()) {
        return {};
    }
    const auto length = entries_.front().block_id.size();
    for (const auto& entry : entries_) {
        if (entry.block_id.size() != length) {
            return unexpected{error{error_code::invalid_block_id,
                "All block ids of a blob must have the same length"}};
        }
    }
    return {};
}

auto block_manifest::to_xml() const -> std::string {
    std::ostringstream xml;
    xml << "<?xml version=\"1.0\" encoding=\"utf-8\"?>\n<BlockList>";
    for (const auto& entry : entries_) {
        const char* tag = to_string(entry.mode);
        xml << "<" << tag << ">" << blob_utils::xml_escape(entry.block_id)
            << "</" << tag << ">";
    }
    xml << "</BlockList>";
    return xml.str();
}

auto block_manifest::from_xml(const std::string& xml) -> result<block_manifest> {
    auto open = xml.find("<BlockList>");
    auto close = xml.find("</BlockList>");
    if (open == std::string::npos || close == std::string::npos || close < open) {
        return unexpected{error{error_code::malformed_response, "Missing <BlockList> element"}};
    }

    block_manifest manifest;
    std::size_t pos = open + 11;
    while (pos < close) {
        auto lt = xml.find('<', pos);
        if (lt == std::string::npos || lt >= close) break;
        auto gt = xml.find('>', lt);
        if (gt == std::string::npos) {
            return unexpected{error{error_code::malformed_response, "Unterminated element"}};
        }
        auto tag = std::string_view(xml).substr(lt + 1, gt - lt - 1);
        auto mode = parse_mode(tag);
        if (!mode) {
            return unexpected{error{error_code::malformed_response,
                "Unknown block list element <" + std::string(tag) + ">"}};
        }
        auto end_tag = "</" + std::string(tag) + ">";
        auto end = xml.find(end_tag, gt);
        if (end == std::string::npos) {
            return unexpected{error{error_code::malformed_response,
                "Missing " + end_tag}};
        }
        auto id = blob_utils::xml_unescape(std::string_view(xml).substr(gt + 1, end - gt - 1));
        if (auto r = manifest.add(std::move(id), *mode); !r.has_value()) {
            return unexpected{r.error()};
        }
        pos = end + end_tag.size();
    }
    return manifest;
}

// ============================================================================
// block_id_generator
// ============================================================================

block_id_generator::block_id_generator()
    : prefix_(blob_utils::generate_random_hex(4)) {}

block_id_generator::block_id_generator(std::string prefix)
    : prefix_(std::move(prefix)) {}

auto block_id_generator::next() -> std::string {
    return make_id(prefix_, sequence_.fetch_add(1, std::memory_order_relaxed));
}

auto block_id_generator::make_id(const std::string& prefix, uint32_t sequence)
    -> std::string {
    std::ostringstream oss;
    oss << prefix << "-" << std::setfill('0') << std::setw(6) << sequence;
    return blob_utils::base64_encode(oss.str());
}

}  // namespace kcenon::blob_transfer
