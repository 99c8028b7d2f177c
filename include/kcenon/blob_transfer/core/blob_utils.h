/**
 * @file blob_utils.h
 * @brief Encoding, time, XML and crypto helpers shared by the blob client
 *
 * Helpers used by request signing, manifest serialization, the batch
 * pipeline and the test service.
 */

#ifndef KCENON_BLOB_TRANSFER_CORE_BLOB_UTILS_H
#define KCENON_BLOB_TRANSFER_CORE_BLOB_UTILS_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace kcenon::blob_transfer::blob_utils {

// ============================================================================
// Encoding Utilities
// ============================================================================

/**
 * @brief Convert bytes to lowercase hexadecimal string
 */
auto bytes_to_hex(const std::vector<uint8_t>& bytes) -> std::string;

/**
 * @brief Base64 encode bytes
 */
auto base64_encode(const std::vector<uint8_t>& data) -> std::string;

/**
 * @brief Base64 encode string
 */
auto base64_encode(const std::string& data) -> std::string;

/**
 * @brief Base64 decode string
 * @return Decoded bytes, or nullopt when @p encoded is not valid base64
 */
auto base64_decode(const std::string& encoded) -> std::optional<std::vector<uint8_t>>;

/**
 * @brief URL encode a string (RFC 3986)
 * @param value String to encode
 * @param encode_slash Whether to encode forward slashes (default: true)
 */
auto url_encode(const std::string& value, bool encode_slash = true) -> std::string;

/**
 * @brief Decode percent-encoded text; '+' is left untouched
 */
auto url_decode(std::string_view value) -> std::string;

/**
 * @brief View bytes as text without copying
 */
inline auto as_string_view(std::span<const std::byte> data) -> std::string_view {
    return {reinterpret_cast<const char*>(data.data()), data.size()};
}

/**
 * @brief Copy text into a byte vector
 */
auto to_bytes(std::string_view text) -> std::vector<std::byte>;

// ============================================================================
// String Utilities
// ============================================================================

auto to_lower(std::string_view value) -> std::string;

auto iequals(std::string_view a, std::string_view b) -> bool;

auto trim(std::string_view value) -> std::string_view;

// ============================================================================
// Cryptographic Utilities
// ============================================================================

/**
 * @brief HMAC-SHA256
 * @return HMAC bytes (32), or nullopt when the OpenSSL call fails
 */
auto hmac_sha256(const std::vector<uint8_t>& key,
                 const std::string& data) -> std::optional<std::vector<uint8_t>>;

// ============================================================================
// Time Utilities
// ============================================================================

/**
 * @brief Current UTC time in RFC 1123 format
 */
auto get_rfc1123_time() -> std::string;

/**
 * @brief Format a time point in RFC 1123 format
 */
auto format_rfc1123(std::chrono::system_clock::time_point tp) -> std::string;

/**
 * @brief Parse an RFC 1123 date ("Sun, 06 Nov 1994 08:49:37 GMT")
 */
auto parse_rfc1123(const std::string& value)
    -> std::optional<std::chrono::system_clock::time_point>;

// ============================================================================
// Random Utilities
// ============================================================================

/**
 * @brief Bytes from the OpenSSL generator; zero-filled if it fails
 */
auto generate_random_bytes(std::size_t count) -> std::vector<uint8_t>;

auto generate_random_hex(std::size_t byte_count) -> std::string;

/**
 * @brief Random version 4 UUID in canonical text form
 */
auto generate_uuid() -> std::string;

// ============================================================================
// XML Utilities
// ============================================================================

/**
 * @brief Extract the first XML element value
 */
auto extract_xml_element(std::string_view xml,
                         std::string_view tag) -> std::optional<std::string>;

/**
 * @brief Extract every value of an element, in document order
 */
auto extract_xml_elements(std::string_view xml,
                          std::string_view tag) -> std::vector<std::string>;

/**
 * @brief Escape text for inclusion in XML character data
 */
auto xml_escape(std::string_view text) -> std::string;

/**
 * @brief Undo xml_escape for the five predefined entities
 */
auto xml_unescape(std::string_view text) -> std::string;

}  // namespace kcenon::blob_transfer::blob_utils

#endif  // KCENON_BLOB_TRANSFER_CORE_BLOB_UTILS_H
