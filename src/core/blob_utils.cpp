/**
 * @file blob_utils.cpp
 * @brief Encoding, time, XML and crypto helpers shared by the blob client
 */

#include "kcenon/blob_transfer/core/blob_utils.h"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <locale>
#include <sstream>

#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>

namespace kcenon::blob_transfer::blob_utils {

// ============================================================================
// Encoding Utilities
// ============================================================================

auto bytes_to_hex(const std::vector<uint8_t>& bytes) -> std::string {
    std::ostringstream oss;
    for (auto byte : bytes) {
        oss << std::hex << std::setfill('0') << std::setw(2)
            << static_cast<int>(byte);
    }
    return oss.str();
}

namespace {
constexpr const char* BASE64_CHARS =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

constexpr auto base64_value(char c) -> int {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}
}  // namespace

auto base64_encode(const std::vector<uint8_t>& data) -> std::string {
    std::string result;
    result.reserve(((data.size() + 2) / 3) * 4);

    for (std::size_t i = 0; i < data.size(); i += 3) {
        uint32_t n = static_cast<uint32_t>(data[i]) << 16;
        if (i + 1 < data.size()) n |= static_cast<uint32_t>(data[i + 1]) << 8;
        if (i + 2 < data.size()) n |= static_cast<uint32_t>(data[i + 2]);

        result += BASE64_CHARS[(n >> 18) & 0x3F];
        result += BASE64_CHARS[(n >> 12) & 0x3F];
        result += (i + 1 < data.size()) ? BASE64_CHARS[(n >> 6) & 0x3F] : '=';
        result += (i + 2 < data.size()) ? BASE64_CHARS[n & 0x3F] : '=';
    }

    return result;
}

auto base64_encode(const std::string& data) -> std::string {
    std::vector<uint8_t> bytes(data.begin(), data.end());
    return base64_encode(bytes);
}

auto base64_decode(const std::string& encoded) -> std::optional<std::vector<uint8_t>> {
    if (encoded.size() % 4 != 0) {
        return std::nullopt;
    }

    std::vector<uint8_t> result;
    result.reserve((encoded.size() / 4) * 3);

    int bits = 0;
    int bit_count = 0;
    std::size_t padding = 0;

    for (std::size_t i = 0; i < encoded.size(); ++i) {
        char c = encoded[i];
        if (c == '=') {
            // Padding is only legal in the last two positions
            if (i + 2 < encoded.size()) {
                return std::nullopt;
            }
            ++padding;
            continue;
        }
        if (padding > 0) {
            return std::nullopt;
        }

        int val = base64_value(c);
        if (val < 0) {
            return std::nullopt;
        }

        bits = ((bits << 6) | val) & 0xFFFFFF;
        bit_count += 6;

        if (bit_count >= 8) {
            bit_count -= 8;
            result.push_back(static_cast<uint8_t>((bits >> bit_count) & 0xFF));
        }
    }

    return result;
}

auto url_encode(const std::string& value, bool encode_slash) -> std::string {
    std::ostringstream escaped;
    escaped.fill('0');
    escaped << std::hex;

    for (char c : value) {
        if (std::isalnum(static_cast<unsigned char>(c)) ||
            c == '-' || c == '_' || c == '.' || c == '~') {
            escaped << c;
        } else if (c == '/' && !encode_slash) {
            escaped << c;
        } else {
            escaped << '%' << std::setw(2) << std::uppercase
                    << static_cast<int>(static_cast<unsigned char>(c));
        }
    }

    return escaped.str();
}

auto url_decode(std::string_view value) -> std::string {
    std::string out;
    out.reserve(value.size());

    for (std::size_t i = 0; i < value.size(); ++i) {
        if (value[i] == '%' && i + 2 < value.size() &&
            std::isxdigit(static_cast<unsigned char>(value[i + 1])) &&
            std::isxdigit(static_cast<unsigned char>(value[i + 2]))) {
            auto hex = std::string(value.substr(i + 1, 2));
            out += static_cast<char>(std::stoi(hex, nullptr, 16));
            i += 2;
        } else {
            out += value[i];
        }
    }
    return out;
}

auto to_bytes(std::string_view text) -> std::vector<std::byte> {
    std::vector<std::byte> bytes(text.size());
    std::transform(text.begin(), text.end(), bytes.begin(),
                   [](char c) { return static_cast<std::byte>(c); });
    return bytes;
}

// ============================================================================
// String Utilities
// ============================================================================

auto to_lower(std::string_view value) -> std::string {
    std::string out(value);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

auto iequals(std::string_view a, std::string_view b) -> bool {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

auto trim(std::string_view value) -> std::string_view {
    auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

// ============================================================================
// Cryptographic Utilities
// ============================================================================

auto hmac_sha256(const std::vector<uint8_t>& key,
                 const std::string& data) -> std::optional<std::vector<uint8_t>> {
    std::vector<uint8_t> result(EVP_MAX_MD_SIZE);
    unsigned int len = 0;

    auto* digest = HMAC(EVP_sha256(),
                        key.data(),
                        static_cast<int>(key.size()),
                        reinterpret_cast<const unsigned char*>(data.data()),
                        data.size(),
                        result.data(),
                        &len);
    if (digest == nullptr) {
        return std::nullopt;
    }

    result.resize(len);
    return result;
}

// ============================================================================
// Time Utilities
// ============================================================================

auto get_rfc1123_time() -> std::string {
    return format_rfc1123(std::chrono::system_clock::now());
}

auto format_rfc1123(std::chrono::system_clock::time_point tp) -> std::string {
    auto time_t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
#ifdef _WIN32
    gmtime_s(&tm, &time_t);
#else
    gmtime_r(&time_t, &tm);
#endif
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    oss << std::put_time(&tm, "%a, %d %b %Y %H:%M:%S GMT");
    return oss.str();
}

auto parse_rfc1123(const std::string& value)
    -> std::optional<std::chrono::system_clock::time_point> {
    std::tm tm{};
    std::istringstream iss(value);
    iss.imbue(std::locale::classic());
    iss >> std::get_time(&tm, "%a, %d %b %Y %H:%M:%S");
    if (iss.fail()) {
        return std::nullopt;
    }
#ifdef _WIN32
    auto t = _mkgmtime(&tm);
#else
    auto t = timegm(&tm);
#endif
    if (t == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(t);
}

// ============================================================================
// Random Utilities
// ============================================================================

auto generate_random_bytes(std::size_t count) -> std::vector<uint8_t> {
    std::vector<uint8_t> bytes(count);
    if (count > 0 &&
        RAND_bytes(reinterpret_cast<unsigned char*>(bytes.data()), static_cast<int>(count)) != 1) {
        std::fill(bytes.begin(), bytes.end(), uint8_t{0});
    }
    return bytes;
}

auto generate_random_hex(std::size_t byte_count) -> std::string {
    return bytes_to_hex(generate_random_bytes(byte_count));
}

auto generate_uuid() -> std::string {
    auto bytes = generate_random_bytes(16);
    bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);
    bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);

    auto hex = bytes_to_hex(bytes);
    return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) +
           "-" + hex.substr(16, 4) + "-" + hex.substr(20, 12);
}

// ============================================================================
// XML Utilities
// ============================================================================

auto extract_xml_element(std::string_view xml,
                         std::string_view tag) -> std::optional<std::string> {
    std::string open_tag = "<" + std::string(tag) + ">";
    std::string close_tag = "</" + std::string(tag) + ">";

    auto start_pos = xml.find(open_tag);
    if (start_pos == std::string_view::npos) {
        return std::nullopt;
    }
    start_pos += open_tag.length();

    auto end_pos = xml.find(close_tag, start_pos);
    if (end_pos == std::string_view::npos) {
        return std::nullopt;
    }

    return std::string(xml.substr(start_pos, end_pos - start_pos));
}

auto extract_xml_elements(std::string_view xml,
                          std::string_view tag) -> std::vector<std::string> {
    std::string open_tag = "<" + std::string(tag) + ">";
    std::string close_tag = "</" + std::string(tag) + ">";

    std::vector<std::string> values;
    std::size_t pos = 0;
    while (true) {
        auto start = xml.find(open_tag, pos);
        if (start == std::string_view::npos) break;
        start += open_tag.length();
        auto end = xml.find(close_tag, start);
        if (end == std::string_view::npos) break;
        values.emplace_back(xml.substr(start, end - start));
        pos = end + close_tag.length();
    }
    return values;
}

auto xml_escape(std::string_view text) -> std::string {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&':  out += "&amp;"; break;
            case '<':  out += "&lt;"; break;
            case '>':  out += "&gt;"; break;
            case '"':  out += "&quot;"; break;
            case '\'': out += "&apos;"; break;
            default:   out += c;
        }
    }
    return out;
}

auto xml_unescape(std::string_view text) -> std::string {
    static constexpr std::pair<std::string_view, char> entities[] = {
        {"&amp;", '&'}, {"&lt;", '<'}, {"&gt;", '>'}, {"&quot;", '"'}, {"&apos;", '\''}};

    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size();) {
        bool matched = false;
        if (text[i] == '&') {
            for (const auto& [entity, ch] : entities) {
                if (text.substr(i, entity.size()) == entity) {
                    out += ch;
                    i += entity.size();
                    matched = true;
                    break;
                }
            }
        }
        if (!matched) {
            out += text[i++];
        }
    }
    return out;
}

}  // namespace kcenon::blob_transfer::blob_utils
