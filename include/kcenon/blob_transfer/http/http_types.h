/**
 * @file http_types.h
 * @brief HTTP request/response model used between the client and its transport
 */

#ifndef KCENON_BLOB_TRANSFER_HTTP_HTTP_TYPES_H
#define KCENON_BLOB_TRANSFER_HTTP_HTTP_TYPES_H

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kcenon::blob_transfer {

/**
 * @brief HTTP methods used by the blob protocol
 */
enum class http_method {
    get,
    put,
    post,
    del,
    head,
};

[[nodiscard]] constexpr auto to_string(http_method method) -> const char* {
    switch (method) {
        case http_method::get: return "GET";
        case http_method::put: return "PUT";
        case http_method::post: return "POST";
        case http_method::del: return "DELETE";
        case http_method::head: return "HEAD";
        default: return "GET";
    }
}

/**
 * @brief Parse a method token ("DELETE") back into http_method
 */
[[nodiscard]] auto parse_http_method(std::string_view token) -> std::optional<http_method>;

/**
 * @brief Case-insensitive ordering for header names
 */
struct header_name_less {
    using is_transparent = void;
    auto operator()(std::string_view a, std::string_view b) const -> bool;
};

using http_headers = std::map<std::string, std::string, header_name_less>;

/**
 * @brief Outgoing HTTP request
 */
struct http_request {
    http_method method = http_method::get;
    std::string url;
    http_headers headers;
    std::vector<std::byte> body;

    void set_header(const std::string& name, std::string value) {
        headers[name] = std::move(value);
    }

    [[nodiscard]] auto get_header(std::string_view name) const -> std::optional<std::string> {
        auto it = headers.find(name);
        if (it != headers.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    [[nodiscard]] auto body_string() const -> std::string {
        return std::string(reinterpret_cast<const char*>(body.data()), body.size());
    }
};

/**
 * @brief Incoming HTTP response
 */
struct http_response {
    int status_code = 0;
    std::string reason_phrase;
    http_headers headers;
    std::vector<std::byte> body;

    [[nodiscard]] auto is_success() const noexcept -> bool {
        return status_code >= 200 && status_code < 300;
    }

    [[nodiscard]] auto get_header(std::string_view name) const -> std::optional<std::string> {
        auto it = headers.find(name);
        if (it != headers.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    [[nodiscard]] auto body_string() const -> std::string {
        return std::string(reinterpret_cast<const char*>(body.data()), body.size());
    }
};

/**
 * @brief Components of an absolute URL
 */
struct url_parts {
    std::string scheme;
    std::string authority;  ///< host[:port]
    std::string path;       ///< always starts with '/'
    std::string query;      ///< raw query without '?'
};

/**
 * @brief Split an absolute URL into its components
 */
[[nodiscard]] auto parse_url(std::string_view url) -> std::optional<url_parts>;

/**
 * @brief Decode a raw query string into name/value pairs
 *
 * Names keep their original case; values are percent-decoded.
 */
[[nodiscard]] auto parse_query(std::string_view query) -> std::map<std::string, std::string>;

/**
 * @brief Append a raw query fragment ("a=b&c=d") to a URL
 */
[[nodiscard]] auto append_query(const std::string& url, std::string_view fragment) -> std::string;

/**
 * @brief Standard reason phrase for a status code
 */
[[nodiscard]] auto reason_phrase_for(int status_code) -> const char*;

}  // namespace kcenon::blob_transfer

#endif  // KCENON_BLOB_TRANSFER_HTTP_HTTP_TYPES_H
