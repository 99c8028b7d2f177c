/**
 * @file http_types.cpp
 * @brief HTTP model helpers
 */

#include "kcenon/blob_transfer/http/http_types.h"
#include "kcenon/blob_transfer/core/blob_utils.h"

#include <algorithm>
#include <cctype>

namespace kcenon::blob_transfer {

auto parse_http_method(std::string_view token) -> std::optional<http_method> {
    if (token == "GET") return http_method::get;
    if (token == "PUT") return http_method::put;
    if (token == "POST") return http_method::post;
    if (token == "DELETE") return http_method::del;
    if (token == "HEAD") return http_method::head;
    return std::nullopt;
}

auto header_name_less::operator()(std::string_view a, std::string_view b) const -> bool {
    return std::lexicographical_compare(
        a.begin(), a.end(), b.begin(), b.end(), [](char x, char y) {
            return std::tolower(static_cast<unsigned char>(x)) <
                   std::tolower(static_cast<unsigned char>(y));
        });
}

auto parse_url(std::string_view url) -> std::optional<url_parts> {
    auto scheme_end = url.find("://");
    if (scheme_end == std::string_view::npos || scheme_end == 0) {
        return std::nullopt;
    }

    url_parts parts;
    parts.scheme = std::string(url.substr(0, scheme_end));

    auto rest = url.substr(scheme_end + 3);
    auto path_start = rest.find_first_of("/?");
    parts.authority = std::string(rest.substr(0, path_start));
    if (parts.authority.empty()) {
        return std::nullopt;
    }

    if (path_start == std::string_view::npos) {
        parts.path = "/";
        return parts;
    }

    rest = rest.substr(path_start);
    auto query_start = rest.find('?');
    parts.path = std::string(rest.substr(0, query_start));
    if (parts.path.empty()) {
        parts.path = "/";
    }
    if (query_start != std::string_view::npos) {
        parts.query = std::string(rest.substr(query_start + 1));
    }
    return parts;
}

auto parse_query(std::string_view query) -> std::map<std::string, std::string> {
    std::map<std::string, std::string> params;
    std::size_t pos = 0;
    while (pos < query.size()) {
        auto amp = query.find('&', pos);
        auto pair = query.substr(pos, amp == std::string_view::npos ? std::string_view::npos
                                                                    : amp - pos);
        if (!pair.empty()) {
            auto eq = pair.find('=');
            if (eq == std::string_view::npos) {
                params[blob_utils::url_decode(pair)] = "";
            } else {
                params[blob_utils::url_decode(pair.substr(0, eq))] =
                    blob_utils::url_decode(pair.substr(eq + 1));
            }
        }
        if (amp == std::string_view::npos) break;
        pos = amp + 1;
    }
    return params;
}

auto append_query(const std::string& url, std::string_view fragment) -> std::string {
    while (!fragment.empty() && (fragment.front() == '?' || fragment.front() == '&')) {
        fragment.remove_prefix(1);
    }
    if (fragment.empty()) {
        return url;
    }
    char sep = url.find('?') == std::string::npos ? '?' : '&';
    return url + sep + std::string(fragment);
}

auto reason_phrase_for(int status_code) -> const char* {
    switch (status_code) {
        case 200: return "OK";
        case 201: return "Created";
        case 202: return "Accepted";
        case 206: return "Partial Content";
        case 304: return "Not Modified";
        case 400: return "Bad Request";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 409: return "Conflict";
        case 412: return "Precondition Failed";
        case 416: return "Range Not Satisfiable";
        case 500: return "Internal Server Error";
        case 503: return "Service Unavailable";
        default: return "Unknown";
    }
}

}  // namespace kcenon::blob_transfer
