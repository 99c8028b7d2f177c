/**
 * @file request_signer.cpp
 * @brief SharedKey and SAS request authorization
 */

#include "kcenon/blob_transfer/auth/request_signer.h"
#include "kcenon/blob_transfer/core/blob_utils.h"
#include "kcenon/blob_transfer/core/logging.h"

#include <map>
#include <sstream>

namespace kcenon::blob_transfer {

auto storage_request_signer::sign(http_request& request,
                                  const storage_credentials& credentials) -> result<void> {
    switch (credentials.kind) {
        case credential_kind::anonymous:
            return {};

        case credential_kind::sas:
            if (!credentials.sas_token || credentials.sas_token->empty()) {
                return unexpected{error{error_code::invalid_configuration,
                    "SAS credentials without a token"}};
            }
            request.url = append_query(request.url, *credentials.sas_token);
            return {};

        case credential_kind::shared_key: {
            if (!credentials.account_key) {
                return unexpected{error{error_code::invalid_configuration,
                    "Shared key credentials without an account key"}};
            }
            if (!request.get_header("x-ms-date")) {
                request.set_header("x-ms-date", blob_utils::get_rfc1123_time());
            }
            auto header = compute_shared_key(request, credentials.account_name,
                                             *credentials.account_key);
            if (!header.has_value()) {
                return unexpected{header.error()};
            }
            request.set_header("Authorization", std::move(header.value()));
            return {};
        }
    }
    return unexpected{error{error_code::invalid_configuration, "Unknown credential kind"}};
}

auto storage_request_signer::build_string_to_sign(const http_request& request,
                                                  const std::string& account_name)
    -> std::string {
    auto get_header = [&request](std::string_view name) -> std::string {
        return request.get_header(name).value_or("");
    };

    // Zero length is signed as an empty string
    std::string content_length;
    if (auto header = request.get_header("Content-Length")) {
        content_length = *header == "0" ? "" : *header;
    } else if (!request.body.empty()) {
        content_length = std::to_string(request.body.size());
    }

    std::ostringstream string_to_sign;
    string_to_sign << to_string(request.method) << "\n";
    string_to_sign << get_header("Content-Encoding") << "\n";
    string_to_sign << get_header("Content-Language") << "\n";
    string_to_sign << content_length << "\n";
    string_to_sign << get_header("Content-MD5") << "\n";
    string_to_sign << get_header("Content-Type") << "\n";
    string_to_sign << get_header("Date") << "\n";
    string_to_sign << get_header("If-Modified-Since") << "\n";
    string_to_sign << get_header("If-Match") << "\n";
    string_to_sign << get_header("If-None-Match") << "\n";
    string_to_sign << get_header("If-Unmodified-Since") << "\n";
    string_to_sign << get_header("Range") << "\n";

    // Canonicalized headers (x-ms-*)
    std::map<std::string, std::string> ms_headers;
    for (const auto& [key, value] : request.headers) {
        auto lower_key = blob_utils::to_lower(key);
        if (lower_key.starts_with("x-ms-")) {
            ms_headers[lower_key] = std::string(blob_utils::trim(value));
        }
    }
    for (const auto& [key, value] : ms_headers) {
        string_to_sign << key << ":" << value << "\n";
    }

    // Canonicalized resource
    std::string path = "/";
    std::string query;
    if (auto parts = parse_url(request.url)) {
        path = parts->path;
        query = parts->query;
    }
    string_to_sign << "/" << account_name << path;

    std::map<std::string, std::string> params;
    for (const auto& [name, value] : parse_query(query)) {
        params[blob_utils::to_lower(name)] = value;
    }
    for (const auto& [name, value] : params) {
        string_to_sign << "\n" << name << ":" << value;
    }
    return string_to_sign.str();
}

auto storage_request_signer::compute_shared_key(const http_request& request,
                                                const std::string& account_name,
                                                const std::string& account_key)
    -> result<std::string> {
    auto key_bytes = blob_utils::base64_decode(account_key);
    if (!key_bytes) {
        return unexpected{error{error_code::invalid_configuration,
            "Account key is not valid base64"}};
    }

    auto signature = blob_utils::hmac_sha256(*key_bytes,
                                             build_string_to_sign(request, account_name));
    if (!signature) {
        BT_LOG_ERROR(log_category::auth, "HMAC-SHA256 computation failed");
        return unexpected{error{error_code::internal_error, "Failed to compute signature"}};
    }
    return "SharedKey " + account_name + ":" + blob_utils::base64_encode(*signature);
}

}  // namespace kcenon::blob_transfer
