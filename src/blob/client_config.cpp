/**
 * @file client_config.cpp
 * @brief Configuration validation and endpoint derivation
 */

#include "kcenon/blob_transfer/blob/client_config.h"
#include "kcenon/blob_transfer/http/http_types.h"

namespace kcenon::blob_transfer {

auto blob_request_options::validate() const -> result<void> {
    if (block_size == 0 || block_size > max_block_size) {
        return unexpected{error{error_code::invalid_block_size,
            "Block size must be between 1 byte and " + std::to_string(max_block_size) +
                " bytes, got " + std::to_string(block_size)}};
    }
    if (stream_write_size == 0 || stream_write_size > max_block_size) {
        return unexpected{error{error_code::invalid_block_size,
            "Stream write size must be between 1 byte and " +
                std::to_string(max_block_size) + " bytes, got " +
                std::to_string(stream_write_size)}};
    }
    if (single_shot_threshold > max_single_shot_threshold) {
        return unexpected{error{error_code::invalid_argument,
            "Single-shot threshold exceeds " + std::to_string(max_single_shot_threshold) +
                " bytes"}};
    }
    if (parallelism == 0) {
        return unexpected{error{error_code::invalid_argument,
            "Parallelism must be at least 1"}};
    }
    if (use_transactional_md5 && use_transactional_crc64) {
        return unexpected{error{error_code::invalid_argument,
            "Transactional MD5 and CRC64 are mutually exclusive"}};
    }
    return {};
}

auto blob_client_config::primary_endpoint() const -> std::string {
    std::string url = endpoint;
    if (url.empty()) {
        url = std::string(use_ssl ? "https" : "http") + "://" + account_name +
              ".blob.core.windows.net";
    }
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url;
}

auto blob_client_config::secondary_endpoint_url() const -> std::string {
    std::string url = secondary_endpoint;
    if (url.empty()) {
        if (!endpoint.empty()) {
            // No derivable secondary for a custom endpoint
            return primary_endpoint();
        }
        url = std::string(use_ssl ? "https" : "http") + "://" + account_name +
              "-secondary.blob.core.windows.net";
    }
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url;
}

auto blob_client_config::validate() const -> result<void> {
    if (account_name.empty() && endpoint.empty()) {
        return unexpected{error{error_code::invalid_configuration,
            "Either an account name or an endpoint is required"}};
    }
    if (!parse_url(primary_endpoint())) {
        return unexpected{error{error_code::invalid_configuration,
            "Invalid endpoint: " + primary_endpoint()}};
    }
    if (api_version.empty()) {
        return unexpected{error{error_code::invalid_configuration, "API version is empty"}};
    }
    if (timeout.count() <= 0) {
        return unexpected{error{error_code::invalid_configuration,
            "Timeout must be positive"}};
    }
    return default_request_options.validate();
}

auto blob_client_config_builder::from_connection_string(const std::string& connection_string)
    -> result<blob_client_config_builder> {
    auto settings = parse_connection_string(connection_string);
    if (!settings.has_value()) {
        return unexpected{settings.error()};
    }

    blob_client_config_builder builder;
    builder.with_account(settings.value().credentials.account_name)
        .with_endpoint(settings.value().blob_endpoint)
        .with_ssl(settings.value().protocol != "http");
    return builder;
}

auto blob_client_config_builder::build() const -> result<blob_client_config> {
    if (auto valid = config_.validate(); !valid.has_value()) {
        return unexpected{valid.error()};
    }
    return config_;
}

}  // namespace kcenon::blob_transfer
