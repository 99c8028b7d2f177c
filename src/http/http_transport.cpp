/**
 * @file http_transport.cpp
 * @brief network_system backed HTTP transport
 */

#include "kcenon/blob_transfer/http/http_transport.h"
#include "kcenon/blob_transfer/config/feature_flags.h"
#include "kcenon/blob_transfer/core/logging.h"

#include <map>

#if KCENON_WITH_NETWORK_SYSTEM
#include <kcenon/network/core/http_client.h>
#endif

namespace kcenon::blob_transfer {

struct network_http_transport::impl {
#if KCENON_WITH_NETWORK_SYSTEM
    std::shared_ptr<kcenon::network::core::http_client> client;

    explicit impl(std::chrono::milliseconds timeout)
        : client(std::make_shared<kcenon::network::core::http_client>(timeout)) {}

    static auto convert_response(const kcenon::network::internal::http_response& resp)
        -> http_response {
        http_response converted;
        converted.status_code = resp.status_code;
        converted.reason_phrase = reason_phrase_for(resp.status_code);
        for (const auto& [key, value] : resp.headers) {
            converted.headers[key] = value;
        }
        converted.body.reserve(resp.body.size());
        for (auto c : resp.body) {
            converted.body.push_back(static_cast<std::byte>(c));
        }
        return converted;
    }
#else
    explicit impl(std::chrono::milliseconds /*timeout*/) {}
#endif
};

network_http_transport::network_http_transport(std::chrono::milliseconds timeout)
    : impl_(std::make_unique<impl>(timeout)) {}

network_http_transport::~network_http_transport() = default;

auto network_http_transport::is_available() const noexcept -> bool {
#if KCENON_WITH_NETWORK_SYSTEM
    return impl_->client != nullptr;
#else
    return false;
#endif
}

auto network_http_transport::send(const http_request& request) -> result<http_response> {
#if KCENON_WITH_NETWORK_SYSTEM
    if (!impl_->client) {
        return unexpected{error{error_code::not_initialized, "HTTP client not initialized"}};
    }

    std::map<std::string, std::string> headers(request.headers.begin(), request.headers.end());

    switch (request.method) {
        case http_method::get: {
            auto response = impl_->client->get(request.url, {}, headers);
            if (response.is_err()) {
                BT_LOG_WARN(log_category::http, "GET failed: " + request.url);
                return unexpected{error{error_code::transport_error, "HTTP GET request failed"}};
            }
            return impl::convert_response(response.value());
        }
        case http_method::put: {
            auto response = impl_->client->put(request.url, request.body_string(), headers);
            if (response.is_err()) {
                BT_LOG_WARN(log_category::http, "PUT failed: " + request.url);
                return unexpected{error{error_code::transport_error, "HTTP PUT request failed"}};
            }
            return impl::convert_response(response.value());
        }
        case http_method::post: {
            auto response = impl_->client->post(request.url, request.body_string(), headers);
            if (response.is_err()) {
                BT_LOG_WARN(log_category::http, "POST failed: " + request.url);
                return unexpected{error{error_code::transport_error, "HTTP POST request failed"}};
            }
            return impl::convert_response(response.value());
        }
        case http_method::del: {
            auto response = impl_->client->del(request.url, headers);
            if (response.is_err()) {
                BT_LOG_WARN(log_category::http, "DELETE failed: " + request.url);
                return unexpected{error{error_code::transport_error, "HTTP DELETE request failed"}};
            }
            return impl::convert_response(response.value());
        }
        case http_method::head: {
            auto response = impl_->client->head(request.url, headers);
            if (response.is_err()) {
                BT_LOG_WARN(log_category::http, "HEAD failed: " + request.url);
                return unexpected{error{error_code::transport_error, "HTTP HEAD request failed"}};
            }
            return impl::convert_response(response.value());
        }
    }
    return unexpected{error{error_code::invalid_argument, "Unsupported HTTP method"}};
#else
    (void)request;
    return unexpected{error{error_code::not_initialized,
        "HTTP client not available (KCENON_WITH_NETWORK_SYSTEM not defined)"}};
#endif
}

auto make_default_transport(std::chrono::milliseconds timeout)
    -> std::shared_ptr<http_transport_interface> {
    return std::make_shared<network_http_transport>(timeout);
}

}  // namespace kcenon::blob_transfer
