/**
 * @file service_context.cpp
 * @brief Request execution, signing and response classification
 */

#include "kcenon/blob_transfer/blob/service_context.h"
#include "kcenon/blob_transfer/core/blob_utils.h"
#include "kcenon/blob_transfer/core/logging.h"

#include <algorithm>

namespace kcenon::blob_transfer {

auto classify_response(const http_response& response) -> error {
    service_error_info info;
    info.status_code = response.status_code;
    info.request_id = response.get_header("x-ms-request-id").value_or("");

    auto body = response.body_string();
    if (auto header_code = response.get_header("x-ms-error-code")) {
        info.error_code = *header_code;
    } else if (auto xml_code = blob_utils::extract_xml_element(body, "Code")) {
        info.error_code = *xml_code;
    }
    if (auto xml_message = blob_utils::extract_xml_element(body, "Message")) {
        info.message = blob_utils::xml_unescape(*xml_message);
    } else if (!response.reason_phrase.empty()) {
        info.message = response.reason_phrase;
    } else {
        info.message = reason_phrase_for(response.status_code);
    }

    error_code code = error_code::service_error;
    switch (response.status_code) {
        case 304: code = error_code::not_modified; break;
        case 403: code = error_code::authentication_failed; break;
        case 404: code = error_code::blob_not_found; break;
        case 409: code = error_code::conflict; break;
        case 412: code = error_code::precondition_failed; break;
        case 503: code = error_code::server_busy; break;
        case 400:
            if (info.error_code == "Md5Mismatch" || info.error_code == "Crc64Mismatch") {
                code = error_code::checksum_mismatch;
            }
            break;
        default:
            break;
    }

    std::string message = "HTTP " + std::to_string(response.status_code);
    if (!info.error_code.empty()) {
        message += " " + info.error_code;
    }
    message += ": " + info.message;
    return error{code, std::move(message), std::move(info)};
}

// ============================================================================
// service_context
// ============================================================================

service_context::service_context(blob_client_config config,
                                 storage_credentials credentials,
                                 std::shared_ptr<http_transport_interface> transport,
                                 std::shared_ptr<request_signer> signer)
    : config_(std::move(config)),
      credentials_(std::move(credentials)),
      transport_(std::move(transport)),
      signer_(std::move(signer)) {
    if (!transport_) {
        transport_ = make_default_transport(config_.timeout);
    }
    if (!signer_) {
        signer_ = std::make_shared<storage_request_signer>();
    }
}

auto service_context::resource_path(const std::string& container,
                                    const std::string& blob) const -> std::string {
    std::string path;
    if (auto parts = parse_url(config_.primary_endpoint()); parts && parts->path != "/") {
        path = parts->path;
    }
    path += "/" + blob_utils::url_encode(container, false);
    if (!blob.empty()) {
        path += "/" + blob_utils::url_encode(blob, false);
    }
    return path;
}

auto service_context::resource_url(storage_location location,
                                   const std::string& container,
                                   const std::string& blob,
                                   const std::string& query) const -> std::string {
    std::string url = config_.endpoint_for(location);
    if (!container.empty()) {
        url += "/" + blob_utils::url_encode(container, false);
    }
    if (!blob.empty()) {
        url += "/" + blob_utils::url_encode(blob, false);
    }
    if (container.empty() && blob.empty()) {
        url += "/";
    }
    if (!query.empty()) {
        url += "?" + query;
    }
    return url;
}

void service_context::add_protocol_headers(http_request& request) const {
    request.set_header("x-ms-version", config_.api_version);
    if (!request.get_header("x-ms-date")) {
        request.set_header("x-ms-date", blob_utils::get_rfc1123_time());
    }
    if (!request.get_header("x-ms-client-request-id")) {
        request.set_header("x-ms-client-request-id", blob_utils::generate_uuid());
    }
}

auto service_context::send_once(http_request request, const std::vector<int>& expected)
    -> result<http_response> {
    add_protocol_headers(request);
    if (auto signed_request = signer_->sign(request, credentials_); !signed_request.has_value()) {
        return unexpected{signed_request.error()};
    }

    BT_LOG_TRACE(log_category::http,
                 std::string(to_string(request.method)) + " " + request.url);

    requests_sent_.fetch_add(1, std::memory_order_relaxed);
    bytes_uploaded_.fetch_add(request.body.size(), std::memory_order_relaxed);

    auto response = transport_->send(request);
    if (!response.has_value()) {
        failed_requests_.fetch_add(1, std::memory_order_relaxed);
        BT_LOG_DEBUG(log_category::http, std::string(to_string(request.method)) + " " +
                                             request.url + " -> " + response.error().message);
        return response;
    }
    bytes_downloaded_.fetch_add(response.value().body.size(), std::memory_order_relaxed);

    const int status = response.value().status_code;
    if (std::find(expected.begin(), expected.end(), status) != expected.end()) {
        return response;
    }

    failed_requests_.fetch_add(1, std::memory_order_relaxed);
    auto err = classify_response(response.value());

    transfer_log_context ctx;
    ctx.status_code = status;
    if (err.service && !err.service->request_id.empty()) {
        ctx.request_id = err.service->request_id;
    }
    BT_LOG_DEBUG_CTX(log_category::http,
                     std::string(to_string(request.method)) + " " + request.url + " -> " +
                         err.message,
                     ctx);
    return unexpected{std::move(err)};
}

auto service_context::execute(const request_factory& factory,
                              const std::vector<int>& expected,
                              const retry_policy& policy,
                              location_mode mode) -> result<http_response> {
    retry_executor executor(policy, [this](const error&, std::size_t) {
        retries_.fetch_add(1, std::memory_order_relaxed);
    });

    return executor.execute<http_response>(
        [&](storage_location location) -> result<http_response> {
            return send_once(factory(location), expected);
        },
        mode);
}

auto service_context::thread_pool() -> std::shared_ptr<adapters::transfer_thread_pool_interface> {
    std::lock_guard<std::mutex> lock(pool_mutex_);
    if (!pool_) {
        pool_ = adapters::transfer_pool_factory::create(0, "blob_transfer_pool");
    }
    return pool_;
}

auto service_context::statistics() const -> transfer_statistics {
    transfer_statistics stats;
    stats.requests_sent = requests_sent_.load(std::memory_order_relaxed);
    stats.bytes_uploaded = bytes_uploaded_.load(std::memory_order_relaxed);
    stats.bytes_downloaded = bytes_downloaded_.load(std::memory_order_relaxed);
    stats.retries = retries_.load(std::memory_order_relaxed);
    stats.failed_requests = failed_requests_.load(std::memory_order_relaxed);
    return stats;
}

void service_context::reset_statistics() {
    requests_sent_.store(0, std::memory_order_relaxed);
    bytes_uploaded_.store(0, std::memory_order_relaxed);
    bytes_downloaded_.store(0, std::memory_order_relaxed);
    retries_.store(0, std::memory_order_relaxed);
    failed_requests_.store(0, std::memory_order_relaxed);
}

}  // namespace kcenon::blob_transfer
