/**
 * @file batch_request_builder.cpp
 * @brief Batch request serialization
 */

#include "kcenon/blob_transfer/batch/batch_request_builder.h"
#include "kcenon/blob_transfer/core/blob_utils.h"
#include "kcenon/blob_transfer/core/logging.h"
#include "kcenon/blob_transfer/http/multipart.h"

namespace kcenon::blob_transfer {

batch_request_builder::batch_request_builder(const service_context& context)
    : context_(context) {}

auto batch_request_builder::build_sub_request(const sub_operation& operation,
                                              batch_operation_type type) const
    -> result<http_request> {
    http_request request;

    switch (type) {
        case batch_operation_type::delete_blob: {
            const auto* params = std::get_if<delete_parameters>(&operation.parameters);
            if (params == nullptr) {
                return unexpected{error{error_code::invalid_argument,
                    "Operation " + std::to_string(operation.index) + " is not a delete"}};
            }
            request.method = http_method::del;
            request.url = context_.resource_url(storage_location::primary,
                                                operation.container, operation.blob);
            if (const char* value = to_header_value(params->snapshots)) {
                request.set_header("x-ms-delete-snapshots", value);
            }
            break;
        }
        case batch_operation_type::set_tier: {
            const auto* params = std::get_if<set_tier_parameters>(&operation.parameters);
            if (params == nullptr) {
                return unexpected{error{error_code::invalid_argument,
                    "Operation " + std::to_string(operation.index) + " is not a set tier"}};
            }
            request.method = http_method::put;
            request.url = context_.resource_url(storage_location::primary,
                                                operation.container, operation.blob,
                                                "comp=tier");
            request.set_header("x-ms-access-tier", to_string(params->tier));
            if (params->priority) {
                request.set_header("x-ms-rehydrate-priority", to_string(*params->priority));
            }
            request.set_header("Content-Length", "0");
            break;
        }
    }

    request.set_header("x-ms-date", blob_utils::get_rfc1123_time());
    operation.condition.apply_to(request.headers);

    const auto& credentials = operation.credentials ? *operation.credentials
                                                    : context_.credentials();
    if (auto signed_request = context_.signer().sign(request, credentials);
        !signed_request.has_value()) {
        return unexpected{signed_request.error()};
    }
    return request;
}

auto batch_request_builder::build(const blob_batch& batch, std::string boundary) const
    -> result<http_request> {
    if (boundary.empty()) {
        boundary = "batch_" + blob_utils::generate_uuid();
    }

    multipart_writer writer(boundary);
    for (const auto& operation : batch.operations()) {
        auto sub = build_sub_request(operation, batch.type());
        if (!sub.has_value()) {
            return unexpected{sub.error()};
        }

        auto parts = parse_url(sub.value().url);
        if (!parts) {
            return unexpected{error{error_code::invalid_argument,
                "Invalid sub-request URL: " + sub.value().url}};
        }
        std::string target = parts->path;
        if (!parts->query.empty()) {
            target += "?" + parts->query;
        }

        http_headers mime;
        mime["Content-Type"] = "application/http";
        mime["Content-Transfer-Encoding"] = "binary";
        mime["Content-ID"] = std::to_string(operation.index);

        writer.add_part(mime,
                        std::string(to_string(sub.value().method)) + " " + target + " HTTP/1.1",
                        sub.value().headers,
                        sub.value().body_string());
    }

    http_request request;
    request.method = http_method::post;
    request.url = context_.resource_url(storage_location::primary, {}, {}, "comp=batch");
    request.set_header("Content-Type", writer.content_type());
    request.body = blob_utils::to_bytes(writer.finish());

    BT_LOG_DEBUG(log_category::batch,
                 "Built " + std::string(to_string(batch.type())) + " batch with " +
                     std::to_string(batch.size()) + " operations");
    return request;
}

}  // namespace kcenon::blob_transfer
