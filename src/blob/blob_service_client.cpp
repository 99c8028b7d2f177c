/**
 * @file blob_service_client.cpp
 * @brief Account-level client and batch execution
 */

#include "kcenon/blob_transfer/blob/blob_service_client.h"
#include "kcenon/blob_transfer/batch/batch_request_builder.h"
#include "kcenon/blob_transfer/batch/batch_response_parser.h"
#include "kcenon/blob_transfer/core/logging.h"

namespace kcenon::blob_transfer {

blob_service_client::blob_service_client(std::shared_ptr<service_context> context)
    : context_(std::move(context)) {}

auto blob_service_client::create(blob_client_config config,
                                 storage_credentials credentials,
                                 std::shared_ptr<http_transport_interface> transport,
                                 std::shared_ptr<request_signer> signer)
    -> result<std::unique_ptr<blob_service_client>> {
    get_logger().initialize();

    if (config.account_name.empty()) {
        config.account_name = credentials.account_name;
    }
    if (auto valid = config.validate(); !valid.has_value()) {
        return unexpected{valid.error()};
    }

    auto context = std::make_shared<service_context>(std::move(config), std::move(credentials),
                                                     std::move(transport), std::move(signer));
    BT_LOG_INFO(log_category::client,
                "Blob service client created for " + context->config().primary_endpoint());
    return std::unique_ptr<blob_service_client>(new blob_service_client(std::move(context)));
}

auto blob_service_client::from_connection_string(
    const std::string& connection_string,
    std::shared_ptr<http_transport_interface> transport)
    -> result<std::unique_ptr<blob_service_client>> {
    auto settings = parse_connection_string(connection_string);
    if (!settings.has_value()) {
        return unexpected{settings.error()};
    }

    auto config = blob_client_config_builder()
                      .with_account(settings.value().credentials.account_name)
                      .with_endpoint(settings.value().blob_endpoint)
                      .with_ssl(settings.value().protocol != "http")
                      .build();
    if (!config.has_value()) {
        return unexpected{config.error()};
    }
    return create(std::move(config.value()), std::move(settings.value().credentials),
                  std::move(transport));
}

auto blob_service_client::get_block_blob_client(const std::string& container,
                                                const std::string& blob) const
    -> block_blob_client {
    return block_blob_client(context_, container, blob);
}

auto blob_service_client::execute_batch(const blob_batch& batch,
                                        const std::optional<blob_request_options>& options)
    -> result<std::vector<batch_sub_response>> {
    const auto& opts = options ? *options : context_->config().default_request_options;

    batch_request_builder builder(*context_);
    auto request = builder.build(batch);
    if (!request.has_value()) {
        return unexpected{request.error()};
    }

    transfer_log_context ctx;
    ctx.block_count = batch.size();
    BT_LOG_DEBUG_CTX(log_category::batch,
                     std::string("Sending ") + to_string(batch.type()) + " batch", ctx);

    auto response = context_->execute(
        [&](storage_location) { return request.value(); },
        {202}, opts.retry.value_or(context_->config().retry));
    if (!response.has_value()) {
        // The outer request failed; there are no sub-results to report
        return unexpected{response.error()};
    }

    batch_response_parser parser(batch.size());
    auto outcome = parser.parse(response.value());
    if (!outcome.has_value()) {
        return unexpected{outcome.error()};
    }

    ctx.status_code = response.value().status_code;
    BT_LOG_INFO_CTX(log_category::batch, "Batch completed", ctx);
    return batch_result_aggregator::aggregate(std::move(outcome.value()));
}

}  // namespace kcenon::blob_transfer
