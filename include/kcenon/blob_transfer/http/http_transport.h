/**
 * @file http_transport.h
 * @brief Transport abstraction for blob requests
 *
 * The client never talks to sockets directly; every request goes through
 * an http_transport_interface so tests can inject an in-memory service.
 */

#ifndef KCENON_BLOB_TRANSFER_HTTP_HTTP_TRANSPORT_H
#define KCENON_BLOB_TRANSFER_HTTP_HTTP_TRANSPORT_H

#include "http_types.h"
#include "kcenon/blob_transfer/core/types.h"

#include <chrono>
#include <memory>

namespace kcenon::blob_transfer {

/**
 * @brief Sends one HTTP request and returns the response
 *
 * Implementations must be safe to call concurrently from block workers.
 * A result error means the exchange failed at the transport level; any
 * HTTP status, including 4xx/5xx, is returned as a response.
 */
class http_transport_interface {
public:
    virtual ~http_transport_interface() = default;

    [[nodiscard]] virtual auto send(const http_request& request)
        -> result<http_response> = 0;
};

/**
 * @brief Transport backed by network_system's http_client
 *
 * Without network_system every send() fails with not_initialized.
 */
class network_http_transport : public http_transport_interface {
public:
    explicit network_http_transport(
        std::chrono::milliseconds timeout = std::chrono::milliseconds(30000));
    ~network_http_transport() override;

    network_http_transport(const network_http_transport&) = delete;
    auto operator=(const network_http_transport&) -> network_http_transport& = delete;

    [[nodiscard]] auto send(const http_request& request) -> result<http_response> override;

    /**
     * @brief Check if network_system is linked
     */
    [[nodiscard]] auto is_available() const noexcept -> bool;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

/**
 * @brief Create the default transport for the current build
 */
[[nodiscard]] auto make_default_transport(
    std::chrono::milliseconds timeout = std::chrono::milliseconds(30000))
    -> std::shared_ptr<http_transport_interface>;

}  // namespace kcenon::blob_transfer

#endif  // KCENON_BLOB_TRANSFER_HTTP_HTTP_TRANSPORT_H
