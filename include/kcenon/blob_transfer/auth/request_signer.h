/**
 * @file request_signer.h
 * @brief Request authorization (SharedKey, SAS, anonymous)
 */

#ifndef KCENON_BLOB_TRANSFER_AUTH_REQUEST_SIGNER_H
#define KCENON_BLOB_TRANSFER_AUTH_REQUEST_SIGNER_H

#include "storage_credentials.h"
#include "kcenon/blob_transfer/core/types.h"
#include "kcenon/blob_transfer/http/http_types.h"

#include <string>

namespace kcenon::blob_transfer {

/**
 * @brief Authorizes an outgoing request with a set of credentials
 */
class request_signer {
public:
    virtual ~request_signer() = default;

    /**
     * @brief Authorize @p request in place
     *
     * Must be called after all headers that take part in the signature
     * are set.
     */
    [[nodiscard]] virtual auto sign(http_request& request,
                                    const storage_credentials& credentials)
        -> result<void> = 0;
};

/**
 * @brief Default signer
 *
 * - shared_key: adds x-ms-date when missing and an
 *   "Authorization: SharedKey account:signature" header
 * - sas: appends the token to the query string
 * - anonymous: leaves the request untouched
 */
class storage_request_signer : public request_signer {
public:
    [[nodiscard]] auto sign(http_request& request,
                            const storage_credentials& credentials)
        -> result<void> override;

    /**
     * @brief Canonical string signed by the SharedKey scheme
     */
    [[nodiscard]] static auto build_string_to_sign(const http_request& request,
                                                   const std::string& account_name)
        -> std::string;

    /**
     * @brief Compute the SharedKey header value for @p request
     */
    [[nodiscard]] static auto compute_shared_key(const http_request& request,
                                                 const std::string& account_name,
                                                 const std::string& account_key)
        -> result<std::string>;
};

}  // namespace kcenon::blob_transfer

#endif  // KCENON_BLOB_TRANSFER_AUTH_REQUEST_SIGNER_H
