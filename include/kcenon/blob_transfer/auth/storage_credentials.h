/**
 * @file storage_credentials.h
 * @brief Storage account credentials and connection string parsing
 */

#ifndef KCENON_BLOB_TRANSFER_AUTH_STORAGE_CREDENTIALS_H
#define KCENON_BLOB_TRANSFER_AUTH_STORAGE_CREDENTIALS_H

#include "kcenon/blob_transfer/core/types.h"

#include <optional>
#include <string>

namespace kcenon::blob_transfer {

/**
 * @brief How requests made with a credential are authorized
 */
enum class credential_kind {
    anonymous,   ///< No authorization
    shared_key,  ///< Account key, Authorization: SharedKey header
    sas,         ///< Shared access signature appended to the query
};

[[nodiscard]] constexpr auto to_string(credential_kind kind) -> const char* {
    switch (kind) {
        case credential_kind::anonymous: return "anonymous";
        case credential_kind::shared_key: return "shared_key";
        case credential_kind::sas: return "sas";
        default: return "unknown";
    }
}

/**
 * @brief Credentials for one storage account
 */
struct storage_credentials {
    credential_kind kind = credential_kind::anonymous;

    /// Storage account name
    std::string account_name;

    /// Base64 account key (shared_key only)
    std::optional<std::string> account_key;

    /// SAS token without leading '?' (sas only)
    std::optional<std::string> sas_token;

    [[nodiscard]] auto is_anonymous() const noexcept -> bool {
        return kind == credential_kind::anonymous;
    }

    /**
     * @brief Anonymous credentials (public containers)
     */
    [[nodiscard]] static auto anonymous(std::string account_name = {}) -> storage_credentials;

    /**
     * @brief Shared key credentials
     *
     * Fails with invalid_configuration when the key is not valid base64.
     */
    [[nodiscard]] static auto shared_key(std::string account_name, std::string account_key)
        -> result<storage_credentials>;

    /**
     * @brief SAS credentials; a leading '?' on the token is dropped
     */
    [[nodiscard]] static auto sas(std::string account_name, std::string token)
        -> storage_credentials;

    /**
     * @brief Build credentials from "AccountName=...;AccountKey=..." style strings
     */
    [[nodiscard]] static auto from_connection_string(const std::string& connection_string)
        -> result<storage_credentials>;

    /**
     * @brief Build credentials from AZURE_STORAGE_* environment variables
     *
     * AZURE_STORAGE_CONNECTION_STRING takes precedence; otherwise
     * AZURE_STORAGE_ACCOUNT combined with AZURE_STORAGE_KEY or
     * AZURE_STORAGE_SAS_TOKEN.
     */
    [[nodiscard]] static auto from_environment() -> result<storage_credentials>;
};

/**
 * @brief Parsed form of a storage connection string
 */
struct connection_settings {
    storage_credentials credentials;
    std::string blob_endpoint;  ///< Explicit BlobEndpoint or derived from suffix
    std::string endpoint_suffix = "core.windows.net";
    std::string protocol = "https";
};

/**
 * @brief Parse a connection string
 *
 * Recognized keys: DefaultEndpointsProtocol, AccountName, AccountKey,
 * SharedAccessSignature, EndpointSuffix, BlobEndpoint. Unknown keys are
 * ignored.
 */
[[nodiscard]] auto parse_connection_string(const std::string& connection_string)
    -> result<connection_settings>;

}  // namespace kcenon::blob_transfer

#endif  // KCENON_BLOB_TRANSFER_AUTH_STORAGE_CREDENTIALS_H
