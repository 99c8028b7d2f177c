/**
 * @file storage_credentials.cpp
 * @brief Credential construction and connection string parsing
 */

#include "kcenon/blob_transfer/auth/storage_credentials.h"
#include "kcenon/blob_transfer/core/blob_utils.h"
#include "kcenon/blob_transfer/core/logging.h"

#include <cstdlib>

namespace kcenon::blob_transfer {

namespace {

auto get_env(const char* name) -> std::optional<std::string> {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

}  // namespace

auto storage_credentials::anonymous(std::string account_name) -> storage_credentials {
    storage_credentials creds;
    creds.kind = credential_kind::anonymous;
    creds.account_name = std::move(account_name);
    return creds;
}

auto storage_credentials::shared_key(std::string account_name, std::string account_key)
    -> result<storage_credentials> {
    if (account_name.empty()) {
        return unexpected{error{error_code::invalid_configuration,
            "Shared key credentials require an account name"}};
    }
    auto decoded = blob_utils::base64_decode(account_key);
    if (!decoded || decoded->empty()) {
        return unexpected{error{error_code::invalid_configuration,
            "Account key is not valid base64"}};
    }

    storage_credentials creds;
    creds.kind = credential_kind::shared_key;
    creds.account_name = std::move(account_name);
    creds.account_key = std::move(account_key);
    return creds;
}

auto storage_credentials::sas(std::string account_name, std::string token)
    -> storage_credentials {
    if (!token.empty() && token.front() == '?') {
        token.erase(0, 1);
    }
    storage_credentials creds;
    creds.kind = credential_kind::sas;
    creds.account_name = std::move(account_name);
    creds.sas_token = std::move(token);
    return creds;
}

auto storage_credentials::from_connection_string(const std::string& connection_string)
    -> result<storage_credentials> {
    auto settings = parse_connection_string(connection_string);
    if (!settings.has_value()) {
        return unexpected{settings.error()};
    }
    return settings.value().credentials;
}

auto storage_credentials::from_environment() -> result<storage_credentials> {
    if (auto conn = get_env("AZURE_STORAGE_CONNECTION_STRING")) {
        BT_LOG_DEBUG(log_category::auth, "Using AZURE_STORAGE_CONNECTION_STRING");
        return from_connection_string(*conn);
    }

    auto account = get_env("AZURE_STORAGE_ACCOUNT");
    if (!account) {
        return unexpected{error{error_code::invalid_configuration,
            "AZURE_STORAGE_ACCOUNT is not set"}};
    }

    if (auto key = get_env("AZURE_STORAGE_KEY")) {
        return shared_key(*account, *key);
    }
    if (auto token = get_env("AZURE_STORAGE_SAS_TOKEN")) {
        return sas(*account, *token);
    }
    return anonymous(*account);
}

auto parse_connection_string(const std::string& connection_string)
    -> result<connection_settings> {
    connection_settings settings;
    std::string account_key;
    std::string sas_token;

    std::size_t pos = 0;
    while (pos < connection_string.size()) {
        auto semi_pos = connection_string.find(';', pos);
        auto segment = connection_string.substr(
            pos, semi_pos == std::string::npos ? std::string::npos : semi_pos - pos);
        pos = semi_pos == std::string::npos ? connection_string.size() : semi_pos + 1;

        // Values may contain '=' (base64 padding, SAS query), so split on the first one
        auto eq_pos = segment.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }
        auto key = segment.substr(0, eq_pos);
        auto value = segment.substr(eq_pos + 1);

        if (key == "AccountName") {
            settings.credentials.account_name = value;
        } else if (key == "AccountKey") {
            account_key = value;
        } else if (key == "SharedAccessSignature") {
            sas_token = value;
        } else if (key == "EndpointSuffix") {
            settings.endpoint_suffix = value;
        } else if (key == "DefaultEndpointsProtocol") {
            settings.protocol = value;
        } else if (key == "BlobEndpoint") {
            settings.blob_endpoint = value;
        }
    }

    if (settings.credentials.account_name.empty() && settings.blob_endpoint.empty()) {
        return unexpected{error{error_code::invalid_configuration,
            "Connection string has neither AccountName nor BlobEndpoint"}};
    }

    if (!account_key.empty()) {
        auto creds = storage_credentials::shared_key(settings.credentials.account_name,
                                                     account_key);
        if (!creds.has_value()) {
            return unexpected{creds.error()};
        }
        settings.credentials = std::move(creds.value());
    } else if (!sas_token.empty()) {
        settings.credentials = storage_credentials::sas(settings.credentials.account_name,
                                                        sas_token);
    } else {
        settings.credentials = storage_credentials::anonymous(settings.credentials.account_name);
    }

    if (settings.blob_endpoint.empty()) {
        settings.blob_endpoint = settings.protocol + "://" +
                                 settings.credentials.account_name + ".blob." +
                                 settings.endpoint_suffix;
    }
    while (!settings.blob_endpoint.empty() && settings.blob_endpoint.back() == '/') {
        settings.blob_endpoint.pop_back();
    }
    return settings;
}

}  // namespace kcenon::blob_transfer
