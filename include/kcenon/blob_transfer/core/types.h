/**
 * @file types.h
 * @brief Core type definitions for blob_transfer_system
 */

#ifndef KCENON_BLOB_TRANSFER_CORE_TYPES_H
#define KCENON_BLOB_TRANSFER_CORE_TYPES_H

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace kcenon::blob_transfer {

/**
 * @brief Error codes for blob transfer operations
 *
 * Codes are grouped by family so callers can classify failures with the
 * range helpers below instead of enumerating individual codes.
 */
enum class error_code {
    success = 0,

    // Misuse / local state errors (-100 to -199)
    invalid_argument = -100,
    invalid_block_size = -101,
    invalid_block_id = -102,
    unsupported_operation = -103,
    stream_closed = -104,
    invalid_state = -105,
    batch_too_large = -106,
    invalid_metadata = -107,
    invalid_configuration = -108,

    // Transport errors (-200 to -299)
    transport_error = -200,
    connection_failed = -201,
    connection_timeout = -202,
    not_initialized = -203,

    // Protocol / parse errors (-300 to -399)
    protocol_error = -300,
    malformed_multipart = -301,
    batch_index_out_of_order = -302,
    missing_error_detail = -303,
    malformed_response = -304,

    // Data integrity errors (-400 to -499)
    checksum_mismatch = -400,

    // Service-reported errors (-500 to -599)
    service_error = -500,
    blob_not_found = -501,
    precondition_failed = -502,
    conflict = -503,
    not_modified = -504,
    server_busy = -505,
    authentication_failed = -506,
    batch_operation_failed = -510,

    // Transfer errors (-600 to -699)
    transfer_cancelled = -600,
    block_transfer_failed = -601,

    // File errors (-700 to -799)
    file_not_found = -700,
    file_read_error = -701,
    file_write_error = -702,

    // Internal errors (-900)
    internal_error = -900,
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) -> const char* {
    switch (code) {
        case error_code::success:
            return "success";
        case error_code::invalid_argument:
            return "invalid argument";
        case error_code::invalid_block_size:
            return "invalid block size";
        case error_code::invalid_block_id:
            return "invalid block id";
        case error_code::unsupported_operation:
            return "unsupported operation";
        case error_code::stream_closed:
            return "stream closed";
        case error_code::invalid_state:
            return "invalid state";
        case error_code::batch_too_large:
            return "batch too large";
        case error_code::invalid_metadata:
            return "invalid metadata";
        case error_code::invalid_configuration:
            return "invalid configuration";
        case error_code::transport_error:
            return "transport error";
        case error_code::connection_failed:
            return "connection failed";
        case error_code::connection_timeout:
            return "connection timeout";
        case error_code::not_initialized:
            return "not initialized";
        case error_code::protocol_error:
            return "protocol error";
        case error_code::malformed_multipart:
            return "malformed multipart body";
        case error_code::batch_index_out_of_order:
            return "batch operation index out of order";
        case error_code::missing_error_detail:
            return "missing error detail";
        case error_code::malformed_response:
            return "malformed response";
        case error_code::checksum_mismatch:
            return "checksum mismatch";
        case error_code::service_error:
            return "service error";
        case error_code::blob_not_found:
            return "blob not found";
        case error_code::precondition_failed:
            return "precondition failed";
        case error_code::conflict:
            return "conflict";
        case error_code::not_modified:
            return "not modified";
        case error_code::server_busy:
            return "server busy";
        case error_code::authentication_failed:
            return "authentication failed";
        case error_code::batch_operation_failed:
            return "batch operation failed";
        case error_code::transfer_cancelled:
            return "transfer cancelled";
        case error_code::block_transfer_failed:
            return "block transfer failed";
        case error_code::file_not_found:
            return "file not found";
        case error_code::file_read_error:
            return "file read error";
        case error_code::file_write_error:
            return "file write error";
        case error_code::internal_error:
            return "internal error";
        default:
            return "unknown error";
    }
}

// ============================================================================
// Error classification helpers
// ============================================================================

[[nodiscard]] constexpr auto is_misuse_error(error_code code) -> bool {
    auto v = static_cast<int>(code);
    return v <= -100 && v > -200;
}

[[nodiscard]] constexpr auto is_transport_error(error_code code) -> bool {
    auto v = static_cast<int>(code);
    return v <= -200 && v > -300;
}

[[nodiscard]] constexpr auto is_protocol_error(error_code code) -> bool {
    auto v = static_cast<int>(code);
    return v <= -300 && v > -400;
}

[[nodiscard]] constexpr auto is_integrity_error(error_code code) -> bool {
    auto v = static_cast<int>(code);
    return v <= -400 && v > -500;
}

[[nodiscard]] constexpr auto is_service_error(error_code code) -> bool {
    auto v = static_cast<int>(code);
    return v <= -500 && v > -600;
}

[[nodiscard]] constexpr auto is_transfer_error(error_code code) -> bool {
    auto v = static_cast<int>(code);
    return v <= -600 && v > -700;
}

/**
 * @brief Details reported by the storage service for a failed request
 */
struct service_error_info {
    int status_code = 0;
    std::string error_code;   ///< Symbolic service code, e.g. "BlobNotFound"
    std::string message;      ///< Human-readable service message
    std::string request_id;
};

struct batch_outcome;

/**
 * @brief Error type with code and optional message
 *
 * Service failures carry the status and symbolic code reported by the
 * service. Batch failures additionally carry the full parsed outcome so
 * callers can inspect what succeeded alongside what failed.
 */
struct error {
    error_code code;
    std::string message;
    std::optional<service_error_info> service;
    std::shared_ptr<const batch_outcome> batch;

    error() : code(error_code::success) {}
    explicit error(error_code c) : code(c), message(to_string(c)) {}
    error(error_code c, std::string msg) : code(c), message(std::move(msg)) {}
    error(error_code c, std::string msg, service_error_info info)
        : code(c), message(std::move(msg)), service(std::move(info)) {}

    [[nodiscard]] explicit operator bool() const noexcept {
        return code != error_code::success;
    }

    /**
     * @brief HTTP status reported by the service, or 0 for local errors
     */
    [[nodiscard]] auto status_code() const noexcept -> int {
        return service ? service->status_code : 0;
    }

    /**
     * @brief Outcome of a failed batch, or nullptr for any other error
     */
    [[nodiscard]] auto batch_failure() const noexcept -> const batch_outcome* {
        return batch.get();
    }
};

/**
 * @brief Whether a failed request may be attempted again
 *
 * Transport failures (other than a missing transport) and the service
 * statuses 408, 429, 500, 503 and 504 are retryable. Misuse, protocol,
 * integrity and precondition errors never are.
 */
[[nodiscard]] inline auto is_retryable(const error& err) noexcept -> bool {
    if (is_transport_error(err.code)) {
        return err.code != error_code::not_initialized;
    }
    if (is_service_error(err.code)) {
        switch (err.status_code()) {
            case 408:
            case 429:
            case 500:
            case 503:
            case 504:
                return true;
            default:
                return false;
        }
    }
    return false;
}

/**
 * @brief Wrapper for unexpected error (used with result<T>)
 */
struct unexpected {
    error err;

    explicit unexpected(error e) : err(std::move(e)) {}
};

/**
 * @brief Result type for operations that can fail
 *
 * A simple Result type similar to std::expected (C++23).
 * Contains either a value of type T or an error.
 */
template <typename T>
class result {
public:
    result() : value_(std::nullopt), error_{} {}

    result(T value) : value_(std::move(value)), error_{} {}

    result(unexpected u) : value_(std::nullopt), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return value_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return value_.has_value(); }

    [[nodiscard]] auto value() & -> T& { return *value_; }
    [[nodiscard]] auto value() const& -> const T& { return *value_; }
    [[nodiscard]] auto value() && -> T&& { return std::move(*value_); }

    [[nodiscard]] auto operator->() -> T* { return &*value_; }
    [[nodiscard]] auto operator->() const -> const T* { return &*value_; }
    [[nodiscard]] auto operator*() & -> T& { return *value_; }
    [[nodiscard]] auto operator*() const& -> const T& { return *value_; }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    std::optional<T> value_;
    struct error error_;
};

/**
 * @brief Specialization of result for void return type
 */
template <>
class result<void> {
public:
    result() : has_value_(true) {}

    result(unexpected u) : has_value_(false), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    bool has_value_;
    struct error error_;
};

}  // namespace kcenon::blob_transfer

#endif  // KCENON_BLOB_TRANSFER_CORE_TYPES_H
