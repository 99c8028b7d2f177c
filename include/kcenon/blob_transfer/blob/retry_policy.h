/**
 * @file retry_policy.h
 * @brief Exponential backoff retry with primary/secondary location selection
 */

#ifndef KCENON_BLOB_TRANSFER_BLOB_RETRY_POLICY_H
#define KCENON_BLOB_TRANSFER_BLOB_RETRY_POLICY_H

#include "kcenon/blob_transfer/core/logging.h"
#include "kcenon/blob_transfer/core/types.h"

#include <chrono>
#include <cstddef>
#include <functional>
#include <string>
#include <thread>

namespace kcenon::blob_transfer {

/**
 * @brief Storage location a single attempt is sent to
 */
enum class storage_location {
    primary,
    secondary,
};

[[nodiscard]] constexpr auto to_string(storage_location location) -> const char* {
    return location == storage_location::primary ? "primary" : "secondary";
}

/**
 * @brief Which locations a read may be served from, and in what order
 */
enum class location_mode {
    primary_only,
    primary_then_secondary,
    secondary_only,
    secondary_then_primary,
};

[[nodiscard]] constexpr auto to_string(location_mode mode) -> const char* {
    switch (mode) {
        case location_mode::primary_only: return "primary_only";
        case location_mode::primary_then_secondary: return "primary_then_secondary";
        case location_mode::secondary_only: return "secondary_only";
        case location_mode::secondary_then_primary: return "secondary_then_primary";
        default: return "primary_only";
    }
}

/**
 * @brief Location used for the given 0-based attempt
 *
 * The *_then_* modes alternate between the two locations.
 */
[[nodiscard]] constexpr auto location_for_attempt(location_mode mode, std::size_t attempt)
    -> storage_location {
    switch (mode) {
        case location_mode::primary_only:
            return storage_location::primary;
        case location_mode::secondary_only:
            return storage_location::secondary;
        case location_mode::primary_then_secondary:
            return attempt % 2 == 0 ? storage_location::primary : storage_location::secondary;
        case location_mode::secondary_then_primary:
            return attempt % 2 == 0 ? storage_location::secondary : storage_location::primary;
        default:
            return storage_location::primary;
    }
}

/**
 * @brief Retry policy configuration
 */
struct retry_policy {
    /// Maximum number of retries after the first attempt
    std::size_t max_retries = 3;

    /// Delay before the first retry
    std::chrono::milliseconds initial_delay{1000};

    /// Upper bound for a single delay
    std::chrono::milliseconds max_delay{30000};

    /// Multiplier for exponential backoff
    double backoff_multiplier = 2.0;

    /// Randomize each delay by [0.5, 1.5)
    bool use_jitter = true;

    [[nodiscard]] static auto no_retry() -> retry_policy {
        retry_policy policy;
        policy.max_retries = 0;
        return policy;
    }
};

/**
 * @brief Delay before the given 1-based retry
 */
[[nodiscard]] auto calculate_retry_delay(const retry_policy& policy, std::size_t retry)
    -> std::chrono::milliseconds;

/**
 * @brief Runs an operation under a retry policy
 *
 * The operation receives the location of each attempt. Only errors for
 * which is_retryable() holds are retried.
 */
class retry_executor {
public:
    using retry_observer = std::function<void(const error&, std::size_t retry)>;

    explicit retry_executor(retry_policy policy, retry_observer observer = nullptr)
        : policy_(std::move(policy)), observer_(std::move(observer)) {}

    template <typename T>
    [[nodiscard]] auto execute(const std::function<result<T>(storage_location)>& operation,
                               location_mode mode = location_mode::primary_only) const
        -> result<T> {
        for (std::size_t attempt = 0;; ++attempt) {
            auto location = location_for_attempt(mode, attempt);
            auto outcome = operation(location);
            if (outcome.has_value()) {
                return outcome;
            }
            if (attempt >= policy_.max_retries || !is_retryable(outcome.error())) {
                return outcome;
            }

            auto delay = calculate_retry_delay(policy_, attempt + 1);
            BT_LOG_DEBUG(log_category::http,
                         "Retry " + std::to_string(attempt + 1) + "/" +
                             std::to_string(policy_.max_retries) + " after " +
                             std::to_string(delay.count()) + "ms: " +
                             outcome.error().message);
            if (observer_) {
                observer_(outcome.error(), attempt + 1);
            }
            if (delay.count() > 0) {
                std::this_thread::sleep_for(delay);
            }
        }
    }

    [[nodiscard]] auto policy() const -> const retry_policy& { return policy_; }

private:
    retry_policy policy_;
    retry_observer observer_;
};

}  // namespace kcenon::blob_transfer

#endif  // KCENON_BLOB_TRANSFER_BLOB_RETRY_POLICY_H
