/**
 * @file retry_policy.cpp
 * @brief Backoff computation
 */

#include "kcenon/blob_transfer/blob/retry_policy.h"

#include <algorithm>
#include <random>

namespace kcenon::blob_transfer {

auto calculate_retry_delay(const retry_policy& policy, std::size_t retry)
    -> std::chrono::milliseconds {
    auto delay = static_cast<double>(policy.initial_delay.count());

    for (std::size_t i = 1; i < retry; ++i) {
        delay *= policy.backoff_multiplier;
    }

    delay = std::min(delay, static_cast<double>(policy.max_delay.count()));

    if (policy.use_jitter && delay > 0.0) {
        thread_local std::mt19937 gen(std::random_device{}());
        std::uniform_real_distribution<> dis(0.5, 1.5);
        delay *= dis(gen);
    }

    return std::chrono::milliseconds(static_cast<int64_t>(delay));
}

}  // namespace kcenon::blob_transfer
