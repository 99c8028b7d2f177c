/**
 * @file cancellation.h
 * @brief Cooperative cancellation for chunked transfers
 */

#ifndef KCENON_BLOB_TRANSFER_CORE_CANCELLATION_H
#define KCENON_BLOB_TRANSFER_CORE_CANCELLATION_H

#include <atomic>
#include <memory>
#include <utility>

namespace kcenon::blob_transfer {

/**
 * @brief Observer side of a cancellation_source
 *
 * A default constructed token is never cancelled. Tokens are cheap to copy
 * and safe to query from any thread.
 */
class cancellation_token {
public:
    cancellation_token() = default;

    [[nodiscard]] auto is_cancelled() const noexcept -> bool {
        return flag_ && flag_->load(std::memory_order_acquire);
    }

    [[nodiscard]] auto can_be_cancelled() const noexcept -> bool {
        return flag_ != nullptr;
    }

private:
    friend class cancellation_source;

    explicit cancellation_token(std::shared_ptr<std::atomic<bool>> flag)
        : flag_(std::move(flag)) {}

    std::shared_ptr<std::atomic<bool>> flag_;
};

/**
 * @brief Owner side that requests cancellation
 */
class cancellation_source {
public:
    cancellation_source() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() noexcept { flag_->store(true, std::memory_order_release); }

    [[nodiscard]] auto is_cancelled() const noexcept -> bool {
        return flag_->load(std::memory_order_acquire);
    }

    [[nodiscard]] auto token() const -> cancellation_token {
        return cancellation_token(flag_);
    }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

}  // namespace kcenon::blob_transfer

#endif  // KCENON_BLOB_TRANSFER_CORE_CANCELLATION_H
