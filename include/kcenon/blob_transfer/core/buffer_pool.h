/**
 * @file buffer_pool.h
 * @brief Bounded pool of reusable block buffers with outstanding-count tracking
 */

#ifndef KCENON_BLOB_TRANSFER_CORE_BUFFER_POOL_H
#define KCENON_BLOB_TRANSFER_CORE_BUFFER_POOL_H

#include <cstddef>
#include <memory>
#include <optional>
#include <span>
#include <vector>

namespace kcenon::blob_transfer {

class buffer_pool;

/**
 * @brief RAII handle to a buffer checked out of a buffer_pool
 *
 * The buffer returns to its pool when the handle is destroyed or reset,
 * on every path. A default constructed handle owns nothing.
 */
class pooled_buffer {
public:
    pooled_buffer() = default;
    ~pooled_buffer();

    pooled_buffer(const pooled_buffer&) = delete;
    auto operator=(const pooled_buffer&) -> pooled_buffer& = delete;
    pooled_buffer(pooled_buffer&& other) noexcept;
    auto operator=(pooled_buffer&& other) noexcept -> pooled_buffer&;

    [[nodiscard]] auto valid() const noexcept -> bool { return state_ != nullptr; }

    [[nodiscard]] auto data() -> std::vector<std::byte>& { return data_; }
    [[nodiscard]] auto data() const -> const std::vector<std::byte>& { return data_; }

    [[nodiscard]] auto bytes() const -> std::span<const std::byte> { return data_; }
    [[nodiscard]] auto size() const noexcept -> std::size_t { return data_.size(); }

    /**
     * @brief Return the buffer to its pool now
     */
    void reset();

private:
    friend class buffer_pool;
    struct pool_state;

    pooled_buffer(std::shared_ptr<pool_state> state, std::vector<std::byte> data);

    std::shared_ptr<pool_state> state_;
    std::vector<std::byte> data_;
};

/**
 * @brief Pool of block-sized buffers shared by concurrent block tasks
 *
 * checkout() blocks while @c max_buffers buffers are outstanding; a
 * max_buffers of 0 means unbounded. outstanding_count() is 0 whenever no
 * transfer holds a buffer, which tests assert at idle.
 *
 * @note Thread-safe. Handles may outlive the pool object.
 */
class buffer_pool {
public:
    explicit buffer_pool(std::size_t buffer_size, std::size_t max_buffers = 0);
    ~buffer_pool();

    buffer_pool(const buffer_pool&) = delete;
    auto operator=(const buffer_pool&) -> buffer_pool& = delete;

    /**
     * @brief Check out an empty buffer with capacity for buffer_size() bytes
     */
    [[nodiscard]] auto checkout() -> pooled_buffer;

    /**
     * @brief Check out a buffer without blocking
     * @return nullopt when the pool is exhausted
     */
    [[nodiscard]] auto try_checkout() -> std::optional<pooled_buffer>;

    [[nodiscard]] auto outstanding_count() const -> std::size_t;
    [[nodiscard]] auto idle_count() const -> std::size_t;
    [[nodiscard]] auto total_checkouts() const -> std::size_t;
    [[nodiscard]] auto buffer_size() const noexcept -> std::size_t;
    [[nodiscard]] auto max_buffers() const noexcept -> std::size_t;

private:
    std::shared_ptr<pooled_buffer::pool_state> state_;
};

}  // namespace kcenon::blob_transfer

#endif  // KCENON_BLOB_TRANSFER_CORE_BUFFER_POOL_H
