/**
 * @file buffer_pool.cpp
 * @brief Implementation of the block buffer pool
 */

#include <kcenon/blob_transfer/core/buffer_pool.h>

#include <condition_variable>
#include <mutex>

namespace kcenon::blob_transfer {

struct pooled_buffer::pool_state {
    std::size_t buffer_size = 0;
    std::size_t max_buffers = 0;

    mutable std::mutex mutex;
    std::condition_variable available;
    std::vector<std::vector<std::byte>> idle;
    std::size_t outstanding = 0;
    std::size_t checkouts = 0;

    auto take_locked() -> std::vector<std::byte> {
        ++outstanding;
        ++checkouts;
        if (!idle.empty()) {
            auto buffer = std::move(idle.back());
            idle.pop_back();
            buffer.clear();
            return buffer;
        }
        std::vector<std::byte> buffer;
        buffer.reserve(buffer_size);
        return buffer;
    }

    void give_back(std::vector<std::byte> buffer) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            --outstanding;
            // Oversized buffers are dropped so one large block cannot pin memory
            if (buffer.capacity() <= buffer_size * 2) {
                idle.push_back(std::move(buffer));
            }
        }
        available.notify_one();
    }
};

// ============================================================================
// pooled_buffer
// ============================================================================

pooled_buffer::pooled_buffer(std::shared_ptr<pool_state> state, std::vector<std::byte> data)
    : state_(std::move(state)), data_(std::move(data)) {}

pooled_buffer::~pooled_buffer() {
    reset();
}

pooled_buffer::pooled_buffer(pooled_buffer&& other) noexcept
    : state_(std::move(other.state_)), data_(std::move(other.data_)) {
    other.state_.reset();
}

auto pooled_buffer::operator=(pooled_buffer&& other) noexcept -> pooled_buffer& {
    if (this != &other) {
        reset();
        state_ = std::move(other.state_);
        data_ = std::move(other.data_);
        other.state_.reset();
    }
    return *this;
}

void pooled_buffer::reset() {
    if (state_) {
        auto state = std::move(state_);
        state_.reset();
        state->give_back(std::move(data_));
        data_ = {};
    }
}

// ============================================================================
// buffer_pool
// ============================================================================

buffer_pool::buffer_pool(std::size_t buffer_size, std::size_t max_buffers)
    : state_(std::make_shared<pooled_buffer::pool_state>()) {
    state_->buffer_size = buffer_size;
    state_->max_buffers = max_buffers;
}

buffer_pool::~buffer_pool() = default;

auto buffer_pool::checkout() -> pooled_buffer {
    std::unique_lock<std::mutex> lock(state_->mutex);
    state_->available.wait(lock, [this] {
        return state_->max_buffers == 0 || state_->outstanding < state_->max_buffers;
    });
    return pooled_buffer(state_, state_->take_locked());
}

auto buffer_pool::try_checkout() -> std::optional<pooled_buffer> {
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (state_->max_buffers != 0 && state_->outstanding >= state_->max_buffers) {
        return std::nullopt;
    }
    return pooled_buffer(state_, state_->take_locked());
}

auto buffer_pool::outstanding_count() const -> std::size_t {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->outstanding;
}

auto buffer_pool::idle_count() const -> std::size_t {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->idle.size();
}

auto buffer_pool::total_checkouts() const -> std::size_t {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->checkouts;
}

auto buffer_pool::buffer_size() const noexcept -> std::size_t {
    return state_->buffer_size;
}

auto buffer_pool::max_buffers() const noexcept -> std::size_t {
    return state_->max_buffers;
}

}  // namespace kcenon::blob_transfer
