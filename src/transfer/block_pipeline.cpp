/**
 * @file block_pipeline.cpp
 * @brief Bounded-parallel block dispatch
 */

#include "kcenon/blob_transfer/transfer/block_pipeline.h"
#include "kcenon/blob_transfer/core/logging.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <mutex>
#include <optional>

namespace kcenon::blob_transfer {

auto make_block_error(const error& cause, const block_task_info& info) -> error {
    std::string message = "Block " + std::to_string(info.index) + " (offset " +
                          std::to_string(info.offset) + ", length " +
                          std::to_string(info.length) + ") failed: " + cause.message;

    error_code code = error_code::block_transfer_failed;
    if (cause.code == error_code::checksum_mismatch ||
        cause.code == error_code::transfer_cancelled) {
        code = cause.code;
    }

    error wrapped{code, std::move(message)};
    wrapped.service = cause.service;
    return wrapped;
}

struct block_pipeline::state {
    std::mutex mutex;
    std::condition_variable changed;
    std::size_t in_flight = 0;
    std::size_t completed = 0;
    std::optional<error> first_error;
    std::atomic<bool> cancelled{false};
    completion_handler on_complete;

    void finish(const block_task_info& info, result<void> outcome) {
        completion_handler handler;
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (!outcome.has_value() && !first_error) {
                first_error = outcome.error();
            }
            if (outcome.has_value()) {
                ++completed;
                handler = on_complete;
            }
        }
        if (handler) {
            handler(info);
        }
        {
            std::lock_guard<std::mutex> lock(mutex);
            --in_flight;
        }
        changed.notify_all();
    }
};

block_pipeline::block_pipeline(std::shared_ptr<adapters::transfer_thread_pool_interface> pool,
                               adapters::transfer_stage stage,
                               std::size_t parallelism,
                               cancellation_token token)
    : pool_(std::move(pool)),
      stage_(stage),
      parallelism_(std::max<std::size_t>(parallelism, 1)),
      token_(std::move(token)),
      state_(std::make_shared<state>()) {}

block_pipeline::~block_pipeline() {
    auto outcome = drain();
    if (!outcome.has_value()) {
        BT_LOG_DEBUG(log_category::transfer,
                     "Pipeline destroyed after failure: " + outcome.error().message);
    }
}

void block_pipeline::set_completion_handler(completion_handler handler) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->on_complete = std::move(handler);
}

auto block_pipeline::is_cancelled() const -> bool {
    return token_.is_cancelled() || state_->cancelled.load(std::memory_order_acquire);
}

auto block_pipeline::submit(const block_task_info& info, block_task task) -> result<void> {
    {
        std::unique_lock<std::mutex> lock(state_->mutex);
        state_->changed.wait(lock, [this] {
            return state_->in_flight < parallelism_ || state_->first_error.has_value() ||
                   is_cancelled();
        });
        if (state_->first_error) {
            return unexpected{*state_->first_error};
        }
        if (is_cancelled()) {
            error cancelled{error_code::transfer_cancelled, "Transfer cancelled"};
            state_->first_error = cancelled;
            return unexpected{std::move(cancelled)};
        }
        ++state_->in_flight;
    }

    reap_finished();

    auto slot = std::make_shared<block_task>(std::move(task));
    auto shared = state_;
    auto token = token_;
    auto run = [shared, token, slot, info]() {
        result<void> outcome;
        bool skip = false;
        {
            std::lock_guard<std::mutex> lock(shared->mutex);
            skip = shared->first_error.has_value();
        }
        if (token.is_cancelled() || shared->cancelled.load(std::memory_order_acquire)) {
            outcome = unexpected{error{error_code::transfer_cancelled,
                "Transfer cancelled before block " + std::to_string(info.index)}};
        } else if (skip) {
            // Another block already failed; the latched error is reported
            outcome = result<void>{};
        } else {
            try {
                outcome = (*slot)();
            } catch (const std::exception& e) {
                outcome = unexpected{error{error_code::internal_error,
                    std::string("Block task threw: ") + e.what()}};
            }
            if (!outcome.has_value()) {
                outcome = unexpected{make_block_error(outcome.error(), info)};
            }
        }
        // Release captured buffers before signalling completion
        *slot = nullptr;
        if (skip && outcome.has_value()) {
            std::lock_guard<std::mutex> lock(shared->mutex);
            --shared->in_flight;
            shared->changed.notify_all();
            return;
        }
        shared->finish(info, std::move(outcome));
    };

    futures_.push_back(pool_->submit(stage_, std::move(run)));
    return {};
}

void block_pipeline::reap_finished() {
    futures_.erase(std::remove_if(futures_.begin(), futures_.end(),
                                  [](std::future<void>& f) {
                                      return f.wait_for(std::chrono::seconds(0)) ==
                                             std::future_status::ready;
                                  }),
                   futures_.end());
}

auto block_pipeline::drain() -> result<void> {
    {
        std::unique_lock<std::mutex> lock(state_->mutex);
        state_->changed.wait(lock, [this] { return state_->in_flight == 0; });
    }
    for (auto& f : futures_) {
        f.wait();
    }
    futures_.clear();

    std::lock_guard<std::mutex> lock(state_->mutex);
    if (state_->first_error) {
        return unexpected{*state_->first_error};
    }
    return {};
}

void block_pipeline::cancel() {
    state_->cancelled.store(true, std::memory_order_release);
    state_->changed.notify_all();
}

auto block_pipeline::in_flight() const -> std::size_t {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->in_flight;
}

auto block_pipeline::completed() const -> std::size_t {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->completed;
}

auto block_pipeline::failed() const -> bool {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->first_error.has_value();
}

}  // namespace kcenon::blob_transfer
