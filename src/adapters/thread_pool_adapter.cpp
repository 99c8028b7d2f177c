// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.cpp
 * @brief Worker pool implementations for block transfers
 */

#include "kcenon/blob_transfer/adapters/thread_pool_adapter.h"

#include <array>
#include <exception>
#include <thread>

#if KCENON_WITH_THREAD_SYSTEM
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wdeprecated-declarations"
#include <kcenon/thread/core/job.h>
#include <kcenon/thread/core/job_queue.h>
#include <kcenon/thread/core/thread_worker.h>
#pragma clang diagnostic pop
#endif

namespace kcenon::blob_transfer::adapters {

namespace {

constexpr std::size_t stage_count = 3;

/**
 * @brief Per-stage active/completed counters
 */
class stage_counters {
public:
    void started(transfer_stage stage) {
        active_[index(stage)].fetch_add(1, std::memory_order_relaxed);
    }

    void finished(transfer_stage stage) {
        active_[index(stage)].fetch_sub(1, std::memory_order_relaxed);
        completed_[index(stage)].fetch_add(1, std::memory_order_relaxed);
    }

    [[nodiscard]] auto active(transfer_stage stage) const -> std::size_t {
        return active_[index(stage)].load(std::memory_order_relaxed);
    }

    [[nodiscard]] auto completed(transfer_stage stage) const -> std::size_t {
        return completed_[index(stage)].load(std::memory_order_relaxed);
    }

private:
    static constexpr auto index(transfer_stage stage) -> std::size_t {
        return static_cast<std::size_t>(stage);
    }

    std::array<std::atomic<std::size_t>, stage_count> active_{};
    std::array<std::atomic<std::size_t>, stage_count> completed_{};
};

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Wrap a task so it fulfils @p promise and updates the counters
 *
 * An escaping exception is stored in the future rather than lost.
 */
auto make_tracked_task(std::function<void()> task,
                       std::shared_ptr<std::promise<void>> promise,
                       std::shared_ptr<stage_counters> counters,
                       transfer_stage stage) -> std::function<void()> {
    return [task = std::move(task), promise = std::move(promise),
            counters = std::move(counters), stage]() {
        std::exception_ptr failure;
        try {
            task();
        } catch (...) {
            failure = std::current_exception();
        }
        // Counters settle before the waiter wakes
        counters->finished(stage);
        if (failure) {
            promise->set_exception(failure);
        } else {
            promise->set_value();
        }
    };
}

#endif  // KCENON_WITH_THREAD_SYSTEM

}  // namespace

// ============================================================================
// thread_system_transfer_adapter
// ============================================================================

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief thread_system job running one block task
 */
class block_task_job : public kcenon::thread::job {
public:
    block_task_job(std::function<void()> func, transfer_stage stage)
        : job(to_string(stage)), func_(std::move(func)) {}

    [[nodiscard]] auto do_work() -> common::VoidResult override {
        if (func_) {
            func_();
        }
        return common::ok();
    }

private:
    std::function<void()> func_;
};

struct thread_system_transfer_adapter::impl {
    std::shared_ptr<kcenon::thread::thread_pool> pool;
    std::size_t worker_count{0};
    std::shared_ptr<stage_counters> counters = std::make_shared<stage_counters>();
};

thread_system_transfer_adapter::thread_system_transfer_adapter(
    std::shared_ptr<kcenon::thread::thread_pool> pool, std::size_t worker_count)
    : pimpl_(std::make_unique<impl>()) {
    pimpl_->pool = std::move(pool);
    pimpl_->worker_count = worker_count;
}

thread_system_transfer_adapter::~thread_system_transfer_adapter() = default;

auto thread_system_transfer_adapter::create_default(std::size_t worker_count,
                                                    const std::string& pool_name)
    -> std::shared_ptr<thread_system_transfer_adapter> {
    if (worker_count == 0) {
        worker_count = std::thread::hardware_concurrency();
        if (worker_count == 0) {
            worker_count = 4;
        }
    }

    auto pool = std::make_shared<kcenon::thread::thread_pool>(pool_name);
    for (std::size_t i = 0; i < worker_count; ++i) {
        auto worker = std::make_unique<kcenon::thread::thread_worker>();
        worker->set_job_queue(pool->get_job_queue());
        pool->enqueue(std::move(worker));
    }
    pool->start();

    return std::make_shared<thread_system_transfer_adapter>(std::move(pool), worker_count);
}

auto thread_system_transfer_adapter::submit(transfer_stage stage, std::function<void()> task)
    -> std::future<void> {
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();

    pimpl_->counters->started(stage);
    auto job = std::make_unique<block_task_job>(
        make_tracked_task(std::move(task), promise, pimpl_->counters, stage), stage);
    pimpl_->pool->enqueue(std::move(job));

    return future;
}

auto thread_system_transfer_adapter::worker_count() const -> std::size_t {
    return pimpl_->worker_count;
}

auto thread_system_transfer_adapter::is_running() const -> bool {
    return pimpl_->pool != nullptr;
}

auto thread_system_transfer_adapter::active_tasks(transfer_stage stage) const -> std::size_t {
    return pimpl_->counters->active(stage);
}

auto thread_system_transfer_adapter::completed_tasks(transfer_stage stage) const
    -> std::size_t {
    return pimpl_->counters->completed(stage);
}

#endif  // KCENON_WITH_THREAD_SYSTEM

// ============================================================================
// async_transfer_pool
// ============================================================================

struct async_transfer_pool::impl {
    std::shared_ptr<stage_counters> counters = std::make_shared<stage_counters>();
};

async_transfer_pool::async_transfer_pool()
    : pimpl_(std::make_shared<impl>()) {}

async_transfer_pool::~async_transfer_pool() = default;

auto async_transfer_pool::submit(transfer_stage stage, std::function<void()> task)
    -> std::future<void> {
    pimpl_->counters->started(stage);

    auto counters = pimpl_->counters;
    return std::async(std::launch::async,
                      [counters = std::move(counters), task = std::move(task), stage]() {
                          try {
                              task();
                          } catch (...) {
                              counters->finished(stage);
                              throw;
                          }
                          counters->finished(stage);
                      });
}

auto async_transfer_pool::worker_count() const -> std::size_t {
    auto count = std::thread::hardware_concurrency();
    return count > 0 ? count : 4;
}

auto async_transfer_pool::is_running() const -> bool {
    return true;
}

auto async_transfer_pool::active_tasks(transfer_stage stage) const -> std::size_t {
    return pimpl_->counters->active(stage);
}

auto async_transfer_pool::completed_tasks(transfer_stage stage) const -> std::size_t {
    return pimpl_->counters->completed(stage);
}

// ============================================================================
// transfer_pool_factory
// ============================================================================

auto transfer_pool_factory::create(std::size_t worker_count, const std::string& pool_name)
    -> std::shared_ptr<transfer_thread_pool_interface> {
#if KCENON_WITH_THREAD_SYSTEM
    return thread_system_transfer_adapter::create_default(worker_count, pool_name);
#else
    (void)worker_count;
    (void)pool_name;
    return std::make_shared<async_transfer_pool>();
#endif
}

}  // namespace kcenon::blob_transfer::adapters
