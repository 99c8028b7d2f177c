// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.h
 * @brief Worker pool abstraction for block transfers
 *
 * Block uploads, range downloads and write-stream flushes run on a pool
 * obtained from transfer_pool_factory. With thread_system the pool wraps
 * kcenon::thread::thread_pool; otherwise each task runs on std::async.
 *
 * The pool does not bound in-flight work. Callers (block_pipeline) limit
 * how many tasks they submit at once.
 */

#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <string>

#include "../config/feature_flags.h"

#if KCENON_WITH_THREAD_SYSTEM
#include <kcenon/thread/core/thread_pool.h>
#endif

namespace kcenon::blob_transfer::adapters {

/**
 * @brief Kind of work a task performs, tracked for diagnostics
 */
enum class transfer_stage {
    upload_block,
    download_range,
    stream_block,
};

[[nodiscard]] constexpr auto to_string(transfer_stage stage) -> const char* {
    switch (stage) {
        case transfer_stage::upload_block: return "upload_block";
        case transfer_stage::download_range: return "download_range";
        case transfer_stage::stream_block: return "stream_block";
        default: return "unknown";
    }
}

/**
 * @brief Interface for the pool block tasks run on
 */
class transfer_thread_pool_interface {
public:
    virtual ~transfer_thread_pool_interface() = default;

    /**
     * @brief Run @p task on a worker
     * @return Future that becomes ready when the task finishes
     */
    virtual auto submit(transfer_stage stage, std::function<void()> task)
        -> std::future<void> = 0;

    [[nodiscard]] virtual auto worker_count() const -> std::size_t = 0;

    [[nodiscard]] virtual auto is_running() const -> bool = 0;

    /**
     * @brief Tasks submitted for @p stage that have not finished
     */
    [[nodiscard]] virtual auto active_tasks(transfer_stage stage) const -> std::size_t = 0;

    /**
     * @brief Tasks ever completed for @p stage
     */
    [[nodiscard]] virtual auto completed_tasks(transfer_stage stage) const -> std::size_t = 0;
};

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Pool backed by thread_system's thread_pool
 */
class thread_system_transfer_adapter : public transfer_thread_pool_interface {
public:
    explicit thread_system_transfer_adapter(
        std::shared_ptr<kcenon::thread::thread_pool> pool,
        std::size_t worker_count);
    ~thread_system_transfer_adapter() override;

    thread_system_transfer_adapter(const thread_system_transfer_adapter&) = delete;
    auto operator=(const thread_system_transfer_adapter&)
        -> thread_system_transfer_adapter& = delete;

    /**
     * @brief Start a pool with @p worker_count workers (0 = hardware concurrency)
     */
    [[nodiscard]] static auto create_default(std::size_t worker_count,
                                             const std::string& pool_name)
        -> std::shared_ptr<thread_system_transfer_adapter>;

    auto submit(transfer_stage stage, std::function<void()> task)
        -> std::future<void> override;

    [[nodiscard]] auto worker_count() const -> std::size_t override;
    [[nodiscard]] auto is_running() const -> bool override;
    [[nodiscard]] auto active_tasks(transfer_stage stage) const -> std::size_t override;
    [[nodiscard]] auto completed_tasks(transfer_stage stage) const -> std::size_t override;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

#endif  // KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Fallback that runs every task on std::async
 */
class async_transfer_pool : public transfer_thread_pool_interface {
public:
    async_transfer_pool();
    ~async_transfer_pool() override;

    async_transfer_pool(const async_transfer_pool&) = delete;
    auto operator=(const async_transfer_pool&) -> async_transfer_pool& = delete;

    auto submit(transfer_stage stage, std::function<void()> task)
        -> std::future<void> override;

    [[nodiscard]] auto worker_count() const -> std::size_t override;
    [[nodiscard]] auto is_running() const -> bool override;
    [[nodiscard]] auto active_tasks(transfer_stage stage) const -> std::size_t override;
    [[nodiscard]] auto completed_tasks(transfer_stage stage) const -> std::size_t override;

private:
    struct impl;
    std::shared_ptr<impl> pimpl_;
};

/**
 * @brief Selects thread_system when linked, std::async otherwise
 */
class transfer_pool_factory {
public:
    [[nodiscard]] static auto create(std::size_t worker_count = 0,
                                     const std::string& pool_name = "blob_transfer_pool")
        -> std::shared_ptr<transfer_thread_pool_interface>;

    [[nodiscard]] static constexpr auto has_thread_system() noexcept -> bool {
#if KCENON_WITH_THREAD_SYSTEM
        return true;
#else
        return false;
#endif
    }
};

}  // namespace kcenon::blob_transfer::adapters
