/**
 * @file block_pipeline.h
 * @brief Bounded-parallel block dispatch shared by uploads, downloads and streams
 *
 * A block_pipeline runs block tasks on a worker pool with at most
 * `parallelism` tasks in flight. submit() blocks while the limit is
 * reached. The first failure is latched: later submits return it and
 * tasks that have not started yet are skipped. A cancelled token or
 * cancel() makes pending tasks stop before their network call.
 */

#ifndef KCENON_BLOB_TRANSFER_TRANSFER_BLOCK_PIPELINE_H
#define KCENON_BLOB_TRANSFER_TRANSFER_BLOCK_PIPELINE_H

#include "kcenon/blob_transfer/adapters/thread_pool_adapter.h"
#include "kcenon/blob_transfer/core/cancellation.h"
#include "kcenon/blob_transfer/core/types.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <vector>

namespace kcenon::blob_transfer {

/**
 * @brief Identity of one block transfer task
 */
struct block_task_info {
    std::size_t index = 0;
    uint64_t offset = 0;
    uint64_t length = 0;
};

/**
 * @brief Lifecycle of a block task
 */
enum class block_task_state {
    pending,
    in_flight,
    done,
    failed,
};

/**
 * @brief Attach block identity to a failure
 *
 * checksum_mismatch and transfer_cancelled keep their code; every other
 * failure becomes block_transfer_failed. Service details are preserved.
 */
[[nodiscard]] auto make_block_error(const error& cause, const block_task_info& info) -> error;

class block_pipeline {
public:
    using block_task = std::function<result<void>()>;
    using completion_handler = std::function<void(const block_task_info&)>;

    block_pipeline(std::shared_ptr<adapters::transfer_thread_pool_interface> pool,
                   adapters::transfer_stage stage,
                   std::size_t parallelism,
                   cancellation_token token = {});

    /**
     * @brief Waits for every in-flight task
     */
    ~block_pipeline();

    block_pipeline(const block_pipeline&) = delete;
    auto operator=(const block_pipeline&) -> block_pipeline& = delete;

    /**
     * @brief Called on a worker after each successful task
     */
    void set_completion_handler(completion_handler handler);

    /**
     * @brief Queue a task, blocking while `parallelism` tasks are in flight
     *
     * Returns the latched failure, or transfer_cancelled, instead of
     * queueing once the pipeline has failed or been cancelled. Captured
     * resources are released as soon as the task finishes.
     */
    [[nodiscard]] auto submit(const block_task_info& info, block_task task) -> result<void>;

    /**
     * @brief Wait until no task is in flight and report the first failure
     */
    [[nodiscard]] auto drain() -> result<void>;

    /**
     * @brief Stop pending tasks before they issue requests
     */
    void cancel();

    [[nodiscard]] auto in_flight() const -> std::size_t;
    [[nodiscard]] auto completed() const -> std::size_t;
    [[nodiscard]] auto failed() const -> bool;
    [[nodiscard]] auto parallelism() const noexcept -> std::size_t { return parallelism_; }

private:
    struct state;

    [[nodiscard]] auto is_cancelled() const -> bool;
    void reap_finished();

    std::shared_ptr<adapters::transfer_thread_pool_interface> pool_;
    adapters::transfer_stage stage_;
    std::size_t parallelism_;
    cancellation_token token_;
    std::shared_ptr<state> state_;
    std::vector<std::future<void>> futures_;
};

}  // namespace kcenon::blob_transfer

#endif  // KCENON_BLOB_TRANSFER_TRANSFER_BLOCK_PIPELINE_H
