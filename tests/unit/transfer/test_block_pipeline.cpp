/**
 * @file test_block_pipeline.cpp
 * @brief Unit tests for bounded-parallel block dispatch
 */

#include <gtest/gtest.h>

#include <kcenon/blob_transfer/transfer/block_pipeline.h>

#include <atomic>
#include <chrono>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>

namespace kcenon::blob_transfer::test {

using adapters::transfer_pool_factory;
using adapters::transfer_stage;

class BlockPipelineTest : public ::testing::Test {
protected:
    void SetUp() override { pool_ = transfer_pool_factory::create(4, "pipeline_test"); }

    static auto info(std::size_t index) -> block_task_info {
        return {index, index * 100, 100};
    }

    std::shared_ptr<adapters::transfer_thread_pool_interface> pool_;
};

TEST_F(BlockPipelineTest, RunsAllTasks) {
    block_pipeline pipeline(pool_, transfer_stage::upload_block, 3);
    std::atomic<int> runs{0};
    std::mutex mutex;
    std::set<std::size_t> completed;
    pipeline.set_completion_handler([&](const block_task_info& done) {
        std::lock_guard<std::mutex> lock(mutex);
        completed.insert(done.index);
    });

    for (std::size_t i = 0; i < 10; ++i) {
        ASSERT_TRUE(pipeline.submit(info(i), [&]() -> result<void> {
            ++runs;
            return {};
        }).has_value());
    }
    ASSERT_TRUE(pipeline.drain().has_value());
    EXPECT_EQ(runs.load(), 10);
    EXPECT_EQ(pipeline.completed(), 10u);
    EXPECT_EQ(pipeline.in_flight(), 0u);
    EXPECT_EQ(completed.size(), 10u);
    EXPECT_FALSE(pipeline.failed());
}

TEST_F(BlockPipelineTest, BoundsTasksInFlight) {
    block_pipeline pipeline(pool_, transfer_stage::download_range, 2);
    std::atomic<int> active{0};
    std::atomic<int> peak{0};

    for (std::size_t i = 0; i < 8; ++i) {
        ASSERT_TRUE(pipeline.submit(info(i), [&]() -> result<void> {
            int now = ++active;
            int seen = peak.load();
            while (now > seen && !peak.compare_exchange_weak(seen, now)) {
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            --active;
            return {};
        }).has_value());
        EXPECT_LE(pipeline.in_flight(), 2u);
    }
    ASSERT_TRUE(pipeline.drain().has_value());
    EXPECT_LE(peak.load(), 2);
    EXPECT_EQ(pipeline.parallelism(), 2u);
}

TEST_F(BlockPipelineTest, ZeroParallelismRunsOneAtATime) {
    block_pipeline pipeline(pool_, transfer_stage::upload_block, 0);
    EXPECT_EQ(pipeline.parallelism(), 1u);
}

TEST_F(BlockPipelineTest, FirstFailureIsLatched) {
    block_pipeline pipeline(pool_, transfer_stage::upload_block, 1);

    ASSERT_TRUE(pipeline.submit(info(0), []() -> result<void> {
        service_error_info detail;
        detail.status_code = 500;
        return unexpected{error{error_code::service_error, "HTTP 500", detail}};
    }).has_value());

    auto outcome = pipeline.drain();
    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().code, error_code::block_transfer_failed);
    EXPECT_EQ(outcome.error().status_code(), 500);
    EXPECT_NE(outcome.error().message.find("Block 0"), std::string::npos);
    EXPECT_TRUE(pipeline.failed());

    bool ran = false;
    auto later = pipeline.submit(info(1), [&]() -> result<void> {
        ran = true;
        return {};
    });
    ASSERT_FALSE(later.has_value());
    EXPECT_EQ(later.error().code, error_code::block_transfer_failed);
    EXPECT_FALSE(ran);
}

TEST_F(BlockPipelineTest, ChecksumMismatchKeepsItsCode) {
    block_pipeline pipeline(pool_, transfer_stage::download_range, 1);
    ASSERT_TRUE(pipeline.submit(info(2), []() -> result<void> {
        return unexpected{error{error_code::checksum_mismatch, "bad md5"}};
    }).has_value());

    auto outcome = pipeline.drain();
    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().code, error_code::checksum_mismatch);
}

TEST_F(BlockPipelineTest, ThrowingTaskBecomesError) {
    block_pipeline pipeline(pool_, transfer_stage::upload_block, 1);
    ASSERT_TRUE(pipeline.submit(info(0), []() -> result<void> {
        throw std::runtime_error("boom");
    }).has_value());

    auto outcome = pipeline.drain();
    ASSERT_FALSE(outcome.has_value());
    EXPECT_NE(outcome.error().message.find("boom"), std::string::npos);
}

TEST_F(BlockPipelineTest, CancelledTokenStopsSubmission) {
    cancellation_source source;
    block_pipeline pipeline(pool_, transfer_stage::upload_block, 2, source.token());
    source.cancel();

    bool ran = false;
    auto submitted = pipeline.submit(info(0), [&]() -> result<void> {
        ran = true;
        return {};
    });
    ASSERT_FALSE(submitted.has_value());
    EXPECT_EQ(submitted.error().code, error_code::transfer_cancelled);
    EXPECT_FALSE(ran);
    EXPECT_EQ(pipeline.drain().error().code, error_code::transfer_cancelled);
}

TEST_F(BlockPipelineTest, CancelStopsPendingTasks) {
    block_pipeline pipeline(pool_, transfer_stage::stream_block, 4);
    pipeline.cancel();

    auto submitted = pipeline.submit(info(0), []() -> result<void> { return {}; });
    ASSERT_FALSE(submitted.has_value());
    EXPECT_EQ(submitted.error().code, error_code::transfer_cancelled);
}

TEST_F(BlockPipelineTest, MakeBlockErrorDescribesBlock) {
    service_error_info detail;
    detail.status_code = 503;
    detail.error_code = "ServerBusy";
    error cause{error_code::server_busy, "HTTP 503 ServerBusy: busy", detail};

    auto wrapped = make_block_error(cause, {3, 300, 100});
    EXPECT_EQ(wrapped.code, error_code::block_transfer_failed);
    EXPECT_EQ(wrapped.status_code(), 503);
    EXPECT_EQ(wrapped.message,
              "Block 3 (offset 300, length 100) failed: HTTP 503 ServerBusy: busy");
}

}  // namespace kcenon::blob_transfer::test
