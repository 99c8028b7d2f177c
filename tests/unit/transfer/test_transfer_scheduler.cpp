/**
 * @file test_transfer_scheduler.cpp
 * @brief Unit tests for chunked uploads and downloads
 */

#include <gtest/gtest.h>

#include "blob_test_fixture.h"

#include <atomic>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <thread>

namespace kcenon::blob_transfer::test {

class TransferSchedulerTest : public BlobServiceFixture {
protected:
    auto upload_sequential(const std::string& name, const std::vector<std::byte>& payload,
                           const blob_request_options& options)
        -> result<upload_summary> {
        memory_byte_source source(payload);
        return blob(name).upload_from_stream(
            source, stream_descriptor::sequential(payload.size()), {}, options);
    }

    static auto is_block(const recorded_request& r) -> bool {
        return r.method == http_method::put && r.comp() == "block";
    }
};

// ============================================================================
// Planning
// ============================================================================

TEST_F(TransferSchedulerTest, PlanBlocksSplitsWithShortTail) {
    auto plan = plan_blocks(2500, 1024);
    ASSERT_TRUE(plan.has_value());
    ASSERT_EQ(plan.value().size(), 3u);
    EXPECT_EQ(plan.value()[0].offset, 0u);
    EXPECT_EQ(plan.value()[1].offset, 1024u);
    EXPECT_EQ(plan.value()[2].offset, 2048u);
    EXPECT_EQ(plan.value()[2].length, 452u);
    EXPECT_EQ(plan.value()[2].index, 2u);
}

TEST_F(TransferSchedulerTest, PlanBlocksEmptyLength) {
    auto plan = plan_blocks(0, 1024);
    ASSERT_TRUE(plan.has_value());
    EXPECT_TRUE(plan.value().empty());
}

TEST_F(TransferSchedulerTest, PlanBlocksRejectsZeroBlockSize) {
    auto plan = plan_blocks(10, 0);
    ASSERT_FALSE(plan.has_value());
    EXPECT_EQ(plan.error().code, error_code::invalid_block_size);
}

TEST_F(TransferSchedulerTest, PlanBlocksRejectsTooManyBlocks) {
    EXPECT_TRUE(plan_blocks(max_block_count, 1).has_value());

    auto plan = plan_blocks(max_block_count + 1, 1);
    ASSERT_FALSE(plan.has_value());
    EXPECT_EQ(plan.error().code, error_code::invalid_argument);
}

TEST_F(TransferSchedulerTest, SingleShotOnlyForSeekableSourcesUnderThreshold) {
    blob_request_options options;
    options.single_shot_threshold = 1000;

    EXPECT_TRUE(use_single_shot(stream_descriptor::seekable_of(1000), options));
    EXPECT_FALSE(use_single_shot(stream_descriptor::seekable_of(1001), options));
    EXPECT_FALSE(use_single_shot(stream_descriptor::sequential(10), options));
    EXPECT_FALSE(use_single_shot(stream_descriptor{true, std::nullopt}, options));
}

// ============================================================================
// Round trips
// ============================================================================

TEST_F(TransferSchedulerTest, BlockUploadRoundTripsForVariousBlockCounts) {
    const std::vector<std::size_t> block_counts = {0, 1, 3, 10};
    for (auto m : block_counts) {
        SCOPED_TRACE("blocks=" + std::to_string(m));
        const std::string name = "roundtrip-" + std::to_string(m);
        auto payload = make_payload(m == 0 ? 0 : m * 1024 - 7, static_cast<uint32_t>(m));

        auto summary = upload_sequential(name, payload, small_block_options());
        ASSERT_TRUE(summary.has_value()) << summary.error().message;
        EXPECT_FALSE(summary.value().single_shot);
        EXPECT_EQ(summary.value().manifest.size(), m);
        EXPECT_EQ(summary.value().bytes_uploaded, payload.size());

        std::vector<std::string> expected_ids;
        for (const auto& entry : summary.value().manifest.entries()) {
            expected_ids.push_back(entry.block_id);
        }
        EXPECT_EQ(service_->committed_block_ids(container_, name), expected_ids);

        auto downloaded = blob(name).download_to_bytes({}, small_block_options());
        ASSERT_TRUE(downloaded.has_value()) << downloaded.error().message;
        EXPECT_EQ(downloaded.value(), payload);
    }
}

TEST_F(TransferSchedulerTest, SingleShotAndBlockUploadsStoreSameContent) {
    auto payload = make_payload(1000);
    auto options = small_block_options();

    auto single = blob("single").upload_from_bytes(payload, {}, options);
    ASSERT_TRUE(single.has_value()) << single.error().message;
    EXPECT_TRUE(single.value().single_shot);
    EXPECT_TRUE(single.value().manifest.empty());
    EXPECT_EQ(service_->count_requests(http_method::put), 1u);
    EXPECT_EQ(service_->count_requests(http_method::put, "block"), 0u);

    service_->clear_requests();
    auto larger = make_payload(5000);
    auto blocks = blob("blocks").upload_from_bytes(larger, {}, options);
    ASSERT_TRUE(blocks.has_value()) << blocks.error().message;
    EXPECT_FALSE(blocks.value().single_shot);
    EXPECT_EQ(service_->count_requests(http_method::put, "block"), 5u);
    EXPECT_EQ(service_->count_requests(http_method::put, "blocklist"), 1u);

    EXPECT_EQ(service_->blob_content(container_, "single"), payload);
    EXPECT_EQ(service_->blob_content(container_, "blocks"), larger);
}

TEST_F(TransferSchedulerTest, StreamSourceOfUnknownLength) {
    auto payload = make_payload(4000);
    std::string text(reinterpret_cast<const char*>(payload.data()), payload.size());
    std::istringstream input(text);
    stream_byte_source source(input);

    auto summary = blob("from-stream").upload_from_stream(
        source, stream_descriptor::sequential(), {}, small_block_options());
    ASSERT_TRUE(summary.has_value()) << summary.error().message;
    EXPECT_EQ(summary.value().manifest.size(), 4u);
    EXPECT_EQ(service_->blob_content(container_, "from-stream"), payload);
}

TEST_F(TransferSchedulerTest, OneByteBlocksRoundTrip) {
    auto payload = make_payload(37, 7);
    auto options = small_block_options(1, 4);

    auto summary = blob("one-byte").upload_from_bytes(payload, {}, options);
    ASSERT_TRUE(summary.has_value()) << summary.error().message;
    EXPECT_EQ(summary.value().manifest.size(), payload.size());
    EXPECT_EQ(service_->count_requests(http_method::put, "block"), payload.size());

    auto downloaded = blob("one-byte").download_to_bytes({}, options);
    ASSERT_TRUE(downloaded.has_value()) << downloaded.error().message;
    EXPECT_EQ(downloaded.value(), payload);
}

TEST_F(TransferSchedulerTest, LargeBlocksRoundTrip) {
    constexpr uint64_t block = 8 * mib;
    auto payload = make_payload(2 * block + 5, 9);
    auto options = small_block_options(block, 2);

    auto summary = blob("large-blocks").upload_from_bytes(payload, {}, options);
    ASSERT_TRUE(summary.has_value()) << summary.error().message;
    EXPECT_EQ(summary.value().manifest.size(), 3u);

    auto downloaded = blob("large-blocks").download_to_bytes({}, options);
    ASSERT_TRUE(downloaded.has_value()) << downloaded.error().message;
    EXPECT_EQ(downloaded.value(), payload);
}

TEST_F(TransferSchedulerTest, BlockSizeAcceptedUpToMaximum) {
    blob_request_options options;
    options.block_size = max_block_size;
    EXPECT_TRUE(options.validate().has_value());

    options.block_size = max_block_size + 1;
    auto rejected = options.validate();
    ASSERT_FALSE(rejected.has_value());
    EXPECT_EQ(rejected.error().code, error_code::invalid_block_size);

    auto result = upload_sequential("oversized-block", make_payload(10), options);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::invalid_block_size);
    EXPECT_EQ(service_->total_requests(), 0u);
}

TEST_F(TransferSchedulerTest, StreamSourceWithParallelBlocks) {
    auto payload = make_payload(10 * 1024 + 17, 11);
    std::string text(reinterpret_cast<const char*>(payload.data()), payload.size());
    std::istringstream input(text);
    stream_byte_source source(input);
    service_->set_latency(std::chrono::milliseconds(2));

    auto summary = blob("stream-parallel").upload_from_stream(
        source, stream_descriptor::sequential(), {}, small_block_options(1024, 4));
    ASSERT_TRUE(summary.has_value()) << summary.error().message;
    EXPECT_EQ(summary.value().manifest.size(), 11u);
    EXPECT_EQ(summary.value().bytes_uploaded, payload.size());
    EXPECT_LE(service_->max_concurrent_requests(), 4u);
    EXPECT_EQ(service_->blob_content(container_, "stream-parallel"), payload);
}

TEST_F(TransferSchedulerTest, DownloadIntoFileSink) {
    auto payload = make_payload(10 * 1024 + 3);
    service_->seed_blob(container_, "to-file", payload);

    auto path = std::filesystem::temp_directory_path() / "blob_transfer_test_download.bin";
    {
        auto sink = file_byte_sink::open(path);
        ASSERT_TRUE(sink.has_value()) << sink.error().message;

        auto summary = blob("to-file").download_to_sink(*sink.value(), {},
                                                        small_block_options(1024, 4));
        ASSERT_TRUE(summary.has_value()) << summary.error().message;
        EXPECT_EQ(summary.value().range_count, 11u);
        EXPECT_EQ(summary.value().bytes_downloaded, payload.size());
    }

    std::ifstream file(path, std::ios::binary);
    std::vector<char> raw((std::istreambuf_iterator<char>(file)),
                          std::istreambuf_iterator<char>());
    file.close();
    std::filesystem::remove(path);

    ASSERT_EQ(raw.size(), payload.size());
    EXPECT_EQ(std::memcmp(raw.data(), payload.data(), raw.size()), 0);
}

// ============================================================================
// Checksums
// ============================================================================

TEST_F(TransferSchedulerTest, StoreContentMd5RecordsWholeContentDigest) {
    auto payload = make_payload(3 * 1024 + 100);
    auto options = small_block_options();
    options.store_content_md5 = true;

    auto summary = blob("with-md5").upload_from_bytes(payload, {}, options);
    ASSERT_TRUE(summary.has_value()) << summary.error().message;

    auto expected = checksum::md5_base64(payload);
    ASSERT_TRUE(expected.has_value());
    EXPECT_EQ(summary.value().content_md5, expected.value());
    EXPECT_EQ(service_->blob_content_md5(container_, "with-md5"), expected.value());
}

TEST_F(TransferSchedulerTest, CorruptedBlockUploadFailsWithoutCommit) {
    auto options = no_retry_options(small_block_options());
    options.use_transactional_md5 = true;
    service_->corrupt_uploads(1);

    auto result = blob("corrupt-up").upload_from_bytes(make_payload(4096), {}, options);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::checksum_mismatch);
    EXPECT_EQ(service_->count_requests(http_method::put, "blocklist"), 0u);
    EXPECT_FALSE(service_->blob_exists(container_, "corrupt-up"));
}

TEST_F(TransferSchedulerTest, CorruptedRangeDownloadIsDetected) {
    service_->seed_blob(container_, "corrupt-down", make_payload(4096));
    service_->corrupt_downloads(true);

    auto options = no_retry_options(small_block_options());
    options.use_transactional_md5 = true;

    auto result = blob("corrupt-down").download_to_bytes({}, options);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::checksum_mismatch);
}

TEST_F(TransferSchedulerTest, TamperedContentFailsStoredMd5Validation) {
    auto payload = make_payload(800);
    auto md5 = checksum::md5_base64(payload);
    ASSERT_TRUE(md5.has_value());
    service_->seed_blob(container_, "tampered", payload, md5.value());
    service_->tamper_content(container_, "tampered");

    auto options = no_retry_options(small_block_options());
    auto result = blob("tampered").download_to_bytes({}, options);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::checksum_mismatch);

    options.disable_content_md5_validation = true;
    auto unchecked = blob("tampered").download_to_bytes({}, options);
    ASSERT_TRUE(unchecked.has_value()) << unchecked.error().message;
    EXPECT_NE(unchecked.value(), payload);
}

TEST_F(TransferSchedulerTest, TamperedContentFailsStoredMd5ValidationAcrossRanges) {
    auto payload = make_payload(4096);
    auto md5 = checksum::md5_base64(payload);
    ASSERT_TRUE(md5.has_value());
    service_->seed_blob(container_, "tampered-ranges", payload, md5.value());
    service_->tamper_content(container_, "tampered-ranges");

    auto options = no_retry_options(small_block_options());
    auto result = blob("tampered-ranges").download_to_bytes({}, options);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::checksum_mismatch);

    options.disable_content_md5_validation = true;
    auto unchecked = blob("tampered-ranges").download_to_bytes({}, options);
    ASSERT_TRUE(unchecked.has_value()) << unchecked.error().message;
    EXPECT_EQ(unchecked.value().size(), payload.size());
}

TEST_F(TransferSchedulerTest, StoredMd5ValidatedWhenRangesCompleteOutOfOrder) {
    auto payload = make_payload(8 * 1024 + 100);
    auto md5 = checksum::md5_base64(payload);
    ASSERT_TRUE(md5.has_value());
    service_->seed_blob(container_, "parallel-md5", payload, md5.value());

    // Hold the first range back so later ranges finish before it
    service_->set_observer([](const recorded_request& r) {
        auto range = r.headers.find("x-ms-range");
        if (range != r.headers.end() && range->second.starts_with("bytes=0-")) {
            std::this_thread::sleep_for(std::chrono::milliseconds(30));
        }
    });

    auto downloaded = blob("parallel-md5").download_to_bytes({}, small_block_options(1024, 4));
    ASSERT_TRUE(downloaded.has_value()) << downloaded.error().message;
    EXPECT_EQ(downloaded.value(), payload);
}

// ============================================================================
// Validation before any request
// ============================================================================

TEST_F(TransferSchedulerTest, ZeroBlockSizeRejectedBeforeAnyRequest) {
    auto options = small_block_options();
    options.block_size = 0;

    auto result = upload_sequential("zero-block", make_payload(10), options);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::invalid_block_size);
    EXPECT_EQ(service_->total_requests(), 0u);
}

TEST_F(TransferSchedulerTest, TooManyBlocksRejectedBeforeAnyRequest) {
    auto options = small_block_options(1);
    memory_byte_source source(make_payload(max_block_count + 1));

    auto result = blob("too-many").upload_from_stream(
        source, stream_descriptor::sequential(max_block_count + 1), {}, options);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::invalid_argument);
    EXPECT_EQ(service_->total_requests(), 0u);
}

TEST_F(TransferSchedulerTest, CancelledTokenRejectedBeforeAnyRequest) {
    cancellation_source cancel;
    cancel.cancel();
    auto options = small_block_options();
    options.cancellation = cancel.token();

    auto result = blob("pre-cancelled").upload_from_bytes(make_payload(4096), {}, options);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::transfer_cancelled);
    EXPECT_EQ(service_->total_requests(), 0u);
}

// ============================================================================
// Concurrency and buffers
// ============================================================================

TEST_F(TransferSchedulerTest, ParallelismBoundsConcurrentRequests) {
    service_->set_latency(std::chrono::milliseconds(10));
    auto payload = make_payload(16 * 1024);

    auto summary = blob("parallel").upload_from_bytes(payload, {}, small_block_options(1024, 4));
    ASSERT_TRUE(summary.has_value()) << summary.error().message;
    EXPECT_LE(service_->max_concurrent_requests(), 4u);
    EXPECT_EQ(service_->blob_content(container_, "parallel"), payload);
}

TEST_F(TransferSchedulerTest, SharedPoolIsIdleAfterSuccess) {
    auto pool = std::make_shared<buffer_pool>(1024, 3);
    auto options = small_block_options(1024, 2);
    options.pool = pool;

    auto summary = upload_sequential("pool-ok", make_payload(8 * 1024), options);
    ASSERT_TRUE(summary.has_value()) << summary.error().message;
    EXPECT_EQ(pool->outstanding_count(), 0u);
    EXPECT_GE(pool->total_checkouts(), 8u);
}

TEST_F(TransferSchedulerTest, SharedPoolIsIdleAfterBlockFailure) {
    auto pool = std::make_shared<buffer_pool>(1024, 3);
    auto options = no_retry_options(small_block_options(1024, 2));
    options.pool = pool;
    service_->inject_failure(is_block, 500, "InternalError");

    auto result = blob("pool-fail").upload_from_bytes(make_payload(8 * 1024), {}, options);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(pool->outstanding_count(), 0u);
    EXPECT_EQ(service_->count_requests(http_method::put, "blocklist"), 0u);
}

TEST_F(TransferSchedulerTest, CancellationMidUploadStopsWithoutCommit) {
    auto pool = std::make_shared<buffer_pool>(1024, 2);
    cancellation_source cancel;
    auto options = small_block_options(1024, 1);
    options.pool = pool;
    options.cancellation = cancel.token();

    service_->set_observer([&cancel](const recorded_request& r) {
        if (r.method == http_method::put && r.comp() == "block") {
            cancel.cancel();
        }
    });

    auto result = blob("cancelled").upload_from_bytes(make_payload(8 * 1024), {}, options);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::transfer_cancelled);
    EXPECT_EQ(service_->count_requests(http_method::put, "blocklist"), 0u);
    EXPECT_LT(service_->count_requests(http_method::put, "block"), 8u);
    EXPECT_FALSE(service_->blob_exists(container_, "cancelled"));
    EXPECT_EQ(pool->outstanding_count(), 0u);
}

TEST_F(TransferSchedulerTest, ProgressReachesTotal) {
    std::atomic<uint64_t> last{0};
    std::atomic<int> calls{0};
    auto options = small_block_options(1024, 3);
    options.on_progress = [&](uint64_t transferred, std::optional<uint64_t>) {
        last = transferred;
        ++calls;
    };

    auto payload = make_payload(6 * 1024 + 1);
    auto summary = blob("progress").upload_from_bytes(payload, {}, options);
    ASSERT_TRUE(summary.has_value()) << summary.error().message;
    EXPECT_EQ(last.load(), payload.size());
    EXPECT_EQ(calls.load(), 7);
}

// ============================================================================
// Failures
// ============================================================================

TEST_F(TransferSchedulerTest, BlockFailureReportsBlockAndStatus) {
    service_->inject_failure(is_block, 500, "InternalError");
    auto options = no_retry_options(small_block_options());

    auto result = blob("block-fail").upload_from_bytes(make_payload(4096), {}, options);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::block_transfer_failed);
    EXPECT_EQ(result.error().status_code(), 500);
    EXPECT_NE(result.error().message.find("Block "), std::string::npos);
    EXPECT_FALSE(service_->blob_exists(container_, "block-fail"));
}

TEST_F(TransferSchedulerTest, SequentialSourceShorterThanDeclaredLengthFails) {
    auto payload = make_payload(3000);
    std::string text(reinterpret_cast<const char*>(payload.data()), payload.size());
    std::istringstream input(text);
    stream_byte_source source(input);

    auto result = blob("short-stream").upload_from_stream(
        source, stream_descriptor::sequential(4000), {}, small_block_options());
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::file_read_error);
    EXPECT_EQ(service_->count_requests(http_method::put, "blocklist"), 0u);
    EXPECT_FALSE(service_->blob_exists(container_, "short-stream"));
}

TEST_F(TransferSchedulerTest, SequentialSourceStopsAtDeclaredLength) {
    auto payload = make_payload(5000);
    memory_byte_source source(payload);

    auto summary = blob("capped-stream").upload_from_stream(
        source, stream_descriptor::sequential(2500), {}, small_block_options());
    ASSERT_TRUE(summary.has_value()) << summary.error().message;
    EXPECT_EQ(summary.value().bytes_uploaded, 2500u);
    EXPECT_EQ(summary.value().manifest.size(), 3u);
    EXPECT_EQ(service_->blob_content(container_, "capped-stream"),
              std::vector<std::byte>(payload.begin(), payload.begin() + 2500));
}

TEST_F(TransferSchedulerTest, TransientFailureIsRetried) {
    service_->inject_failure(is_block, 503, "ServerBusy");
    auto payload = make_payload(4096);

    auto summary = blob("retried").upload_from_bytes(payload, {}, small_block_options());
    ASSERT_TRUE(summary.has_value()) << summary.error().message;
    EXPECT_GE(client_->statistics().retries, 1u);
    EXPECT_EQ(service_->blob_content(container_, "retried"), payload);
}

TEST_F(TransferSchedulerTest, TransportFailureIsRetried) {
    service_->fail_transport(1);
    auto payload = make_payload(512);

    auto summary = blob("transport-retry").upload_from_bytes(payload, {}, small_block_options());
    ASSERT_TRUE(summary.has_value()) << summary.error().message;
    EXPECT_EQ(service_->blob_content(container_, "transport-retry"), payload);
}

TEST_F(TransferSchedulerTest, IfNotExistsUploadOnExistingBlobConflicts) {
    service_->seed_blob(container_, "taken", make_payload(10));
    auto options = no_retry_options(small_block_options());

    auto single = blob("taken").upload_from_bytes(make_payload(100), access_condition::if_not_exists(),
                                                  options);
    ASSERT_FALSE(single.has_value());
    EXPECT_EQ(single.error().code, error_code::conflict);

    auto blocks = blob("taken").upload_from_bytes(make_payload(4096),
                                                  access_condition::if_not_exists(), options);
    ASSERT_FALSE(blocks.has_value());
    EXPECT_EQ(blocks.error().code, error_code::conflict);
    EXPECT_EQ(service_->blob_content(container_, "taken"), make_payload(10));
}

TEST_F(TransferSchedulerTest, DownloadIsPinnedToObservedEtag) {
    service_->seed_blob(container_, "changing", make_payload(4096, 1));

    std::atomic<bool> replaced{false};
    service_->set_observer([this, &replaced](const recorded_request& r) {
        if (r.method == http_method::get && r.headers.count("x-ms-range") &&
            !replaced.exchange(true)) {
            service_->seed_blob(container_, "changing", make_payload(4096, 2));
        }
    });

    auto result = blob("changing").download_to_bytes({}, no_retry_options(small_block_options()));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().status_code(), 412);
}

TEST_F(TransferSchedulerTest, DownloadOfMissingBlobIsNotFound) {
    auto result = blob("missing").download_to_bytes({}, no_retry_options(small_block_options()));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::blob_not_found);
}

}  // namespace kcenon::blob_transfer::test
