/**
 * @file transfer_scheduler.cpp
 * @brief Chunked upload and download implementation
 */

#include "kcenon/blob_transfer/transfer/transfer_scheduler.h"
#include "kcenon/blob_transfer/core/buffer_pool.h"
#include "kcenon/blob_transfer/core/checksum.h"
#include "kcenon/blob_transfer/core/logging.h"
#include "kcenon/blob_transfer/transfer/block_manifest.h"

#include <algorithm>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>

namespace kcenon::blob_transfer {

namespace {

/**
 * @brief Fill @p buffer from @p source, stopping early only at end of data
 */
auto fill_buffer(byte_source& source, bool positional, uint64_t offset,
                 std::span<std::byte> buffer) -> result<std::size_t> {
    std::size_t filled = 0;
    while (filled < buffer.size()) {
        auto chunk = buffer.subspan(filled);
        auto read = positional ? source.read_at(offset + filled, chunk) : source.read(chunk);
        if (!read.has_value()) {
            return unexpected{read.error()};
        }
        if (read.value() == 0) {
            break;
        }
        filled += read.value();
    }
    return filled;
}

auto cancelled_error() -> error {
    return error{error_code::transfer_cancelled, "Transfer cancelled"};
}

/**
 * @brief MD5 over ranges that complete in any order
 *
 * Ranges ahead of the next expected offset are held until the gap before
 * them has been hashed.
 */
class ordered_md5 {
public:
    auto add(uint64_t offset, std::vector<std::byte> data) -> result<void> {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_.emplace(offset, std::move(data));
        while (!pending_.empty() && pending_.begin()->first == next_offset_) {
            auto head = pending_.begin();
            if (auto updated = md5_.update(head->second); !updated.has_value()) {
                return updated;
            }
            next_offset_ += head->second.size();
            pending_.erase(head);
        }
        return {};
    }

    auto finish(uint64_t expected_length) -> result<std::string> {
        std::lock_guard<std::mutex> lock(mutex_);
        if (next_offset_ != expected_length) {
            return unexpected{error{error_code::internal_error,
                "Hashed " + std::to_string(next_offset_) + " of " +
                std::to_string(expected_length) + " bytes"}};
        }
        auto values = md5_.finish();
        if (!values.has_value()) {
            return unexpected{values.error()};
        }
        return *values.value().md5_base64;
    }

private:
    std::mutex mutex_;
    checksum_calculator md5_{true, false};
    std::map<uint64_t, std::vector<std::byte>> pending_;
    uint64_t next_offset_ = 0;
};

}  // namespace

auto use_single_shot(const stream_descriptor& descriptor,
                     const blob_request_options& options) -> bool {
    return descriptor.seekable && descriptor.length.has_value() &&
           *descriptor.length <= options.single_shot_threshold;
}

auto plan_blocks(uint64_t length, uint64_t block_size) -> result<std::vector<block_task_info>> {
    if (block_size == 0) {
        return unexpected{error{error_code::invalid_block_size, "Block size must be positive"}};
    }
    const uint64_t count = (length + block_size - 1) / block_size;
    if (count > max_block_count) {
        return unexpected{error{error_code::invalid_argument,
            std::to_string(length) + " bytes need " + std::to_string(count) +
            " blocks of " + std::to_string(block_size) + "; at most " +
            std::to_string(max_block_count) + " are allowed"}};
    }

    std::vector<block_task_info> blocks;
    blocks.reserve(static_cast<std::size_t>(count));
    for (uint64_t i = 0; i < count; ++i) {
        const uint64_t offset = i * block_size;
        blocks.push_back({static_cast<std::size_t>(i), offset,
                          std::min(block_size, length - offset)});
    }
    return blocks;
}

transfer_scheduler::transfer_scheduler(const block_blob_client& client,
                                       blob_request_options options)
    : client_(client), options_(std::move(options)) {}

void transfer_scheduler::report_progress(uint64_t transferred,
                                         std::optional<uint64_t> total) const {
    if (options_.on_progress) {
        options_.on_progress(transferred, total);
    }
}

// ============================================================================
// Upload
// ============================================================================

auto transfer_scheduler::upload(byte_source& source,
                                const stream_descriptor& descriptor,
                                const access_condition& condition) -> result<upload_summary> {
    if (auto valid = options_.validate(); !valid.has_value()) {
        return unexpected{valid.error()};
    }
    if (descriptor.length) {
        if (auto plan = plan_blocks(*descriptor.length, options_.block_size); !plan.has_value()) {
            if (!use_single_shot(descriptor, options_)) {
                return unexpected{plan.error()};
            }
        }
    }
    if (options_.cancellation.is_cancelled()) {
        return unexpected{cancelled_error()};
    }

    transfer_log_context ctx;
    ctx.blob_name = client_.blob_name();
    ctx.total_bytes = descriptor.length;
    BT_LOG_DEBUG_CTX(log_category::transfer, "Starting upload", ctx);

    const auto started = std::chrono::steady_clock::now();
    auto outcome = use_single_shot(descriptor, options_)
                       ? upload_single_shot(source, *descriptor.length, condition)
                       : upload_blocks(source, descriptor, condition);

    ctx.duration_ms = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started).count());
    if (outcome.has_value()) {
        ctx.bytes_transferred = outcome.value().bytes_uploaded;
        BT_LOG_INFO_CTX(log_category::transfer, "Upload completed", ctx);
    } else {
        ctx.error_message = outcome.error().message;
        BT_LOG_WARN_CTX(log_category::transfer, "Upload failed", ctx);
    }
    return outcome;
}

auto transfer_scheduler::upload_single_shot(byte_source& source,
                                            uint64_t length,
                                            const access_condition& condition)
    -> result<upload_summary> {
    std::vector<std::byte> data(static_cast<std::size_t>(length));
    auto filled = fill_buffer(source, true, 0, data);
    if (!filled.has_value()) {
        return unexpected{filled.error()};
    }
    if (filled.value() != length) {
        return unexpected{error{error_code::file_read_error,
            "Source ended after " + std::to_string(filled.value()) + " of " +
            std::to_string(length) + " declared bytes"}};
    }

    upload_summary summary;
    summary.single_shot = true;
    if (options_.store_content_md5) {
        auto md5 = checksum::md5_base64(data);
        if (!md5.has_value()) {
            return unexpected{md5.error()};
        }
        summary.content_md5 = std::move(md5.value());
    }

    auto etag = client_.put_blob(data, condition, options_);
    if (!etag.has_value()) {
        return unexpected{etag.error()};
    }
    summary.etag = std::move(etag.value());
    summary.bytes_uploaded = length;
    report_progress(length, length);
    return summary;
}

auto transfer_scheduler::upload_blocks(byte_source& source,
                                       const stream_descriptor& descriptor,
                                       const access_condition& condition)
    -> result<upload_summary> {
    const auto block_size = static_cast<std::size_t>(options_.block_size);
    const std::size_t parallelism = std::max<std::size_t>(options_.parallelism, 1);

    auto buffers = options_.pool ? options_.pool
                                 : std::make_shared<buffer_pool>(block_size, parallelism + 1);

    // Seekable sources of known length are read by the workers themselves
    const bool worker_reads =
        descriptor.seekable && descriptor.length.has_value() && !options_.store_content_md5;

    std::optional<checksum_calculator> md5;
    if (options_.store_content_md5) {
        md5.emplace(true, false);
    }

    block_pipeline pipeline(client_.context()->thread_pool(),
                            adapters::transfer_stage::upload_block,
                            parallelism, options_.cancellation);

    std::mutex progress_mutex;
    uint64_t uploaded = 0;
    pipeline.set_completion_handler([&](const block_task_info& info) {
        std::lock_guard<std::mutex> lock(progress_mutex);
        uploaded += info.length;
        report_progress(uploaded, descriptor.length);
    });

    block_id_generator ids;
    block_manifest manifest;
    uint64_t offset = 0;
    std::optional<error> failure;

    for (std::size_t index = 0;; ++index) {
        if (descriptor.length && offset >= *descriptor.length && index > 0) {
            break;
        }
        auto buffer = std::make_shared<pooled_buffer>(buffers->checkout());
        block_task_info info{index, offset, 0};
        block_pipeline::block_task task;
        const auto block_id = ids.next();

        if (worker_reads) {
            info.length = std::min<uint64_t>(block_size, *descriptor.length - offset);
            if (info.length == 0) {
                break;
            }
            task = [client = client_, opts = options_, &source, buffer, info, block_id]()
                -> result<void> {
                buffer->data().resize(static_cast<std::size_t>(info.length));
                auto filled = fill_buffer(source, true, info.offset, buffer->data());
                if (!filled.has_value()) {
                    return unexpected{filled.error()};
                }
                if (filled.value() != info.length) {
                    return unexpected{error{error_code::file_read_error,
                        "Source ended inside block " + std::to_string(info.index)}};
                }
                return client.put_block(block_id, buffer->bytes(), opts);
            };
        } else {
            const auto want = descriptor.length
                                  ? static_cast<std::size_t>(
                                        std::min<uint64_t>(block_size, *descriptor.length - offset))
                                  : block_size;
            buffer->data().resize(want);
            auto filled = fill_buffer(source, descriptor.seekable, offset, buffer->data());
            if (!filled.has_value()) {
                failure = filled.error();
                break;
            }
            if (filled.value() == 0 && index > 0) {
                break;
            }
            buffer->data().resize(filled.value());
            if (md5) {
                if (auto updated = md5->update(buffer->bytes()); !updated.has_value()) {
                    failure = updated.error();
                    break;
                }
            }
            if (filled.value() == 0) {
                // Empty source: commit an empty block list
                break;
            }
            if (index >= max_block_count) {
                failure = error{error_code::invalid_argument,
                    "Source exceeds " + std::to_string(max_block_count) + " blocks of " +
                    std::to_string(block_size) + " bytes"};
                break;
            }
            info.length = filled.value();
            task = [client = client_, opts = options_, buffer, block_id]() -> result<void> {
                return client.put_block(block_id, buffer->bytes(), opts);
            };
        }

        if (auto added = manifest.add(block_id); !added.has_value()) {
            failure = added.error();
            break;
        }
        buffer.reset();
        if (auto submitted = pipeline.submit(info, std::move(task)); !submitted.has_value()) {
            failure = submitted.error();
            break;
        }
        offset += info.length;
    }

    if (failure) {
        pipeline.cancel();
    }
    auto drained = pipeline.drain();
    if (failure) {
        return unexpected{*failure};
    }
    if (!drained.has_value()) {
        return unexpected{drained.error()};
    }
    if (options_.cancellation.is_cancelled()) {
        return unexpected{cancelled_error()};
    }
    if (descriptor.length && offset != *descriptor.length) {
        return unexpected{error{error_code::file_read_error,
            "Source ended after " + std::to_string(offset) + " of " +
            std::to_string(*descriptor.length) + " declared bytes"}};
    }

    upload_summary summary;
    if (md5) {
        auto values = md5->finish();
        if (!values.has_value()) {
            return unexpected{values.error()};
        }
        summary.content_md5 = values.value().md5_base64;
    }

    auto etag = client_.put_block_list(manifest, condition, summary.content_md5, options_);
    if (!etag.has_value()) {
        return unexpected{etag.error()};
    }

    summary.manifest = std::move(manifest);
    summary.etag = std::move(etag.value());
    summary.bytes_uploaded = offset;
    if (summary.manifest.empty()) {
        report_progress(0, descriptor.length);
    }
    return summary;
}

// ============================================================================
// Download
// ============================================================================

auto transfer_scheduler::download(byte_sink& sink, const access_condition& condition)
    -> result<download_summary> {
    if (auto valid = options_.validate(); !valid.has_value()) {
        return unexpected{valid.error()};
    }
    if (options_.cancellation.is_cancelled()) {
        return unexpected{cancelled_error()};
    }

    auto props = client_.get_properties(condition, options_);
    if (!props.has_value()) {
        return unexpected{props.error()};
    }

    download_summary summary;
    summary.properties = std::move(props.value());
    const uint64_t length = summary.properties.content_length;

    if (auto resized = sink.resize(length); !resized.has_value()) {
        return unexpected{resized.error()};
    }

    const auto pinned = summary.properties.etag.empty()
                            ? access_condition::none()
                            : access_condition::if_match_etag(summary.properties.etag);

    transfer_log_context ctx;
    ctx.blob_name = client_.blob_name();
    ctx.total_bytes = length;

    if (length <= options_.block_size) {
        auto data = client_.download_range(0, length, pinned, options_);
        if (!data.has_value()) {
            return unexpected{data.error()};
        }
        if (data.value().size() != length) {
            return unexpected{error{error_code::malformed_response,
                "Expected " + std::to_string(length) + " bytes, received " +
                std::to_string(data.value().size())}};
        }
        if (!options_.disable_content_md5_validation && summary.properties.content_md5 &&
            !checksum::verify_md5(data.value(), *summary.properties.content_md5)) {
            ctx.error_message = "stored Content-MD5 does not match";
            BT_LOG_WARN_CTX(log_category::checksum, "Download failed validation", ctx);
            return unexpected{error{error_code::checksum_mismatch,
                "Content of " + client_.blob_name() + " does not match its stored MD5"}};
        }
        if (auto written = sink.write_at(0, data.value()); !written.has_value()) {
            return unexpected{written.error()};
        }
        summary.range_count = length > 0 ? 1 : 0;
        summary.bytes_downloaded = length;
        report_progress(length, length);
    } else {
        auto ranges = plan_blocks(length, options_.block_size);
        if (!ranges.has_value()) {
            // Reads are not bound by the block count limit
            ranges = std::vector<block_task_info>{};
            for (uint64_t offset = 0, i = 0; offset < length; offset += options_.block_size, ++i) {
                ranges.value().push_back({static_cast<std::size_t>(i), offset,
                                          std::min<uint64_t>(options_.block_size,
                                                             length - offset)});
            }
        }

        block_pipeline pipeline(client_.context()->thread_pool(),
                                adapters::transfer_stage::download_range,
                                options_.parallelism, options_.cancellation);

        std::mutex progress_mutex;
        uint64_t downloaded = 0;
        pipeline.set_completion_handler([&](const block_task_info& info) {
            std::lock_guard<std::mutex> lock(progress_mutex);
            downloaded += info.length;
            report_progress(downloaded, length);
        });

        std::shared_ptr<ordered_md5> whole_md5;
        if (!options_.disable_content_md5_validation && summary.properties.content_md5) {
            whole_md5 = std::make_shared<ordered_md5>();
        }

        std::optional<error> failure;
        for (const auto& range : ranges.value()) {
            auto task = [client = client_, opts = options_, &sink, pinned, range, whole_md5]()
                -> result<void> {
                auto data = client.download_range(range.offset, range.length, pinned, opts);
                if (!data.has_value()) {
                    return unexpected{data.error()};
                }
                if (data.value().size() != range.length) {
                    return unexpected{error{error_code::malformed_response,
                        "Short range: " + std::to_string(data.value().size()) + " bytes"}};
                }
                if (auto written = sink.write_at(range.offset, data.value());
                    !written.has_value()) {
                    return written;
                }
                if (whole_md5) {
                    return whole_md5->add(range.offset, std::move(data.value()));
                }
                return {};
            };
            if (auto submitted = pipeline.submit(range, std::move(task)); !submitted.has_value()) {
                failure = submitted.error();
                break;
            }
        }

        auto drained = pipeline.drain();
        if (failure) {
            return unexpected{*failure};
        }
        if (!drained.has_value()) {
            return unexpected{drained.error()};
        }
        if (whole_md5) {
            auto computed = whole_md5->finish(length);
            if (!computed.has_value()) {
                return unexpected{computed.error()};
            }
            if (computed.value() != *summary.properties.content_md5) {
                ctx.error_message = "stored Content-MD5 does not match";
                BT_LOG_WARN_CTX(log_category::checksum, "Download failed validation", ctx);
                return unexpected{error{error_code::checksum_mismatch,
                    "Content of " + client_.blob_name() + " does not match its stored MD5"}};
            }
        }
        summary.range_count = ranges.value().size();
        summary.bytes_downloaded = length;
    }

    if (auto flushed = sink.flush(); !flushed.has_value()) {
        return unexpected{flushed.error()};
    }

    ctx.bytes_transferred = summary.bytes_downloaded;
    ctx.block_count = summary.range_count;
    BT_LOG_INFO_CTX(log_category::transfer, "Download completed", ctx);
    return summary;
}

}  // namespace kcenon::blob_transfer
