/**
 * @file blob_write_stream.cpp
 * @brief Buffered block blob writer
 */

#include "kcenon/blob_transfer/stream/blob_write_stream.h"
#include "kcenon/blob_transfer/core/blob_utils.h"
#include "kcenon/blob_transfer/core/logging.h"

#include <algorithm>

namespace kcenon::blob_transfer {

auto blob_write_stream::create(const block_blob_client& client,
                               access_condition condition,
                               blob_request_options options)
    -> std::unique_ptr<blob_write_stream> {
    return std::unique_ptr<blob_write_stream>(
        new blob_write_stream(client, std::move(condition), std::move(options)));
}

blob_write_stream::blob_write_stream(const block_blob_client& client,
                                     access_condition condition,
                                     blob_request_options options)
    : client_(client),
      condition_(std::move(condition)),
      options_(std::move(options)),
      buffer_size_(static_cast<std::size_t>(options_.stream_write_size)),
      pool_(options_.pool ? options_.pool
                          : std::make_shared<buffer_pool>(
                                buffer_size_, std::max<std::size_t>(options_.parallelism, 1) + 1)),
      pipeline_(client_.context()->thread_pool(),
                adapters::transfer_stage::stream_block,
                options_.parallelism,
                options_.cancellation) {
    if (options_.store_content_md5) {
        md5_.emplace(true, false);
    }
    BT_LOG_DEBUG(log_category::stream, "Opened write stream for " + client_.blob_name());
}

blob_write_stream::~blob_write_stream() {
    if (state_ == write_stream_state::open) {
        auto closed = close();
        if (!closed.has_value()) {
            BT_LOG_ERROR(log_category::stream,
                         "Write stream for " + client_.blob_name() +
                         " failed to commit on destruction: " + closed.error().message);
        }
    }
}

auto blob_write_stream::fail(error err) -> error {
    state_ = write_stream_state::closed;
    current_.reset();
    BT_LOG_WARN(log_category::stream,
                "Write stream for " + client_.blob_name() + " closed: " + err.message);
    return err;
}

auto blob_write_stream::write(std::string_view text) -> result<void> {
    auto bytes = blob_utils::to_bytes(text);
    return write(std::span<const std::byte>(bytes));
}

auto blob_write_stream::write(std::span<const std::byte> data) -> result<void> {
    if (state_ != write_stream_state::open) {
        return unexpected{error{error_code::stream_closed,
            std::string("Write stream is ") + to_string(state_)}};
    }

    while (!data.empty()) {
        if (!current_.valid()) {
            current_ = pool_->checkout();
        }
        auto& buffer = current_.data();
        const auto take = std::min(buffer_size_ - buffer.size(), data.size());
        buffer.insert(buffer.end(), data.begin(), data.begin() + static_cast<std::ptrdiff_t>(take));
        data = data.subspan(take);
        position_ += take;

        if (buffer.size() == buffer_size_) {
            if (auto sent = dispatch_current(); !sent.has_value()) {
                return sent;
            }
        }
    }
    return {};
}

auto blob_write_stream::dispatch_current() -> result<void> {
    auto buffer = std::make_shared<pooled_buffer>(std::move(current_));
    if (md5_) {
        if (auto updated = md5_->update(buffer->bytes()); !updated.has_value()) {
            return unexpected{updated.error()};
        }
    }

    const auto block_id = ids_.next();
    if (auto added = manifest_.add(block_id); !added.has_value()) {
        return added;
    }

    const block_task_info info{next_index_++, position_ - buffer->size(), buffer->size()};
    auto task = [client = client_, opts = options_, buffer, block_id]() -> result<void> {
        return client.put_block(block_id, buffer->bytes(), opts);
    };
    return pipeline_.submit(info, std::move(task));
}

auto blob_write_stream::flush() -> result<void> {
    if (state_ != write_stream_state::open) {
        return unexpected{error{error_code::stream_closed,
            std::string("Write stream is ") + to_string(state_)}};
    }
    if (current_.valid() && current_.size() > 0) {
        if (auto sent = dispatch_current(); !sent.has_value()) {
            if (auto drained = pipeline_.drain(); !drained.has_value()) {
                BT_LOG_DEBUG(log_category::stream, "Flush drained: " + drained.error().message);
            }
            return sent;
        }
    }
    return pipeline_.drain();
}

auto blob_write_stream::commit() -> result<std::string> {
    if (state_ == write_stream_state::committed) {
        return etag_;
    }

    if (auto flushed = flush(); !flushed.has_value()) {
        if (flushed.error().code == error_code::stream_closed) {
            return unexpected{flushed.error()};
        }
        return unexpected{fail(flushed.error())};
    }

    std::optional<std::string> content_md5;
    if (md5_) {
        auto values = md5_->finish();
        if (!values.has_value()) {
            return unexpected{fail(values.error())};
        }
        content_md5 = values.value().md5_base64;
    }

    auto etag = client_.put_block_list(manifest_, condition_, content_md5, options_);
    if (!etag.has_value()) {
        return unexpected{fail(etag.error())};
    }

    current_.reset();
    etag_ = std::move(etag.value());
    state_ = write_stream_state::committed;

    transfer_log_context ctx;
    ctx.blob_name = client_.blob_name();
    ctx.bytes_transferred = position_;
    ctx.block_count = manifest_.size();
    BT_LOG_INFO_CTX(log_category::stream, "Write stream committed", ctx);
    return etag_;
}

auto blob_write_stream::close() -> result<void> {
    if (state_ != write_stream_state::open) {
        return {};
    }
    auto committed = commit();
    if (!committed.has_value()) {
        return unexpected{committed.error()};
    }
    return {};
}

void blob_write_stream::abort() {
    if (state_ != write_stream_state::open) {
        return;
    }
    pipeline_.cancel();
    auto drained = pipeline_.drain();
    if (!drained.has_value()) {
        BT_LOG_DEBUG(log_category::stream, "Abort drained: " + drained.error().message);
    }
    current_.reset();
    state_ = write_stream_state::aborted;
    BT_LOG_INFO(log_category::stream, "Write stream for " + client_.blob_name() + " aborted");
}

auto blob_write_stream::seek(int64_t /*offset*/) -> result<uint64_t> {
    return unexpected{error{error_code::unsupported_operation,
        "Write streams only support forward writes"}};
}

}  // namespace kcenon::blob_transfer
