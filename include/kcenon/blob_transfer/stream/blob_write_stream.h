/**
 * @file blob_write_stream.h
 * @brief Buffered, append-only writer that commits a block blob on close
 */

#ifndef KCENON_BLOB_TRANSFER_STREAM_BLOB_WRITE_STREAM_H
#define KCENON_BLOB_TRANSFER_STREAM_BLOB_WRITE_STREAM_H

#include "kcenon/blob_transfer/blob/access_condition.h"
#include "kcenon/blob_transfer/blob/block_blob_client.h"
#include "kcenon/blob_transfer/blob/client_config.h"
#include "kcenon/blob_transfer/core/buffer_pool.h"
#include "kcenon/blob_transfer/core/checksum.h"
#include "kcenon/blob_transfer/core/types.h"
#include "kcenon/blob_transfer/transfer/block_manifest.h"
#include "kcenon/blob_transfer/transfer/block_pipeline.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace kcenon::blob_transfer {

/**
 * @brief Lifecycle of a write stream
 */
enum class write_stream_state {
    open,
    committed,
    aborted,
    closed,
};

[[nodiscard]] constexpr auto to_string(write_stream_state state) -> const char* {
    switch (state) {
        case write_stream_state::open:
            return "open";
        case write_stream_state::committed:
            return "committed";
        case write_stream_state::aborted:
            return "aborted";
        case write_stream_state::closed:
            return "closed";
    }
    return "unknown";
}

/**
 * @brief Write stream over a block blob
 *
 * Bytes are gathered into buffers of stream_write_size. Every full buffer,
 * and every non-empty buffer at flush(), is uploaded as one block with up
 * to `parallelism` uploads in flight. commit() (or close()) writes the
 * block list under the access condition given at open time; nothing is
 * visible to readers before that. A failed block upload is reported by
 * the next write, flush or commit.
 *
 * Only forward writes are supported: seek() fails with
 * unsupported_operation.
 *
 * @note Not thread-safe. Use one stream from one thread at a time.
 */
class blob_write_stream {
public:
    [[nodiscard]] static auto create(const block_blob_client& client,
                                     access_condition condition,
                                     blob_request_options options)
        -> std::unique_ptr<blob_write_stream>;

    /**
     * @brief Commits an open stream; failures are logged
     */
    ~blob_write_stream();

    blob_write_stream(const blob_write_stream&) = delete;
    auto operator=(const blob_write_stream&) -> blob_write_stream& = delete;

    [[nodiscard]] auto write(std::span<const std::byte> data) -> result<void>;
    [[nodiscard]] auto write(std::string_view text) -> result<void>;

    /**
     * @brief Upload the buffered partial block and wait for all uploads
     *
     * Sends nothing when the buffer is empty.
     */
    [[nodiscard]] auto flush() -> result<void>;

    /**
     * @brief Flush and commit the block list
     * @return ETag of the committed blob; repeated calls return it again
     */
    [[nodiscard]] auto commit() -> result<std::string>;

    /**
     * @brief commit() for an open stream, a no-op otherwise
     */
    [[nodiscard]] auto close() -> result<void>;

    /**
     * @brief Stop without committing; staged blocks stay uncommitted
     */
    void abort();

    [[nodiscard]] auto seek(int64_t offset) -> result<uint64_t>;

    [[nodiscard]] auto can_seek() const noexcept -> bool { return false; }
    [[nodiscard]] auto can_write() const noexcept -> bool {
        return state_ == write_stream_state::open;
    }

    /// Bytes accepted so far
    [[nodiscard]] auto position() const noexcept -> uint64_t { return position_; }
    [[nodiscard]] auto state() const noexcept -> write_stream_state { return state_; }
    [[nodiscard]] auto manifest() const -> const block_manifest& { return manifest_; }
    [[nodiscard]] auto buffered_bytes() const noexcept -> std::size_t {
        return current_.valid() ? current_.size() : 0;
    }

private:
    blob_write_stream(const block_blob_client& client,
                      access_condition condition,
                      blob_request_options options);

    [[nodiscard]] auto dispatch_current() -> result<void>;
    [[nodiscard]] auto fail(error err) -> error;

    block_blob_client client_;
    access_condition condition_;
    blob_request_options options_;
    std::size_t buffer_size_;
    std::shared_ptr<buffer_pool> pool_;
    block_pipeline pipeline_;
    pooled_buffer current_;
    block_id_generator ids_;
    block_manifest manifest_;
    std::optional<checksum_calculator> md5_;
    write_stream_state state_ = write_stream_state::open;
    uint64_t position_ = 0;
    std::size_t next_index_ = 0;
    std::string etag_;
};

}  // namespace kcenon::blob_transfer

#endif  // KCENON_BLOB_TRANSFER_STREAM_BLOB_WRITE_STREAM_H
