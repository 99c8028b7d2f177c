/**
 * @file byte_stream.h
 * @brief Byte sources for uploads and random-access sinks for downloads
 */

#ifndef KCENON_BLOB_TRANSFER_TRANSFER_BYTE_STREAM_H
#define KCENON_BLOB_TRANSFER_TRANSFER_BYTE_STREAM_H

#include "kcenon/blob_transfer/core/types.h"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <istream>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <vector>

namespace kcenon::blob_transfer {

/**
 * @brief Caller-supplied facts about a source
 *
 * Seekability is never tested; a source declared seekable must support
 * concurrent read_at().
 */
struct stream_descriptor {
    bool seekable = false;
    std::optional<uint64_t> length;

    [[nodiscard]] static auto seekable_of(uint64_t length) -> stream_descriptor {
        return {true, length};
    }

    [[nodiscard]] static auto sequential(std::optional<uint64_t> length = std::nullopt)
        -> stream_descriptor {
        return {false, length};
    }
};

// ============================================================================
// Sources
// ============================================================================

/**
 * @brief Upload source
 */
class byte_source {
public:
    virtual ~byte_source() = default;

    /**
     * @brief Read the next bytes; 0 means end of data
     */
    [[nodiscard]] virtual auto read(std::span<std::byte> buffer) -> result<std::size_t> = 0;

    /**
     * @brief Read at an absolute offset without moving the sequential position
     *
     * Safe to call from several threads at once. Sources that cannot seek
     * return unsupported_operation.
     */
    [[nodiscard]] virtual auto read_at(uint64_t offset, std::span<std::byte> buffer)
        -> result<std::size_t>;
};

/**
 * @brief Source over an in-memory buffer
 */
class memory_byte_source : public byte_source {
public:
    explicit memory_byte_source(std::vector<std::byte> data);

    [[nodiscard]] auto read(std::span<std::byte> buffer) -> result<std::size_t> override;
    [[nodiscard]] auto read_at(uint64_t offset, std::span<std::byte> buffer)
        -> result<std::size_t> override;

    [[nodiscard]] auto size() const noexcept -> uint64_t { return data_.size(); }

private:
    std::vector<std::byte> data_;
    std::size_t position_ = 0;
};

/**
 * @brief Source over a file on disk
 */
class file_byte_source : public byte_source {
public:
    [[nodiscard]] static auto open(const std::filesystem::path& path)
        -> result<std::unique_ptr<file_byte_source>>;

    [[nodiscard]] auto read(std::span<std::byte> buffer) -> result<std::size_t> override;
    [[nodiscard]] auto read_at(uint64_t offset, std::span<std::byte> buffer)
        -> result<std::size_t> override;

    [[nodiscard]] auto size() const noexcept -> uint64_t { return size_; }

private:
    file_byte_source(std::filesystem::path path, std::ifstream file, uint64_t size);

    std::filesystem::path path_;
    std::mutex mutex_;
    std::ifstream file_;
    uint64_t size_ = 0;
    uint64_t position_ = 0;
};

/**
 * @brief Non-seekable source over a std::istream
 */
class stream_byte_source : public byte_source {
public:
    explicit stream_byte_source(std::istream& stream);

    [[nodiscard]] auto read(std::span<std::byte> buffer) -> result<std::size_t> override;

private:
    std::istream& stream_;
};

// ============================================================================
// Sinks
// ============================================================================

/**
 * @brief Download destination with positional writes
 */
class byte_sink {
public:
    virtual ~byte_sink() = default;

    /**
     * @brief Write at @p offset; safe to call from several threads at once
     */
    [[nodiscard]] virtual auto write_at(uint64_t offset, std::span<const std::byte> data)
        -> result<void> = 0;

    /**
     * @brief Set the final size before ranges are written
     */
    [[nodiscard]] virtual auto resize(uint64_t size) -> result<void> = 0;

    [[nodiscard]] virtual auto flush() -> result<void> { return {}; }
};

class memory_byte_sink : public byte_sink {
public:
    [[nodiscard]] auto write_at(uint64_t offset, std::span<const std::byte> data)
        -> result<void> override;
    [[nodiscard]] auto resize(uint64_t size) -> result<void> override;

    [[nodiscard]] auto data() const -> std::vector<std::byte>;

    /**
     * @brief Move the contents out, leaving the sink empty
     */
    [[nodiscard]] auto release() -> std::vector<std::byte>;

private:
    mutable std::mutex mutex_;
    std::vector<std::byte> data_;
};

class file_byte_sink : public byte_sink {
public:
    /**
     * @brief Create or truncate @p path
     */
    [[nodiscard]] static auto open(const std::filesystem::path& path)
        -> result<std::unique_ptr<file_byte_sink>>;

    [[nodiscard]] auto write_at(uint64_t offset, std::span<const std::byte> data)
        -> result<void> override;
    [[nodiscard]] auto resize(uint64_t size) -> result<void> override;
    [[nodiscard]] auto flush() -> result<void> override;

private:
    file_byte_sink(std::filesystem::path path, std::fstream file);

    std::filesystem::path path_;
    std::mutex mutex_;
    std::fstream file_;
};

}  // namespace kcenon::blob_transfer

#endif  // KCENON_BLOB_TRANSFER_TRANSFER_BYTE_STREAM_H
