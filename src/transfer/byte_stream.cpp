/**
 * @file byte_stream.cpp
 * @brief Memory, file and stream sources and sinks
 */

#include "kcenon/blob_transfer/transfer/byte_stream.h"

#include <algorithm>
#include <cstring>
#include <system_error>

namespace kcenon::blob_transfer {

auto byte_source::read_at(uint64_t /*offset*/, std::span<std::byte> /*buffer*/)
    -> result<std::size_t> {
    return unexpected{error{error_code::unsupported_operation,
        "Source does not support positional reads"}};
}

// ============================================================================
// memory_byte_source
// ============================================================================

memory_byte_source::memory_byte_source(std::vector<std::byte> data)
    : data_(std::move(data)) {}

auto memory_byte_source::read(std::span<std::byte> buffer) -> result<std::size_t> {
    auto count = std::min(buffer.size(), data_.size() - position_);
    if (count > 0) {
        std::memcpy(buffer.data(), data_.data() + position_, count);
        position_ += count;
    }
    return count;
}

auto memory_byte_source::read_at(uint64_t offset, std::span<std::byte> buffer)
    -> result<std::size_t> {
    if (offset >= data_.size()) {
        return std::size_t{0};
    }
    auto count = static_cast<std::size_t>(
        std::min<uint64_t>(buffer.size(), data_.size() - offset));
    std::memcpy(buffer.data(), data_.data() + offset, count);
    return count;
}

// ============================================================================
// file_byte_source
// ============================================================================

file_byte_source::file_byte_source(std::filesystem::path path, std::ifstream file,
                                   uint64_t size)
    : path_(std::move(path)), file_(std::move(file)), size_(size) {}

auto file_byte_source::open(const std::filesystem::path& path)
    -> result<std::unique_ptr<file_byte_source>> {
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return unexpected{error{error_code::file_not_found,
            "Cannot stat " + path.string() + ": " + ec.message()}};
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return unexpected{error{error_code::file_read_error,
            "Cannot open " + path.string()}};
    }
    return std::unique_ptr<file_byte_source>(
        new file_byte_source(path, std::move(file), static_cast<uint64_t>(size)));
}

auto file_byte_source::read(std::span<std::byte> buffer) -> result<std::size_t> {
    std::lock_guard<std::mutex> lock(mutex_);
    auto count = std::min<uint64_t>(buffer.size(), size_ - std::min(position_, size_));
    if (count == 0) {
        return std::size_t{0};
    }
    file_.clear();
    file_.seekg(static_cast<std::streamoff>(position_));
    file_.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(count));
    auto got = static_cast<std::size_t>(file_.gcount());
    if (got != count) {
        return unexpected{error{error_code::file_read_error,
            "Short read from " + path_.string()}};
    }
    position_ += got;
    return got;
}

auto file_byte_source::read_at(uint64_t offset, std::span<std::byte> buffer)
    -> result<std::size_t> {
    std::lock_guard<std::mutex> lock(mutex_);
    if (offset >= size_) {
        return std::size_t{0};
    }
    auto count = std::min<uint64_t>(buffer.size(), size_ - offset);
    file_.clear();
    file_.seekg(static_cast<std::streamoff>(offset));
    file_.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(count));
    auto got = static_cast<std::size_t>(file_.gcount());
    if (got != count) {
        return unexpected{error{error_code::file_read_error,
            "Short read from " + path_.string() + " at offset " + std::to_string(offset)}};
    }
    return got;
}

// ============================================================================
// stream_byte_source
// ============================================================================

stream_byte_source::stream_byte_source(std::istream& stream)
    : stream_(stream) {}

auto stream_byte_source::read(std::span<std::byte> buffer) -> result<std::size_t> {
    if (buffer.empty() || stream_.eof()) {
        return std::size_t{0};
    }
    stream_.read(reinterpret_cast<char*>(buffer.data()),
                 static_cast<std::streamsize>(buffer.size()));
    if (stream_.bad()) {
        return unexpected{error{error_code::file_read_error, "Input stream failed"}};
    }
    return static_cast<std::size_t>(stream_.gcount());
}

// ============================================================================
// memory_byte_sink
// ============================================================================

auto memory_byte_sink::write_at(uint64_t offset, std::span<const std::byte> data)
    -> result<void> {
    std::lock_guard<std::mutex> lock(mutex_);
    auto end = offset + data.size();
    if (end > data_.size()) {
        data_.resize(static_cast<std::size_t>(end));
    }
    if (!data.empty()) {
        std::memcpy(data_.data() + offset, data.data(), data.size());
    }
    return {};
}

auto memory_byte_sink::resize(uint64_t size) -> result<void> {
    std::lock_guard<std::mutex> lock(mutex_);
    data_.resize(static_cast<std::size_t>(size));
    return {};
}

auto memory_byte_sink::data() const -> std::vector<std::byte> {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_;
}

auto memory_byte_sink::release() -> std::vector<std::byte> {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::exchange(data_, {});
}

// ============================================================================
// file_byte_sink
// ============================================================================

file_byte_sink::file_byte_sink(std::filesystem::path path, std::fstream file)
    : path_(std::move(path)), file_(std::move(file)) {}

auto file_byte_sink::open(const std::filesystem::path& path)
    -> result<std::unique_ptr<file_byte_sink>> {
    std::fstream file(path, std::ios::binary | std::ios::in | std::ios::out | std::ios::trunc);
    if (!file) {
        return unexpected{error{error_code::file_write_error,
            "Cannot create " + path.string()}};
    }
    return std::unique_ptr<file_byte_sink>(new file_byte_sink(path, std::move(file)));
}

auto file_byte_sink::write_at(uint64_t offset, std::span<const std::byte> data)
    -> result<void> {
    std::lock_guard<std::mutex> lock(mutex_);
    file_.clear();
    file_.seekp(static_cast<std::streamoff>(offset));
    file_.write(reinterpret_cast<const char*>(data.data()),
                static_cast<std::streamsize>(data.size()));
    if (!file_) {
        return unexpected{error{error_code::file_write_error,
            "Write failed on " + path_.string() + " at offset " + std::to_string(offset)}};
    }
    return {};
}

auto file_byte_sink::resize(uint64_t size) -> result<void> {
    std::lock_guard<std::mutex> lock(mutex_);
    file_.flush();
    std::error_code ec;
    std::filesystem::resize_file(path_, size, ec);
    if (ec) {
        return unexpected{error{error_code::file_write_error,
            "Cannot resize " + path_.string() + ": " + ec.message()}};
    }
    return {};
}

auto file_byte_sink::flush() -> result<void> {
    std::lock_guard<std::mutex> lock(mutex_);
    file_.flush();
    if (!file_) {
        return unexpected{error{error_code::file_write_error,
            "Flush failed on " + path_.string()}};
    }
    return {};
}

}  // namespace kcenon::blob_transfer
