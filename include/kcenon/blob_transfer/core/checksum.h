/**
 * @file checksum.h
 * @brief Checksum utilities for end-to-end data integrity verification
 */

#ifndef KCENON_BLOB_TRANSFER_CORE_CHECKSUM_H
#define KCENON_BLOB_TRANSFER_CORE_CHECKSUM_H

#include <kcenon/blob_transfer/core/types.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>

namespace kcenon::blob_transfer {

/**
 * @brief One-shot checksum helpers for MD5 and CRC64
 *
 * MD5 values travel on the wire base64 encoded (Content-MD5). CRC64 uses the
 * reflected 0x9A6C9329AC4BC9B5 polynomial and travels as base64 of its eight
 * little-endian bytes (x-ms-content-crc64).
 */
class checksum {
public:
    using md5_digest = std::array<uint8_t, 16>;

    /**
     * @brief Calculate the MD5 digest of data
     */
    [[nodiscard]] static auto md5(std::span<const std::byte> data) -> result<md5_digest>;

    /**
     * @brief Calculate the base64 encoded MD5 digest of data
     */
    [[nodiscard]] static auto md5_base64(std::span<const std::byte> data) -> result<std::string>;

    /**
     * @brief Calculate CRC64 of data
     * @param data Input data span
     * @param previous CRC64 of the bytes preceding @p data, 0 to start fresh
     *
     * Chaining holds: crc64(b, crc64(a)) == crc64(a + b).
     */
    [[nodiscard]] static auto crc64(std::span<const std::byte> data,
                                    uint64_t previous = 0) -> uint64_t;

    /**
     * @brief Encode a CRC64 value the way it is carried in request headers
     */
    [[nodiscard]] static auto crc64_base64(uint64_t value) -> std::string;

    /**
     * @brief Verify data against a base64 encoded MD5
     */
    [[nodiscard]] static auto verify_md5(std::span<const std::byte> data,
                                         const std::string& expected_base64) -> bool;
};

/**
 * @brief Checksum values produced by a checksum_calculator
 */
struct checksum_values {
    std::optional<std::string> md5_base64;
    std::optional<uint64_t> crc64;
    uint64_t bytes_processed = 0;
};

/**
 * @brief Incremental MD5 / CRC64 calculator over streamed byte ranges
 *
 * Bytes must be fed in content order. Not thread-safe.
 */
class checksum_calculator {
public:
    checksum_calculator(bool compute_md5, bool compute_crc64);
    ~checksum_calculator();

    checksum_calculator(const checksum_calculator&) = delete;
    auto operator=(const checksum_calculator&) -> checksum_calculator& = delete;
    checksum_calculator(checksum_calculator&&) noexcept;
    auto operator=(checksum_calculator&&) noexcept -> checksum_calculator&;

    /**
     * @brief Feed the next range of bytes
     */
    [[nodiscard]] auto update(std::span<const std::byte> data) -> result<void>;

    /**
     * @brief Finish the calculation; the calculator cannot be updated afterwards
     */
    [[nodiscard]] auto finish() -> result<checksum_values>;

    [[nodiscard]] auto bytes_processed() const -> uint64_t;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::blob_transfer

#endif  // KCENON_BLOB_TRANSFER_CORE_CHECKSUM_H
