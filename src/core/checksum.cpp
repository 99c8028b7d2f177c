/**
 * @file checksum.cpp
 * @brief Implementation of checksum utilities
 */

#include <kcenon/blob_transfer/core/checksum.h>
#include <kcenon/blob_transfer/core/blob_utils.h>

#include <openssl/evp.h>

#include <vector>

namespace kcenon::blob_transfer {

namespace {

// CRC64 polynomial (reflected form of 0xAD93D23594C93659)
constexpr uint64_t CRC64_POLYNOMIAL = 0x9A6C9329AC4BC9B5ULL;

// Generate CRC64 lookup table at compile time
constexpr auto generate_crc64_table() -> std::array<uint64_t, 256> {
    std::array<uint64_t, 256> table{};

    for (uint64_t i = 0; i < 256; ++i) {
        uint64_t crc = i;
        for (int j = 0; j < 8; ++j) {
            if (crc & 1) {
                crc = (crc >> 1) ^ CRC64_POLYNOMIAL;
            } else {
                crc >>= 1;
            }
        }
        table[i] = crc;
    }

    return table;
}

constexpr auto CRC64_TABLE = generate_crc64_table();

struct evp_ctx_deleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

using evp_ctx_ptr = std::unique_ptr<EVP_MD_CTX, evp_ctx_deleter>;

auto md5_failure(const char* step) -> unexpected {
    return unexpected{error{error_code::internal_error,
        std::string("MD5 computation failed at ") + step}};
}

}  // namespace

// ============================================================================
// checksum
// ============================================================================

auto checksum::md5(std::span<const std::byte> data) -> result<md5_digest> {
    evp_ctx_ptr ctx(EVP_MD_CTX_new());
    if (!ctx) {
        return md5_failure("context allocation");
    }
    if (EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1) {
        return md5_failure("init");
    }
    if (!data.empty() && EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
        return md5_failure("update");
    }

    md5_digest digest{};
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest.data(), &len) != 1 || len != digest.size()) {
        return md5_failure("final");
    }
    return digest;
}

auto checksum::md5_base64(std::span<const std::byte> data) -> result<std::string> {
    auto digest = md5(data);
    if (!digest.has_value()) {
        return unexpected{digest.error()};
    }
    return blob_utils::base64_encode(
        std::vector<uint8_t>(digest.value().begin(), digest.value().end()));
}

auto checksum::crc64(std::span<const std::byte> data, uint64_t previous) -> uint64_t {
    uint64_t crc = ~previous;

    for (std::byte b : data) {
        auto index = static_cast<uint8_t>(crc ^ static_cast<uint8_t>(b));
        crc = CRC64_TABLE[index] ^ (crc >> 8);
    }

    return ~crc;
}

auto checksum::crc64_base64(uint64_t value) -> std::string {
    std::vector<uint8_t> bytes(8);
    for (std::size_t i = 0; i < 8; ++i) {
        bytes[i] = static_cast<uint8_t>(value >> (i * 8));
    }
    return blob_utils::base64_encode(bytes);
}

auto checksum::verify_md5(std::span<const std::byte> data,
                          const std::string& expected_base64) -> bool {
    auto actual = md5_base64(data);
    return actual.has_value() && actual.value() == expected_base64;
}

// ============================================================================
// checksum_calculator
// ============================================================================

struct checksum_calculator::impl {
    evp_ctx_ptr md5_ctx;
    bool compute_crc64 = false;
    uint64_t crc = 0;
    uint64_t bytes = 0;
    bool init_failed = false;
    bool finished = false;
};

checksum_calculator::checksum_calculator(bool compute_md5, bool compute_crc64)
    : impl_(std::make_unique<impl>()) {
    impl_->compute_crc64 = compute_crc64;
    if (compute_md5) {
        impl_->md5_ctx.reset(EVP_MD_CTX_new());
        if (!impl_->md5_ctx ||
            EVP_DigestInit_ex(impl_->md5_ctx.get(), EVP_md5(), nullptr) != 1) {
            impl_->init_failed = true;
        }
    }
}

checksum_calculator::~checksum_calculator() = default;

checksum_calculator::checksum_calculator(checksum_calculator&&) noexcept = default;
auto checksum_calculator::operator=(checksum_calculator&&) noexcept
    -> checksum_calculator& = default;

auto checksum_calculator::update(std::span<const std::byte> data) -> result<void> {
    if (impl_->init_failed) {
        return md5_failure("init");
    }
    if (impl_->finished) {
        return unexpected{error{error_code::invalid_state,
            "checksum calculator already finished"}};
    }

    if (impl_->md5_ctx && !data.empty() &&
        EVP_DigestUpdate(impl_->md5_ctx.get(), data.data(), data.size()) != 1) {
        return md5_failure("update");
    }
    if (impl_->compute_crc64) {
        impl_->crc = checksum::crc64(data, impl_->crc);
    }
    impl_->bytes += data.size();
    return result<void>{};
}

auto checksum_calculator::finish() -> result<checksum_values> {
    if (impl_->init_failed) {
        return md5_failure("init");
    }
    if (impl_->finished) {
        return unexpected{error{error_code::invalid_state,
            "checksum calculator already finished"}};
    }
    impl_->finished = true;

    checksum_values values;
    values.bytes_processed = impl_->bytes;

    if (impl_->md5_ctx) {
        checksum::md5_digest digest{};
        unsigned int len = 0;
        if (EVP_DigestFinal_ex(impl_->md5_ctx.get(), digest.data(), &len) != 1 ||
            len != digest.size()) {
            return md5_failure("final");
        }
        values.md5_base64 = blob_utils::base64_encode(
            std::vector<uint8_t>(digest.begin(), digest.end()));
    }
    if (impl_->compute_crc64) {
        values.crc64 = impl_->crc;
    }
    return values;
}

auto checksum_calculator::bytes_processed() const -> uint64_t {
    return impl_->bytes;
}

}  // namespace kcenon::blob_transfer
