/**
 * @file test_checksum.cpp
 * @brief Unit tests for checksum utilities
 */

#include <gtest/gtest.h>

#include <kcenon/blob_transfer/core/checksum.h>

#include <algorithm>
#include <cstring>
#include <random>
#include <span>
#include <string>
#include <vector>

namespace kcenon::blob_transfer::test {

class ChecksumTest : public ::testing::Test {
protected:
    static auto bytes_of(const std::string& text) -> std::vector<std::byte> {
        std::vector<std::byte> data(text.size());
        if (!text.empty()) {
            std::memcpy(data.data(), text.data(), text.size());
        }
        return data;
    }

    static auto random_bytes(std::size_t size) -> std::vector<std::byte> {
        std::vector<std::byte> data(size);
        std::mt19937 gen(7);
        std::uniform_int_distribution<int> dis(0, 255);
        for (auto& b : data) {
            b = static_cast<std::byte>(dis(gen));
        }
        return data;
    }
};

// MD5 Tests

TEST_F(ChecksumTest, MD5_EmptyData) {
    auto md5 = checksum::md5_base64({});
    ASSERT_TRUE(md5.has_value());
    EXPECT_EQ(md5.value(), "1B2M2Y8AsgTpgAmY7PhCfg==");
}

TEST_F(ChecksumTest, MD5_KnownValues) {
    auto abc = checksum::md5_base64(bytes_of("abc"));
    ASSERT_TRUE(abc.has_value());
    EXPECT_EQ(abc.value(), "kAFQmDzST7DWlj99KOF/cg==");

    auto fox = checksum::md5_base64(bytes_of("The quick brown fox jumps over the lazy dog"));
    ASSERT_TRUE(fox.has_value());
    EXPECT_EQ(fox.value(), "nhB9nTcrtoJr2B01QqQZ1g==");
}

TEST_F(ChecksumTest, MD5_RawDigest) {
    auto digest = checksum::md5(bytes_of("abc"));
    ASSERT_TRUE(digest.has_value());
    EXPECT_EQ(digest.value()[0], 0x90);
    EXPECT_EQ(digest.value()[1], 0x01);
    EXPECT_EQ(digest.value()[15], 0x72);
}

TEST_F(ChecksumTest, MD5_Verify) {
    auto data = bytes_of("abc");
    EXPECT_TRUE(checksum::verify_md5(data, "kAFQmDzST7DWlj99KOF/cg=="));
    EXPECT_FALSE(checksum::verify_md5(data, "1B2M2Y8AsgTpgAmY7PhCfg=="));
    EXPECT_FALSE(checksum::verify_md5(data, ""));
}

// CRC64 Tests

TEST_F(ChecksumTest, CRC64_EmptyData) {
    EXPECT_EQ(checksum::crc64({}), 0u);
    EXPECT_EQ(checksum::crc64({}, 0x1234), 0x1234u);
}

TEST_F(ChecksumTest, CRC64_KnownValue) {
    EXPECT_EQ(checksum::crc64(bytes_of("123456789")), 0xAE8B14860A799888ULL);
}

TEST_F(ChecksumTest, CRC64_Chaining) {
    auto data = random_bytes(10000);
    const auto whole = checksum::crc64(data);

    std::span<const std::byte> all(data);
    for (std::size_t split : {0u, 1u, 4096u, 9999u, 10000u}) {
        auto first = checksum::crc64(all.subspan(0, split));
        EXPECT_EQ(checksum::crc64(all.subspan(split), first), whole) << "split at " << split;
    }
}

TEST_F(ChecksumTest, CRC64_DetectsSingleBitFlip) {
    auto data = random_bytes(1024);
    const auto before = checksum::crc64(data);
    data[500] ^= std::byte{0x01};
    EXPECT_NE(checksum::crc64(data), before);
}

TEST_F(ChecksumTest, CRC64_Base64IsLittleEndian) {
    EXPECT_EQ(checksum::crc64_base64(0), "AAAAAAAAAAA=");
    EXPECT_EQ(checksum::crc64_base64(0x01), "AQAAAAAAAAA=");
    EXPECT_EQ(checksum::crc64_base64(0x0100000000000000ULL), "AAAAAAAAAAE=");
}

// Incremental calculator Tests

TEST_F(ChecksumTest, Calculator_MatchesOneShot) {
    auto data = random_bytes(5000);
    checksum_calculator calc(true, true);

    std::span<const std::byte> all(data);
    for (std::size_t offset = 0; offset < data.size(); offset += 777) {
        auto len = std::min<std::size_t>(777, data.size() - offset);
        ASSERT_TRUE(calc.update(all.subspan(offset, len)).has_value());
    }
    EXPECT_EQ(calc.bytes_processed(), 5000u);

    auto values = calc.finish();
    ASSERT_TRUE(values.has_value());
    ASSERT_TRUE(values.value().md5_base64.has_value());
    ASSERT_TRUE(values.value().crc64.has_value());
    EXPECT_EQ(*values.value().md5_base64, checksum::md5_base64(data).value());
    EXPECT_EQ(*values.value().crc64, checksum::crc64(data));
    EXPECT_EQ(values.value().bytes_processed, 5000u);
}

TEST_F(ChecksumTest, Calculator_OnlyRequestedValues) {
    checksum_calculator md5_only(true, false);
    ASSERT_TRUE(md5_only.update(bytes_of("abc")).has_value());
    auto values = md5_only.finish();
    ASSERT_TRUE(values.has_value());
    EXPECT_EQ(values.value().md5_base64.value_or(""), "kAFQmDzST7DWlj99KOF/cg==");
    EXPECT_FALSE(values.value().crc64.has_value());

    checksum_calculator none(false, false);
    ASSERT_TRUE(none.update(bytes_of("abc")).has_value());
    auto empty = none.finish();
    ASSERT_TRUE(empty.has_value());
    EXPECT_FALSE(empty.value().md5_base64.has_value());
    EXPECT_EQ(empty.value().bytes_processed, 3u);
}

TEST_F(ChecksumTest, Calculator_RejectsUseAfterFinish) {
    checksum_calculator calc(true, true);
    ASSERT_TRUE(calc.finish().has_value());

    auto updated = calc.update(bytes_of("late"));
    ASSERT_FALSE(updated.has_value());
    EXPECT_EQ(updated.error().code, error_code::invalid_state);

    auto finished = calc.finish();
    ASSERT_FALSE(finished.has_value());
    EXPECT_EQ(finished.error().code, error_code::invalid_state);
}

TEST_F(ChecksumTest, Calculator_Movable) {
    checksum_calculator calc(false, true);
    ASSERT_TRUE(calc.update(bytes_of("1234")).has_value());

    checksum_calculator moved = std::move(calc);
    ASSERT_TRUE(moved.update(bytes_of("56789")).has_value());
    auto values = moved.finish();
    ASSERT_TRUE(values.has_value());
    EXPECT_EQ(values.value().crc64.value_or(0), 0xAE8B14860A799888ULL);
}

}  // namespace kcenon::blob_transfer::test
