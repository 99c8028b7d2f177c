/**
 * @file test_request_signer.cpp
 * @brief Unit tests for SharedKey and SAS request authorization
 */

#include <gtest/gtest.h>

#include <kcenon/blob_transfer/auth/request_signer.h>
#include <kcenon/blob_transfer/core/blob_utils.h>

#include <string>

namespace kcenon::blob_transfer::test {

class RequestSignerTest : public ::testing::Test {
protected:
    static auto put_block_request() -> http_request {
        http_request request;
        request.method = http_method::put;
        request.url = "https://devaccount.blob.core.windows.net/c/b.txt?comp=block&blockid=QUFB";
        request.set_header("Content-Length", "11");
        request.set_header("Content-MD5", "md5value");
        request.set_header("x-ms-date", "Sun, 06 Nov 1994 08:49:37 GMT");
        request.set_header("x-ms-version", "2021-08-06");
        return request;
    }

    storage_request_signer signer_;
};

TEST_F(RequestSignerTest, StringToSignLayout) {
    auto text = storage_request_signer::build_string_to_sign(put_block_request(), "devaccount");
    EXPECT_EQ(text,
              "PUT\n"
              "\n"
              "\n"
              "11\n"
              "md5value\n"
              "\n"
              "\n"
              "\n"
              "\n"
              "\n"
              "\n"
              "\n"
              "x-ms-date:Sun, 06 Nov 1994 08:49:37 GMT\n"
              "x-ms-version:2021-08-06\n"
              "/devaccount/c/b.txt\n"
              "blockid:QUFB\n"
              "comp:block");
}

TEST_F(RequestSignerTest, ZeroContentLengthSignedAsEmpty) {
    http_request request;
    request.method = http_method::del;
    request.url = "https://a.blob.core.windows.net/c/b";
    request.set_header("Content-Length", "0");
    auto text = storage_request_signer::build_string_to_sign(request, "a");
    EXPECT_EQ(text.rfind("DELETE\n\n\n\n", 0), 0u);
}

TEST_F(RequestSignerTest, SharedKeyHeader) {
    auto creds = storage_credentials::shared_key("devaccount", "a2V5");
    ASSERT_TRUE(creds.has_value());

    auto request = put_block_request();
    ASSERT_TRUE(signer_.sign(request, creds.value()).has_value());

    auto expected_mac = blob_utils::hmac_sha256(
        {'k', 'e', 'y'}, storage_request_signer::build_string_to_sign(request, "devaccount"));
    ASSERT_TRUE(expected_mac.has_value());
    EXPECT_EQ(request.get_header("Authorization").value_or(""),
              "SharedKey devaccount:" + blob_utils::base64_encode(*expected_mac));
}

TEST_F(RequestSignerTest, SharedKeyAddsDate) {
    auto creds = storage_credentials::shared_key("devaccount", "a2V5");
    ASSERT_TRUE(creds.has_value());

    http_request request;
    request.url = "https://devaccount.blob.core.windows.net/c/b";
    ASSERT_TRUE(signer_.sign(request, creds.value()).has_value());
    EXPECT_TRUE(request.get_header("x-ms-date").has_value());
    EXPECT_TRUE(request.get_header("Authorization").has_value());
}

TEST_F(RequestSignerTest, SignatureChangesWithHeaders) {
    auto first = storage_request_signer::compute_shared_key(put_block_request(), "devaccount",
                                                            "a2V5");
    auto changed = put_block_request();
    changed.set_header("If-Match", "\"0x1\"");
    auto second = storage_request_signer::compute_shared_key(changed, "devaccount", "a2V5");
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_NE(first.value(), second.value());
}

TEST_F(RequestSignerTest, SasAppendsToken) {
    auto creds = storage_credentials::sas("devaccount", "sv=2021&sig=abc");
    auto request = put_block_request();
    ASSERT_TRUE(signer_.sign(request, creds).has_value());
    EXPECT_EQ(request.url,
              "https://devaccount.blob.core.windows.net/c/b.txt?comp=block&blockid=QUFB"
              "&sv=2021&sig=abc");
    EXPECT_FALSE(request.get_header("Authorization").has_value());
}

TEST_F(RequestSignerTest, SasWithoutTokenRejected) {
    storage_credentials creds;
    creds.kind = credential_kind::sas;
    http_request request;
    auto signed_request = signer_.sign(request, creds);
    ASSERT_FALSE(signed_request.has_value());
    EXPECT_EQ(signed_request.error().code, error_code::invalid_configuration);
}

TEST_F(RequestSignerTest, AnonymousUntouched) {
    auto request = put_block_request();
    const auto url = request.url;
    ASSERT_TRUE(signer_.sign(request, storage_credentials::anonymous()).has_value());
    EXPECT_EQ(request.url, url);
    EXPECT_FALSE(request.get_header("Authorization").has_value());
}

}  // namespace kcenon::blob_transfer::test
