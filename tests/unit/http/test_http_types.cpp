/**
 * @file test_http_types.cpp
 * @brief Unit tests for HTTP model helpers and the network transport fallback
 */

#include <gtest/gtest.h>

#include <kcenon/blob_transfer/config/feature_flags.h>
#include <kcenon/blob_transfer/http/http_transport.h>
#include <kcenon/blob_transfer/http/http_types.h>

#include <string>

namespace kcenon::blob_transfer::test {

class HttpTypesTest : public ::testing::Test {};

TEST_F(HttpTypesTest, MethodRoundTrip) {
    for (auto method : {http_method::get, http_method::put, http_method::post,
                        http_method::del, http_method::head}) {
        auto parsed = parse_http_method(to_string(method));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, method);
    }
    EXPECT_FALSE(parse_http_method("PATCH").has_value());
    EXPECT_FALSE(parse_http_method("delete").has_value());
}

TEST_F(HttpTypesTest, HeaderNamesCaseInsensitive) {
    http_request request;
    request.set_header("Content-MD5", "abc");
    request.set_header("x-ms-date", "now");

    EXPECT_EQ(request.get_header("content-md5").value_or(""), "abc");
    EXPECT_EQ(request.get_header("X-MS-DATE").value_or(""), "now");
    EXPECT_FALSE(request.get_header("ETag").has_value());

    request.set_header("CONTENT-md5", "def");
    EXPECT_EQ(request.headers.size(), 2u);
    EXPECT_EQ(request.get_header("Content-MD5").value_or(""), "def");
}

TEST_F(HttpTypesTest, ResponseSuccessRange) {
    http_response response;
    response.status_code = 201;
    EXPECT_TRUE(response.is_success());
    response.status_code = 304;
    EXPECT_FALSE(response.is_success());
    response.status_code = 199;
    EXPECT_FALSE(response.is_success());
}

TEST_F(HttpTypesTest, ParseUrl) {
    auto parts = parse_url("https://acct.blob.core.windows.net/c/dir/b.txt?comp=block&x=1");
    ASSERT_TRUE(parts.has_value());
    EXPECT_EQ(parts->scheme, "https");
    EXPECT_EQ(parts->authority, "acct.blob.core.windows.net");
    EXPECT_EQ(parts->path, "/c/dir/b.txt");
    EXPECT_EQ(parts->query, "comp=block&x=1");

    auto root = parse_url("http://127.0.0.1:10000?comp=batch");
    ASSERT_TRUE(root.has_value());
    EXPECT_EQ(root->authority, "127.0.0.1:10000");
    EXPECT_EQ(root->path, "/");
    EXPECT_EQ(root->query, "comp=batch");

    EXPECT_FALSE(parse_url("acct.blob.core.windows.net/c").has_value());
    EXPECT_FALSE(parse_url("https:///c").has_value());
}

TEST_F(HttpTypesTest, ParseQuery) {
    auto params = parse_query("comp=block&blockid=QUFB%3D%3D&flag&sig=a%2Bb");
    EXPECT_EQ(params.at("comp"), "block");
    EXPECT_EQ(params.at("blockid"), "QUFB==");
    EXPECT_EQ(params.at("flag"), "");
    EXPECT_EQ(params.at("sig"), "a+b");
    EXPECT_TRUE(parse_query("").empty());
}

TEST_F(HttpTypesTest, AppendQuery) {
    EXPECT_EQ(append_query("https://a/c/b", "?sv=1&sig=x"), "https://a/c/b?sv=1&sig=x");
    EXPECT_EQ(append_query("https://a/c/b?comp=block", "sig=x"),
              "https://a/c/b?comp=block&sig=x");
    EXPECT_EQ(append_query("https://a/c/b", ""), "https://a/c/b");
}

TEST_F(HttpTypesTest, ReasonPhrases) {
    EXPECT_STREQ(reason_phrase_for(202), "Accepted");
    EXPECT_STREQ(reason_phrase_for(412), "Precondition Failed");
    EXPECT_STREQ(reason_phrase_for(299), "Unknown");
}

#if !KCENON_WITH_NETWORK_SYSTEM
TEST_F(HttpTypesTest, NetworkTransportUnavailableWithoutNetworkSystem) {
    network_http_transport transport;
    EXPECT_FALSE(transport.is_available());

    http_request request;
    request.url = "https://acct.blob.core.windows.net/c/b";
    auto response = transport.send(request);
    ASSERT_FALSE(response.has_value());
    EXPECT_EQ(response.error().code, error_code::not_initialized);
}
#endif

}  // namespace kcenon::blob_transfer::test
