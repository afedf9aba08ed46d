#include <gtest/gtest.h>
#include "http_framing.hpp"
#include <cstdint>
#include <string>

using namespace co::http_framing;

class FramingTest : public ::testing::Test {
protected:
    void SetUp() override {
        // 每个测试前的设置
    }

    void TearDown() override {
        // 每个测试后的清理
    }
};

// =============================================================================
// 请求分帧测试
// =============================================================================

TEST_F(FramingTest, RequestWithoutBodyHeaders) {
    auto mode = request_framing(header_list{{"Host", "example.com"}});
    ASSERT_TRUE(mode.has_value());
    EXPECT_EQ(*mode, framing_mode::no_body());
}

TEST_F(FramingTest, RequestContentLength) {
    auto mode = request_framing(header_list{{"Content-Length", "42"}});
    ASSERT_TRUE(mode.has_value());
    EXPECT_EQ(mode->kind, framing_kind::content_length);
    EXPECT_EQ(mode->length, 42u);
}

TEST_F(FramingTest, RequestChunked) {
    auto mode = request_framing(header_list{{"Transfer-Encoding", "gzip, Chunked"}});
    ASSERT_TRUE(mode.has_value());
    EXPECT_EQ(*mode, framing_mode::chunked());
}

TEST_F(FramingTest, RepeatedIdenticalContentLengthAccepted) {
    auto mode = request_framing(header_list{{"Content-Length", "5, 5"}, {"content-length", "5"}});
    ASSERT_TRUE(mode.has_value());
    EXPECT_EQ(*mode, framing_mode::content_length(5));
}

// =============================================================================
// 非法分帧头部测试（请求走私防护）
// =============================================================================

TEST_F(FramingTest, ContentLengthAndTransferEncodingRejectedInEitherOrder) {
    auto cl_first = request_framing(header_list{{"Content-Length", "5"}, {"Transfer-Encoding", "chunked"}});
    ASSERT_FALSE(cl_first.has_value());
    EXPECT_EQ(cl_first.error().code, error_code::ambiguous_framing);

    auto te_first = request_framing(header_list{{"Transfer-Encoding", "chunked"}, {"Content-Length", "5"}});
    ASSERT_FALSE(te_first.has_value());
    EXPECT_EQ(te_first.error().code, error_code::ambiguous_framing);
}

TEST_F(FramingTest, InvalidContentLengthValues) {
    for (const char* value : {"", "abc", "-1", "+5", "1.0", "0x10", "18446744073709551616", "99999999999999999999999"}) {
        auto mode = request_framing(header_list{{"Content-Length", value}});
        ASSERT_FALSE(mode.has_value()) << "value: '" << value << "'";
        EXPECT_EQ(mode.error().code, error_code::invalid_content_length) << "value: '" << value << "'";
    }
}

TEST_F(FramingTest, LargestContentLengthAccepted) {
    auto mode = request_framing(header_list{{"Content-Length", "18446744073709551615"}});
    ASSERT_TRUE(mode.has_value());
    EXPECT_EQ(mode->length, UINT64_MAX);

    auto padded = request_framing(header_list{{"Content-Length", "000000000000000000000042"}});
    ASSERT_TRUE(padded.has_value());
    EXPECT_EQ(padded->length, 42u);
}

TEST_F(FramingTest, ConflictingContentLength) {
    auto mode = request_framing(header_list{{"Content-Length", "5"}, {"Content-Length", "6"}});
    ASSERT_FALSE(mode.has_value());
    EXPECT_EQ(mode.error().code, error_code::conflicting_content_length);
}

TEST_F(FramingTest, UnsupportedTransferCoding) {
    auto mode = request_framing(header_list{{"Transfer-Encoding", "chunked, gzip"}});
    ASSERT_FALSE(mode.has_value());
    EXPECT_EQ(mode.error().code, error_code::unsupported_transfer_encoding);
    EXPECT_EQ(mode.error().status_hint, 501);

    auto twice = request_framing(header_list{{"Transfer-Encoding", "chunked"}, {"Transfer-Encoding", "chunked"}});
    ASSERT_FALSE(twice.has_value());
    EXPECT_EQ(twice.error().code, error_code::unsupported_transfer_encoding);
}

// =============================================================================
// 响应分帧测试
// =============================================================================

TEST_F(FramingTest, ResponsesWithoutBody) {
    header_list with_length{{"Content-Length", "10"}};

    EXPECT_EQ(*response_framing("HEAD", 200, with_length), framing_mode::no_body());
    EXPECT_EQ(*response_framing("GET", 204, with_length), framing_mode::no_body());
    EXPECT_EQ(*response_framing("GET", 304, with_length), framing_mode::no_body());
    EXPECT_EQ(*response_framing("GET", 101, with_length), framing_mode::no_body());
    EXPECT_EQ(*response_framing("CONNECT", 200, with_length), framing_mode::no_body());
}

TEST_F(FramingTest, ConnectFailureHasBody) {
    auto mode = response_framing("CONNECT", 407, header_list{{"Content-Length", "3"}});
    ASSERT_TRUE(mode.has_value());
    EXPECT_EQ(*mode, framing_mode::content_length(3));
}

TEST_F(FramingTest, ResponseChunkedBeatsCloseDelimited) {
    EXPECT_EQ(*response_framing("GET", 200, header_list{{"Transfer-Encoding", "chunked"}}),
              framing_mode::chunked());
    EXPECT_EQ(*response_framing("GET", 200, header_list{}), framing_mode::close_delimited());
}

TEST_F(FramingTest, ResponseHeadersValidatedEvenWithoutBody) {
    auto mode = response_framing("HEAD", 200,
                                 header_list{{"Content-Length", "1"}, {"Transfer-Encoding", "chunked"}});
    ASSERT_FALSE(mode.has_value());
    EXPECT_EQ(mode.error().code, error_code::ambiguous_framing);
}

// =============================================================================
// Keep-Alive与100-continue测试
// =============================================================================

TEST_F(FramingTest, KeepAlive) {
    EXPECT_TRUE(keep_alive(version::http_1_1, header_list{}));
    EXPECT_TRUE(keep_alive(version::http_1_1, header_list{{"Connection", "keep-alive"}}));
    EXPECT_FALSE(keep_alive(version::http_1_1, header_list{{"Connection", "Upgrade, Close"}}));
    EXPECT_FALSE(keep_alive(version::http_1_0, header_list{}));
    EXPECT_TRUE(keep_alive(version::http_1_0, header_list{{"Connection", "Keep-Alive"}}));
    EXPECT_FALSE(keep_alive(version::http_1_0, header_list{{"Connection", "keep-alive, close"}}));
}

TEST_F(FramingTest, ExpectContinue) {
    EXPECT_TRUE(has_expect_100_continue(version::http_1_1, header_list{{"Expect", "100-Continue"}}));
    EXPECT_FALSE(has_expect_100_continue(version::http_1_0, header_list{{"Expect", "100-continue"}}));
    EXPECT_FALSE(has_expect_100_continue(version::http_1_1, header_list{}));
}

TEST_F(FramingTest, FramingKindNames) {
    EXPECT_EQ(to_string(framing_kind::chunked), "chunked");
    EXPECT_EQ(to_string(framing_kind::close_delimited), "close-delimited");
}
