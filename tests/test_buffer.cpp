#include <gtest/gtest.h>
#include "http_framing.hpp"
#include <string>
#include <vector>
#include <span>

using namespace co::http_framing;

class BufferTest : public ::testing::Test {
protected:
    void SetUp() override {
        // 每个测试前的设置
    }

    void TearDown() override {
        // 每个测试后的清理
    }

    line_limits strict_limits_{};
    line_limits lenient_limits_{8 * 1024, 16 * 1024, true};
};

// =============================================================================
// 输出缓冲区基本功能测试
// =============================================================================

TEST_F(BufferTest, OutputBufferConstruction) {
    output_buffer buffer;
    EXPECT_EQ(buffer.size(), 0);
    EXPECT_TRUE(buffer.empty());
}

TEST_F(BufferTest, OutputBufferAppend) {
    output_buffer buffer;

    buffer.append(std::string_view{"Hello, "});
    buffer.append("World!", 6);

    EXPECT_EQ(buffer.view(), "Hello, World!");
    EXPECT_EQ(buffer.size(), 13);
}

TEST_F(BufferTest, OutputBufferAppendSpan) {
    output_buffer buffer;

    std::string test_str = "chunk";
    std::span<const uint8_t> span(reinterpret_cast<const uint8_t*>(test_str.data()), test_str.size());
    buffer.append(span);

    auto data = buffer.data();
    ASSERT_EQ(data.size(), test_str.size());
    EXPECT_EQ(std::string(reinterpret_cast<const char*>(data.data()), data.size()), test_str);
}

TEST_F(BufferTest, OutputBufferReleaseString) {
    output_buffer buffer;
    buffer.append(std::string_view{"payload"});

    auto released = buffer.release_string();
    EXPECT_EQ(released, "payload");
    EXPECT_TRUE(buffer.empty());
}

// =============================================================================
// 接收缓冲区测试
// =============================================================================

TEST_F(BufferTest, ReceiveBufferExtractAtMost) {
    receive_buffer buffer;
    buffer.append("hello world");

    EXPECT_EQ(buffer.extract_at_most(5), "hello");
    EXPECT_EQ(buffer.size(), 6);
    EXPECT_EQ(buffer.extract_at_most(100), " world");
    EXPECT_TRUE(buffer.empty());
    EXPECT_TRUE(buffer.extract_at_most(10).empty());
}

TEST_F(BufferTest, ReceiveBufferExtractExact) {
    receive_buffer buffer;
    buffer.append("abc");

    EXPECT_FALSE(buffer.extract_exact(4).has_value());
    EXPECT_EQ(buffer.size(), 3);

    auto bytes = buffer.extract_exact(2);
    ASSERT_TRUE(bytes.has_value());
    EXPECT_EQ(*bytes, "ab");
    EXPECT_EQ(buffer.view(), "c");
}

TEST_F(BufferTest, ReceiveBufferExtractLine) {
    receive_buffer buffer;
    buffer.append("first\r\nsec");

    auto line = buffer.extract_line(strict_limits_);
    ASSERT_TRUE(line.has_value());
    ASSERT_TRUE(line->has_value());
    EXPECT_EQ(**line, "first");

    // 不完整的行不会被消费
    auto partial = buffer.extract_line(strict_limits_);
    ASSERT_TRUE(partial.has_value());
    EXPECT_FALSE(partial->has_value());
    EXPECT_EQ(buffer.view(), "sec");

    buffer.append("ond\r\n");
    auto second = buffer.extract_line(strict_limits_);
    ASSERT_TRUE(second.has_value());
    ASSERT_TRUE(second->has_value());
    EXPECT_EQ(**second, "second");
    EXPECT_TRUE(buffer.empty());
}

TEST_F(BufferTest, ReceiveBufferExtractLinesWaitsForEmptyLine) {
    receive_buffer buffer;
    buffer.append("GET / HTTP/1.1\r\nHost: a\r\n");

    auto incomplete = buffer.extract_lines(strict_limits_);
    ASSERT_TRUE(incomplete.has_value());
    EXPECT_FALSE(incomplete->has_value());
    EXPECT_EQ(buffer.size(), 25);

    buffer.append("\r\nrest");
    auto block = buffer.extract_lines(strict_limits_);
    ASSERT_TRUE(block.has_value());
    ASSERT_TRUE(block->has_value());
    ASSERT_EQ((*block)->size(), 2);
    EXPECT_EQ((**block)[0], "GET / HTTP/1.1");
    EXPECT_EQ((**block)[1], "Host: a");
    EXPECT_EQ(buffer.view(), "rest");
}

TEST_F(BufferTest, ReceiveBufferEmptyBlock) {
    receive_buffer buffer;
    buffer.append("\r\n");

    auto block = buffer.extract_lines(strict_limits_);
    ASSERT_TRUE(block.has_value());
    ASSERT_TRUE(block->has_value());
    EXPECT_TRUE((*block)->empty());
}

TEST_F(BufferTest, ReceiveBufferBareLineFeed) {
    receive_buffer strict;
    strict.append("line\n");
    auto rejected = strict.extract_line(strict_limits_);
    ASSERT_FALSE(rejected.has_value());
    EXPECT_EQ(rejected.error().code, error_code::bare_line_feed);

    receive_buffer lenient;
    lenient.append("a: 1\nb: 2\n\n");
    auto block = lenient.extract_lines(lenient_limits_);
    ASSERT_TRUE(block.has_value());
    ASSERT_TRUE(block->has_value());
    ASSERT_EQ((*block)->size(), 2);
    EXPECT_EQ((**block)[1], "b: 2");
}

TEST_F(BufferTest, ReceiveBufferLineTooLong) {
    receive_buffer buffer;
    line_limits limits{16, 64, false};
    buffer.append(std::string(17, 'x'));

    auto result = buffer.extract_line(limits);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::line_too_long);
    EXPECT_EQ(result.error().status_hint, 431);
    EXPECT_TRUE(is_resource_exhaustion(result.error().code));
}

TEST_F(BufferTest, ReceiveBufferBlockTooLarge) {
    receive_buffer buffer;
    line_limits limits{64, 32, false};
    buffer.append("X-A: 0123456789\r\nX-B: 0123456789\r\nX-C: 0123456789\r\n");

    auto result = buffer.extract_lines(limits);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::header_block_too_large);
    EXPECT_EQ(result.error().status_hint, 431);
}

TEST_F(BufferTest, ReceiveBufferInvalidRequestByte) {
    receive_buffer buffer;
    EXPECT_FALSE(buffer.starts_with_invalid_request_byte());

    buffer.append(std::string_view{"\x16\x03\x01", 3});
    EXPECT_TRUE(buffer.starts_with_invalid_request_byte());

    buffer.clear();
    buffer.append("GET");
    EXPECT_FALSE(buffer.starts_with_invalid_request_byte());
}

// =============================================================================
// 头部列表测试
// =============================================================================

TEST_F(BufferTest, HeaderListCaseInsensitiveLookup) {
    header_list fields{{"Content-Type", "text/plain"}, {"X-Multi", "a"}, {"x-multi", "b"}};

    EXPECT_EQ(fields.get("content-type"), "text/plain");
    EXPECT_EQ(fields.count("X-MULTI"), 2);
    EXPECT_EQ(fields.get_all("x-multi"), (std::vector<std::string_view>{"a", "b"}));
    EXPECT_FALSE(fields.has("host"));

    // 原始大小写保留
    EXPECT_EQ(fields[0].name, "Content-Type");
}

TEST_F(BufferTest, HeaderListCommaValues) {
    header_list fields{{"Connection", "Keep-Alive, Upgrade"}, {"connection", " close ,"}};

    EXPECT_EQ(fields.get_comma_values("connection"),
              (std::vector<std::string>{"keep-alive", "upgrade", "close"}));

    fields.set_comma_values("Connection", {"close"});
    ASSERT_EQ(fields.size(), 1);
    EXPECT_EQ(fields[0].name, "Connection");
    EXPECT_EQ(fields[0].value, "close");

    fields.set_comma_values("connection", {});
    EXPECT_TRUE(fields.empty());
}
