#pragma once

#include "core.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <utility>

namespace co::http_framing {

// =============================================================================
// Output Buffer Interface
// =============================================================================

class output_buffer {
public:
    output_buffer() = default;

    // Non-copyable, movable
    output_buffer(const output_buffer&) = delete;
    output_buffer& operator=(const output_buffer&) = delete;
    output_buffer(output_buffer&&) = default;
    output_buffer& operator=(output_buffer&&) = default;

    // Append data
    void append(std::string_view data);
    void append(std::span<const uint8_t> data);
    void append(const char* data, size_t size);

    // Access data
    std::span<const uint8_t> data() const noexcept;
    std::string_view view() const noexcept;
    size_t size() const noexcept;
    bool empty() const noexcept;

    void clear() noexcept;

    // Transfer ownership
    std::string release_string();

private:
    std::string buffer_;
};

// =============================================================================
// Receive Buffer Interface
// =============================================================================

// Limits applied while extracting lines from a receive_buffer
struct line_limits {
    size_t max_line_size = 8 * 1024;
    size_t max_block_size = 16 * 1024;
    bool allow_bare_lf = false;
};

// Append-only accumulator for unconsumed input. Bytes enter at the tail and
// leave from the head; nothing is ever rewritten in place.
//
// Views returned by the extract_* calls point into the buffer and stay valid
// until the next mutating call (append, extract_*, clear).
class receive_buffer {
public:
    receive_buffer() = default;

    receive_buffer(const receive_buffer&) = delete;
    receive_buffer& operator=(const receive_buffer&) = delete;
    receive_buffer(receive_buffer&&) = default;
    receive_buffer& operator=(receive_buffer&&) = default;

    void append(std::string_view data);

    size_t size() const noexcept { return data_.size() - start_; }
    bool empty() const noexcept { return size() == 0; }
    std::string_view view() const noexcept;

    // Consumes up to `count` bytes; empty view when nothing is buffered
    std::string_view extract_at_most(size_t count);

    // Consumes exactly `count` bytes, or nothing when fewer are buffered
    std::optional<std::string_view> extract_exact(size_t count);

    // Consumes one line, terminator excluded from the result. nullopt when the
    // line is not complete yet.
    std::expected<std::optional<std::string_view>, protocol_error>
    extract_line(const line_limits& limits);

    // Consumes a block of lines ending with an empty line. The empty line is
    // not part of the result; a buffer starting with an empty line yields an
    // empty vector. nullopt when the block is not complete yet.
    std::expected<std::optional<std::vector<std::string_view>>, protocol_error>
    extract_lines(const line_limits& limits);

    // True when the first buffered byte can never start a request line
    bool starts_with_invalid_request_byte() const noexcept;

    void clear() noexcept;

private:
    struct line_span {
        size_t offset;
        size_t length;
    };

    void compact();
    void consume(size_t count) noexcept;
    std::expected<std::optional<line_span>, protocol_error> scan_line(const line_limits& limits);

    std::string data_;
    size_t start_ = 0;

    // Resumable line scanning state, offsets relative to start_
    size_t scan_pos_ = 0;
    size_t line_begin_ = 0;
    std::vector<line_span> block_lines_;
};

} // namespace co::http_framing

// Include implementation
#include "detail/buffer_impl.hpp"
