#pragma once

#include "buffer.hpp"
#include "core.hpp"
#include "events.hpp"
#include "framing.hpp"
#include "options.hpp"
#include <span>
#include <variant>

namespace co::http_framing {

// =============================================================================
// Start Line and Header Parsing
// =============================================================================

// Status line of a response, before it is split into an
// informational_response or a response_line event
struct status_line {
    version http_version = version::http_1_1;
    unsigned int status_code = 0;
    std::string reason;
};

std::expected<version, protocol_error> parse_http_version(std::string_view text);
std::expected<request_line, protocol_error> parse_request_line(std::string_view line);
std::expected<status_line, protocol_error> parse_status_line(std::string_view line);

// One line per element, terminators already stripped
std::expected<header_list, protocol_error> parse_header_lines(std::span<const std::string_view> lines,
                                                              obs_fold_policy fold);

// =============================================================================
// Head Readers
// =============================================================================

struct request_head {
    request_line line;
    header_list fields;
};

struct response_head {
    status_line line;
    header_list fields;
};

// Each reader consumes a complete head (start line, header block, empty line)
// or nothing at all. nullopt means more bytes are needed.
std::expected<std::optional<request_head>, protocol_error>
read_request_head(receive_buffer& buffer, const connection_options& options);

std::expected<std::optional<response_head>, protocol_error>
read_response_head(receive_buffer& buffer, const connection_options& options);

// =============================================================================
// Body Readers
// =============================================================================

class content_length_reader {
public:
    explicit content_length_reader(uint64_t length) noexcept
        : length_(length), remaining_(length) {}

    std::expected<std::optional<event>, protocol_error> read(receive_buffer& buffer);
    std::expected<event, protocol_error> read_eof() const;

    uint64_t remaining() const noexcept { return remaining_; }

private:
    uint64_t length_;
    uint64_t remaining_;
};

class chunked_reader {
public:
    chunked_reader() = default;

    std::expected<std::optional<event>, protocol_error> read(receive_buffer& buffer,
                                                             const connection_options& options);
    std::expected<event, protocol_error> read_eof() const;

private:
    enum class state {
        chunk_size,
        chunk_data,
        chunk_crlf,
        trailers,
        complete
    };

    // false when the chunk-size line is not complete yet
    std::expected<bool, protocol_error> read_chunk_header(receive_buffer& buffer,
                                                          const connection_options& options);

    state state_ = state::chunk_size;
    uint64_t remaining_ = 0;
    bool chunk_start_ = false;
};

// Body runs until the peer closes the connection
class close_delimited_reader {
public:
    std::expected<std::optional<event>, protocol_error> read(receive_buffer& buffer);
    std::expected<event, protocol_error> read_eof() const;
};

using body_reader = std::variant<content_length_reader, chunked_reader, close_delimited_reader>;

// no_body is read as a zero-length content-length body
body_reader make_body_reader(framing_mode mode);

// Next data or end_of_message event; nullopt when more bytes are needed
std::expected<std::optional<event>, protocol_error> read_body(body_reader& reader, receive_buffer& buffer,
                                                              const connection_options& options);

// Called when the peer closed the connection and the buffer is drained
std::expected<event, protocol_error> read_body_eof(const body_reader& reader);

} // namespace co::http_framing

// Include implementation
#include "detail/parser_impl.hpp"
