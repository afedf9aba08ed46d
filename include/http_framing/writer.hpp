#pragma once

#include "buffer.hpp"
#include "core.hpp"
#include "events.hpp"
#include "framing.hpp"
#include <variant>

namespace co::http_framing {

// =============================================================================
// Outgoing Message Validation
// =============================================================================

// Checks an outgoing start line or header block before anything is written.
// Only HTTP/1.1 is ever serialized.
std::expected<void, protocol_error> validate_outgoing(const request_line& line);
std::expected<void, protocol_error> validate_outgoing(const response_line& line);
std::expected<void, protocol_error> validate_outgoing(const informational_response& response);
std::expected<void, protocol_error> validate_outgoing(const header_list& fields);

// =============================================================================
// Head Writers
// =============================================================================

void write_request_line(const request_line& line, output_buffer& out);

// An empty reason is replaced by the standard phrase for the status
void write_response_line(const response_line& line, output_buffer& out);
void write_informational_response(const informational_response& response, output_buffer& out);

// Header fields followed by the empty line closing the block
void write_headers(const header_list& fields, output_buffer& out);

// =============================================================================
// Body Writers
// =============================================================================

class content_length_writer {
public:
    explicit content_length_writer(uint64_t length) noexcept
        : length_(length), remaining_(length) {}

    std::expected<void, protocol_error> write_data(std::string_view bytes, output_buffer& out);
    std::expected<void, protocol_error> write_end(const header_list& trailers, output_buffer& out);

private:
    uint64_t length_;
    uint64_t remaining_;
};

class chunked_writer {
public:
    std::expected<void, protocol_error> write_data(std::string_view bytes, output_buffer& out);
    std::expected<void, protocol_error> write_end(const header_list& trailers, output_buffer& out);
};

class close_delimited_writer {
public:
    std::expected<void, protocol_error> write_data(std::string_view bytes, output_buffer& out);
    std::expected<void, protocol_error> write_end(const header_list& trailers, output_buffer& out);
};

using body_writer = std::variant<content_length_writer, chunked_writer, close_delimited_writer>;

// no_body is written as a zero-length content-length body
body_writer make_body_writer(framing_mode mode);

// Writes a data or end_of_message event; any other event is illegal here
std::expected<void, protocol_error> write_body(body_writer& writer, const event& ev, output_buffer& out);

} // namespace co::http_framing

// Include implementation
#include "detail/writer_impl.hpp"
