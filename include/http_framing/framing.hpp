#pragma once

#include "core.hpp"
#include <cstdint>

namespace co::http_framing {

// =============================================================================
// Body Framing Policy
// =============================================================================

enum class framing_kind {
    no_body,
    content_length,
    chunked,
    close_delimited
};

// How one message body is delimited. Fixed when the header block is
// processed and discarded at end of message.
struct framing_mode {
    framing_kind kind = framing_kind::no_body;
    uint64_t length = 0;

    static constexpr framing_mode no_body() noexcept { return {framing_kind::no_body, 0}; }
    static constexpr framing_mode content_length(uint64_t n) noexcept { return {framing_kind::content_length, n}; }
    static constexpr framing_mode chunked() noexcept { return {framing_kind::chunked, 0}; }
    static constexpr framing_mode close_delimited() noexcept { return {framing_kind::close_delimited, 0}; }

    bool operator==(const framing_mode&) const = default;
};

// Framing-relevant facts extracted from a header block
struct framing_headers {
    bool chunked = false;
    std::optional<uint64_t> content_length;
};

// Rejects every ambiguous combination of Content-Length and
// Transfer-Encoding: malformed or differing lengths, both headers at once,
// a final coding other than chunked, chunked applied twice.
std::expected<framing_headers, protocol_error> validate_framing_headers(const header_list& fields);

std::expected<framing_mode, protocol_error> request_framing(const header_list& fields);

// `request_method` is the method of the request being answered; empty when
// the response is sent before any request was seen.
std::expected<framing_mode, protocol_error> response_framing(std::string_view request_method,
                                                             unsigned int status_code,
                                                             const header_list& fields);

// Whether the connection may carry another message after this one.
// HTTP/1.1 unless "Connection: close"; HTTP/1.0 only with
// "Connection: keep-alive".
bool keep_alive(version v, const header_list& fields);

bool has_expect_100_continue(version v, const header_list& fields);

std::string to_string(framing_kind k);

} // namespace co::http_framing

// Include implementation
#include "detail/framing_impl.hpp"
