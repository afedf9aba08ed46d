#pragma once

#include "core.hpp"
#include <string>
#include <string_view>
#include <variant>

namespace co::http_framing {

// =============================================================================
// Protocol Events
// =============================================================================

struct request_line {
    std::string method;
    std::string target;
    version http_version = version::http_1_1;

    co::http_framing::method method_type() const noexcept { return method_from_string(method); }

    bool operator==(const request_line&) const = default;
};

// Final (non-1xx) response status line
struct response_line {
    unsigned int status_code = 200;
    std::string reason;
    version http_version = version::http_1_1;

    bool operator==(const response_line&) const = default;
};

// Header block following a request_line or response_line
struct headers {
    header_list fields;

    bool operator==(const headers&) const = default;
};

// 1xx response: status line and header block in one event, never a body
struct informational_response {
    unsigned int status_code = 100;
    std::string reason;
    header_list fields;
    version http_version = version::http_1_1;

    bool operator==(const informational_response&) const = default;
};

// A piece of message body. When produced by the parser, `bytes` points into
// the connection's receive buffer and is only valid until the next call on
// that connection; copy it to keep it.
struct data {
    std::string_view bytes;
    bool chunk_start = false;
    bool chunk_end = false;

    bool operator==(const data& other) const noexcept { return bytes == other.bytes; }
};

struct end_of_message {
    header_list trailers;

    bool operator==(const end_of_message&) const = default;
};

struct connection_closed {
    bool operator==(const connection_closed&) const = default;
};

using event = std::variant<request_line, response_line, headers, informational_response,
                           data, end_of_message, connection_closed>;

// Same order as the alternatives of `event`
enum class event_kind {
    request_line,
    response_line,
    headers,
    informational_response,
    data,
    end_of_message,
    connection_closed
};

inline event_kind kind_of(const event& ev) noexcept {
    return static_cast<event_kind>(ev.index());
}

// =============================================================================
// Receive Sentinels
// =============================================================================

// More bytes are needed before the next event can be produced
struct need_data {
    bool operator==(const need_data&) const = default;
};

// The peer is a full message ahead (or switched protocols); nothing more is
// parsed until start_next_cycle() or the caller takes over the stream
struct paused {
    bool operator==(const paused&) const = default;
};

using next_event_result = std::variant<event, need_data, paused>;

inline bool is_need_data(const next_event_result& r) noexcept {
    return std::holds_alternative<need_data>(r);
}

inline bool is_paused(const next_event_result& r) noexcept {
    return std::holds_alternative<paused>(r);
}

inline const event* get_event(const next_event_result& r) noexcept {
    return std::get_if<event>(&r);
}

std::string to_string(event_kind k);

} // namespace co::http_framing

// Include implementation
#include "detail/events_impl.hpp"
