#pragma once

#include "../writer.hpp"
#include <algorithm>
#include <charconv>

namespace co::http_framing {

// =============================================================================
// Outgoing Message Validation
// =============================================================================

inline std::expected<void, protocol_error> validate_outgoing(const request_line& line) {
    if (!detail::is_token(line.method)) {
        return make_error(error_code::invalid_method, "illegal method '" + line.method + "'");
    }
    if (line.target.empty() || !std::all_of(line.target.begin(), line.target.end(), detail::is_vchar)) {
        return make_error(error_code::invalid_target, "illegal request target '" + line.target + "'");
    }
    if (line.http_version != version::http_1_1) {
        return make_error(error_code::unsupported_version,
                          "can only send HTTP/1.1, not " + to_string(line.http_version));
    }
    return {};
}

inline std::expected<void, protocol_error> validate_outgoing(const response_line& line) {
    if (line.status_code < 200 || line.status_code > 999) {
        return make_error(error_code::invalid_status,
                          "final response status must be 200-999, got " + std::to_string(line.status_code));
    }
    if (!detail::is_field_text(line.reason)) {
        return make_error(error_code::invalid_start_line, "illegal reason phrase");
    }
    if (line.http_version != version::http_1_1) {
        return make_error(error_code::unsupported_version,
                          "can only send HTTP/1.1, not " + to_string(line.http_version));
    }
    return {};
}

inline std::expected<void, protocol_error> validate_outgoing(const informational_response& response) {
    if (response.status_code < 100 || response.status_code > 199) {
        return make_error(error_code::invalid_status,
                          "informational status must be 100-199, got " + std::to_string(response.status_code));
    }
    if (!detail::is_field_text(response.reason)) {
        return make_error(error_code::invalid_start_line, "illegal reason phrase");
    }
    if (response.http_version != version::http_1_1) {
        return make_error(error_code::unsupported_version,
                          "can only send HTTP/1.1, not " + to_string(response.http_version));
    }
    return validate_outgoing(response.fields);
}

inline std::expected<void, protocol_error> validate_outgoing(const header_list& fields) {
    for (const auto& h : fields) {
        if (!detail::is_token(h.name)) {
            return make_error(error_code::invalid_header, "illegal header name '" + h.name + "'");
        }
        // Leading or trailing whitespace would not survive a round trip
        if (!detail::is_field_text(h.value) || detail::trim_ows(h.value).size() != h.value.size()) {
            return make_error(error_code::invalid_header, "illegal value for header '" + h.name + "'");
        }
    }
    return {};
}

// =============================================================================
// Head Writers
// =============================================================================

namespace detail {

inline void append_status_line(unsigned int status, std::string_view reason, output_buffer& out) {
    out.append("HTTP/1.1 ");
    out.append(std::to_string(status));
    out.append(" ");
    out.append(reason.empty() ? reason_phrase(status) : reason);
    out.append("\r\n");
}

} // namespace detail

inline void write_request_line(const request_line& line, output_buffer& out) {
    out.append(line.method);
    out.append(" ");
    out.append(line.target);
    out.append(" HTTP/1.1\r\n");
}

inline void write_response_line(const response_line& line, output_buffer& out) {
    detail::append_status_line(line.status_code, line.reason, out);
}

inline void write_informational_response(const informational_response& response, output_buffer& out) {
    detail::append_status_line(response.status_code, response.reason, out);
    write_headers(response.fields, out);
}

inline void write_headers(const header_list& fields, output_buffer& out) {
    for (const auto& h : fields) {
        out.append(h.name);
        out.append(": ");
        out.append(h.value);
        out.append("\r\n");
    }
    out.append("\r\n");
}

// =============================================================================
// Content-Length Body Writer
// =============================================================================

inline std::expected<void, protocol_error> content_length_writer::write_data(std::string_view bytes,
                                                                           output_buffer& out) {
    if (bytes.size() > remaining_) {
        return make_error(error_code::body_too_long,
                          "too much data for declared Content-Length of " + std::to_string(length_));
    }
    remaining_ -= bytes.size();
    out.append(bytes);
    return {};
}

inline std::expected<void, protocol_error> content_length_writer::write_end(const header_list& trailers,
                                                                          output_buffer&) {
    if (remaining_ != 0) {
        return make_error(error_code::incomplete_body,
                          "too little data for declared Content-Length: sent " +
                              std::to_string(length_ - remaining_) + " of " + std::to_string(length_));
    }
    if (!trailers.empty()) {
        return make_error(error_code::invalid_trailer, "trailers require chunked encoding");
    }
    return {};
}

// =============================================================================
// Chunked Body Writer
// =============================================================================

inline std::expected<void, protocol_error> chunked_writer::write_data(std::string_view bytes, output_buffer& out) {
    // A zero-length chunk would terminate the body
    if (bytes.empty()) {
        return {};
    }
    char size[17];
    auto [ptr, ec] = std::to_chars(size, size + sizeof(size), bytes.size(), 16);
    out.append(size, static_cast<size_t>(ptr - size));
    out.append("\r\n");
    out.append(bytes);
    out.append("\r\n");
    return {};
}

inline std::expected<void, protocol_error> chunked_writer::write_end(const header_list& trailers, output_buffer& out) {
    for (auto name : {"content-length", "transfer-encoding", "host"}) {
        if (trailers.has(name)) {
            return make_error(error_code::invalid_trailer,
                              std::string("framing header '") + name + "' not allowed in trailers");
        }
    }
    if (auto valid = validate_outgoing(trailers); !valid) {
        return valid;
    }
    out.append("0\r\n");
    write_headers(trailers, out);
    return {};
}

// =============================================================================
// Close-Delimited Body Writer
// =============================================================================

inline std::expected<void, protocol_error> close_delimited_writer::write_data(std::string_view bytes,
                                                                            output_buffer& out) {
    out.append(bytes);
    return {};
}

inline std::expected<void, protocol_error> close_delimited_writer::write_end(const header_list& trailers,
                                                                           output_buffer&) {
    if (!trailers.empty()) {
        return make_error(error_code::invalid_trailer, "trailers require chunked encoding");
    }
    return {};
}

// =============================================================================
// Body Writer Dispatch
// =============================================================================

inline body_writer make_body_writer(framing_mode mode) {
    switch (mode.kind) {
        case framing_kind::content_length: return content_length_writer{mode.length};
        case framing_kind::chunked: return chunked_writer{};
        case framing_kind::close_delimited: return close_delimited_writer{};
        case framing_kind::no_body: break;
    }
    return content_length_writer{0};
}

inline std::expected<void, protocol_error> write_body(body_writer& writer, const event& ev, output_buffer& out) {
    if (const auto* d = std::get_if<data>(&ev)) {
        return std::visit([&](auto& w) { return w.write_data(d->bytes, out); }, writer);
    }
    if (const auto* eom = std::get_if<end_of_message>(&ev)) {
        return std::visit([&](auto& w) { return w.write_end(eom->trailers, out); }, writer);
    }
    return make_error(error_code::illegal_event, "body writer cannot write " + to_string(kind_of(ev)));
}

} // namespace co::http_framing
