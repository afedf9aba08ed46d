#pragma once

#include "../core.hpp"
#include <algorithm>
#include <cctype>
#include <iterator>

namespace co::http_framing {

namespace detail {

inline char to_lower(char c) noexcept {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

inline bool iequals(std::string_view a, std::string_view b) noexcept {
    return std::equal(a.begin(), a.end(), b.begin(), b.end(),
        [](char ca, char cb) { return to_lower(ca) == to_lower(cb); });
}

inline std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](char c) { return to_lower(c); });
    return out;
}

// Strips optional whitespace (SP / HTAB) on both ends
inline std::string_view trim_ows(std::string_view str) noexcept {
    auto start = str.find_first_not_of(" \t");
    if (start == std::string_view::npos) {
        return {};
    }
    auto end = str.find_last_not_of(" \t");
    return str.substr(start, end - start + 1);
}

// RFC 9110 tchar
inline bool is_tchar(char c) noexcept {
    auto u = static_cast<unsigned char>(c);
    if (std::isalnum(u)) {
        return true;
    }
    switch (c) {
        case '!': case '#': case '$': case '%': case '&': case '\'': case '*':
        case '+': case '-': case '.': case '^': case '_': case '`': case '|': case '~':
            return true;
        default:
            return false;
    }
}

inline bool is_token(std::string_view s) noexcept {
    return !s.empty() && std::all_of(s.begin(), s.end(), is_tchar);
}

// Visible ASCII, no space
inline bool is_vchar(char c) noexcept {
    auto u = static_cast<unsigned char>(c);
    return u >= 0x21 && u <= 0x7e;
}

// Field values and reason phrases: anything but control characters, HTAB allowed
inline bool is_field_text(std::string_view s) noexcept {
    return std::all_of(s.begin(), s.end(), [](char c) {
        auto u = static_cast<unsigned char>(c);
        return c == '\t' || (u >= 0x20 && u != 0x7f);
    });
}

} // namespace detail

// =============================================================================
// Header List Implementation
// =============================================================================

inline std::optional<std::string_view> header_list::get(std::string_view name) const noexcept {
    auto it = std::find_if(fields_.begin(), fields_.end(),
        [name](const header& h) { return detail::iequals(h.name, name); });

    if (it != fields_.end()) {
        return std::string_view{it->value};
    }
    return std::nullopt;
}

inline std::vector<std::string_view> header_list::get_all(std::string_view name) const {
    std::vector<std::string_view> values;
    for (const auto& h : fields_) {
        if (detail::iequals(h.name, name)) {
            values.emplace_back(h.value);
        }
    }
    return values;
}

inline bool header_list::has(std::string_view name) const noexcept {
    return get(name).has_value();
}

inline size_t header_list::count(std::string_view name) const noexcept {
    return static_cast<size_t>(std::count_if(fields_.begin(), fields_.end(),
        [name](const header& h) { return detail::iequals(h.name, name); }));
}

inline std::vector<std::string> header_list::get_comma_values(std::string_view name) const {
    std::vector<std::string> out;
    for (const auto& h : fields_) {
        if (!detail::iequals(h.name, name)) {
            continue;
        }
        std::string_view rest{h.value};
        while (true) {
            auto comma = rest.find(',');
            auto item = detail::trim_ows(rest.substr(0, comma));
            if (!item.empty()) {
                out.push_back(detail::to_lower(item));
            }
            if (comma == std::string_view::npos) {
                break;
            }
            rest.remove_prefix(comma + 1);
        }
    }
    return out;
}

inline void header_list::add(std::string name, std::string value) {
    fields_.emplace_back(std::move(name), std::move(value));
}

inline void header_list::set(std::string name, std::string value) {
    auto it = std::find_if(fields_.begin(), fields_.end(),
        [&name](const header& h) { return detail::iequals(h.name, name); });

    if (it != fields_.end()) {
        it->value = std::move(value);
        // Drop any later duplicates so `set` leaves exactly one field
        fields_.erase(
            std::remove_if(std::next(it), fields_.end(),
                [&name](const header& h) { return detail::iequals(h.name, name); }),
            fields_.end());
    } else {
        add(std::move(name), std::move(value));
    }
}

inline void header_list::remove(std::string_view name) {
    fields_.erase(
        std::remove_if(fields_.begin(), fields_.end(),
            [name](const header& h) { return detail::iequals(h.name, name); }),
        fields_.end());
}

inline void header_list::set_comma_values(std::string_view name,
                                          const std::vector<std::string>& values) {
    // Keep the spelling the caller already used for this field, if any
    std::string spelled{name};
    for (const auto& h : fields_) {
        if (detail::iequals(h.name, name)) {
            spelled = h.name;
            break;
        }
    }
    remove(name);
    if (values.empty()) {
        return;
    }
    std::string joined;
    for (const auto& v : values) {
        if (!joined.empty()) {
            joined += ", ";
        }
        joined += v;
    }
    add(std::move(spelled), std::move(joined));
}

// =============================================================================
// Utility Functions
// =============================================================================

inline method method_from_string(std::string_view m) noexcept {
    if (m == "GET") return method::get;
    if (m == "POST") return method::post;
    if (m == "PUT") return method::put;
    if (m == "DELETE") return method::delete_;
    if (m == "HEAD") return method::head;
    if (m == "OPTIONS") return method::options;
    if (m == "TRACE") return method::trace;
    if (m == "CONNECT") return method::connect;
    if (m == "PATCH") return method::patch;
    return method::unknown;
}

inline std::string to_string(version v) {
    switch (v) {
        case version::http_1_0: return "HTTP/1.0";
        case version::http_1_1: return "HTTP/1.1";
    }
    return "UNKNOWN";
}

inline std::string to_string(role r) {
    switch (r) {
        case role::client: return "client";
        case role::server: return "server";
    }
    return "unknown";
}

inline std::string to_string(method m) {
    switch (m) {
        case method::get: return "GET";
        case method::post: return "POST";
        case method::put: return "PUT";
        case method::delete_: return "DELETE";
        case method::head: return "HEAD";
        case method::options: return "OPTIONS";
        case method::trace: return "TRACE";
        case method::connect: return "CONNECT";
        case method::patch: return "PATCH";
        case method::unknown: return "UNKNOWN";
    }
    return "UNKNOWN";
}

inline std::string to_string(error_code e) {
    switch (e) {
        case error_code::success: return "Success";
        case error_code::invalid_start_line: return "Invalid start line";
        case error_code::invalid_method: return "Invalid method";
        case error_code::invalid_target: return "Invalid request target";
        case error_code::invalid_version: return "Invalid version";
        case error_code::invalid_status: return "Invalid status code";
        case error_code::invalid_header: return "Invalid header";
        case error_code::obsolete_line_folding: return "Obsolete line folding";
        case error_code::bare_line_feed: return "Bare line feed";
        case error_code::missing_host: return "Missing Host header";
        case error_code::duplicate_host: return "Duplicate Host header";
        case error_code::invalid_content_length: return "Invalid Content-Length";
        case error_code::conflicting_content_length: return "Conflicting Content-Length";
        case error_code::unsupported_transfer_encoding: return "Unsupported Transfer-Encoding";
        case error_code::ambiguous_framing: return "Ambiguous message framing";
        case error_code::invalid_chunk: return "Invalid chunk";
        case error_code::invalid_trailer: return "Invalid trailer";
        case error_code::incomplete_body: return "Incomplete body";
        case error_code::body_too_long: return "Body exceeds declared length";
        case error_code::unexpected_data: return "Unexpected data";
        case error_code::unexpected_close: return "Unexpected close";
        case error_code::line_too_long: return "Line too long";
        case error_code::header_block_too_large: return "Header block too large";
        case error_code::illegal_event: return "Illegal event for current state";
        case error_code::unsupported_version: return "Unsupported version";
        case error_code::unexpected_switch: return "Unexpected protocol switch";
        case error_code::connection_closed: return "Connection closed";
        case error_code::connection_error: return "Connection error";
        case error_code::not_reusable: return "Connection not reusable";
    }
    return "Unknown error";
}

inline std::string_view reason_phrase(unsigned int status) noexcept {
    switch (status) {
        // 1xx Informational
        case 100: return "Continue";
        case 101: return "Switching Protocols";
        case 102: return "Processing";
        case 103: return "Early Hints";

        // 2xx Success
        case 200: return "OK";
        case 201: return "Created";
        case 202: return "Accepted";
        case 203: return "Non-Authoritative Information";
        case 204: return "No Content";
        case 205: return "Reset Content";
        case 206: return "Partial Content";

        // 3xx Redirection
        case 300: return "Multiple Choices";
        case 301: return "Moved Permanently";
        case 302: return "Found";
        case 303: return "See Other";
        case 304: return "Not Modified";
        case 307: return "Temporary Redirect";
        case 308: return "Permanent Redirect";

        // 4xx Client Error
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 408: return "Request Timeout";
        case 409: return "Conflict";
        case 410: return "Gone";
        case 411: return "Length Required";
        case 413: return "Content Too Large";
        case 414: return "URI Too Long";
        case 415: return "Unsupported Media Type";
        case 417: return "Expectation Failed";
        case 426: return "Upgrade Required";
        case 429: return "Too Many Requests";
        case 431: return "Request Header Fields Too Large";

        // 5xx Server Error
        case 500: return "Internal Server Error";
        case 501: return "Not Implemented";
        case 502: return "Bad Gateway";
        case 503: return "Service Unavailable";
        case 504: return "Gateway Timeout";
        case 505: return "HTTP Version Not Supported";
    }
    return {};
}

} // namespace co::http_framing
