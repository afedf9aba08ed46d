#pragma once

#include <cstdint>
#include <expected>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace co::http_framing {

// =============================================================================
// Core Types and Enums
// =============================================================================

enum class version {
    http_1_0,
    http_1_1
};

enum class role {
    client,
    server
};

enum class method {
    get, post, put, delete_, head, options, trace, connect, patch, unknown
};

enum class error_code {
    success = 0,

    // Start line / header syntax
    invalid_start_line,
    invalid_method,
    invalid_target,
    invalid_version,
    invalid_status,
    invalid_header,
    obsolete_line_folding,
    bare_line_feed,
    missing_host,
    duplicate_host,

    // Body framing
    invalid_content_length,
    conflicting_content_length,
    unsupported_transfer_encoding,
    ambiguous_framing,
    invalid_chunk,
    invalid_trailer,
    incomplete_body,
    body_too_long,
    unexpected_data,
    unexpected_close,

    // Resource exhaustion
    line_too_long,
    header_block_too_large,

    // Connection state
    illegal_event,
    unsupported_version,
    unexpected_switch,
    connection_closed,
    connection_error,
    not_reusable
};

// Header representation
struct header {
    std::string name;
    std::string value;

    header() = default;
    header(std::string n, std::string v)
        : name(std::move(n)), value(std::move(v)) {}

    bool operator==(const header&) const = default;
};

// Ordered header fields. Names keep the case they were received or supplied
// with; every lookup is case-insensitive.
class header_list {
public:
    header_list() = default;
    header_list(std::initializer_list<header> fields) : fields_(fields) {}

    std::optional<std::string_view> get(std::string_view name) const noexcept;
    std::vector<std::string_view> get_all(std::string_view name) const;
    bool has(std::string_view name) const noexcept;
    size_t count(std::string_view name) const noexcept;

    // Comma-separated values of every field called `name`, trimmed and
    // lowercased, empty elements dropped.
    std::vector<std::string> get_comma_values(std::string_view name) const;

    void add(std::string name, std::string value);
    void set(std::string name, std::string value);
    void remove(std::string_view name);
    // Replaces every `name` field by one field joining `values`, or removes
    // it when `values` is empty.
    void set_comma_values(std::string_view name, const std::vector<std::string>& values);

    auto begin() const noexcept { return fields_.begin(); }
    auto end() const noexcept { return fields_.end(); }
    size_t size() const noexcept { return fields_.size(); }
    bool empty() const noexcept { return fields_.empty(); }
    const header& operator[](size_t i) const { return fields_[i]; }
    const std::vector<header>& fields() const noexcept { return fields_; }

    bool operator==(const header_list&) const = default;

private:
    std::vector<header> fields_;
};

// =============================================================================
// Errors
// =============================================================================

struct protocol_error {
    error_code code = error_code::success;
    std::string message;
    // Status a server would answer with if it reports the failure to its peer
    unsigned int status_hint = 400;
};

// The local caller misused the API: out-of-order event, declared
// Content-Length exceeded, call after closure.
struct local_protocol_error : protocol_error {
    local_protocol_error() = default;
    explicit local_protocol_error(protocol_error e) : protocol_error(std::move(e)) {}
};

// The peer sent malformed or ambiguous bytes.
struct remote_protocol_error : protocol_error {
    remote_protocol_error() = default;
    explicit remote_protocol_error(protocol_error e) : protocol_error(std::move(e)) {}
};

inline std::unexpected<protocol_error> make_error(error_code code, std::string message,
                                                  unsigned int status_hint = 400) {
    return std::unexpected(protocol_error{code, std::move(message), status_hint});
}

constexpr bool is_resource_exhaustion(error_code e) noexcept {
    return e == error_code::line_too_long || e == error_code::header_block_too_large;
}

std::string to_string(version v);
std::string to_string(role r);
std::string to_string(method m);
std::string to_string(error_code e);

method method_from_string(std::string_view m) noexcept;

// Standard reason phrase for `status`, empty when unknown
std::string_view reason_phrase(unsigned int status) noexcept;

constexpr role opposite(role r) noexcept {
    return r == role::client ? role::server : role::client;
}

} // namespace co::http_framing

// Include implementation
#include "detail/core_impl.hpp"
