#pragma once

#include "../framing.hpp"
#include <algorithm>
#include <charconv>

namespace co::http_framing {

namespace detail {

inline std::expected<uint64_t, protocol_error> parse_content_length(std::string_view value) {
    if (value.empty() || !std::all_of(value.begin(), value.end(), [](char c) { return c >= '0' && c <= '9'; })) {
        return make_error(error_code::invalid_content_length,
                          "bad Content-Length: '" + std::string(value) + "'");
    }
    // Anything past 2^64 - 1 comes back as result_out_of_range
    uint64_t length = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), length);
    if (ec != std::errc{} || ptr != value.data() + value.size()) {
        return make_error(error_code::invalid_content_length,
                          "bad Content-Length: '" + std::string(value) + "'");
    }
    return length;
}

} // namespace detail

inline std::expected<framing_headers, protocol_error> validate_framing_headers(const header_list& fields) {
    framing_headers out;

    auto has_te = fields.has("transfer-encoding");
    auto has_cl = fields.has("content-length");

    if (has_te && has_cl) {
        return make_error(error_code::ambiguous_framing,
                          "message has both Transfer-Encoding and Content-Length");
    }

    if (has_te) {
        auto codings = fields.get_comma_values("transfer-encoding");
        if (codings.empty() || codings.back() != "chunked") {
            return make_error(error_code::unsupported_transfer_encoding,
                              "final transfer coding is not chunked", 501);
        }
        if (std::count(codings.begin(), codings.end(), "chunked") > 1) {
            return make_error(error_code::unsupported_transfer_encoding,
                              "chunked applied more than once");
        }
        out.chunked = true;
        return out;
    }

    if (has_cl) {
        auto values = fields.get_comma_values("content-length");
        if (values.empty()) {
            return make_error(error_code::invalid_content_length, "empty Content-Length");
        }
        std::optional<uint64_t> length;
        for (const auto& v : values) {
            auto parsed = detail::parse_content_length(v);
            if (!parsed) {
                return std::unexpected(parsed.error());
            }
            if (length && *length != *parsed) {
                return make_error(error_code::conflicting_content_length,
                                  "conflicting Content-Length values");
            }
            length = *parsed;
        }
        out.content_length = length;
    }

    return out;
}

inline std::expected<framing_mode, protocol_error> request_framing(const header_list& fields) {
    auto validated = validate_framing_headers(fields);
    if (!validated) {
        return std::unexpected(validated.error());
    }
    if (validated->chunked) {
        return framing_mode::chunked();
    }
    if (validated->content_length) {
        return framing_mode::content_length(*validated->content_length);
    }
    return framing_mode::no_body();
}

inline std::expected<framing_mode, protocol_error> response_framing(std::string_view request_method,
                                                                    unsigned int status_code,
                                                                    const header_list& fields) {
    auto validated = validate_framing_headers(fields);
    if (!validated) {
        return std::unexpected(validated.error());
    }

    if (request_method == "HEAD" || status_code == 204 || status_code == 304 || status_code < 200 ||
        (request_method == "CONNECT" && status_code >= 200 && status_code < 300)) {
        return framing_mode::no_body();
    }
    if (validated->chunked) {
        return framing_mode::chunked();
    }
    if (validated->content_length) {
        return framing_mode::content_length(*validated->content_length);
    }
    return framing_mode::close_delimited();
}

inline bool keep_alive(version v, const header_list& fields) {
    auto tokens = fields.get_comma_values("connection");
    if (std::find(tokens.begin(), tokens.end(), "close") != tokens.end()) {
        return false;
    }
    // HTTP/1.0 closes unless the peer opted in
    if (v == version::http_1_0) {
        return std::find(tokens.begin(), tokens.end(), "keep-alive") != tokens.end();
    }
    return true;
}

inline bool has_expect_100_continue(version v, const header_list& fields) {
    // HTTP/1.0 peers cannot send 100 Continue
    if (v == version::http_1_0) {
        return false;
    }
    auto expect = fields.get_comma_values("expect");
    return std::find(expect.begin(), expect.end(), "100-continue") != expect.end();
}

inline std::string to_string(framing_kind k) {
    switch (k) {
        case framing_kind::no_body: return "no-body";
        case framing_kind::content_length: return "content-length";
        case framing_kind::chunked: return "chunked";
        case framing_kind::close_delimited: return "close-delimited";
    }
    return "unknown";
}

} // namespace co::http_framing
