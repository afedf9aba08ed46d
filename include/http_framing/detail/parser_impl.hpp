#pragma once

#include "../parser.hpp"
#include <algorithm>
#include <charconv>
#include <limits>
#include <type_traits>

namespace co::http_framing {

// =============================================================================
// Start Line Parsing
// =============================================================================

inline std::expected<version, protocol_error> parse_http_version(std::string_view text) {
    if (text.size() != 8 || !text.starts_with("HTTP/") || text[6] != '.' ||
        !std::isdigit(static_cast<unsigned char>(text[5])) ||
        !std::isdigit(static_cast<unsigned char>(text[7]))) {
        return make_error(error_code::invalid_version, "malformed HTTP version '" + std::string(text) + "'");
    }
    if (text == "HTTP/1.1") {
        return version::http_1_1;
    }
    if (text == "HTTP/1.0") {
        return version::http_1_0;
    }
    return make_error(error_code::unsupported_version, "unsupported HTTP version " + std::string(text), 505);
}

inline std::expected<request_line, protocol_error> parse_request_line(std::string_view line) {
    auto method_end = line.find(' ');
    if (method_end == std::string_view::npos) {
        return make_error(error_code::invalid_start_line, "illegal request line");
    }
    auto target_end = line.find(' ', method_end + 1);
    if (target_end == std::string_view::npos) {
        return make_error(error_code::invalid_start_line, "illegal request line");
    }

    auto method_str = line.substr(0, method_end);
    auto target = line.substr(method_end + 1, target_end - method_end - 1);
    auto version_str = line.substr(target_end + 1);

    if (!detail::is_token(method_str)) {
        return make_error(error_code::invalid_method, "illegal method '" + std::string(method_str) + "'");
    }
    if (target.empty() || !std::all_of(target.begin(), target.end(), detail::is_vchar)) {
        return make_error(error_code::invalid_target, "illegal request target");
    }

    auto ver = parse_http_version(version_str);
    if (!ver) {
        return std::unexpected(ver.error());
    }

    request_line out;
    out.method = std::string(method_str);
    out.target = std::string(target);
    out.http_version = *ver;
    return out;
}

inline std::expected<status_line, protocol_error> parse_status_line(std::string_view line) {
    auto version_end = line.find(' ');
    if (version_end == std::string_view::npos) {
        return make_error(error_code::invalid_start_line, "illegal status line");
    }

    auto ver = parse_http_version(line.substr(0, version_end));
    if (!ver) {
        return std::unexpected(ver.error());
    }

    auto rest = line.substr(version_end + 1);
    if (rest.size() < 3 || (rest.size() > 3 && rest[3] != ' ')) {
        return make_error(error_code::invalid_status, "illegal status code");
    }
    auto code = rest.substr(0, 3);
    if (!std::all_of(code.begin(), code.end(), [](char c) { return c >= '0' && c <= '9'; })) {
        return make_error(error_code::invalid_status, "illegal status code '" + std::string(code) + "'");
    }

    status_line out;
    out.http_version = *ver;
    std::from_chars(code.data(), code.data() + code.size(), out.status_code);
    if (out.status_code < 100) {
        return make_error(error_code::invalid_status, "status code " + std::string(code) + " out of range");
    }

    if (rest.size() > 3) {
        auto reason = rest.substr(4);
        if (!detail::is_field_text(reason)) {
            return make_error(error_code::invalid_start_line, "illegal reason phrase");
        }
        out.reason = std::string(reason);
    }
    return out;
}

// =============================================================================
// Header Block Parsing
// =============================================================================

inline std::expected<header_list, protocol_error> parse_header_lines(std::span<const std::string_view> lines,
                                                                     obs_fold_policy fold) {
    header_list out;
    std::optional<header> current;

    for (auto line : lines) {
        if (line.front() == ' ' || line.front() == '\t') {
            if (fold == obs_fold_policy::reject) {
                return make_error(error_code::obsolete_line_folding, "obsolete line folding in header block");
            }
            if (!current) {
                return make_error(error_code::invalid_header, "continuation line at start of headers");
            }
            auto continuation = detail::trim_ows(line);
            if (!detail::is_field_text(continuation)) {
                return make_error(error_code::invalid_header,
                                  "illegal character in value of header '" + current->name + "'");
            }
            if (!continuation.empty()) {
                if (!current->value.empty()) {
                    current->value += ' ';
                }
                current->value += continuation;
            }
            continue;
        }

        auto colon = line.find(':');
        if (colon == std::string_view::npos) {
            return make_error(error_code::invalid_header, "header line without ':'");
        }
        auto name = line.substr(0, colon);
        // Also rejects whitespace between the name and the colon
        if (!detail::is_token(name)) {
            return make_error(error_code::invalid_header, "illegal header name '" + std::string(name) + "'");
        }
        auto value = detail::trim_ows(line.substr(colon + 1));
        if (!detail::is_field_text(value)) {
            return make_error(error_code::invalid_header,
                              "illegal character in value of header '" + std::string(name) + "'");
        }

        if (current) {
            out.add(std::move(current->name), std::move(current->value));
        }
        current.emplace(std::string(name), std::string(value));
    }

    if (current) {
        out.add(std::move(current->name), std::move(current->value));
    }
    return out;
}

// =============================================================================
// Head Readers
// =============================================================================

inline std::expected<std::optional<request_head>, protocol_error>
read_request_head(receive_buffer& buffer, const connection_options& options) {
    // A TLS handshake or other binary garbage is refused on its first byte
    if (buffer.starts_with_invalid_request_byte()) {
        return make_error(error_code::invalid_start_line, "illegal request line");
    }

    auto lines = buffer.extract_lines(options.limits());
    if (!lines) {
        return std::unexpected(lines.error());
    }
    if (!*lines) {
        return std::optional<request_head>{};
    }
    if ((*lines)->empty()) {
        return make_error(error_code::invalid_start_line, "no request line received");
    }

    const auto& block = **lines;
    auto line = parse_request_line(block.front());
    if (!line) {
        return std::unexpected(line.error());
    }
    auto fields = parse_header_lines(std::span<const std::string_view>(block).subspan(1), options.obs_fold);
    if (!fields) {
        return std::unexpected(fields.error());
    }

    if (line->http_version == version::http_1_1) {
        auto hosts = fields->count("host");
        if (hosts == 0) {
            return make_error(error_code::missing_host, "missing mandatory Host header");
        }
        if (hosts > 1) {
            return make_error(error_code::duplicate_host, "found multiple Host headers");
        }
    }

    auto framing = validate_framing_headers(*fields);
    if (!framing) {
        return std::unexpected(framing.error());
    }

    return std::optional<request_head>{request_head{std::move(*line), std::move(*fields)}};
}

inline std::expected<std::optional<response_head>, protocol_error>
read_response_head(receive_buffer& buffer, const connection_options& options) {
    auto lines = buffer.extract_lines(options.limits());
    if (!lines) {
        return std::unexpected(lines.error());
    }
    if (!*lines) {
        return std::optional<response_head>{};
    }
    if ((*lines)->empty()) {
        return make_error(error_code::invalid_start_line, "no response line received");
    }

    const auto& block = **lines;
    auto line = parse_status_line(block.front());
    if (!line) {
        return std::unexpected(line.error());
    }
    auto fields = parse_header_lines(std::span<const std::string_view>(block).subspan(1), options.obs_fold);
    if (!fields) {
        return std::unexpected(fields.error());
    }

    if (line->status_code >= 200) {
        auto framing = validate_framing_headers(*fields);
        if (!framing) {
            return std::unexpected(framing.error());
        }
    }

    return std::optional<response_head>{response_head{std::move(*line), std::move(*fields)}};
}

// =============================================================================
// Content-Length Body Reader
// =============================================================================

namespace detail {

inline size_t clamp_to_size(uint64_t n) noexcept {
    return n > std::numeric_limits<size_t>::max() ? std::numeric_limits<size_t>::max()
                                                  : static_cast<size_t>(n);
}

} // namespace detail

inline std::expected<std::optional<event>, protocol_error> content_length_reader::read(receive_buffer& buffer) {
    if (remaining_ == 0) {
        return std::optional<event>{end_of_message{}};
    }
    auto bytes = buffer.extract_at_most(detail::clamp_to_size(remaining_));
    if (bytes.empty()) {
        return std::optional<event>{};
    }
    remaining_ -= bytes.size();
    return std::optional<event>{data{bytes}};
}

inline std::expected<event, protocol_error> content_length_reader::read_eof() const {
    return make_error(error_code::incomplete_body,
                      "peer closed connection without sending complete message body: received " +
                          std::to_string(length_ - remaining_) + " bytes, expected " + std::to_string(length_));
}

// =============================================================================
// Chunked Body Reader
// =============================================================================

inline std::expected<bool, protocol_error> chunked_reader::read_chunk_header(receive_buffer& buffer,
                                                                           const connection_options& options) {
    auto line = buffer.extract_line(options.limits());
    if (!line) {
        return std::unexpected(line.error());
    }
    if (!*line) {
        return false;
    }

    // chunk-size [ BWS ";" chunk-ext ], extensions are ignored
    auto text = **line;
    auto size_part = text.substr(0, text.find(';'));
    auto end = size_part.find_last_not_of(" \t");
    size_part = end == std::string_view::npos ? std::string_view{} : size_part.substr(0, end + 1);

    if (size_part.empty() || size_part.size() > 16 ||
        !std::all_of(size_part.begin(), size_part.end(),
                     [](char c) { return std::isxdigit(static_cast<unsigned char>(c)) != 0; })) {
        return make_error(error_code::invalid_chunk, "illegal chunk header '" + std::string(text) + "'");
    }

    uint64_t size = 0;
    std::from_chars(size_part.data(), size_part.data() + size_part.size(), size, 16);

    if (size == 0) {
        state_ = state::trailers;
    } else {
        remaining_ = size;
        chunk_start_ = true;
        state_ = state::chunk_data;
    }
    return true;
}

inline std::expected<std::optional<event>, protocol_error> chunked_reader::read(receive_buffer& buffer,
                                                                              const connection_options& options) {
    while (true) {
        switch (state_) {
            case state::chunk_size: {
                auto got = read_chunk_header(buffer, options);
                if (!got) {
                    return std::unexpected(got.error());
                }
                if (!*got) {
                    return std::optional<event>{};
                }
                break;
            }

            case state::chunk_data: {
                auto bytes = buffer.extract_at_most(detail::clamp_to_size(remaining_));
                if (bytes.empty()) {
                    return std::optional<event>{};
                }
                remaining_ -= bytes.size();
                data out{bytes, chunk_start_, remaining_ == 0};
                chunk_start_ = false;
                if (remaining_ == 0) {
                    state_ = state::chunk_crlf;
                }
                return std::optional<event>{out};
            }

            case state::chunk_crlf: {
                auto line = buffer.extract_line(options.limits());
                if (!line) {
                    return std::unexpected(line.error());
                }
                if (!*line) {
                    return std::optional<event>{};
                }
                if (!(*line)->empty()) {
                    return make_error(error_code::invalid_chunk, "missing CRLF after chunk data");
                }
                state_ = state::chunk_size;
                break;
            }

            case state::trailers: {
                auto lines = buffer.extract_lines(options.limits());
                if (!lines) {
                    return std::unexpected(lines.error());
                }
                if (!*lines) {
                    return std::optional<event>{};
                }
                auto trailers = parse_header_lines(**lines, options.obs_fold);
                if (!trailers) {
                    return std::unexpected(trailers.error());
                }
                for (auto name : {"content-length", "transfer-encoding", "host"}) {
                    if (trailers->has(name)) {
                        return make_error(error_code::invalid_trailer,
                                          std::string("framing header '") + name + "' not allowed in trailers");
                    }
                }
                state_ = state::complete;
                return std::optional<event>{end_of_message{std::move(*trailers)}};
            }

            case state::complete:
                return std::optional<event>{};
        }
    }
}

inline std::expected<event, protocol_error> chunked_reader::read_eof() const {
    return make_error(error_code::incomplete_body,
                      "peer closed connection without sending complete message body: incomplete chunked read");
}

// =============================================================================
// Close-Delimited Body Reader
// =============================================================================

inline std::expected<std::optional<event>, protocol_error> close_delimited_reader::read(receive_buffer& buffer) {
    auto bytes = buffer.extract_at_most(buffer.size());
    if (bytes.empty()) {
        return std::optional<event>{};
    }
    return std::optional<event>{data{bytes}};
}

inline std::expected<event, protocol_error> close_delimited_reader::read_eof() const {
    return event{end_of_message{}};
}

// =============================================================================
// Body Reader Dispatch
// =============================================================================

inline body_reader make_body_reader(framing_mode mode) {
    switch (mode.kind) {
        case framing_kind::content_length: return content_length_reader{mode.length};
        case framing_kind::chunked: return chunked_reader{};
        case framing_kind::close_delimited: return close_delimited_reader{};
        case framing_kind::no_body: break;
    }
    return content_length_reader{0};
}

inline std::expected<std::optional<event>, protocol_error> read_body(body_reader& reader, receive_buffer& buffer,
                                                                     const connection_options& options) {
    return std::visit([&](auto& r) -> std::expected<std::optional<event>, protocol_error> {
        if constexpr (std::is_same_v<std::decay_t<decltype(r)>, chunked_reader>) {
            return r.read(buffer, options);
        } else {
            return r.read(buffer);
        }
    }, reader);
}

inline std::expected<event, protocol_error> read_body_eof(const body_reader& reader) {
    return std::visit([](const auto& r) { return r.read_eof(); }, reader);
}

} // namespace co::http_framing
