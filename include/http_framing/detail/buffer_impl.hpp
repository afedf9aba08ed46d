#pragma once

#include "../buffer.hpp"
#include <algorithm>

namespace co::http_framing {

// =============================================================================
// Output Buffer Implementation
// =============================================================================

inline void output_buffer::append(std::string_view data) {
    buffer_.append(data);
}

inline void output_buffer::append(std::span<const uint8_t> data) {
    buffer_.append(reinterpret_cast<const char*>(data.data()), data.size());
}

inline void output_buffer::append(const char* data, size_t size) {
    buffer_.append(data, size);
}

inline std::span<const uint8_t> output_buffer::data() const noexcept {
    return std::span<const uint8_t>{
        reinterpret_cast<const uint8_t*>(buffer_.data()),
        buffer_.size()
    };
}

inline std::string_view output_buffer::view() const noexcept {
    return std::string_view{buffer_};
}

inline size_t output_buffer::size() const noexcept {
    return buffer_.size();
}

inline bool output_buffer::empty() const noexcept {
    return buffer_.empty();
}

inline void output_buffer::clear() noexcept {
    buffer_.clear();
}

inline std::string output_buffer::release_string() {
    std::string out = std::move(buffer_);
    buffer_.clear();
    return out;
}

// =============================================================================
// Receive Buffer Implementation
// =============================================================================

inline void receive_buffer::append(std::string_view data) {
    compact();
    data_.append(data);
}

inline std::string_view receive_buffer::view() const noexcept {
    return std::string_view{data_}.substr(start_);
}

inline void receive_buffer::compact() {
    if (start_ == 0) {
        return;
    }
    data_.erase(0, start_);
    start_ = 0;
}

inline void receive_buffer::consume(size_t count) noexcept {
    start_ += count;
    scan_pos_ = 0;
    line_begin_ = 0;
    block_lines_.clear();
}

inline std::string_view receive_buffer::extract_at_most(size_t count) {
    compact();
    auto n = std::min(count, size());
    auto out = view().substr(0, n);
    consume(n);
    return out;
}

inline std::optional<std::string_view> receive_buffer::extract_exact(size_t count) {
    compact();
    if (size() < count) {
        return std::nullopt;
    }
    auto out = view().substr(0, count);
    consume(count);
    return out;
}

inline std::expected<std::optional<receive_buffer::line_span>, protocol_error>
receive_buffer::scan_line(const line_limits& limits) {
    auto buf = view();
    auto lf = buf.find('\n', scan_pos_);
    if (lf == std::string_view::npos) {
        scan_pos_ = buf.size();
        if (buf.size() - line_begin_ > limits.max_line_size) {
            return make_error(error_code::line_too_long,
                              "line exceeds " + std::to_string(limits.max_line_size) + " bytes", 431);
        }
        return std::optional<line_span>{};
    }

    size_t end = lf;
    if (end > line_begin_ && buf[end - 1] == '\r') {
        --end;
    } else if (!limits.allow_bare_lf) {
        return make_error(error_code::bare_line_feed, "line terminated by bare LF");
    }

    line_span line{line_begin_, end - line_begin_};
    if (line.length > limits.max_line_size) {
        return make_error(error_code::line_too_long,
                          "line exceeds " + std::to_string(limits.max_line_size) + " bytes", 431);
    }
    line_begin_ = lf + 1;
    scan_pos_ = lf + 1;
    return std::optional<line_span>{line};
}

inline std::expected<std::optional<std::string_view>, protocol_error>
receive_buffer::extract_line(const line_limits& limits) {
    compact();
    auto line = scan_line(limits);
    if (!line) {
        return std::unexpected(line.error());
    }
    if (!*line) {
        return std::optional<std::string_view>{};
    }
    auto out = view().substr((*line)->offset, (*line)->length);
    consume(line_begin_);
    return std::optional<std::string_view>{out};
}

inline std::expected<std::optional<std::vector<std::string_view>>, protocol_error>
receive_buffer::extract_lines(const line_limits& limits) {
    compact();
    while (true) {
        auto line = scan_line(limits);
        if (!line) {
            return std::unexpected(line.error());
        }
        if (!*line) {
            if (size() > limits.max_block_size) {
                return make_error(error_code::header_block_too_large,
                                  "header block exceeds " + std::to_string(limits.max_block_size) + " bytes",
                                  431);
            }
            return std::optional<std::vector<std::string_view>>{};
        }
        if ((*line)->length == 0) {
            break;
        }
        block_lines_.push_back(**line);
        if (line_begin_ > limits.max_block_size) {
            return make_error(error_code::header_block_too_large,
                              "header block exceeds " + std::to_string(limits.max_block_size) + " bytes",
                              431);
        }
    }

    auto buf = view();
    std::vector<std::string_view> lines;
    lines.reserve(block_lines_.size());
    for (const auto& l : block_lines_) {
        lines.push_back(buf.substr(l.offset, l.length));
    }
    consume(line_begin_);
    return std::optional<std::vector<std::string_view>>{std::move(lines)};
}

inline bool receive_buffer::starts_with_invalid_request_byte() const noexcept {
    return !empty() && static_cast<unsigned char>(view()[0]) < 0x21;
}

inline void receive_buffer::clear() noexcept {
    data_.clear();
    start_ = 0;
    scan_pos_ = 0;
    line_begin_ = 0;
    block_lines_.clear();
}

} // namespace co::http_framing
