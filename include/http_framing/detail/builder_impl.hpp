#pragma once

#include "../builder.hpp"

namespace co::http_framing {

// =============================================================================
// Request Builder Implementation
// =============================================================================

inline request_builder& request_builder::method(enum method m) {
    line_.method = to_string(m);
    return *this;
}

inline request_builder& request_builder::method(std::string_view m) {
    line_.method = std::string(m);
    return *this;
}

inline request_builder& request_builder::target(std::string t) {
    line_.target = std::move(t);
    return *this;
}

inline request_builder& request_builder::header(std::string name, std::string value) {
    fields_.add(std::move(name), std::move(value));
    return *this;
}

// =============================================================================
// Common HTTP Methods
// =============================================================================

inline request_builder& request_builder::GET(std::string target) {
    return method(method::get).target(std::move(target));
}

inline request_builder& request_builder::POST(std::string target) {
    return method(method::post).target(std::move(target));
}

inline request_builder& request_builder::PUT(std::string target) {
    return method(method::put).target(std::move(target));
}

inline request_builder& request_builder::DELETE(std::string target) {
    return method(method::delete_).target(std::move(target));
}

inline request_builder& request_builder::HEAD(std::string target) {
    return method(method::head).target(std::move(target));
}

inline request_builder& request_builder::OPTIONS(std::string target) {
    return method(method::options).target(std::move(target));
}

inline request_builder& request_builder::PATCH(std::string target) {
    return method(method::patch).target(std::move(target));
}

inline request_builder& request_builder::CONNECT(std::string authority) {
    return method(method::connect).target(std::move(authority));
}

// =============================================================================
// Common Headers
// =============================================================================

inline request_builder& request_builder::host(std::string h) {
    fields_.set("Host", std::move(h));
    return *this;
}

inline request_builder& request_builder::user_agent(std::string ua) {
    return header("User-Agent", std::move(ua));
}

inline request_builder& request_builder::content_type(std::string ct) {
    return header("Content-Type", std::move(ct));
}

inline request_builder& request_builder::accept(std::string accept) {
    return header("Accept", std::move(accept));
}

// =============================================================================
// Framing and Connection Management
// =============================================================================

inline request_builder& request_builder::content_length(uint64_t length) {
    fields_.remove("Transfer-Encoding");
    fields_.set("Content-Length", std::to_string(length));
    return *this;
}

inline request_builder& request_builder::chunked() {
    fields_.remove("Content-Length");
    fields_.set("Transfer-Encoding", "chunked");
    return *this;
}

inline request_builder& request_builder::close() {
    fields_.set("Connection", "close");
    return *this;
}

inline request_builder& request_builder::expect_continue() {
    fields_.set("Expect", "100-continue");
    return *this;
}

inline request_builder& request_builder::upgrade(std::string protocol) {
    fields_.set("Upgrade", std::move(protocol));
    fields_.set("Connection", "Upgrade");
    return *this;
}

inline std::vector<event> request_builder::build() const {
    std::vector<event> out;
    out.emplace_back(line_);
    out.emplace_back(headers{fields_});
    return out;
}

// =============================================================================
// Response Builder Implementation
// =============================================================================

inline response_builder& response_builder::status(unsigned int code) {
    status_code_ = code;
    reason_ = std::string(reason_phrase(code));
    return *this;
}

inline response_builder& response_builder::status(unsigned int code, std::string reason) {
    status_code_ = code;
    reason_ = std::move(reason);
    return *this;
}

inline response_builder& response_builder::header(std::string name, std::string value) {
    fields_.add(std::move(name), std::move(value));
    return *this;
}

// =============================================================================
// Common Status Codes
// =============================================================================

inline response_builder& response_builder::switching_protocols(std::string protocol) {
    fields_.set("Upgrade", std::move(protocol));
    fields_.set("Connection", "Upgrade");
    return status(101);
}

inline response_builder& response_builder::ok() {
    return status(200);
}

inline response_builder& response_builder::created() {
    return status(201);
}

inline response_builder& response_builder::no_content() {
    return status(204);
}

inline response_builder& response_builder::moved_permanently(std::string location) {
    return status(301).header("Location", std::move(location));
}

inline response_builder& response_builder::found(std::string location) {
    return status(302).header("Location", std::move(location));
}

inline response_builder& response_builder::not_modified() {
    return status(304);
}

inline response_builder& response_builder::bad_request() {
    return status(400);
}

inline response_builder& response_builder::not_found() {
    return status(404);
}

inline response_builder& response_builder::request_header_fields_too_large() {
    return status(431);
}

inline response_builder& response_builder::internal_server_error() {
    return status(500);
}

inline response_builder& response_builder::not_implemented() {
    return status(501);
}

// =============================================================================
// Common Response Headers
// =============================================================================

inline response_builder& response_builder::content_type(std::string ct) {
    return header("Content-Type", std::move(ct));
}

inline response_builder& response_builder::server(std::string s) {
    return header("Server", std::move(s));
}

inline response_builder& response_builder::location(std::string loc) {
    return header("Location", std::move(loc));
}

// =============================================================================
// Framing and Connection Management
// =============================================================================

inline response_builder& response_builder::content_length(uint64_t length) {
    fields_.remove("Transfer-Encoding");
    fields_.set("Content-Length", std::to_string(length));
    return *this;
}

inline response_builder& response_builder::chunked() {
    fields_.remove("Content-Length");
    fields_.set("Transfer-Encoding", "chunked");
    return *this;
}

inline response_builder& response_builder::close() {
    fields_.set("Connection", "close");
    return *this;
}

inline std::vector<event> response_builder::build() const {
    std::vector<event> out;
    if (status_code_ < 200) {
        out.emplace_back(informational_response{status_code_, reason_, fields_, version::http_1_1});
        return out;
    }
    out.emplace_back(response_line{status_code_, reason_, version::http_1_1});
    out.emplace_back(headers{fields_});
    return out;
}

} // namespace co::http_framing
