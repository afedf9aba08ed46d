#pragma once

#include "core.hpp"
#include "events.hpp"
#include <vector>

namespace co::http_framing {

// =============================================================================
// Builder Pattern Classes
// =============================================================================

// Builds the head of an outgoing request: a request_line event followed by
// a headers event. The body is sent separately as data events.
class request_builder {
public:
    request_builder() = default;

    request_builder& method(enum method m);
    request_builder& method(std::string_view m);
    request_builder& target(std::string t);
    request_builder& header(std::string name, std::string value);

    // Common methods
    request_builder& GET(std::string target);
    request_builder& POST(std::string target);
    request_builder& PUT(std::string target);
    request_builder& DELETE(std::string target);
    request_builder& HEAD(std::string target);
    request_builder& OPTIONS(std::string target);
    request_builder& PATCH(std::string target);
    request_builder& CONNECT(std::string authority);

    // Common headers
    request_builder& host(std::string h);
    request_builder& user_agent(std::string ua);
    request_builder& content_type(std::string ct);
    request_builder& accept(std::string accept);

    // Framing and connection management
    request_builder& content_length(uint64_t length);
    request_builder& chunked();
    request_builder& close();
    request_builder& expect_continue();
    request_builder& upgrade(std::string protocol);

    const request_line& line() const noexcept { return line_; }
    const header_list& fields() const noexcept { return fields_; }

    std::vector<event> build() const;

private:
    request_line line_{"GET", "/", version::http_1_1};
    header_list fields_;
};

// Builds the head of an outgoing response. A 1xx status yields a single
// informational_response event, any other status a response_line event
// followed by a headers event.
class response_builder {
public:
    response_builder() = default;

    // The reason defaults to the standard phrase for `code`
    response_builder& status(unsigned int code);
    response_builder& status(unsigned int code, std::string reason);
    response_builder& header(std::string name, std::string value);

    // Common status codes
    response_builder& switching_protocols(std::string protocol);
    response_builder& ok();
    response_builder& created();
    response_builder& no_content();
    response_builder& moved_permanently(std::string location);
    response_builder& found(std::string location);
    response_builder& not_modified();
    response_builder& bad_request();
    response_builder& not_found();
    response_builder& request_header_fields_too_large();
    response_builder& internal_server_error();
    response_builder& not_implemented();

    // Common headers
    response_builder& content_type(std::string ct);
    response_builder& server(std::string s);
    response_builder& location(std::string loc);

    // Framing and connection management
    response_builder& content_length(uint64_t length);
    response_builder& chunked();
    response_builder& close();

    unsigned int status_code() const noexcept { return status_code_; }
    const header_list& fields() const noexcept { return fields_; }

    std::vector<event> build() const;

private:
    unsigned int status_code_ = 200;
    std::string reason_;
    header_list fields_;
};

} // namespace co::http_framing

// Include implementation
#include "detail/builder_impl.hpp"
