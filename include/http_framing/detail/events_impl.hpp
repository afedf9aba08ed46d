#pragma once

#include "../events.hpp"

namespace co::http_framing {

inline std::string to_string(event_kind k) {
    switch (k) {
        case event_kind::request_line: return "request_line";
        case event_kind::response_line: return "response_line";
        case event_kind::headers: return "headers";
        case event_kind::informational_response: return "informational_response";
        case event_kind::data: return "data";
        case event_kind::end_of_message: return "end_of_message";
        case event_kind::connection_closed: return "connection_closed";
    }
    return "unknown";
}

} // namespace co::http_framing
