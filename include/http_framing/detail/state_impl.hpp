#pragma once

#include "../state.hpp"

namespace co::http_framing {

// =============================================================================
// Transition Table
// =============================================================================

inline std::span<const state_machine::transition> state_machine::transitions() noexcept {
    using cs = connection_state;
    using ek = event_kind;
    using sw = switch_event;
    constexpr role client = role::client;
    constexpr role server = role::server;

    static constexpr transition table[] = {
        // Client
        {client, cs::idle, ek::request_line, sw::none, false, cs::send_headers},
        {client, cs::send_headers, ek::headers, sw::none, false, cs::send_body},
        {client, cs::send_body, ek::data, sw::none, false, cs::send_body},
        {client, cs::send_body, ek::end_of_message, sw::none, false, cs::done},
        {client, cs::idle, ek::connection_closed, sw::none, false, cs::closed},
        {client, cs::done, ek::connection_closed, sw::none, false, cs::closed},
        {client, cs::must_close, ek::connection_closed, sw::none, false, cs::closed},
        {client, cs::closed, ek::connection_closed, sw::none, false, cs::closed},

        // Server
        {server, cs::idle, ek::request_line, sw::none, true, cs::send_response},
        {server, cs::idle, ek::response_line, sw::none, false, cs::send_headers},
        {server, cs::send_response, ek::response_line, sw::none, false, cs::send_headers},
        {server, cs::send_response, ek::response_line, sw::connect, false, cs::send_headers},
        {server, cs::send_response, ek::informational_response, sw::none, false, cs::send_response},
        {server, cs::send_response, ek::informational_response, sw::upgrade, false, cs::switched_protocol},
        {server, cs::send_headers, ek::headers, sw::none, false, cs::send_body},
        {server, cs::send_headers, ek::headers, sw::connect, false, cs::switched_protocol},
        {server, cs::send_body, ek::data, sw::none, false, cs::send_body},
        {server, cs::send_body, ek::end_of_message, sw::none, false, cs::done},
        {server, cs::idle, ek::connection_closed, sw::none, false, cs::closed},
        {server, cs::done, ek::connection_closed, sw::none, false, cs::closed},
        {server, cs::must_close, ek::connection_closed, sw::none, false, cs::closed},
        {server, cs::closed, ek::connection_closed, sw::none, false, cs::closed},
    };
    return table;
}

// =============================================================================
// State Machine Implementation
// =============================================================================

inline bool state_machine::has_pending_switch(switch_event sw) const noexcept {
    switch (sw) {
        case switch_event::upgrade: return pending_upgrade_;
        case switch_event::connect: return pending_connect_;
        case switch_event::none: return false;
    }
    return false;
}

inline void state_machine::set_state(role r, connection_state s) noexcept {
    if (r == role::client) {
        client_ = s;
    } else {
        server_ = s;
    }
}

inline std::expected<void, protocol_error>
state_machine::process_event(role r, event_kind kind, switch_event server_switch) {
    if (server_switch != switch_event::none) {
        if (r != role::server) {
            return make_error(error_code::unexpected_switch, "only a server can accept a protocol switch");
        }
        if (!has_pending_switch(server_switch)) {
            return make_error(error_code::unexpected_switch,
                              "server accepted a " + to_string(server_switch) + " switch nobody proposed");
        }
    }

    // Validate both sides before touching anything so a rejected event
    // leaves the machine as it was
    auto saved = *this;

    // A final response without a switch declines every pending proposal
    if (r == role::server && kind == event_kind::response_line && server_switch == switch_event::none) {
        pending_upgrade_ = false;
        pending_connect_ = false;
    }

    auto fired = fire_event_triggered(r, kind, server_switch, false);
    if (!fired) {
        *this = saved;
        return fired;
    }

    // The server state follows the client's request line
    if (r == role::client && kind == event_kind::request_line) {
        fired = fire_event_triggered(role::server, kind, switch_event::none, true);
        if (!fired) {
            *this = saved;
            return fired;
        }
    }

    fire_state_triggered();
    return {};
}

inline std::expected<void, protocol_error>
state_machine::fire_event_triggered(role r, event_kind kind, switch_event sw, bool observed) {
    auto current = state(r);
    for (const auto& t : transitions()) {
        if (t.who == r && t.from == current && t.kind == kind && t.sw == sw && t.observed == observed) {
            set_state(r, t.to);
            return {};
        }
    }
    return make_error(error_code::illegal_event,
                      "can't handle event type " + to_string(kind) + " when role=" + to_string(r) +
                          " and state=" + to_string(current));
}

inline void state_machine::fire_state_triggered() {
    using cs = connection_state;
    while (true) {
        auto start_client = client_;
        auto start_server = server_;

        if (has_pending_switch_proposals() && client_ == cs::done) {
            client_ = cs::might_switch_protocol;
        }
        if (!has_pending_switch_proposals() && client_ == cs::might_switch_protocol) {
            client_ = cs::done;
        }

        if (!keep_alive_) {
            if (client_ == cs::done) client_ = cs::must_close;
            if (server_ == cs::done) server_ = cs::must_close;
        }

        if (client_ == cs::might_switch_protocol && server_ == cs::switched_protocol) {
            client_ = cs::switched_protocol;
        }

        // Once one side is gone the other can only close
        if (client_ == cs::closed && (server_ == cs::done || server_ == cs::idle)) {
            server_ = cs::must_close;
        }
        if (client_ == cs::error && server_ == cs::done) {
            server_ = cs::must_close;
        }
        if (server_ == cs::closed && (client_ == cs::done || client_ == cs::idle)) {
            client_ = cs::must_close;
        }
        if (server_ == cs::error && client_ == cs::done) {
            client_ = cs::must_close;
        }

        if (client_ == start_client && server_ == start_server) {
            return;
        }
    }
}

inline void state_machine::process_error(role r) {
    set_state(r, connection_state::error);
    fire_state_triggered();
}

inline void state_machine::process_keep_alive_disabled() {
    keep_alive_ = false;
    fire_state_triggered();
}

inline void state_machine::process_client_switch_proposal(switch_event sw) {
    if (sw == switch_event::upgrade) {
        pending_upgrade_ = true;
    } else if (sw == switch_event::connect) {
        pending_connect_ = true;
    }
    fire_state_triggered();
}

inline std::expected<void, protocol_error> state_machine::start_next_cycle() {
    if (client_ != connection_state::done || server_ != connection_state::done) {
        return make_error(error_code::not_reusable,
                          "not in a reusable state: client=" + to_string(client_) +
                              " server=" + to_string(server_));
    }
    // done/done implies keep-alive and no pending proposal, the state
    // triggers would have moved either side otherwise
    client_ = connection_state::idle;
    server_ = connection_state::idle;
    return {};
}

// =============================================================================
// Utility Functions
// =============================================================================

inline std::string to_string(connection_state s) {
    switch (s) {
        case connection_state::idle: return "IDLE";
        case connection_state::send_response: return "SEND_RESPONSE";
        case connection_state::send_headers: return "SEND_HEADERS";
        case connection_state::send_body: return "SEND_BODY";
        case connection_state::done: return "DONE";
        case connection_state::must_close: return "MUST_CLOSE";
        case connection_state::closed: return "CLOSED";
        case connection_state::might_switch_protocol: return "MIGHT_SWITCH_PROTOCOL";
        case connection_state::switched_protocol: return "SWITCHED_PROTOCOL";
        case connection_state::error: return "ERROR";
    }
    return "UNKNOWN";
}

inline std::string to_string(switch_event sw) {
    switch (sw) {
        case switch_event::none: return "none";
        case switch_event::upgrade: return "upgrade";
        case switch_event::connect: return "connect";
    }
    return "unknown";
}

} // namespace co::http_framing
