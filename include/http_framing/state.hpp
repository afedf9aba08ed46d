#pragma once

#include "core.hpp"
#include "events.hpp"
#include <span>

namespace co::http_framing {

// =============================================================================
// Connection States (one per direction)
// =============================================================================

enum class connection_state {
    idle,
    send_response,          // server: request seen, response not started
    send_headers,           // start line sent, header block pending
    send_body,              // body being sent (ours) or expected (theirs)
    done,
    must_close,
    closed,
    might_switch_protocol,  // client: done, waiting for the server to accept a switch
    switched_protocol,
    error
};

// Protocol switch a client proposes and a server may accept
enum class switch_event {
    none,
    upgrade,    // Upgrade header, accepted by 101 Switching Protocols
    connect     // CONNECT method, accepted by a 2xx response
};

// =============================================================================
// Connection State Machine
// =============================================================================

// Tracks both directions of one connection. Event-triggered transitions come
// from a static table keyed by (role, state, event kind, switch); after each
// change the state-triggered rules are applied until nothing moves.
class state_machine {
public:
    state_machine() = default;

    connection_state state(role r) const noexcept {
        return r == role::client ? client_ : server_;
    }

    bool keep_alive() const noexcept { return keep_alive_; }
    bool has_pending_switch(switch_event sw) const noexcept;
    bool has_pending_switch_proposals() const noexcept { return pending_upgrade_ || pending_connect_; }

    // Applies `kind` sent by `r`. `server_switch` is the proposal a server
    // event accepts, if any. On failure nothing changes; the caller decides
    // whether to mark the direction as errored.
    std::expected<void, protocol_error> process_event(role r, event_kind kind,
                                                      switch_event server_switch = switch_event::none);

    void process_error(role r);
    void process_keep_alive_disabled();
    void process_client_switch_proposal(switch_event sw);

    // Both directions must be done
    std::expected<void, protocol_error> start_next_cycle();

private:
    struct transition {
        role who;
        connection_state from;
        event_kind kind;
        switch_event sw;
        bool observed;          // server reacting to the client's request line
        connection_state to;
    };

    static std::span<const transition> transitions() noexcept;

    std::expected<void, protocol_error> fire_event_triggered(role r, event_kind kind,
                                                             switch_event sw, bool observed);
    void fire_state_triggered();
    void set_state(role r, connection_state s) noexcept;

    connection_state client_ = connection_state::idle;
    connection_state server_ = connection_state::idle;
    bool keep_alive_ = true;
    bool pending_upgrade_ = false;
    bool pending_connect_ = false;
};

std::string to_string(connection_state s);
std::string to_string(switch_event sw);

} // namespace co::http_framing

// Include implementation
#include "detail/state_impl.hpp"
