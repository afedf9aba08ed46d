#pragma once

#include "buffer.hpp"
#include "core.hpp"
#include "events.hpp"
#include "framing.hpp"
#include "options.hpp"
#include "parser.hpp"
#include "state.hpp"
#include "writer.hpp"
#include <functional>
#include <optional>

namespace co::http_framing {

// Bytes received but not parsed, handed over after a protocol switch
struct trailing_bytes {
    std::string_view bytes;
    bool closed = false;    // peer already signalled end of stream
};

// =============================================================================
// HTTP/1.1 Connection
// =============================================================================

// One side of an HTTP/1.1 connection. Performs no I/O: the caller feeds
// received bytes to receive_data(), pulls events with next_event(), and
// writes whatever send() returns to the transport.
//
// The first protocol error, local or remote, puts the failing direction
// into ERROR and makes the whole connection unusable: every later
// receive_data(), next_event(), send() and start_next_cycle() fails.
class connection {
public:
    using trace_callback = std::function<void(std::string_view message)>;

    explicit connection(role our_role, connection_options options = {});

    // Non-copyable, movable
    connection(const connection&) = delete;
    connection& operator=(const connection&) = delete;
    connection(connection&&) = default;
    connection& operator=(connection&&) = default;

    // =============================================================================
    // Receiving
    // =============================================================================

    // Empty `bytes` signals that the peer closed its side
    std::expected<void, local_protocol_error> receive_data(std::string_view bytes);

    std::expected<next_event_result, remote_protocol_error> next_event();

    // =============================================================================
    // Sending
    // =============================================================================

    std::expected<std::string, local_protocol_error> send(const event& ev);

    // Appends to `out`, returns the number of bytes appended
    std::expected<size_t, local_protocol_error> send(const event& ev, output_buffer& out);

    // The transport failed to write what send() returned
    void send_failed();

    // =============================================================================
    // State
    // =============================================================================

    role our_role() const noexcept { return our_role_; }
    role their_role() const noexcept { return opposite(our_role_); }
    connection_state our_state() const noexcept { return machine_.state(our_role_); }
    connection_state their_state() const noexcept { return machine_.state(their_role()); }

    bool has_error() const noexcept { return errored_; }

    std::optional<version> their_http_version() const noexcept { return their_http_version_; }
    bool client_is_waiting_for_100_continue() const noexcept { return client_waiting_for_100_continue_; }
    bool they_are_waiting_for_100_continue() const noexcept {
        return their_role() == role::client && client_waiting_for_100_continue_;
    }

    trailing_bytes trailing_data() const noexcept { return {buffer_.view(), receive_closed_}; }

    const connection_options& options() const noexcept { return options_; }

    void set_trace_callback(trace_callback callback) { trace_ = std::move(callback); }

    // Both directions must be done
    std::expected<void, local_protocol_error> start_next_cycle();

private:
    std::expected<next_event_result, protocol_error> extract_next_event();
    std::expected<void, protocol_error> process_event(role who, const event& ev);
    std::expected<void, protocol_error> write_event(const event& ev, output_buffer& out);
    std::expected<header_list, protocol_error> clean_up_response_headers(const header_list& fields);
    switch_event server_switch_for(const event& ev) const;
    void respond_to_state_changes(connection_state old_client, connection_state old_server);
    void process_error(role who, const protocol_error& error);
    void trace(std::string_view message) const;

    role our_role_;
    connection_options options_;
    state_machine machine_;
    receive_buffer buffer_;
    bool receive_closed_ = false;
    bool errored_ = false;
    trace_callback trace_;

    std::optional<version> their_http_version_;
    bool client_waiting_for_100_continue_ = false;

    // Per cycle
    std::string request_method_;
    version request_version_ = version::http_1_1;
    version response_version_ = version::http_1_1;
    unsigned int response_status_ = 0;
    switch_event accepted_switch_ = switch_event::none;
    std::optional<header_list> pending_headers_;
    framing_mode client_framing_;
    framing_mode server_framing_;
    std::optional<body_writer> writer_;
    std::optional<body_reader> reader_;
};

} // namespace co::http_framing

// Include implementation
#include "detail/connection_impl.hpp"
