#pragma once

#include "../connection.hpp"
#include <algorithm>

namespace co::http_framing {

namespace detail {

inline std::unexpected<local_protocol_error> local_error(protocol_error e) {
    return std::unexpected(local_protocol_error{std::move(e)});
}

inline std::unexpected<remote_protocol_error> remote_error(protocol_error e) {
    return std::unexpected(remote_protocol_error{std::move(e)});
}

} // namespace detail

// =============================================================================
// Connection Implementation
// =============================================================================

inline connection::connection(role our_role, connection_options options)
    : our_role_(our_role), options_(std::move(options)) {}

inline void connection::trace(std::string_view message) const {
    if (trace_) {
        trace_(message);
    }
}

inline void connection::process_error(role who, const protocol_error& error) {
    errored_ = true;
    auto old_client = machine_.state(role::client);
    auto old_server = machine_.state(role::server);
    machine_.process_error(who);
    trace(to_string(who) + " error (" + to_string(error.code) + "): " + error.message);
    respond_to_state_changes(old_client, old_server);
}

inline void connection::respond_to_state_changes(connection_state old_client, connection_state old_server) {
    for (auto r : {role::client, role::server}) {
        auto old_state = r == role::client ? old_client : old_server;
        auto new_state = machine_.state(r);
        if (old_state != new_state) {
            trace(to_string(r) + ": " + to_string(old_state) + " -> " + to_string(new_state));
        }
    }

    auto framing_of = [this](role r) { return r == role::client ? client_framing_ : server_framing_; };
    auto old_ours = our_role_ == role::client ? old_client : old_server;
    auto old_theirs = our_role_ == role::client ? old_server : old_client;

    if (our_state() != old_ours && our_state() == connection_state::send_body) {
        writer_ = make_body_writer(framing_of(our_role_));
    }
    if (their_state() != old_theirs && their_state() == connection_state::send_body) {
        reader_ = make_body_reader(framing_of(their_role()));
    }
}

inline switch_event connection::server_switch_for(const event& ev) const {
    if (const auto* info = std::get_if<informational_response>(&ev)) {
        if (info->status_code == 101 && machine_.has_pending_switch(switch_event::upgrade)) {
            return switch_event::upgrade;
        }
    } else if (const auto* line = std::get_if<response_line>(&ev)) {
        if (line->status_code >= 200 && line->status_code < 300 &&
            machine_.has_pending_switch(switch_event::connect)) {
            return switch_event::connect;
        }
    } else if (std::holds_alternative<headers>(ev)) {
        return accepted_switch_;
    }
    return switch_event::none;
}

inline std::expected<void, protocol_error> connection::process_event(role who, const event& ev) {
    auto old_client = machine_.state(role::client);
    auto old_server = machine_.state(role::server);

    // Framing is checked before any state moves
    std::optional<framing_mode> framing;
    if (const auto* h = std::get_if<headers>(&ev)) {
        auto mode = who == role::client ? request_framing(h->fields)
                                        : response_framing(request_method_, response_status_, h->fields);
        if (!mode) {
            return std::unexpected(mode.error());
        }
        framing = *mode;
    }

    auto sw = who == role::server ? server_switch_for(ev) : switch_event::none;
    if (auto moved = machine_.process_event(who, kind_of(ev), sw); !moved) {
        return moved;
    }

    if (const auto* line = std::get_if<request_line>(&ev)) {
        request_method_ = line->method;
        request_version_ = line->http_version;
        if (who == their_role()) {
            their_http_version_ = line->http_version;
        }
    } else if (const auto* status = std::get_if<response_line>(&ev)) {
        response_status_ = status->status_code;
        response_version_ = status->http_version;
        accepted_switch_ = sw;
        client_waiting_for_100_continue_ = false;
        if (who == their_role()) {
            their_http_version_ = status->http_version;
        }
    } else if (const auto* info = std::get_if<informational_response>(&ev)) {
        client_waiting_for_100_continue_ = false;
        if (who == their_role()) {
            their_http_version_ = info->http_version;
        }
    } else if (const auto* h = std::get_if<headers>(&ev)) {
        if (who == role::client) {
            client_framing_ = *framing;
            if (!keep_alive(request_version_, h->fields)) {
                machine_.process_keep_alive_disabled();
            }
            if (has_expect_100_continue(request_version_, h->fields)) {
                client_waiting_for_100_continue_ = true;
            }
            if (method_from_string(request_method_) == method::connect) {
                machine_.process_client_switch_proposal(switch_event::connect);
            }
            if (h->fields.has("upgrade")) {
                machine_.process_client_switch_proposal(switch_event::upgrade);
            }
        } else {
            server_framing_ = *framing;
            if (!keep_alive(response_version_, h->fields) ||
                framing->kind == framing_kind::close_delimited) {
                machine_.process_keep_alive_disabled();
            }
        }
    } else if (who == role::client &&
               (std::holds_alternative<data>(ev) || std::holds_alternative<end_of_message>(ev))) {
        client_waiting_for_100_continue_ = false;
    }

    respond_to_state_changes(old_client, old_server);
    return {};
}

// =============================================================================
// Receiving
// =============================================================================

inline std::expected<void, local_protocol_error> connection::receive_data(std::string_view bytes) {
    if (errored_) {
        return detail::local_error({error_code::connection_error, "can't receive data after a protocol error"});
    }
    if (!bytes.empty()) {
        if (receive_closed_ || their_state() == connection_state::closed) {
            return detail::local_error({error_code::connection_closed, "received close, then received more data"});
        }
        buffer_.append(bytes);
        return {};
    }
    if (receive_closed_) {
        return detail::local_error({error_code::connection_closed, "end of stream signalled twice"});
    }
    receive_closed_ = true;
    trace("peer closed its side of the connection");
    return {};
}

inline std::expected<next_event_result, protocol_error> connection::extract_next_event() {
    auto state = their_state();
    // Their side may not run more than one message ahead of ours
    if (state == connection_state::done && !buffer_.empty()) {
        return next_event_result{paused{}};
    }
    if (state == connection_state::might_switch_protocol || state == connection_state::switched_protocol) {
        return next_event_result{paused{}};
    }

    std::optional<event> ev;
    switch (state) {
        case connection_state::idle:
        case connection_state::send_response: {
            if (their_role() == role::client) {
                auto head = read_request_head(buffer_, options_);
                if (!head) {
                    return std::unexpected(head.error());
                }
                if (*head) {
                    pending_headers_ = std::move((*head)->fields);
                    ev = std::move((*head)->line);
                }
            } else {
                auto head = read_response_head(buffer_, options_);
                if (!head) {
                    return std::unexpected(head.error());
                }
                if (*head) {
                    auto& line = (*head)->line;
                    if (line.status_code < 200) {
                        ev = informational_response{line.status_code, std::move(line.reason),
                                                    std::move((*head)->fields), line.http_version};
                    } else {
                        pending_headers_ = std::move((*head)->fields);
                        ev = response_line{line.status_code, std::move(line.reason), line.http_version};
                    }
                }
            }
            break;
        }

        case connection_state::send_headers: {
            if (!pending_headers_) {
                return make_error(error_code::connection_error, "no header block pending");
            }
            ev = headers{std::move(*pending_headers_)};
            pending_headers_.reset();
            break;
        }

        case connection_state::send_body: {
            auto body = read_body(*reader_, buffer_, options_);
            if (!body) {
                return std::unexpected(body.error());
            }
            ev = std::move(*body);
            break;
        }

        case connection_state::done:
        case connection_state::must_close:
        case connection_state::closed:
            if (!buffer_.empty()) {
                return make_error(error_code::unexpected_data, "got data when expecting EOF");
            }
            break;

        default:
            return make_error(error_code::connection_error, "can't receive data in state " + to_string(state));
    }

    if (!ev && buffer_.empty() && receive_closed_) {
        if (state == connection_state::send_body) {
            auto eof = read_body_eof(*reader_);
            if (!eof) {
                return std::unexpected(eof.error());
            }
            ev = std::move(*eof);
        } else {
            ev = connection_closed{};
        }
    }

    if (!ev) {
        return next_event_result{need_data{}};
    }
    return next_event_result{std::move(*ev)};
}

inline std::expected<next_event_result, remote_protocol_error> connection::next_event() {
    if (errored_) {
        return detail::remote_error({error_code::connection_error, "can't produce events after a protocol error"});
    }

    auto result = extract_next_event();
    if (!result) {
        process_error(their_role(), result.error());
        return detail::remote_error(std::move(result.error()));
    }

    if (const auto* ev = get_event(*result)) {
        if (auto processed = process_event(their_role(), *ev); !processed) {
            process_error(their_role(), processed.error());
            return detail::remote_error(std::move(processed.error()));
        }
    } else if (is_need_data(*result)) {
        if (buffer_.size() > options_.max_header_block_size) {
            protocol_error error{error_code::header_block_too_large, "receive buffer too long", 431};
            process_error(their_role(), error);
            return detail::remote_error(std::move(error));
        }
        if (receive_closed_) {
            protocol_error error{error_code::unexpected_close, "peer unexpectedly closed connection"};
            process_error(their_role(), error);
            return detail::remote_error(std::move(error));
        }
    }
    return std::move(*result);
}

// =============================================================================
// Sending
// =============================================================================

inline std::expected<header_list, protocol_error> connection::clean_up_response_headers(const header_list& fields) {
    // A HEAD response advertises the framing a GET would have had
    std::string_view framing_method = request_method_ == "HEAD" ? std::string_view{"GET"} : request_method_;
    auto framing = response_framing(framing_method, response_status_, fields);
    if (!framing) {
        return std::unexpected(framing.error());
    }

    header_list out = fields;
    bool need_close = false;
    if (framing->kind == framing_kind::chunked || framing->kind == framing_kind::close_delimited) {
        out.remove("content-length");
        if (!their_http_version_ || *their_http_version_ == version::http_1_0) {
            out.remove("transfer-encoding");
            if (request_method_ != "HEAD") {
                need_close = true;
            }
        } else {
            out.set_comma_values("Transfer-Encoding", {"chunked"});
        }
    }

    if (!machine_.keep_alive() || need_close) {
        auto tokens = out.get_comma_values("connection");
        tokens.erase(std::remove(tokens.begin(), tokens.end(), "keep-alive"), tokens.end());
        if (std::find(tokens.begin(), tokens.end(), "close") == tokens.end()) {
            tokens.emplace_back("close");
        }
        out.set_comma_values("Connection", tokens);
    }
    return out;
}

inline std::expected<void, protocol_error> connection::write_event(const event& ev, output_buffer& out) {
    std::expected<void, protocol_error> valid;
    if (const auto* line = std::get_if<request_line>(&ev)) {
        valid = validate_outgoing(*line);
    } else if (const auto* status = std::get_if<response_line>(&ev)) {
        valid = validate_outgoing(*status);
    } else if (const auto* info = std::get_if<informational_response>(&ev)) {
        valid = validate_outgoing(*info);
    } else if (const auto* h = std::get_if<headers>(&ev)) {
        valid = validate_outgoing(h->fields);
    }
    if (!valid) {
        return valid;
    }

    if (const auto* h = std::get_if<headers>(&ev); h && our_state() == connection_state::send_headers) {
        headers outgoing{h->fields};
        if (our_role_ == role::server) {
            auto cleaned = clean_up_response_headers(h->fields);
            if (!cleaned) {
                return std::unexpected(cleaned.error());
            }
            outgoing.fields = std::move(*cleaned);
        } else if (request_version_ == version::http_1_1) {
            auto hosts = outgoing.fields.count("host");
            if (hosts == 0) {
                return make_error(error_code::missing_host, "missing mandatory Host header");
            }
            if (hosts > 1) {
                return make_error(error_code::duplicate_host, "found multiple Host headers");
            }
        }

        event processed{outgoing};
        if (auto moved = process_event(our_role_, processed); !moved) {
            return moved;
        }
        write_headers(outgoing.fields, out);
        return {};
    }

    if (auto moved = process_event(our_role_, ev); !moved) {
        return moved;
    }

    switch (kind_of(ev)) {
        case event_kind::request_line:
            write_request_line(std::get<request_line>(ev), out);
            return {};
        case event_kind::response_line:
            write_response_line(std::get<response_line>(ev), out);
            return {};
        case event_kind::informational_response:
            write_informational_response(std::get<informational_response>(ev), out);
            return {};
        case event_kind::headers:
            write_headers(std::get<headers>(ev).fields, out);
            return {};
        case event_kind::data:
        case event_kind::end_of_message:
            if (!writer_) {
                return make_error(error_code::illegal_event, "no message body in progress");
            }
            return write_body(*writer_, ev, out);
        case event_kind::connection_closed:
            return {};
    }
    return {};
}

inline std::expected<size_t, local_protocol_error> connection::send(const event& ev, output_buffer& out) {
    if (errored_) {
        return detail::local_error({error_code::connection_error, "can't send data after a protocol error"});
    }

    auto before = out.size();
    auto written = write_event(ev, out);
    if (!written) {
        process_error(our_role_, written.error());
        return detail::local_error(std::move(written.error()));
    }
    return out.size() - before;
}

inline std::expected<std::string, local_protocol_error> connection::send(const event& ev) {
    output_buffer out;
    auto written = send(ev, out);
    if (!written) {
        return std::unexpected(std::move(written.error()));
    }
    return out.release_string();
}

inline void connection::send_failed() {
    process_error(our_role_, protocol_error{error_code::connection_error, "transport failed to send data"});
}

// =============================================================================
// Connection Reuse
// =============================================================================

inline std::expected<void, local_protocol_error> connection::start_next_cycle() {
    if (errored_) {
        return detail::local_error({error_code::connection_error, "can't reuse a connection after a protocol error"});
    }
    auto old_client = machine_.state(role::client);
    auto old_server = machine_.state(role::server);
    if (auto reset = machine_.start_next_cycle(); !reset) {
        return detail::local_error(std::move(reset.error()));
    }

    request_method_.clear();
    request_version_ = version::http_1_1;
    response_version_ = version::http_1_1;
    response_status_ = 0;
    accepted_switch_ = switch_event::none;
    pending_headers_.reset();
    client_framing_ = framing_mode{};
    server_framing_ = framing_mode{};
    writer_.reset();
    reader_.reset();
    client_waiting_for_100_continue_ = false;

    respond_to_state_changes(old_client, old_server);
    return {};
}

} // namespace co::http_framing
