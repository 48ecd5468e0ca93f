/*
 *
 * Modified by ScyllaDB
 * Copyright (C) 2015-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: (AGPL-3.0-or-later and Apache-2.0)
 */

#pragma once

#include "streaming/stream_state.hh"
#include "gms/inet_address.hh"
#include <seastar/core/sstring.hh>
#include <exception>
#include <stdexcept>

namespace streaming {

class stream_exception : public std::exception {
public:
    stream_state state;
    sstring msg;
    stream_exception(stream_state s, sstring m)
        : state(std::move(s))
        , msg(std::move(m)) {
    }
    virtual const char* what() const noexcept override {
        return msg.c_str();
    }
};

// Bookkeeping was addressed to a peer that never took part in the operation.
class unknown_peer_exception : public std::runtime_error {
public:
    gms::inet_address peer;
    explicit unknown_peer_exception(gms::inet_address peer_)
        : std::runtime_error(fmt::format("Unknown peer requested: {}", peer_))
        , peer(peer_) {
    }
};

// Progress arrived for a session whose session_info was never registered.
class missing_session_info_exception : public std::runtime_error {
public:
    gms::inet_address peer;
    int session_index;
    missing_session_info_exception(gms::inet_address peer_, int session_index_)
        : std::runtime_error(fmt::format("No session info registered for {} ID#{}", peer_, session_index_))
        , peer(peer_)
        , session_index(session_index_) {
    }
};

class stream_connection_exception : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace streaming
