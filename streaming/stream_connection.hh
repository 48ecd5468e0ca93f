/*
 * Copyright (C) 2015-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <seastar/core/future.hh>
#include <seastar/core/shared_ptr.hh>
#include <chrono>
#include <memory>
#include <optional>
#include "gms/inet_address.hh"
#include "streaming/stream_message.hh"

namespace streaming {

/**
 * Transport handle of one stream session.
 *
 * Messages passed to send() are delivered to the peer in order; a failed
 * transport makes send() and receive() resolve exceptionally. Encoding of
 * the messages on the wire belongs to the implementation.
 */
class stream_connection {
public:
    virtual ~stream_connection() = default;
    virtual future<> send(stream_message msg) = 0;
    // Disengaged once the peer closed its side of the connection.
    virtual future<std::optional<stream_message>> receive() = 0;
    // Fails a pending receive(). Closing an already closed connection is a no-op.
    virtual future<> close() = 0;
};

/**
 * Establishes the transport of a session.
 *
 * @param peer the logical endpoint of the session
 * @param connecting the address actually dialed, which may differ from peer
 */
class stream_connection_factory {
public:
    virtual ~stream_connection_factory() = default;
    virtual future<std::unique_ptr<stream_connection>> create_connection(gms::inet_address peer, gms::inet_address connecting) = 0;
};

/**
 * Retries failed dials of the wrapped factory with exponential backoff.
 */
class retrying_connection_factory final : public stream_connection_factory {
    shared_ptr<stream_connection_factory> _dialer;
    unsigned _max_attempts;
    std::chrono::milliseconds _retry_delay;
public:
    retrying_connection_factory(shared_ptr<stream_connection_factory> dialer, unsigned max_attempts, std::chrono::milliseconds retry_delay);

    virtual future<std::unique_ptr<stream_connection>> create_connection(gms::inet_address peer, gms::inet_address connecting) override;
};

} // namespace streaming
