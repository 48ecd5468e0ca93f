/*
 * Copyright (C) 2024-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <seastar/core/future.hh>
#include <seastar/core/gate.hh>
#include <seastar/core/queue.hh>
#include <seastar/core/shared_future.hh>
#include <seastar/core/shared_ptr.hh>
#include <algorithm>
#include <functional>
#include <map>
#include <optional>
#include <memory>
#include <stdexcept>
#include <utility>
#include <vector>

#include "seastarx.hh"
#include "streaming/stream_connection.hh"
#include "streaming/stream_connection_executor.hh"
#include "streaming/stream_message.hh"

namespace streaming::test {

// One direction of an in-memory connection.
struct loopback_pipe {
    seastar::queue<std::optional<stream_message>> messages{1024};
    bool reader_closed = false;
};

// In-memory connection end. Messages are delivered in order; closing an end
// signals end of stream to the other one.
class loopback_connection final : public stream_connection {
    lw_shared_ptr<loopback_pipe> _in;
    lw_shared_ptr<loopback_pipe> _out;
    bool _closed = false;
public:
    loopback_connection(lw_shared_ptr<loopback_pipe> in, lw_shared_ptr<loopback_pipe> out)
        : _in(std::move(in))
        , _out(std::move(out)) {
    }

    virtual future<> send(stream_message msg) override {
        if (_closed || _out->reader_closed) {
            return make_exception_future<>(std::runtime_error("loopback connection closed"));
        }
        return _out->messages.push_eventually(std::move(msg));
    }

    virtual future<std::optional<stream_message>> receive() override {
        return _in->messages.pop_eventually();
    }

    virtual future<> close() override {
        if (_closed) {
            return make_ready_future<>();
        }
        _closed = true;
        _in->reader_closed = true;
        _in->messages.abort(std::make_exception_ptr(std::runtime_error("loopback connection closed")));
        if (_out->reader_closed) {
            return make_ready_future<>();
        }
        return _out->messages.push_eventually(std::nullopt);
    }

    bool is_closed() const {
        return _closed;
    }
};

// Returns the dialing end and the accepting end of a new connection.
inline std::pair<std::unique_ptr<loopback_connection>, std::unique_ptr<loopback_connection>> make_loopback_connection() {
    auto a = make_lw_shared<loopback_pipe>();
    auto b = make_lw_shared<loopback_pipe>();
    return {std::make_unique<loopback_connection>(a, b), std::make_unique<loopback_connection>(b, a)};
}

// Hands the accepting end of every dialed connection to an acceptor, e.g.
// the receiving stream_manager. Without an acceptor the accepting end is dropped.
class loopback_connection_factory final : public stream_connection_factory {
public:
    using acceptor = std::function<future<> (std::unique_ptr<stream_connection>)>;
private:
    acceptor _acceptor;
    gate _accepts;
    std::vector<std::pair<gms::inet_address, gms::inet_address>> _dialed;
    size_t _accept_failures = 0;
public:
    loopback_connection_factory() = default;
    explicit loopback_connection_factory(acceptor a)
        : _acceptor(std::move(a)) {
    }

    virtual future<std::unique_ptr<stream_connection>> create_connection(gms::inet_address peer, gms::inet_address connecting) override {
        _dialed.emplace_back(peer, connecting);
        auto [client, server] = make_loopback_connection();
        if (_acceptor) {
            (void)with_gate(_accepts, [this, server = std::move(server)] () mutable {
                return _acceptor(std::move(server));
            }).handle_exception([this] (std::exception_ptr) {
                ++_accept_failures;
            });
        }
        return make_ready_future<std::unique_ptr<stream_connection>>(std::move(client));
    }

    const std::vector<std::pair<gms::inet_address, gms::inet_address>>& dialed() const {
        return _dialed;
    }

    size_t accept_failures() const {
        return _accept_failures;
    }

    future<> stop() {
        return _accepts.close();
    }
};

// Refuses every connection.
class failing_connection_factory final : public stream_connection_factory {
    size_t _attempts = 0;
public:
    virtual future<std::unique_ptr<stream_connection>> create_connection(gms::inet_address peer, gms::inet_address connecting) override {
        ++_attempts;
        return make_exception_future<std::unique_ptr<stream_connection>>(std::runtime_error(format("connection to {} refused", connecting)));
    }

    size_t attempts() const {
        return _attempts;
    }
};

// Holds the dials to blocked peers until they are released. Tracks how many
// dials are in flight at once.
class blocking_connection_factory final : public stream_connection_factory {
    std::map<gms::inet_address, shared_promise<>> _blocked;
    size_t _in_flight = 0;
    size_t _max_in_flight = 0;
    size_t _dials = 0;
    std::vector<std::unique_ptr<stream_connection>> _accepted;
public:
    void block(gms::inet_address peer) {
        _blocked.try_emplace(peer);
    }

    void release(gms::inet_address peer) {
        auto it = _blocked.find(peer);
        if (it != _blocked.end()) {
            it->second.set_value();
        }
    }

    virtual future<std::unique_ptr<stream_connection>> create_connection(gms::inet_address peer, gms::inet_address connecting) override {
        ++_dials;
        ++_in_flight;
        _max_in_flight = std::max(_max_in_flight, _in_flight);
        auto it = _blocked.find(peer);
        auto ready = it != _blocked.end() ? it->second.get_shared_future() : make_ready_future<>();
        return ready.then([this] {
            --_in_flight;
            auto [client, server] = make_loopback_connection();
            _accepted.push_back(std::move(server));
            return std::unique_ptr<stream_connection>(std::move(client));
        });
    }

    size_t in_flight() const {
        return _in_flight;
    }

    size_t max_in_flight() const {
        return _max_in_flight;
    }

    size_t dials() const {
        return _dials;
    }
};

// Runs every task right away, in the caller's context, until its first
// suspension point.
class inline_connection_executor final : public stream_connection_executor {
    gate _tasks;
    size_t _submitted = 0;
    size_t _failures = 0;
public:
    virtual void submit(task t) override {
        ++_submitted;
        (void)with_gate(_tasks, std::move(t)).handle_exception([this] (std::exception_ptr) {
            ++_failures;
        });
    }

    virtual future<> stop() override {
        return _tasks.close();
    }

    size_t submitted() const {
        return _submitted;
    }

    size_t failures() const {
        return _failures;
    }
};

} // namespace streaming::test
