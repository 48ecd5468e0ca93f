/*
 *
 * Modified by ScyllaDB
 * Copyright (C) 2015-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: (AGPL-3.0-or-later and Apache-2.0)
 */

#include <seastar/core/loop.hh>
#include "streaming/stream_session_state.hh"
#include "streaming/stream_coordinator.hh"
#include "streaming/stream_connection_executor.hh"
#include "streaming/stream_exception.hh"
#include "log.hh"
#include <algorithm>
#include <iterator>
#include <limits>

namespace streaming {

extern logging::logger sslog;

using gms::inet_address;

bool stream_coordinator::host_streaming_data::has_active_sessions() const {
    for (auto const& x : _stream_sessions) {
        if (is_active(x.second->get_state())) {
            return true;
        }
    }
    return false;
}

shared_ptr<stream_session> stream_coordinator::host_streaming_data::create_session(inet_address peer, int id, inet_address connecting,
        const shared_ptr<stream_connection_factory>& factory) {
    auto session = make_shared<stream_session>(peer, connecting, factory, id);
    _stream_sessions.emplace(id, session);
    _session_order.push_back(id);
    return session;
}

shared_ptr<stream_session> stream_coordinator::host_streaming_data::get_or_create_next_session(inet_address peer, inet_address connecting,
        const shared_ptr<stream_connection_factory>& factory) {
    // A cap of 0 (receiving side) still hands out a single session.
    auto cap = std::max(_connections_per_host, 1u);
    if (_stream_sessions.size() < cap) {
        int id = 0;
        if (!_stream_sessions.empty()) {
            auto last = _stream_sessions.rbegin()->first;
            if (last < std::numeric_limits<int>::max()) {
                id = last + 1;
            } else {
                // lowest index not taken by a session created by id
                while (_stream_sessions.contains(id)) {
                    ++id;
                }
            }
        }
        auto session = create_session(peer, id, connecting, factory);
        _last_returned = _session_order.size() - 1;
        return session;
    }
    _last_returned = _last_returned ? (*_last_returned + 1) % _session_order.size() : 0;
    return _stream_sessions.at(_session_order[*_last_returned]);
}

shared_ptr<stream_session> stream_coordinator::host_streaming_data::get_or_create_session_by_id(inet_address peer, int id, inet_address connecting,
        const shared_ptr<stream_connection_factory>& factory) {
    auto it = _stream_sessions.find(id);
    if (it != _stream_sessions.end()) {
        return it->second;
    }
    return create_session(peer, id, connecting, factory);
}

void stream_coordinator::host_streaming_data::update_progress(const progress_info& info) {
    auto it = _session_infos.find(info.session_index);
    if (it == _session_infos.end()) {
        throw missing_session_info_exception(info.peer, info.session_index);
    }
    it->second.update_progress(info);
}

std::vector<session_info> stream_coordinator::host_streaming_data::get_all_session_info() const {
    std::vector<session_info> results;
    results.reserve(_session_infos.size());
    for (auto const& x : _session_infos) {
        results.push_back(x.second);
    }
    return results;
}

stream_coordinator::stream_coordinator(unsigned connections_per_host, shared_ptr<stream_connection_factory> factory, stream_connection_executor& executor)
    : _connections_per_host(connections_per_host)
    , _factory(std::move(factory))
    , _executor(executor) {
}

stream_coordinator::~stream_coordinator() = default;

stream_coordinator::host_streaming_data& stream_coordinator::get_or_create_host_data(inet_address peer) {
    return _peer_sessions.try_emplace(peer, _connections_per_host).first->second;
}

stream_coordinator::host_streaming_data& stream_coordinator::get_host_data(inet_address peer) {
    auto it = _peer_sessions.find(peer);
    if (it == _peer_sessions.end()) {
        throw unknown_peer_exception(peer);
    }
    return it->second;
}

bool stream_coordinator::has_active_sessions() const {
    for (auto const& x : _peer_sessions) {
        if (x.second.has_active_sessions()) {
            return true;
        }
    }
    return false;
}

std::vector<shared_ptr<stream_session>> stream_coordinator::get_all_stream_sessions() const {
    std::vector<shared_ptr<stream_session>> results;
    for (auto const& x : _peer_sessions) {
        for (auto const& s : x.second.sessions()) {
            results.push_back(s.second);
        }
    }
    return results;
}

bool stream_coordinator::is_receiving() const {
    return _connections_per_host == 0;
}

std::set<inet_address> stream_coordinator::get_peers() const {
    std::set<inet_address> results;
    for (auto const& x : _peer_sessions) {
        results.insert(x.first);
    }
    return results;
}

shared_ptr<stream_session> stream_coordinator::get_or_create_next_session(inet_address peer, inet_address connecting) {
    return get_or_create_host_data(peer).get_or_create_next_session(peer, connecting, _factory);
}

shared_ptr<stream_session> stream_coordinator::get_or_create_session_by_id(inet_address peer, int id, inet_address connecting) {
    return get_or_create_host_data(peer).get_or_create_session_by_id(peer, id, connecting, _factory);
}

void stream_coordinator::update_progress(const progress_info& info) {
    get_host_data(info.peer).update_progress(info);
}

void stream_coordinator::add_session_info(session_info info) {
    auto peer = info.peer;
    get_or_create_host_data(peer).add_session_info(std::move(info));
}

std::vector<session_info> stream_coordinator::get_all_session_info() const {
    std::vector<session_info> results;
    for (auto const& x : _peer_sessions) {
        auto infos = x.second.get_all_session_info();
        std::move(infos.begin(), infos.end(), std::back_inserter(results));
    }
    return results;
}

std::vector<session_info> stream_coordinator::get_peer_session_info(inet_address peer) const {
    auto it = _peer_sessions.find(peer);
    if (it == _peer_sessions.end()) {
        return {};
    }
    return it->second.get_all_session_info();
}

void stream_coordinator::abort_all_stream_sessions() {
    for (auto& session : get_all_stream_sessions()) {
        session->abort();
    }
}

void stream_coordinator::connect_all_stream_sessions() {
    for (auto& session : get_all_stream_sessions()) {
        _executor.submit([session] {
            return session->start().then([session] {
                if (session->get_state() != stream_session_state::FAILED) {
                    sslog.info("[Stream #{}, ID#{}] Beginning stream session with {}", session->plan_id(), session->session_index(), session->peer);
                }
            }).handle_exception([session] (std::exception_ptr ep) {
                sslog.warn("[Stream #{}, ID#{}] Failed to start stream session with {}: {}", session->plan_id(), session->session_index(), session->peer, ep);
                session->on_error();
            });
        });
    }
}

future<> stream_coordinator::stop() {
    return parallel_for_each(get_all_stream_sessions(), [] (shared_ptr<stream_session> session) {
        return session->close();
    });
}

} // namespace streaming
