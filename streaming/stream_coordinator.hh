/*
 *
 * Modified by ScyllaDB
 * Copyright (C) 2015-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: (AGPL-3.0-or-later and Apache-2.0)
 */

#pragma once

#include "gms/inet_address.hh"
#include "streaming/stream_fwd.hh"
#include "streaming/stream_session.hh"
#include "streaming/session_info.hh"
#include <map>
#include <optional>
#include <set>
#include <vector>

namespace streaming {

/**
 * {@link StreamCoordinator} is a helper class that abstracts away maintaining multiple
 * StreamSession and ProgressInfo instances per peer.
 *
 * This class coordinates multiple SessionStreams per peer in both the outgoing StreamPlan context and on the
 * inbound StreamResultFuture context.
 *
 * A coordinator belongs to the shard that created it. None of its bookkeeping
 * methods defer, so they never interleave with each other; other shards reach
 * it with invoke_on().
 */
class stream_coordinator {
public:
    using inet_address = gms::inet_address;

private:
    /**
     * Sessions and session infos of one peer.
     *
     * When sending, sessions are created with sequential indexes up to the
     * connections_per_host cap and then reused round robin. When receiving,
     * sessions are created by the index the remote node assigned.
     */
    class host_streaming_data {
        std::map<int, shared_ptr<stream_session>> _stream_sessions;
        // indexes in creation order, the round robin cursor walks it
        std::vector<int> _session_order;
        std::map<int, session_info> _session_infos;
        std::optional<size_t> _last_returned;
        unsigned _connections_per_host;
    public:
        explicit host_streaming_data(unsigned connections_per_host)
            : _connections_per_host(connections_per_host) {
        }

        bool has_active_sessions() const;

        shared_ptr<stream_session> get_or_create_next_session(inet_address peer, inet_address connecting,
                const shared_ptr<stream_connection_factory>& factory);

        shared_ptr<stream_session> get_or_create_session_by_id(inet_address peer, int id, inet_address connecting,
                const shared_ptr<stream_connection_factory>& factory);

        void update_progress(const progress_info& info);

        void add_session_info(session_info info) {
            auto index = info.session_index;
            _session_infos.insert_or_assign(index, std::move(info));
        }

        std::vector<session_info> get_all_session_info() const;

        const std::map<int, shared_ptr<stream_session>>& sessions() const {
            return _stream_sessions;
        }
    private:
        shared_ptr<stream_session> create_session(inet_address peer, int id, inet_address connecting,
                const shared_ptr<stream_connection_factory>& factory);
    };

    std::map<inet_address, host_streaming_data> _peer_sessions;
    unsigned _connections_per_host;
    shared_ptr<stream_connection_factory> _factory;
    stream_connection_executor& _executor;

public:
    /**
     * @param connections_per_host maximum number of sessions per peer, 0 for the receiving side
     * @param factory used by sessions created from now on to connect to peers
     * @param executor runs the connection establishment of the sessions
     */
    stream_coordinator(unsigned connections_per_host, shared_ptr<stream_connection_factory> factory, stream_connection_executor& executor);
    ~stream_coordinator();

    void set_connection_factory(shared_ptr<stream_connection_factory> factory) {
        _factory = std::move(factory);
    }

    /**
     * @return true if any stream session is active
     */
    bool has_active_sessions() const;

    std::vector<shared_ptr<stream_session>> get_all_stream_sessions() const;

    bool is_receiving() const;

    unsigned connections_per_host() const {
        return _connections_per_host;
    }

    /**
     * Submits the connection establishment of every session to the executor
     * and returns without waiting for any of them.
     */
    void connect_all_stream_sessions();

    std::set<inet_address> get_peers() const;

    shared_ptr<stream_session> get_or_create_next_session(inet_address peer, inet_address connecting);
    shared_ptr<stream_session> get_or_create_next_session(inet_address peer) {
        return get_or_create_next_session(peer, peer);
    }

    shared_ptr<stream_session> get_or_create_session_by_id(inet_address peer, int id, inet_address connecting);

    /**
     * @throws unknown_peer_exception if no session was ever created for the peer
     * @throws missing_session_info_exception if the session info was not added yet
     */
    void update_progress(const progress_info& info);

    void add_session_info(session_info info);

    std::vector<session_info> get_all_session_info() const;
    std::vector<session_info> get_peer_session_info(inet_address peer) const;

    void abort_all_stream_sessions();

    // Closes all sessions, failing the ones still active.
    future<> stop();

private:
    host_streaming_data& get_or_create_host_data(inet_address peer);
    host_streaming_data& get_host_data(inet_address peer);
};

} // namespace streaming
