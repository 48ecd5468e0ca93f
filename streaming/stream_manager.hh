/*
 *
 * Modified by ScyllaDB
 * Copyright (C) 2015-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: (AGPL-3.0-or-later and Apache-2.0)
 */

#pragma once
#include "streaming/stream_fwd.hh"
#include "streaming/stream_config.hh"
#include <seastar/core/shared_ptr.hh>
#include <seastar/core/sharded.hh>
#include <seastar/core/gate.hh>
#include <seastar/core/scheduling.hh>
#include "gms/inet_address.hh"
#include <memory>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace streaming {

/**
 * StreamManager manages currently running {@link StreamResultFuture}s and provides status of all operation invoked.
 *
 * All stream operation should be created through this class to track streaming status and progress.
 *
 * It owns the connection factory and the executor that establishes the
 * connections of all the plans of the shard.
 */
class stream_manager : public peering_sharded_service<stream_manager> {
    using inet_address = gms::inet_address;
    /*
     * Currently running streams. Removed after completion/failure.
     * We manage them in two different maps to distinguish plan from initiated ones to
     * receiving ones within the same node.
     */
private:
    stream_config _cfg;
    shared_ptr<stream_connection_factory> _factory;
    std::unique_ptr<stream_connection_executor> _executor;

    std::unordered_map<plan_id, shared_ptr<stream_result_future>> _initiated_streams;
    std::unordered_map<plan_id, shared_ptr<stream_result_future>> _receiving_streams;
    gate _accepts;
    // inbound connections still waiting for their init message
    std::unordered_set<stream_connection*> _pending_accepts;

public:
    /**
     * @param dialer opens connections to peers, retried according to the config
     * @param sg scheduling group connection establishment runs in
     */
    stream_manager(stream_config cfg, shared_ptr<stream_connection_factory> dialer, scheduling_group sg);

    stream_manager(stream_config cfg, shared_ptr<stream_connection_factory> factory, std::unique_ptr<stream_connection_executor> executor);

    ~stream_manager();

    future<> start();
    future<> stop();

    const stream_config& config() const noexcept {
        return _cfg;
    }

    shared_ptr<stream_connection_factory> connection_factory() const noexcept {
        return _factory;
    }

    // Plans created from now on connect through the given factory.
    void set_connection_factory(shared_ptr<stream_connection_factory> factory) {
        _factory = std::move(factory);
    }

    stream_connection_executor& connection_executor() noexcept {
        return *_executor;
    }

    void register_sending(shared_ptr<stream_result_future> result);

    void register_receiving(shared_ptr<stream_result_future> result);

    shared_ptr<stream_result_future> get_sending_stream(streaming::plan_id plan_id) const;

    shared_ptr<stream_result_future> get_receiving_stream(streaming::plan_id plan_id) const;

    std::vector<shared_ptr<stream_result_future>> get_all_streams() const;

    const std::unordered_map<plan_id, shared_ptr<stream_result_future>>& get_initiated_streams() const {
        return _initiated_streams;
    }

    const std::unordered_map<plan_id, shared_ptr<stream_result_future>>& get_receiving_streams() const {
        return _receiving_streams;
    }

    void remove_stream(streaming::plan_id plan_id);

    void show_streams() const;

    /**
     * Takes an inbound connection. Its first message must be the
     * stream_init_message that names the plan and the session it belongs to.
     *
     * A rejected connection is closed. Connections still waiting for their
     * init message are closed by stop().
     */
    future<> accept(std::unique_ptr<stream_connection> connection);

    void fail_sessions(inet_address endpoint);
    void fail_all_sessions();
    bool has_peer(inet_address endpoint) const;

    // Fails the sessions with a peer known to be down, on all shards.
    future<> on_dead(inet_address endpoint);
};

} // namespace streaming
