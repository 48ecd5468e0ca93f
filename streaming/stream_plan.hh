/*
 *
 * Modified by ScyllaDB
 * Copyright (C) 2015-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: (AGPL-3.0-or-later and Apache-2.0)
 */

#pragma once

#include <seastar/core/sstring.hh>
#include "gms/inet_address.hh"
#include "streaming/stream_fwd.hh"
#include "streaming/stream_coordinator.hh"
#include "streaming/stream_transfer_task.hh"
#include "streaming/stream_reason.hh"
#include "streaming/stream_state.hh"
#include <vector>

namespace streaming {

/**
 * {@link StreamPlan} is a helper class that builds StreamOperation of given configuration.
 *
 * This is the class you want to use for building streaming plan and starting streaming.
 */
class stream_plan {
private:
    using inet_address = gms::inet_address;
    stream_manager& _mgr;
    plan_id _plan_id;
    sstring _description;
    stream_reason _reason;
    std::vector<stream_event_handler*> _handlers;
    shared_ptr<stream_coordinator> _coordinator;
    bool _files_added = false;
    bool _aborted = false;
public:

    /**
     * Start building stream plan.
     *
     * @param description Stream type that describes this StreamPlan
     */
    stream_plan(stream_manager& mgr, sstring description, stream_reason reason = stream_reason::unspecified);

    plan_id id() const {
        return _plan_id;
    }

    /**
     * Add files of a table to send to a specific node. Every file goes to the
     * next session of the peer, up to connections_per_host sessions.
     *
     * @param to endpoint address of receiver
     * @param connecting Actual connecting address of the endpoint
     * @param table name of the table the files belong to
     * @param files files to send
     * @return this object for chaining
     */
    stream_plan& transfer_files(inet_address to, inet_address connecting, sstring table, std::vector<outgoing_file> files);

    stream_plan& transfer_files(inet_address to, sstring table, std::vector<outgoing_file> files) {
        return transfer_files(to, to, std::move(table), std::move(files));
    }

    stream_plan& listeners(std::vector<stream_event_handler*> handlers);

    shared_ptr<stream_coordinator> coordinator() const {
        return _coordinator;
    }
public:
    /**
     * @return true if this plan has no plan to execute
     */
    bool is_empty() const {
        return !_coordinator->has_active_sessions();
    }

    /**
     * Execute this {@link StreamPlan} asynchronously.
     *
     * @return Future {@link StreamState} that you can use to listen on progress of streaming.
     */
    future<stream_state> execute();

    void abort() noexcept;
    void do_abort();
};

} // namespace streaming
