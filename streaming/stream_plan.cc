/*
 *
 * Modified by ScyllaDB
 * Copyright (C) 2015-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: (AGPL-3.0-or-later and Apache-2.0)
 */

#include "log.hh"
#include "streaming/stream_plan.hh"
#include "streaming/stream_manager.hh"
#include "streaming/stream_result_future.hh"
#include "streaming/stream_state.hh"
#include <iterator>

namespace streaming {

extern logging::logger sslog;

stream_plan::stream_plan(stream_manager& mgr, sstring description, stream_reason reason)
    : _mgr(mgr)
    , _plan_id(plan_id::create_random_id())
    , _description(std::move(description))
    , _reason(reason)
    , _coordinator(make_shared<stream_coordinator>(mgr.config().connections_per_host, mgr.connection_factory(), mgr.connection_executor()))
{
}

stream_plan& stream_plan::transfer_files(inet_address to, inet_address connecting, sstring table, std::vector<outgoing_file> files) {
    for (auto& file : files) {
        _files_added = true;
        auto session = _coordinator->get_or_create_next_session(to, connecting);
        session->add_transfer_file(table, std::move(file));
        session->set_reason(_reason);
    }
    return *this;
}

future<stream_state> stream_plan::execute() {
    sslog.debug("[Stream #{}] Executing stream_plan description={} files_added={}", _plan_id, _description, _files_added);
    if (_aborted) {
        return make_exception_future<stream_state>(std::runtime_error(format("stream_plan {} is aborted", _plan_id)));
    }
    if (!_files_added) {
        stream_state state(_plan_id, _description, std::vector<session_info>());
        return make_ready_future<stream_state>(std::move(state));
    }
    return stream_result_future::init_sending_side(_mgr, _plan_id, _description, _handlers, _coordinator);
}

stream_plan& stream_plan::listeners(std::vector<stream_event_handler*> handlers) {
    std::copy(handlers.begin(), handlers.end(), std::back_inserter(_handlers));
    return *this;
}

void stream_plan::do_abort() {
    _aborted = true;
    _coordinator->abort_all_stream_sessions();
}

void stream_plan::abort() noexcept {
    try {
        do_abort();
    } catch (...) {
        sslog.error("[Stream #{}] Failed to abort stream plan: {}", _plan_id, std::current_exception());
    }
}

} // namespace streaming
