/*
 * Modified by ScyllaDB
 * Copyright (C) 2015-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: (AGPL-3.0-or-later and Apache-2.0)
 */

#include "streaming/stream_result_future.hh"
#include "streaming/stream_manager.hh"
#include "streaming/stream_exception.hh"
#include "log.hh"
#include <cfloat>
#include <cmath>
#include <fmt/ranges.h>

namespace streaming {

extern logging::logger sslog;

future<stream_state> stream_result_future::init_sending_side(stream_manager& mgr, streaming::plan_id plan_id_, sstring description_,
        std::vector<stream_event_handler*> listeners_, shared_ptr<stream_coordinator> coordinator_) {
    auto sr = ::make_shared<stream_result_future>(mgr, plan_id_, description_, coordinator_);
    // if there is no session to listen to, we immediately set result for returning
    if (!coordinator_->has_active_sessions()) {
        sslog.info("[Stream #{}] Nothing to stream for {}", plan_id_, description_);
        return make_ready_future<stream_state>(sr->get_current_state());
    }
    mgr.register_sending(sr);

    for (auto& listener : listeners_) {
        sr->add_event_listener(listener);
    }

    sslog.info("[Stream #{}] Executing streaming plan for {} with peers={}, master", plan_id_,  description_, coordinator_->get_peers());

    // Initialize and start all sessions
    for (auto& session : coordinator_->get_all_stream_sessions()) {
        session->init(sr);
    }
    coordinator_->connect_all_stream_sessions();

    return sr->_done.get_future();
}

shared_ptr<stream_result_future> stream_result_future::init_receiving_side(stream_manager& mgr, streaming::plan_id plan_id, sstring description, inet_address from) {
    auto sr = mgr.get_receiving_stream(plan_id);
    if (sr) {
        return sr;
    }
    sslog.info("[Stream #{}] Executing streaming plan for {} with peers={}, slave", plan_id, description, from);
    auto coordinator = ::make_shared<stream_coordinator>(0, mgr.connection_factory(), mgr.connection_executor());
    sr = ::make_shared<stream_result_future>(mgr, plan_id, description, std::move(coordinator));
    mgr.register_receiving(sr);
    // Nobody waits for the receiving side, failures are only logged.
    (void)sr->_done.get_future().then_wrapped([plan_id] (future<stream_state> f) {
        if (f.failed()) {
            sslog.debug("[Stream #{}] Receiving side finished with failure: {}", plan_id, f.get_exception());
        }
    });
    return sr;
}

void stream_result_future::handle_session_prepared(shared_ptr<stream_session> session) {
    auto si = session->make_session_info();
    sslog.debug("[Stream #{}] Prepare completed with {} ID#{}. Receiving {}, sending {}",
               session->plan_id(),
               session->peer,
               session->session_index(),
               si.get_total_files_to_receive(),
               si.get_total_files_to_send());
    _coordinator->add_session_info(si);
    fire_stream_event(session_prepared_event(plan_id, std::move(si)));
}

void stream_result_future::handle_session_complete(shared_ptr<stream_session> session) {
    sslog.debug("[Stream #{}] Session with {} ID#{} is complete, state={}", session->plan_id(), session->peer, session->session_index(), session->get_state());
    _coordinator->add_session_info(session->make_session_info());
    fire_stream_event(session_complete_event(session));
    maybe_complete();
}

void stream_result_future::handle_progress(progress_info progress) {
    _coordinator->update_progress(progress);
    fire_stream_event(progress_event(plan_id, std::move(progress)));
}

template <typename Event>
void stream_result_future::fire_stream_event(Event event) {
    // delegate to listener
    for (auto listener : _event_listeners) {
        listener->handle_stream_event(event);
    }
}

void stream_result_future::maybe_complete() {
    auto has_active_sessions = _coordinator->has_active_sessions();
    auto plan_id = this->plan_id;
    sslog.debug("[Stream #{}] stream_result_future: has_active_sessions={}", plan_id, has_active_sessions);
    if (has_active_sessions || _finished) {
        return;
    }
    _finished = true;
    if (sslog.is_enabled(logging::log_level::debug)) {
        _mgr.show_streams();
    }
    _mgr.remove_stream(plan_id);

    auto final_state = get_current_state();
    int64_t bytes_sent = 0;
    int64_t bytes_received = 0;
    for (auto& si : final_state.sessions) {
        bytes_sent += si.get_total_size_sent();
        bytes_received += si.get_total_size_received();
    }
    auto duration = std::chrono::duration_cast<std::chrono::duration<float>>(lowres_clock::now() - _start_time).count();
    auto tx_bw = sstring("0");
    auto rx_bw = sstring("0");
    if (std::fabs(duration) > FLT_EPSILON) {
        tx_bw = format("{:.2f}", bytes_sent / duration / 1024);
        rx_bw = format("{:.2f}", bytes_received / duration / 1024);
    }
    auto stats = format("tx={:d} KiB, {} KiB/s, rx={:d} KiB, {} KiB/s", bytes_sent / 1024, tx_bw, bytes_received / 1024, rx_bw);

    if (final_state.has_failed_session()) {
        sslog.warn("[Stream #{}] Streaming plan for {} failed, peers={}, {}", plan_id, description, _coordinator->get_peers(), stats);
        _done.set_exception(stream_exception(std::move(final_state), "Stream failed"));
    } else {
        sslog.info("[Stream #{}] Streaming plan for {} succeeded, peers={}, {}", plan_id, description, _coordinator->get_peers(), stats);
        _done.set_value(std::move(final_state));
    }
}

inet_address stream_result_future::local_address() const {
    return _mgr.config().broadcast_address;
}

stream_state stream_result_future::get_current_state() const {
    return stream_state(plan_id, description, _coordinator->get_all_session_info());
}

} // namespace streaming
