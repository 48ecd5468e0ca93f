/*
 *
 * Modified by ScyllaDB
 * Copyright (C) 2015-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: (AGPL-3.0-or-later and Apache-2.0)
 */

#include <seastar/core/coroutine.hh>
#include <seastar/core/loop.hh>
#include <seastar/util/defer.hh>
#include "streaming/stream_manager.hh"
#include "streaming/stream_result_future.hh"
#include "streaming/stream_connection.hh"
#include "streaming/stream_connection_executor.hh"
#include "streaming/stream_message.hh"
#include "log.hh"
#include "streaming/stream_session_state.hh"

namespace streaming {

extern logging::logger sslog;

stream_manager::stream_manager(stream_config cfg, shared_ptr<stream_connection_factory> dialer, scheduling_group sg)
        : stream_manager(cfg,
                make_shared<retrying_connection_factory>(std::move(dialer), cfg.max_connect_attempts, cfg.connect_retry_delay),
                std::make_unique<bounded_connection_executor>(cfg.establisher_parallelism_of_shard(this_shard_id(), smp::count), "stream_connection_establisher", sg))
{
}

stream_manager::stream_manager(stream_config cfg, shared_ptr<stream_connection_factory> factory, std::unique_ptr<stream_connection_executor> executor)
        : _cfg(std::move(cfg))
        , _factory(std::move(factory))
        , _executor(std::move(executor))
{
}

stream_manager::~stream_manager() = default;

future<> stream_manager::start() {
    sslog.debug("stream_manager: started, connections_per_host={}, broadcast_address={}", _cfg.connections_per_host, _cfg.broadcast_address);
    return make_ready_future<>();
}

future<> stream_manager::stop() {
    sslog.debug("stream_manager: stopping, {} connections waiting for init", _pending_accepts.size());
    auto accepts_closed = _accepts.close();
    auto pending = std::vector<stream_connection*>(_pending_accepts.begin(), _pending_accepts.end());
    co_await parallel_for_each(pending, [] (stream_connection* connection) {
        return connection->close().handle_exception([] (std::exception_ptr ep) {
            sslog.debug("stream_manager: failed to close connection waiting for init: {}", ep);
        });
    });
    co_await std::move(accepts_closed);
    auto streams = get_all_streams();
    fail_all_sessions();
    co_await parallel_for_each(streams, [] (shared_ptr<stream_result_future> sr) {
        return sr->get_coordinator()->stop();
    });
    co_await _executor->stop();
}

void stream_manager::register_sending(shared_ptr<stream_result_future> result) {
    _initiated_streams[result->plan_id] = std::move(result);
}

void stream_manager::register_receiving(shared_ptr<stream_result_future> result) {
    _receiving_streams[result->plan_id] = std::move(result);
}

shared_ptr<stream_result_future> stream_manager::get_sending_stream(streaming::plan_id plan_id) const {
    auto it = _initiated_streams.find(plan_id);
    if (it != _initiated_streams.end()) {
        return it->second;
    }
    return {};
}

shared_ptr<stream_result_future> stream_manager::get_receiving_stream(streaming::plan_id plan_id) const {
    auto it = _receiving_streams.find(plan_id);
    if (it != _receiving_streams.end()) {
        return it->second;
    }
    return {};
}

void stream_manager::remove_stream(streaming::plan_id plan_id) {
    sslog.debug("stream_manager: removing plan_id={}", plan_id);
    _initiated_streams.erase(plan_id);
    _receiving_streams.erase(plan_id);
}

void stream_manager::show_streams() const {
    for (auto const& x : _initiated_streams) {
        sslog.debug("stream_manager:initiated_stream: plan_id={}", x.first);
    }
    for (auto const& x : _receiving_streams) {
        sslog.debug("stream_manager:receiving_stream: plan_id={}", x.first);
    }
}

std::vector<shared_ptr<stream_result_future>> stream_manager::get_all_streams() const {
    std::vector<shared_ptr<stream_result_future>> result;
    for (auto& x : _initiated_streams) {
        result.push_back(x.second);
    }
    for (auto& x : _receiving_streams) {
        result.push_back(x.second);
    }
    return result;
}

future<> stream_manager::accept(std::unique_ptr<stream_connection> connection) {
    std::exception_ptr ex;
    std::optional<gate::holder> holder;
    try {
        holder.emplace(_accepts.hold());
        std::optional<stream_message> msg;
        {
            _pending_accepts.insert(connection.get());
            auto unregister = defer([this, c = connection.get()] () noexcept {
                _pending_accepts.erase(c);
            });
            msg = co_await connection->receive();
        }
        if (!msg) {
            log_warning_and_throw<std::runtime_error>(sslog, "stream_manager: connection closed before the init message");
        }
        auto* init = std::get_if<stream_init_message>(&*msg);
        if (!init) {
            log_warning_and_throw<std::runtime_error>(sslog, "stream_manager: expected init message, got {}", *msg);
        }
        sslog.debug("[Stream #{}] GOT STREAM_INIT_MESSAGE from {} ID#{}, description={}, reason={}",
                init->plan_id, init->from, init->session_index, init->description, init->reason);
        auto sr = stream_result_future::init_receiving_side(*this, init->plan_id, init->description, init->from);
        auto session = sr->get_coordinator()->get_or_create_session_by_id(init->from, init->session_index, init->from);
        if (session->get_state() != stream_session_state::INITIALIZED) {
            log_warning_and_throw<std::runtime_error>(sslog, "[Stream #{}] Session ID#{} with {} already exists in state {}, duplicated init message?",
                    init->plan_id, init->session_index, init->from, session->get_state());
        }
        if (!session->is_initialized()) {
            session->init(sr);
            session->set_reason(init->reason);
        }
        session->attach(std::move(connection));
    } catch (...) {
        ex = std::current_exception();
    }
    if (ex) {
        if (connection) {
            co_await connection->close().handle_exception([] (std::exception_ptr ep) {
                sslog.debug("stream_manager: failed to close rejected connection: {}", ep);
            });
        }
        std::rethrow_exception(ex);
    }
}

bool stream_manager::has_peer(inet_address endpoint) const {
    for (auto sr : get_all_streams()) {
        for (auto session : sr->get_coordinator()->get_all_stream_sessions()) {
            if (session->peer == endpoint) {
                return true;
            }
        }
    }
    return false;
}

void stream_manager::fail_sessions(inet_address endpoint) {
    for (auto sr : get_all_streams()) {
        for (auto session : sr->get_coordinator()->get_all_stream_sessions()) {
            if (session->peer == endpoint) {
                session->close_session(stream_session_state::FAILED);
            }
        }
    }
}

void stream_manager::fail_all_sessions() {
    for (auto sr : get_all_streams()) {
        for (auto session : sr->get_coordinator()->get_all_stream_sessions()) {
            session->close_session(stream_session_state::FAILED);
        }
    }
}

future<> stream_manager::on_dead(inet_address endpoint) {
    if (has_peer(endpoint)) {
        sslog.info("stream_manager: Close all stream_session with peer = {} in on_dead", endpoint);
        return container().invoke_on_all([endpoint] (stream_manager& sm) {
            sm.fail_sessions(endpoint);
        });
    }
    return make_ready_future<>();
}

} // namespace streaming
