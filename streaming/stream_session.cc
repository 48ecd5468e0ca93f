/*
 *
 * Modified by ScyllaDB
 * Copyright (C) 2015-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: (AGPL-3.0-or-later and Apache-2.0)
 */

#include "log.hh"
#include "streaming/stream_session.hh"
#include "streaming/stream_connection.hh"
#include "streaming/stream_result_future.hh"
#include "streaming/stream_session_state.hh"
#include <seastar/core/coroutine.hh>
#include <seastar/util/variant_utils.hh>
#include <boost/algorithm/cxx11/all_of.hpp>
#include <boost/range/adaptor/map.hpp>
#include <stdexcept>

namespace streaming {

logging::logger sslog("stream_session");

stream_session::stream_session(inet_address peer_, inet_address connecting, shared_ptr<stream_connection_factory> factory, int session_index)
    : peer(peer_)
    , _connecting(connecting)
    , _session_index(session_index)
    , _factory(std::move(factory))
    , _session_info(peer_, session_index, connecting, {}, {}, stream_session_state::INITIALIZED)
{
}

stream_session::~stream_session() = default;

void stream_session::init(shared_ptr<stream_result_future> stream_result_) {
    _stream_result = std::move(stream_result_);
    _plan_id = _stream_result->plan_id;
    _description = _stream_result->description;
}

bool stream_session::is_initialized() const {
    return bool(_stream_result);
}

void stream_session::add_transfer_file(sstring table, outgoing_file file) {
    if (_state != stream_session_state::INITIALIZED) {
        throw std::logic_error(format("[Stream #{}] Cannot add file {} to session ID#{} with {} in state {}",
                _plan_id, file.name, _session_index, peer, _state));
    }
    auto it = _transfers.try_emplace(table, table).first;
    it->second.add_file(std::move(file));
}

future<> stream_session::start() {
    auto holder = _fibers.hold();
    auto self = shared_from_this();
    if (_state != stream_session_state::INITIALIZED) {
        sslog.debug("[Stream #{}] Session ID#{} with {} not started, state={}", _plan_id, _session_index, peer, _state);
        co_return;
    }
    if (peer == _connecting) {
        sslog.debug("[Stream #{}] Starting streaming to {}", _plan_id, peer);
    } else {
        sslog.debug("[Stream #{}] Starting streaming to {} through {}", _plan_id, peer, _connecting);
    }

    std::unique_ptr<stream_connection> connection;
    std::exception_ptr ex;
    try {
        connection = co_await _factory->create_connection(peer, _connecting);
    } catch (...) {
        ex = std::current_exception();
    }
    if (ex) {
        sslog.warn("[Stream #{}] Failed to connect to {} for session ID#{}: {}", _plan_id, _connecting, _session_index, ex);
        on_error();
        co_return;
    }

    if (!is_active(_state)) {
        sslog.debug("[Stream #{}] Session ID#{} with {} closed while connecting, state={}", _plan_id, _session_index, peer, _state);
        co_await connection->close().handle_exception([plan_id = _plan_id] (std::exception_ptr ep) {
            sslog.debug("[Stream #{}] Failed to close unused connection: {}", plan_id, ep);
        });
        co_return;
    }

    _connection = std::move(connection);
    _is_initiator = true;
    set_state(stream_session_state::PREPARING);
    send(stream_init_message{
        .from = _stream_result ? _stream_result->local_address() : inet_address(),
        .session_index = _session_index,
        .plan_id = _plan_id,
        .description = _description,
        .reason = _reason,
    });
    prepare_message prepare;
    for (auto& x : _transfers) {
        prepare.summaries.emplace_back(x.second.get_summary());
    }
    sslog.debug("[Stream #{}] SEND PREPARE_MESSAGE to {} ID#{}, summaries nr={}", _plan_id, peer, _session_index, prepare.summaries.size());
    send(std::move(prepare));
    start_fibers();
}

void stream_session::attach(std::unique_ptr<stream_connection> connection) {
    if (_state != stream_session_state::INITIALIZED || _connection) {
        throw std::logic_error(format("[Stream #{}] Cannot attach connection to session ID#{} with {} in state {}",
                _plan_id, _session_index, peer, _state));
    }
    sslog.debug("[Stream #{}] Accepted connection from {} for session ID#{}", _plan_id, peer, _session_index);
    _connection = std::move(connection);
    set_state(stream_session_state::PREPARING);
    start_fibers();
}

void stream_session::start_fibers() {
    (void)with_gate(_fibers, [this] {
        return run_incoming();
    });
    (void)with_gate(_fibers, [this] {
        return run_outgoing();
    });
}

future<> stream_session::run_incoming() {
    auto self = shared_from_this();
    std::exception_ptr ex;
    try {
        while (is_active(_state)) {
            auto msg = co_await _connection->receive();
            if (!msg) {
                if (is_active(_state)) {
                    throw std::runtime_error(format("Connection to {} closed by peer", _connecting));
                }
                break;
            }
            sslog.trace("[Stream #{}] GOT {} from {} ID#{}", _plan_id, *msg, peer, _session_index);
            handle(std::move(*msg));
        }
    } catch (...) {
        ex = std::current_exception();
    }
    if (ex) {
        if (is_active(_state)) {
            sslog.warn("[Stream #{}] Failed to process messages from {} ID#{}: {}", _plan_id, peer, _session_index, ex);
            on_error();
        } else {
            sslog.debug("[Stream #{}] Receiving from {} ID#{} stopped: {}", _plan_id, peer, _session_index, ex);
        }
    }
}

future<> stream_session::run_outgoing() {
    auto self = shared_from_this();
    std::exception_ptr ex;
    try {
        for (;;) {
            co_await _outbox_cv.wait([this] { return !_outbox.empty() || _outbox_closed; });
            if (_outbox.empty()) {
                break;
            }
            auto msg = std::move(_outbox.front());
            _outbox.pop_front();
            sslog.trace("[Stream #{}] SEND {} to {} ID#{}", _plan_id, msg, peer, _session_index);
            co_await _connection->send(std::move(msg));
        }
    } catch (...) {
        ex = std::current_exception();
    }
    if (ex) {
        if (is_active(_state)) {
            sslog.warn("[Stream #{}] Failed to send to {} ID#{}: {}", _plan_id, peer, _session_index, ex);
            on_error();
        } else {
            sslog.debug("[Stream #{}] Sending to {} ID#{} stopped: {}", _plan_id, peer, _session_index, ex);
        }
    }
    co_await _connection->close().handle_exception([this] (std::exception_ptr ep) {
        sslog.debug("[Stream #{}] Failed to close connection to {} ID#{}: {}", _plan_id, peer, _session_index, ep);
    });
}

void stream_session::send(stream_message msg) {
    if (_outbox_closed) {
        sslog.debug("[Stream #{}] Dropped {} to {} ID#{}, session closed", _plan_id, msg, peer, _session_index);
        return;
    }
    _outbox.push_back(std::move(msg));
    _outbox_cv.signal();
}

void stream_session::close_outbox() {
    _outbox_closed = true;
    _outbox_cv.broadcast();
}

void stream_session::handle(stream_message msg) {
    std::visit(make_visitor(
        [this] (stream_init_message&) {
            throw std::runtime_error(format("Unexpected init message on session ID#{}", _session_index));
        },
        [this] (prepare_message& m) {
            prepare(std::move(m));
        },
        [this] (file_message& m) {
            receive_file(std::move(m));
        },
        [this] (received_message& m) {
            file_received(std::move(m));
        },
        [this] (complete_message&) {
            complete();
        },
        [this] (session_failed_message&) {
            received_failed_message();
        }
    ), msg);
}

void stream_session::prepare(prepare_message msg) {
    sslog.debug("[Stream #{}] GOT PREPARE_MESSAGE from {} ID#{}, summaries nr={}", _plan_id, peer, _session_index, msg.summaries.size());
    if (_state != stream_session_state::PREPARING) {
        throw std::runtime_error(format("Unexpected prepare message in state {}", _state));
    }
    for (auto& summary : msg.summaries) {
        prepare_receiving(summary);
    }
    if (!_is_initiator) {
        // Always send a prepare_message back to the initiator
        prepare_message reply;
        for (auto& x : _transfers) {
            reply.summaries.emplace_back(x.second.get_summary());
        }
        sslog.debug("[Stream #{}] SEND PREPARE_MESSAGE to {} ID#{}, summaries nr={}", _plan_id, peer, _session_index, reply.summaries.size());
        send(std::move(reply));
    }
    if (_stream_result) {
        _stream_result->handle_session_prepared(shared_from_this());
    }
    start_streaming_files();
}

void stream_session::prepare_receiving(const stream_summary& summary) {
    if (summary.files > 0) {
        auto inserted = _receivers.try_emplace(summary.table, summary.table, summary.files, summary.total_size).second;
        if (!inserted) {
            throw std::runtime_error(format("Table {} announced twice", summary.table));
        }
    }
}

void stream_session::start_streaming_files() {
    sslog.debug("[Stream #{}] {}: {} transfers to send, {} receivers", _plan_id, __func__, _transfers.size(), _receivers.size());
    if (!_transfers.empty() || !_receivers.empty()) {
        set_state(stream_session_state::STREAMING);
    }
    for (auto& x : _transfers) {
        for (auto& file : x.second.files()) {
            sslog.trace("[Stream #{}] Start to send {} of table {}", _plan_id, file.name, x.first);
            send(file_message{x.first, file.name, file.size});
            report_progress(progress_info(peer, _session_index, file.name, progress_info::direction::OUT, 0, file.size));
        }
    }
    maybe_completed();
}

void stream_session::receive_file(file_message msg) {
    auto it = _receivers.find(msg.table);
    if (it == _receivers.end()) {
        throw std::runtime_error(format("Received file {} of unexpected table {}", msg.file_name, msg.table));
    }
    auto& task = it->second;
    if (!task.received(msg.file_name)) {
        throw std::runtime_error(format("Received file {} of table {} twice", msg.file_name, msg.table));
    }
    send(received_message{msg.table, msg.file_name});
    report_progress(progress_info(peer, _session_index, msg.file_name, progress_info::direction::IN, msg.size, msg.size));
    if (task.is_completed()) {
        sslog.debug("[Stream #{}] receive task completed: table={}, peer={} ID#{}", _plan_id, msg.table, peer, _session_index);
    }
    maybe_completed();
}

void stream_session::file_received(received_message msg) {
    auto it = _transfers.find(msg.table);
    if (it == _transfers.end()) {
        throw std::runtime_error(format("Acknowledgment for file {} of unexpected table {}", msg.file_name, msg.table));
    }
    auto& task = it->second;
    auto size = task.complete(msg.file_name);
    report_progress(progress_info(peer, _session_index, msg.file_name, progress_info::direction::OUT, size, size));
    if (task.is_completed()) {
        sslog.debug("[Stream #{}] transfer task completed: table={}, peer={} ID#{}", _plan_id, msg.table, peer, _session_index);
    }
    maybe_completed();
}

void stream_session::complete() {
    sslog.debug("[Stream #{}] GOT COMPLETE_MESSAGE from {} ID#{}, state={}", _plan_id, peer, _session_index, _state);
    if (_state == stream_session_state::WAIT_COMPLETE) {
        if (!_complete_sent) {
            send(complete_message{});
            _complete_sent = true;
        }
        close_session(stream_session_state::COMPLETE);
    } else {
        set_state(stream_session_state::WAIT_COMPLETE);
    }
}

void stream_session::received_failed_message() {
    sslog.info("[Stream #{}] Received failed message, peer={} ID#{}", _plan_id, peer, _session_index);
    _received_failed_message = true;
    close_session(stream_session_state::FAILED);
}

bool stream_session::maybe_completed() {
    auto done = [] (const stream_task& task) { return task.is_completed(); };
    bool completed = boost::algorithm::all_of(_receivers | boost::adaptors::map_values, done)
            && boost::algorithm::all_of(_transfers | boost::adaptors::map_values, done);
    if (completed) {
        if (_state == stream_session_state::WAIT_COMPLETE) {
            if (!_complete_sent) {
                send(complete_message{});
                _complete_sent = true;
            }
            sslog.debug("[Stream #{}] maybe_completed: {} -> COMPLETE: peer={} ID#{}", _plan_id, _state, peer, _session_index);
            close_session(stream_session_state::COMPLETE);
        } else {
            send(complete_message{});
            _complete_sent = true;
            set_state(stream_session_state::WAIT_COMPLETE);
        }
    }
    return completed;
}

void stream_session::report_progress(progress_info progress) {
    _session_info.update_progress(progress);
    if (_stream_result) {
        _stream_result->handle_progress(std::move(progress));
    }
}

void stream_session::send_failed_message() {
    if (!_connection) {
        return;
    }
    if (_received_failed_message) {
        sslog.debug("[Stream #{}] Skip sending failed message back to peer", _plan_id);
        return;
    }
    if (_failed_sent) {
        return;
    }
    _failed_sent = true;
    sslog.debug("[Stream #{}] SEND SESSION_FAILED_MESSAGE to {} ID#{}", _plan_id, peer, _session_index);
    send(session_failed_message{});
}

void stream_session::abort() {
    if (sslog.is_enabled(logging::log_level::debug)) {
        sslog.debug("[Stream #{}] Aborted stream session={}, peer={} ID#{}, is_initialized={}", _plan_id, fmt::ptr(this), peer, _session_index, is_initialized());
    } else {
        sslog.info("[Stream #{}] Aborted stream session, peer={} ID#{}, is_initialized={}", _plan_id, peer, _session_index, is_initialized());
    }
    close_session(stream_session_state::FAILED);
}

void stream_session::on_error() {
    sslog.warn("[Stream #{}] Streaming error occurred, peer={} ID#{}", _plan_id, peer, _session_index);
    close_session(stream_session_state::FAILED);
}

void stream_session::close_session(stream_session_state final_state) {
    sslog.debug("[Stream #{}] close_session session={}, state={}, is_aborted={}", _plan_id, fmt::ptr(this), final_state, _is_aborted);
    if (_is_aborted) {
        return;
    }
    _is_aborted = true;
    set_state(final_state);

    if (final_state == stream_session_state::FAILED) {
        for (auto& x : _transfers) {
            sslog.debug("[Stream #{}] close_session session={}, abort stream_transfer_task table={}", _plan_id, fmt::ptr(this), x.first);
            x.second.abort();
        }
        for (auto& x : _receivers) {
            sslog.debug("[Stream #{}] close_session session={}, abort stream_receive_task table={}", _plan_id, fmt::ptr(this), x.first);
            x.second.abort();
        }
        send_failed_message();
    }
    // The outgoing fiber flushes what is queued and closes the connection.
    close_outbox();

    // Dropping the result future here breaks the session <-> plan reference cycle.
    if (auto stream_result = std::exchange(_stream_result, nullptr)) {
        stream_result->handle_session_complete(shared_from_this());
    }
}

future<> stream_session::close() {
    if (is_active(_state)) {
        abort();
    }
    close_outbox();
    if (_fibers.is_closed()) {
        return make_ready_future<>();
    }
    return _fibers.close();
}

session_info stream_session::make_session_info() const {
    auto info = _session_info;
    info.receiving_summaries.clear();
    for (auto& receiver : _receivers) {
        info.receiving_summaries.emplace_back(receiver.second.get_summary());
    }
    info.sending_summaries.clear();
    for (auto& transfer : _transfers) {
        info.sending_summaries.emplace_back(transfer.second.get_summary());
    }
    info.state = _state;
    return info;
}

} // namespace streaming
