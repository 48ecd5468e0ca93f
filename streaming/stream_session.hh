/*
 *
 * Modified by ScyllaDB
 * Copyright (C) 2015-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: (AGPL-3.0-or-later and Apache-2.0)
 */

#pragma once

#include <seastar/core/circular_buffer.hh>
#include <seastar/core/condition-variable.hh>
#include <seastar/core/gate.hh>
#include <seastar/core/shared_ptr.hh>
#include "streaming/stream_fwd.hh"
#include "streaming/stream_session_state.hh"
#include "streaming/stream_transfer_task.hh"
#include "streaming/stream_receive_task.hh"
#include "streaming/stream_message.hh"
#include "streaming/stream_reason.hh"
#include "streaming/session_info.hh"
#include <map>
#include <memory>
#include <vector>

namespace streaming {

/**
 * Handles the streaming of one or more files of one or more tables to and from a specific
 * remote node, over a single connection.
 *
 * Both this node and the remote one will create a similar symmetrical stream_session. A streaming
 * session has the following life-cycle:
 *
 * 1. Connection initialization
 *
 *   (a) A node (the initiator in the following) creates a new stream_session, initializes it (init())
 *       and then starts it (start()). Start dials the peer through the connection factory and sends
 *       a stream_init_message carrying the plan id and the session index.
 *   (b) Upon reception of that message, the follower creates its own stream_session by the same
 *       session index, initializes it if it does not exist yet and attaches the accepted connection
 *       to it (attach()).
 *
 * 2. Streaming preparation phase
 *
 *   (a) Right after the init message the initiator sends a prepare_message that includes the
 *       summaries of the files it will stream to the follower (one stream_transfer_task per table).
 *   (b) Upon reception of the prepare_message, the follower records which files it will receive
 *       (one stream_receive_task per table), sends back its own prepare_message and goes to its
 *       streaming phase.
 *   (c) When the initiator receives the follower prepare_message, it records which files it will
 *       receive and then goes to its own streaming phase.
 *
 * 3. Streaming phase
 *
 *   (a) Each side sends a file_message for each file of each stream_transfer_task. The receiver
 *       acknowledges every file with a received_message. When all files of a task are acknowledged
 *       the task is complete.
 *   (b) When all announced files of a stream_receive_task have arrived, the task is complete.
 *   (c) When all transfer and receive tasks of a session are complete, the session moves to the
 *       completion phase (maybe_completed()).
 *
 * 4. Completion phase
 *
 *   (a) When a node has finished all transfer and receive tasks, it enters the completion phase.
 *       If it had already received a complete_message from the other side (it is in the WAIT_COMPLETE
 *       state), the session is done and is closed (close_session()). Otherwise, the node switches to
 *       the WAIT_COMPLETE state and sends a complete_message to the other side.
 *
 * Any error on either side fails the session. A failing side tells its peer with a
 * session_failed_message.
 */
class stream_session : public enable_shared_from_this<stream_session> {
private:
    using inet_address = gms::inet_address;

public:
    /**
     * Streaming endpoint.
     *
     * Each stream_session is identified by this address which is the broadcast address of the node streaming.
     */
    inet_address peer;
private:
    // Actual connecting address, can differ from the peer's broadcast address.
    inet_address _connecting;
    int _session_index;
    shared_ptr<stream_connection_factory> _factory;
    // should not be null when session is started, dropped when the session closes
    shared_ptr<stream_result_future> _stream_result;
    streaming::plan_id _plan_id = streaming::plan_id::create_null_id();
    sstring _description;
    stream_reason _reason = stream_reason::unspecified;

    // streaming tasks are created and managed per table
    std::map<sstring, stream_transfer_task> _transfers;
    // data receivers, filled after receiving prepare message
    std::map<sstring, stream_receive_task> _receivers;

    std::unique_ptr<stream_connection> _connection;
    circular_buffer<stream_message> _outbox;
    condition_variable _outbox_cv;
    bool _outbox_closed = false;
    // inbound and outbound fibers
    gate _fibers;

    stream_session_state _state = stream_session_state::INITIALIZED;
    bool _is_initiator = false;
    bool _is_aborted = false;
    bool _complete_sent = false;
    bool _failed_sent = false;
    bool _received_failed_message = false;

    session_info _session_info;
public:
    /**
     * Create new streaming session with the peer.
     *
     * @param peer Address of streaming peer
     * @param connecting Actual connecting address
     * @param factory is used for establishing connection
     * @param session_index index of the session among the sessions with the same peer
     */
    stream_session(inet_address peer_, inet_address connecting, shared_ptr<stream_connection_factory> factory, int session_index);
    ~stream_session();

    streaming::plan_id plan_id() const {
        return _plan_id;
    }

    const sstring& description() const {
        return _description;
    }

    int session_index() const {
        return _session_index;
    }

    inet_address connecting() const {
        return _connecting;
    }

    stream_reason get_reason() const {
        return _reason;
    }

    void set_reason(stream_reason reason) {
        _reason = reason;
    }

    /**
     * Bind this session to report to specific stream_result_future.
     *
     * @param stream_result result to report to
     */
    void init(shared_ptr<stream_result_future> stream_result_);

    bool is_initialized() const;

    /**
     * Adds a file to send to the peer. Only allowed before the session started.
     */
    void add_transfer_file(sstring table, outgoing_file file);

    /**
     * Connects to the peer and starts the exchange as the initiator.
     *
     * Connection and protocol failures move the session to FAILED, the
     * returned future only fails if the session was already closed.
     */
    future<> start();

    /**
     * Starts the exchange as the follower, on a connection accepted from the peer.
     */
    void attach(std::unique_ptr<stream_connection> connection);

    /**
     * Set current state to {@code newState}.
     *
     * @param newState new state to set
     */
    void set_state(stream_session_state new_state) {
        _state = new_state;
    }

    /**
     * @return current state
     */
    stream_session_state get_state() const {
        return _state;
    }

    /**
     * Return if this session completed successfully.
     *
     * @return true if session completed successfully.
     */
    bool is_success() const {
        return _state == stream_session_state::COMPLETE;
    }

    /**
     * Call back for handling exception during streaming.
     */
    void on_error();

    void abort();

    // Aborts the session if it is still active and waits for its fibers.
    future<> close();

    /**
     * @return Current snapshot of this session info.
     */
    session_info make_session_info() const;

    const session_info& get_session_info() const {
        return _session_info;
    }

    void close_session(stream_session_state final_state);

private:
    void start_fibers();
    future<> run_incoming();
    future<> run_outgoing();
    void send(stream_message msg);
    void close_outbox();
    void handle(stream_message msg);

    /**
     * Prepare this session for sending/receiving files.
     */
    void prepare(prepare_message msg);
    void prepare_receiving(const stream_summary& summary);
    void start_streaming_files();
    void receive_file(file_message msg);
    void file_received(received_message msg);
    /**
     * Check if session is completed on receiving {@code StreamMessage.Type.COMPLETE} message.
     */
    void complete();
    void received_failed_message();
    bool maybe_completed();
    void send_failed_message();
    void report_progress(progress_info progress);
};

} // namespace streaming
