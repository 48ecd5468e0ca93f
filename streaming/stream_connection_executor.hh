/*
 * Copyright (C) 2015-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <seastar/core/future.hh>
#include <seastar/core/gate.hh>
#include <seastar/core/scheduling.hh>
#include <seastar/core/semaphore.hh>
#include <seastar/util/noncopyable_function.hh>
#include "seastarx.hh"

namespace streaming {

/**
 * Runs the connection establishment of stream sessions.
 *
 * Tasks are fire-and-forget: submit() does not wait for the task, and a
 * task's failure is not reported to the submitter.
 */
class stream_connection_executor {
public:
    using task = noncopyable_function<future<> ()>;

    virtual ~stream_connection_executor() = default;
    virtual void submit(task t) = 0;
    // Waits for the submitted tasks. No task may be submitted afterwards.
    virtual future<> stop() = 0;
};

/**
 * Runs at most `parallelism` tasks at a time, in the given scheduling
 * group. Queued tasks start in submission order.
 *
 * Only establishment is bounded: once connected, a session transfers
 * data in fibers of its own.
 */
class bounded_connection_executor final : public stream_connection_executor {
    sstring _name;
    size_t _parallelism;
    named_semaphore _concurrency;
    gate _tasks;
    scheduling_group _sg;
public:
    bounded_connection_executor(size_t parallelism, sstring name, scheduling_group sg = default_scheduling_group());

    virtual void submit(task t) override;
    virtual future<> stop() override;

    const sstring& name() const noexcept {
        return _name;
    }
    size_t parallelism() const noexcept {
        return _parallelism;
    }
    size_t running() const noexcept;
    size_t waiters() const noexcept {
        return _concurrency.waiters();
    }
    size_t pending() const noexcept {
        return _tasks.get_count();
    }
};

} // namespace streaming
