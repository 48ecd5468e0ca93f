/*
 * Copyright (C) 2015-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <seastar/core/with_scheduling_group.hh>
#include "streaming/stream_connection_executor.hh"
#include "log.hh"
#include <algorithm>

namespace streaming {

extern logging::logger sslog;

bounded_connection_executor::bounded_connection_executor(size_t parallelism, sstring name, scheduling_group sg)
    : _name(name)
    , _parallelism(std::max<size_t>(parallelism, 1))
    , _concurrency(_parallelism, named_semaphore_exception_factory{std::move(name)})
    , _sg(sg)
{
}

size_t bounded_connection_executor::running() const noexcept {
    return _parallelism - _concurrency.available_units();
}

void bounded_connection_executor::submit(task t) {
    if (_tasks.is_closed()) {
        throw gate_closed_exception();
    }
    (void)with_gate(_tasks, [this, t = std::move(t)] () mutable {
        return with_scheduling_group(_sg, [this, t = std::move(t)] () mutable {
            return with_semaphore(_concurrency, 1, [t = std::move(t)] () mutable {
                return futurize_invoke(t);
            });
        });
    }).handle_exception([name = _name] (std::exception_ptr ep) {
        sslog.warn("[{}] Connection task failed: {}", name, ep);
    });
}

future<> bounded_connection_executor::stop() {
    sslog.debug("[{}] Stopping, {} tasks pending", _name, _tasks.get_count());
    return _tasks.close();
}

} // namespace streaming
