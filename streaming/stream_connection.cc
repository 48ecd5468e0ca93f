/*
 * Copyright (C) 2015-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <seastar/core/coroutine.hh>
#include <seastar/core/sleep.hh>
#include <algorithm>
#include "streaming/stream_connection.hh"
#include "streaming/stream_exception.hh"
#include "log.hh"

namespace streaming {

extern logging::logger sslog;

// Backoff stops doubling after this many attempts.
static constexpr unsigned max_backoff_shift = 16;

retrying_connection_factory::retrying_connection_factory(shared_ptr<stream_connection_factory> dialer, unsigned max_attempts, std::chrono::milliseconds retry_delay)
    : _dialer(std::move(dialer))
    , _max_attempts(std::max(max_attempts, 1u))
    , _retry_delay(retry_delay)
{
}

future<std::unique_ptr<stream_connection>> retrying_connection_factory::create_connection(gms::inet_address peer, gms::inet_address connecting) {
    std::exception_ptr last_error;
    for (unsigned attempt = 0; attempt < _max_attempts; ++attempt) {
        if (attempt > 0) {
            auto delay = _retry_delay * (int64_t(1) << std::min(attempt - 1, max_backoff_shift));
            sslog.debug("Retrying connection to {} through {} in {} ms, attempt {}/{}", peer, connecting, delay.count(), attempt + 1, _max_attempts);
            co_await seastar::sleep(delay);
        }
        try {
            co_return co_await _dialer->create_connection(peer, connecting);
        } catch (...) {
            last_error = std::current_exception();
            sslog.debug("Connection to {} through {} failed: {}", peer, connecting, last_error);
        }
    }
    throw stream_connection_exception(fmt::format("Failed to connect to {} through {} after {} attempts: {}",
            peer, connecting, _max_attempts, last_error));
}

} // namespace streaming
