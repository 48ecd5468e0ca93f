/*
 *
 * Modified by ScyllaDB
 * Copyright (C) 2015-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: (AGPL-3.0-or-later and Apache-2.0)
 */

#pragma once

#include "gms/inet_address.hh"
#include <seastar/core/sstring.hh>

namespace streaming {

/**
 * ProgressInfo contains file transfer progress.
 */
class progress_info {
public:
    using inet_address = gms::inet_address;
    /**
     * Direction of the stream.
     */
    enum class direction { OUT, IN };

    inet_address peer;
    int session_index = 0;
    sstring file_name;
    direction dir = direction::OUT;
    int64_t current_bytes = 0;
    int64_t total_bytes = 0;

    progress_info() = default;
    progress_info(inet_address _peer, int _session_index, sstring _file_name, direction _dir, int64_t _current_bytes, int64_t _total_bytes)
        : peer(_peer)
        , session_index(_session_index)
        , file_name(std::move(_file_name))
        , dir(_dir)
        , current_bytes(_current_bytes)
        , total_bytes(_total_bytes) {
    }

    /**
     * @return true if file transfer is completed
     */
    bool is_completed() const {
        return current_bytes >= total_bytes;
    }
};

} // namespace streaming

template <> struct fmt::formatter<streaming::progress_info> : fmt::formatter<string_view> {
    auto format(const streaming::progress_info&, fmt::format_context& ctx) const -> decltype(ctx.out());
};
