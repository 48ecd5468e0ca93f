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
#include "streaming/stream_fwd.hh"
#include "streaming/stream_reason.hh"
#include "streaming/stream_summary.hh"
#include <variant>
#include <vector>

namespace streaming {

/**
 * First message on a connection. Tells the follower which plan and which
 * of the initiator's sessions the connection belongs to.
 */
struct stream_init_message {
    gms::inet_address from;
    int session_index = 0;
    streaming::plan_id plan_id;
    sstring description;
    stream_reason reason = stream_reason::unspecified;
};

struct prepare_message {
    /**
     * Summaries of streaming out
     */
    std::vector<stream_summary> summaries;
};

// Announces one file of a transfer task. The bytes themselves travel
// with the transport.
struct file_message {
    sstring table;
    sstring file_name;
    int64_t size = 0;
};

struct received_message {
    sstring table;
    sstring file_name;
};

struct complete_message {};

struct session_failed_message {};

using stream_message = std::variant<
        stream_init_message,
        prepare_message,
        file_message,
        received_message,
        complete_message,
        session_failed_message>;

} // namespace streaming

template <> struct fmt::formatter<streaming::stream_message> : fmt::formatter<string_view> {
    auto format(const streaming::stream_message&, fmt::format_context& ctx) const -> decltype(ctx.out());
};
